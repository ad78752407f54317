#include "internal/core/pipeline.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>

#include "internal/cache/cache_keys.hpp"
#include "internal/lineage/lineage_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/sql/column_resolver.hpp"
#include "internal/sql/dialect.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/validator.hpp"

namespace colguard::core {

namespace {

struct RenderSlot {
  const model::Model*                 model = nullptr;
  std::optional<render::RenderResult> result;
  std::optional<ModelFailure>         failure;
  bool                                cache_hit = false;
  std::string                         macros_digest;
};

struct ResolveSlot {
  std::string                        name;
  std::optional<model::ModelLineage> lineage;
  std::optional<ModelFailure>        failure;
  bool                               cache_hit = false;
};

struct ValidateSlot {
  std::string                    name;
  std::vector<model::Diagnostic> diagnostics;
  bool                           cache_hit = false;
};

// Runs fn; a per-model error becomes the returned failure.
template <typename Fn>
std::optional<ModelFailure> Guard(const std::string& model, Fn&& fn) {
  try {
    fn();
  } catch (const util::UnresolvedReferenceError& e) {
    return ModelFailure{model, FailureKind::kUnresolvedReference, e.what()};
  } catch (const util::MacroRecursionError& e) {
    return ModelFailure{model, FailureKind::kMacroRecursion, e.what()};
  } catch (const util::TemplateSyntaxError& e) {
    return ModelFailure{model, FailureKind::kTemplateSyntax, e.what()};
  } catch (const util::MalformedQueryError& e) {
    return ModelFailure{model, FailureKind::kMalformedQuery, e.what()};
  }
  return std::nullopt;
}

// A cached render is stale once any of its targets left the project.
bool ReferencesResolve(const model::Project& project, const render::RenderResult& result) {
  for (const auto& ref : result.references) {
    const bool found = ref.kind == model::ReferenceKind::kSource ? project.FindSource(ref.source_name, ref.name) != nullptr
                                                                 : project.FindModel(ref.name) != nullptr;
    if (!found) return false;
  }
  return true;
}

void LogFailure(const ModelFailure& failure) {
  COLGUARD_LOG_WARN("model failed", {observability::StringField("model", failure.model),
                                     observability::StringField("kind", FailureKindName(failure.kind)),
                                     observability::StringField("error", failure.message)});
}

std::int64_t AsInt(std::size_t n) {
  return static_cast<std::int64_t>(n);
}

std::int64_t SystemNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* FailureKindName(FailureKind kind) {
  switch (kind) {
    case FailureKind::kUnresolvedReference:
      return "unresolved_reference";
    case FailureKind::kMacroRecursion:
      return "macro_recursion";
    case FailureKind::kTemplateSyntax:
      return "template_syntax";
    case FailureKind::kMalformedQuery:
      return "malformed_query";
  }
  return "unknown";
}

// ------------------------------------------------------------
// RunReport
// ------------------------------------------------------------

std::size_t RunReport::ErrorCount() const {
  std::size_t n = 0;
  for (const auto& d : diagnostics) {
    if (d.severity == model::Severity::kError) ++n;
  }
  return n;
}

std::size_t RunReport::WarningCount() const {
  return diagnostics.size() - ErrorCount();
}

bool RunReport::HasErrors() const {
  return !failures.empty() || ErrorCount() > 0;
}

// ------------------------------------------------------------
// Pipeline
// ------------------------------------------------------------

Pipeline::Pipeline(PipelineSettings settings, std::shared_ptr<cache::ContentCache> cache)
    : settings_(std::move(settings)), cache_(std::move(cache)) {
}

RunReport Pipeline::Run(const model::Project& project, const RunOptions& options) const {
  const auto dialect         = sql::DialectByName(settings_.dialect);
  auto       render_settings = settings_.render;
  if (render_settings.adapter_type.empty()) {
    render_settings.adapter_type = dialect.name;
  }

  const render::TemplateRenderer renderer(project, render_settings);
  const cache::CacheKeys         keys(project, render_settings, dialect.name);
  const sql::ColumnResolver      resolver(dialect);
  runtime::WorkerPool            pool(settings_.worker_threads);

  RunReport report;
  report.stats.models = project.models.size();

  std::map<std::string, ModelFailure> failures;

  // ------------------------------------------------------------
  // Render
  // ------------------------------------------------------------
  std::vector<RenderSlot> rendered;
  rendered.reserve(project.models.size());
  for (const auto& [name, m] : project.models) {
    rendered.push_back(RenderSlot{&m, std::nullopt, std::nullopt, false, {}});
  }

  std::vector<runtime::Task> tasks;
  for (auto& slot : rendered) {
    tasks.push_back([&, s = &slot] {
      const auto& m = *s->model;
      s->failure    = Guard(m.name, [&] {
        const auto key = keys.RenderKey(m);
        if (cache_) {
          auto cached = cache_->GetRendered(key);
          if (cached && ReferencesResolve(project, cached->result)) {
            auto digest = keys.MacrosDigest(cached->result.macro_lookups);
            if (digest == cached->macros_digest) {
              s->result        = std::move(cached->result);
              s->macros_digest = std::move(digest);
              s->cache_hit     = true;
              return;
            }
          }
        }
        s->result        = renderer.Render(m);
        s->macros_digest = keys.MacrosDigest(s->result->macro_lookups);
        if (cache_) cache_->Put(key, cache::EncodeRendered(m.name, *s->result, s->macros_digest));
      });
    });
  }
  pool.RunAll(std::move(tasks));
  tasks.clear();

  std::map<std::string, const RenderSlot*> by_name;
  for (const auto& slot : rendered) {
    by_name[slot.model->name] = &slot;
    if (slot.failure) {
      LogFailure(*slot.failure);
      failures[slot.model->name] = *slot.failure;
      continue;
    }
    ++report.stats.rendered;
    if (slot.cache_hit) ++report.stats.render_cache_hits;
  }
  COLGUARD_LOG_DEBUG("render stage done", {observability::IntField("rendered", AsInt(report.stats.rendered)),
                                           observability::IntField("cache_hits", AsInt(report.stats.render_cache_hits))});

  // ------------------------------------------------------------
  // Graph
  // ------------------------------------------------------------
  lineage::LineageGraph graph;
  for (const auto& [key, source] : project.sources) {
    graph.AddSource(key);
  }
  for (const auto& slot : rendered) {
    graph.AddModel(slot.model->name);
  }
  for (const auto& slot : rendered) {
    if (!slot.result) continue;
    for (const auto& ref : slot.result->references) {
      graph.AddReference(slot.model->name, ref);
    }
  }

  // Fatal for the run; nothing below has produced a diagnostic yet.
  graph.CheckAcyclic();

  const auto order = graph.TopologicalOrder();

  // ------------------------------------------------------------
  // Fingerprints
  // ------------------------------------------------------------
  std::map<std::string, std::string> fingerprints;
  for (const auto& [key, source] : project.sources) {
    fingerprints[key] = keys.SourceFingerprint(source);
  }
  for (const auto& name : order) {
    std::vector<std::string> upstream;
    for (const auto& parent : graph.Parents(name)) {
      upstream.push_back(fingerprints.at(parent));
    }
    const auto& digest = by_name.at(name)->macros_digest;
    fingerprints[name] = keys.ModelFingerprint(*project.FindModel(name), digest, std::move(upstream));
  }

  // ------------------------------------------------------------
  // Resolve, one layer at a time
  // ------------------------------------------------------------
  const validate::Validator validator(project, graph, dialect);

  for (const auto& layer : graph.Layers()) {
    std::vector<ResolveSlot> slots;
    for (const auto& name : layer) {
      if (by_name.at(name)->result) {
        slots.push_back(ResolveSlot{name, std::nullopt, std::nullopt, false});
      }
    }

    for (auto& slot : slots) {
      tasks.push_back([&, s = &slot] {
        const auto& result = *by_name.at(s->name)->result;
        s->failure         = Guard(s->name, [&] {
          const auto key = keys.LineageKey(fingerprints.at(s->name));
          if (cache_) {
            if (auto cached = cache_->GetLineage(key)) {
              s->lineage   = std::move(cached);
              s->cache_hit = true;
              return;
            }
          }

          // Earlier layers are final; their lineage is only read here.
          sql::RelationCatalog catalog(dialect);
          catalog.AddSearchPrefix(settings_.render.target_schema);
          for (const auto& ref : result.references) {
            const auto node = ref.NodeKey();
            catalog.Add(renderer.RelationFor(ref), sql::UpstreamRelation{node, ref.kind, validator.KnownColumns(node)});
          }

          s->lineage = resolver.Resolve(s->name, result.sql, catalog);
          if (cache_) cache_->Put(key, cache::EncodeLineage(*s->lineage));
        });
      });
    }
    pool.RunAll(std::move(tasks));
    tasks.clear();

    for (auto& slot : slots) {
      if (slot.failure) {
        LogFailure(*slot.failure);
        failures[slot.name] = std::move(*slot.failure);
        continue;
      }
      ++report.stats.resolved;
      if (slot.cache_hit) ++report.stats.lineage_cache_hits;
      graph.SetLineage(std::move(*slot.lineage));
    }
  }
  COLGUARD_LOG_DEBUG("resolve stage done", {observability::IntField("resolved", AsInt(report.stats.resolved)),
                                            observability::IntField("cache_hits", AsInt(report.stats.lineage_cache_hits))});

  // ------------------------------------------------------------
  // Validate
  // ------------------------------------------------------------
  std::vector<ValidateSlot> checks;
  for (const auto& name : order) {
    if (graph.Lineage(name)) {
      checks.push_back(ValidateSlot{name, {}, false});
    }
  }

  for (auto& check : checks) {
    tasks.push_back([&, c = &check] {
      const auto key = keys.ValidationKey(fingerprints.at(c->name));
      if (cache_) {
        if (auto cached = cache_->GetValidation(key)) {
          c->diagnostics = std::move(*cached);
          c->cache_hit   = true;
          return;
        }
      }
      c->diagnostics = validator.ValidateModel(c->name);
      if (cache_) cache_->Put(key, cache::EncodeValidation(c->name, c->diagnostics));
    });
  }
  pool.RunAll(std::move(tasks));

  // ------------------------------------------------------------
  // Change analysis
  // ------------------------------------------------------------
  std::map<std::string, std::vector<ChangeReason>> changes;
  if (cache_) {
    const auto           now = settings_.clock ? settings_.clock() : SystemNowMs();
    const ChangeAnalyzer analyzer(settings_.cache_validity_minutes, now);
    std::set<std::string> stale;

    for (const auto& name : order) {
      const auto  key      = keys.StateKey(name);
      const auto  previous = cache_->GetState(key);
      const auto* slot     = by_name.at(name);

      cache::ModelState current;
      current.model               = name;
      current.content_fingerprint = keys.ContentFingerprint(*slot->model);
      current.analyzed_at_ms      = now;
      current.failed              = failures.contains(name);
      if (slot->result) {
        for (const auto& macro : slot->result->macros_used) {
          current.macro_fingerprints[macro] = keys.MacroFingerprint(macro);
        }
      } else if (previous) {
        // Unrendered: compare the macros it used last time.
        for (const auto& entry : previous->macro_fingerprints) {
          current.macro_fingerprints[entry.first] = keys.MacroFingerprint(entry.first);
        }
      }

      std::vector<std::string> stale_parents;
      for (const auto& parent : graph.Parents(name)) {
        if (stale.contains(parent)) stale_parents.push_back(parent);
      }

      auto reasons = analyzer.Analyze(previous, current, stale_parents);
      for (const auto& reason : reasons) {
        if (reason.code == ChangeReasonCode::kModelStale) stale.insert(name);
      }

      if (!reasons.empty() || current.failed) {
        cache_->Put(key, cache::EncodeState(current));
      }
      if (!reasons.empty()) {
        changes[name] = std::move(reasons);
      }
    }
    report.stats.changed = changes.size();
    COLGUARD_LOG_DEBUG("change analysis done", {observability::IntField("changed", AsInt(changes.size())),
                                                observability::IntField("stale", AsInt(stale.size()))});
  }

  // ------------------------------------------------------------
  // Report
  // ------------------------------------------------------------
  std::optional<std::set<std::string>> selected;
  if (!options.selection.empty()) {
    selected = graph.Select(options.selection);
  }
  const auto reported = [&](const std::string& name) { return !selected || selected->contains(name); };

  for (const auto& name : order) {
    if (!reported(name)) continue;
    report.order.push_back(name);

    auto failure = failures.find(name);
    if (failure != failures.end()) {
      report.failures.push_back(failure->second);
    }

    auto change = changes.find(name);
    if (change != changes.end()) {
      report.changes.push_back(ModelChange{name, std::move(change->second)});
    }
  }

  for (auto& check : checks) {
    ++report.stats.validated;
    if (check.cache_hit) ++report.stats.validation_cache_hits;
    if (!reported(check.name)) continue;

    for (auto& diagnostic : check.diagnostics) {
      report.diagnostics.push_back(std::move(diagnostic));
    }
  }

  if (cache_) {
    // Every artifact this project still needs was touched above.
    report.stats.cache_pruned = cache_->PruneUntouched();
    if (auto flushed = cache_->Flush(); !flushed) {
      COLGUARD_LOG_WARN("cache not persisted", {observability::StringField("error", flushed.message)});
    }
  }

  COLGUARD_LOG_INFO("run complete", {observability::IntField("models", AsInt(report.order.size())),
                                     observability::IntField("errors", AsInt(report.ErrorCount())),
                                     observability::IntField("warnings", AsInt(report.WarningCount())),
                                     observability::IntField("failures", AsInt(report.failures.size())),
                                     observability::IntField("changed", AsInt(report.changes.size())),
                                     observability::IntField("render_cache_hits", AsInt(report.stats.render_cache_hits)),
                                     observability::IntField("lineage_cache_hits", AsInt(report.stats.lineage_cache_hits)),
                                     observability::IntField("validation_cache_hits", AsInt(report.stats.validation_cache_hits))});
  return report;
}

} // namespace colguard::core
