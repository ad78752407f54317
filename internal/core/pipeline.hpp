#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/content_cache.hpp"
#include "internal/core/change_analysis.hpp"
#include "internal/model/diagnostic.hpp"
#include "internal/model/model.hpp"
#include "internal/render/template_renderer.hpp"

namespace colguard::core {

enum class FailureKind {
  kUnresolvedReference,
  kMacroRecursion,
  kTemplateSyntax,
  kMalformedQuery,
};

const char* FailureKindName(FailureKind kind);

// A model that could not be fully analyzed, and why.
struct ModelFailure {
  std::string model;
  FailureKind kind = FailureKind::kMalformedQuery;
  std::string message;
};

struct RunStats {
  std::size_t models = 0;

  std::size_t rendered          = 0;
  std::size_t render_cache_hits = 0;

  std::size_t resolved           = 0;
  std::size_t lineage_cache_hits = 0;

  std::size_t validated             = 0;
  std::size_t validation_cache_hits = 0;
  std::size_t cache_pruned          = 0; // superseded artifacts dropped

  std::size_t changed = 0; // models with a change reason, selected or not
};

struct RunOptions {
  // Graph selector (see LineageGraph::Select). Empty = every model.
  std::string selection;
};

struct RunReport {
  // Ordered by model topological position, then emission order.
  std::vector<model::Diagnostic> diagnostics;
  std::vector<ModelFailure>      failures;

  // Topological order of the reported models.
  std::vector<std::string> order;

  // Reported models whose previous analysis no longer holds, in
  // topological order. Empty without a cache.
  std::vector<ModelChange> changes;

  RunStats stats;

  std::size_t ErrorCount() const;
  std::size_t WarningCount() const;

  // Any error diagnostic or model failure.
  bool HasErrors() const;
};

struct PipelineSettings {
  std::string            dialect = "ansi";
  render::RenderSettings render;
  std::size_t            worker_threads = 0; // 0 = hardware concurrency

  std::uint32_t cache_validity_minutes = 1440;

  // Milliseconds since the epoch. Empty = system clock.
  std::function<std::int64_t()> clock;
};

/*
  Template -> lineage -> validation batch run over one Project.

    render (parallel, cached)
      -> graph + cycle check
      -> fingerprints in topological order
      -> resolve layer by layer (parallel, cached)
      -> validate (parallel, cached)
      -> change analysis against the stored model state
      -> cache prune + flush

  Per-model errors become ModelFailure entries and never stop sibling
  models. A dependency cycle throws util::CyclicDependencyError before
  any diagnostic is produced.
*/
class Pipeline {
 public:
  // cache may be null: every stage then computes from scratch.
  Pipeline(PipelineSettings settings, std::shared_ptr<cache::ContentCache> cache);

  RunReport Run(const model::Project& project, const RunOptions& options = {}) const;

  const PipelineSettings& Settings() const {
    return settings_;
  }

 private:
  PipelineSettings                     settings_;
  std::shared_ptr<cache::ContentCache> cache_;
};

} // namespace colguard::core
