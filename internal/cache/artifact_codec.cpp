#include "internal/cache/artifact_codec.hpp"

namespace colguard::cache {

namespace {

v1::ReferenceKind ToProto(model::ReferenceKind kind) {
  return kind == model::ReferenceKind::kSource ? v1::REFERENCE_KIND_SOURCE : v1::REFERENCE_KIND_MODEL;
}

model::ReferenceKind FromProto(v1::ReferenceKind kind) {
  return kind == v1::REFERENCE_KIND_SOURCE ? model::ReferenceKind::kSource : model::ReferenceKind::kModel;
}

void ToProto(const model::Provenance& p, v1::Provenance* out) {
  out->set_opaque(p.IsOpaque());
  if (p.IsOpaque()) return;
  out->set_producer(p.producer);
  out->set_producer_kind(ToProto(p.producer_kind));
  out->set_column(p.column);
}

model::Provenance FromProto(const v1::Provenance& p) {
  if (p.opaque()) {
    return model::Provenance::Opaque();
  }
  return model::Provenance::Upstream(p.producer(), FromProto(p.producer_kind()), p.column());
}

} // namespace

const char* ArtifactKindName(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::kRendered: return "rendered";
    case ArtifactKind::kLineage: return "lineage";
    case ArtifactKind::kValidation: return "validation";
    case ArtifactKind::kState: return "state";
  }
  return "unknown";
}

std::optional<ArtifactKind> KindOf(const v1::CacheArtifact& artifact) {
  switch (artifact.payload_case()) {
    case v1::CacheArtifact::kRendered: return ArtifactKind::kRendered;
    case v1::CacheArtifact::kLineage: return ArtifactKind::kLineage;
    case v1::CacheArtifact::kValidation: return ArtifactKind::kValidation;
    case v1::CacheArtifact::kState: return ArtifactKind::kState;
    default: return std::nullopt;
  }
}

// ------------------------------------------------------------
// Encode
// ------------------------------------------------------------

v1::CacheArtifact EncodeRendered(const std::string& model, const render::RenderResult& result,
                                 const std::string& macros_digest) {
  v1::CacheArtifact artifact;
  artifact.set_format_version(kArtifactFormatVersion);

  auto* rendered = artifact.mutable_rendered();
  rendered->set_model(model);
  rendered->set_sql(result.sql);
  for (const auto& ref : result.references) {
    auto* r = rendered->add_references();
    r->set_kind(ToProto(ref.kind));
    r->set_source_name(ref.source_name);
    r->set_name(ref.name);
  }
  for (const auto& macro : result.macros_used) {
    rendered->add_macros_used(macro);
  }
  for (const auto& name : result.macro_lookups) {
    rendered->add_macro_lookups(name);
  }
  rendered->set_macros_digest(macros_digest);
  return artifact;
}

v1::CacheArtifact EncodeLineage(const model::ModelLineage& lineage) {
  v1::CacheArtifact artifact;
  artifact.set_format_version(kArtifactFormatVersion);

  auto* record = artifact.mutable_lineage();
  record->set_model(lineage.model);
  record->set_open_wildcard(lineage.open_wildcard);

  for (const auto& column : lineage.columns) {
    auto* c = record->add_columns();
    c->set_name(column.name);
    for (const auto& p : column.provenance) {
      ToProto(p, c->add_provenance());
    }
  }
  for (const auto& d : lineage.dangling) {
    auto* out = record->add_dangling();
    out->set_consumer(d.consumer);
    out->set_relation(d.relation);
    out->set_column(d.column);
  }
  for (const auto& ref : lineage.predicate_refs) {
    auto* out = record->add_predicate_refs();
    out->set_clause(ref.clause);
    ToProto(ref.provenance, out->mutable_provenance());
  }
  for (const auto& a : lineage.ambiguous) {
    auto* out = record->add_ambiguous();
    out->set_consumer(a.consumer);
    out->set_column(a.column);
    for (const auto& relation : a.relations) out->add_relations(relation);
  }
  return artifact;
}

v1::CacheArtifact EncodeValidation(const std::string& model, const std::vector<model::Diagnostic>& diagnostics) {
  v1::CacheArtifact artifact;
  artifact.set_format_version(kArtifactFormatVersion);

  auto* record = artifact.mutable_validation();
  record->set_model(model);
  for (const auto& d : diagnostics) {
    auto* out = record->add_diagnostics();
    out->set_severity(d.severity == model::Severity::kError ? v1::SEVERITY_ERROR : v1::SEVERITY_WARNING);
    out->set_model(d.model);
    out->set_has_column(d.column.has_value());
    if (d.column) out->set_column(*d.column);
    out->set_message(d.message);
  }
  return artifact;
}

// ------------------------------------------------------------
// Decode
// ------------------------------------------------------------

CachedRender DecodeRendered(const v1::RenderedModel& rendered) {
  CachedRender out;
  auto&        result = out.result;
  result.sql          = rendered.sql();
  for (const auto& r : rendered.references()) {
    result.references.push_back(model::Reference{FromProto(r.kind()), r.source_name(), r.name()});
  }
  for (const auto& macro : rendered.macros_used()) {
    result.macros_used.push_back(macro);
  }
  for (const auto& name : rendered.macro_lookups()) {
    result.macro_lookups.push_back(name);
  }
  out.macros_digest = rendered.macros_digest();
  return out;
}

model::ModelLineage DecodeLineage(const v1::LineageRecord& record) {
  model::ModelLineage lineage;
  lineage.model         = record.model();
  lineage.open_wildcard = record.open_wildcard();

  for (const auto& c : record.columns()) {
    model::Column column;
    column.name = c.name();
    for (const auto& p : c.provenance()) {
      column.provenance.push_back(FromProto(p));
    }
    lineage.columns.push_back(std::move(column));
  }
  for (const auto& d : record.dangling()) {
    lineage.dangling.push_back(model::DanglingReference{d.consumer(), d.relation(), d.column()});
  }
  for (const auto& ref : record.predicate_refs()) {
    lineage.predicate_refs.push_back(model::PredicateReference{ref.clause(), FromProto(ref.provenance())});
  }
  for (const auto& a : record.ambiguous()) {
    lineage.ambiguous.push_back(
        model::AmbiguousReference{a.consumer(), a.column(), std::vector<std::string>(a.relations().begin(), a.relations().end())});
  }
  return lineage;
}

std::vector<model::Diagnostic> DecodeValidation(const v1::ValidationRecord& record) {
  std::vector<model::Diagnostic> out;
  for (const auto& d : record.diagnostics()) {
    model::Diagnostic diagnostic;
    diagnostic.severity = d.severity() == v1::SEVERITY_ERROR ? model::Severity::kError : model::Severity::kWarning;
    diagnostic.model    = d.model();
    if (d.has_column()) diagnostic.column = d.column();
    diagnostic.message = d.message();
    out.push_back(std::move(diagnostic));
  }
  return out;
}

// ------------------------------------------------------------
// Model state
// ------------------------------------------------------------

v1::CacheArtifact EncodeState(const ModelState& state) {
  v1::CacheArtifact artifact;
  artifact.set_format_version(kArtifactFormatVersion);

  auto* record = artifact.mutable_state();
  record->set_model(state.model);
  record->set_content_fingerprint(state.content_fingerprint);
  for (const auto& [name, fingerprint] : state.macro_fingerprints) {
    auto* macro = record->add_macros();
    macro->set_name(name);
    macro->set_fingerprint(fingerprint);
  }
  record->set_analyzed_at_ms(state.analyzed_at_ms);
  record->set_failed(state.failed);
  return artifact;
}

ModelState DecodeState(const v1::ModelState& record) {
  ModelState state;
  state.model               = record.model();
  state.content_fingerprint = record.content_fingerprint();
  for (const auto& macro : record.macros()) {
    state.macro_fingerprints[macro.name()] = macro.fingerprint();
  }
  state.analyzed_at_ms = record.analyzed_at_ms();
  state.failed         = record.failed();
  return state;
}

} // namespace colguard::cache
