#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "colguard/v1.hpp"
#include "internal/model/column.hpp"
#include "internal/model/diagnostic.hpp"
#include "internal/render/template_renderer.hpp"

namespace colguard::cache {

inline constexpr std::uint32_t kArtifactFormatVersion = 2;

enum class ArtifactKind {
  kRendered,
  kLineage,
  kValidation,
  kState,
};

// A render is reusable only while macros_digest matches the current
// definitions of result.macro_lookups.
struct CachedRender {
  render::RenderResult result;
  std::string          macros_digest;
};

// What the previous run saw of one model.
struct ModelState {
  std::string                        model;
  std::string                        content_fingerprint;
  std::map<std::string, std::string> macro_fingerprints; // project macros used
  std::int64_t                       analyzed_at_ms = 0;
  bool                               failed         = false;
};

// Stored in the repository's kind column.
const char* ArtifactKindName(ArtifactKind kind);

// nullopt when the payload oneof is unset.
std::optional<ArtifactKind> KindOf(const v1::CacheArtifact& artifact);

v1::CacheArtifact EncodeRendered(const std::string& model, const render::RenderResult& result,
                                 const std::string& macros_digest);
v1::CacheArtifact EncodeLineage(const model::ModelLineage& lineage);
v1::CacheArtifact EncodeValidation(const std::string& model, const std::vector<model::Diagnostic>& diagnostics);
v1::CacheArtifact EncodeState(const ModelState& state);

CachedRender                   DecodeRendered(const v1::RenderedModel& rendered);
model::ModelLineage            DecodeLineage(const v1::LineageRecord& record);
std::vector<model::Diagnostic> DecodeValidation(const v1::ValidationRecord& record);
ModelState                     DecodeState(const v1::ModelState& record);

} // namespace colguard::cache
