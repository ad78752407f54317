#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/model.hpp"
#include "internal/render/template_renderer.hpp"

namespace colguard::cache {

// Bumped whenever renderer or resolver output changes shape.
inline constexpr std::string_view kAnalyzerVersion = "colguard-analyzer/2";

/*
  Content-derived cache keys.

  Every key is a 64-char SHA-256 hex digest. A model fingerprint covers
  its raw text, its docs, the render context (vars, target schema,
  adapter), the macros its render looked up and the sorted fingerprints
  of its upstreams, so a change anywhere upstream yields new keys for
  every descendant. Editing a macro a model never looked up changes
  none of its keys.
*/
class CacheKeys {
 public:
  CacheKeys(const model::Project& project, const render::RenderSettings& settings, std::string dialect);

  // Vars and relation settings shared by every model.
  const std::string& ContextFingerprint() const {
    return context_fingerprint_;
  }

  // Excludes macros; a cached render is checked against MacrosDigest().
  std::string RenderKey(const model::Model& model) const;

  // Name, parameters and body of a project macro; a fixed digest when absent.
  std::string MacroFingerprint(const std::string& name) const;

  // Combined MacroFingerprint() of a render's macro lookups.
  std::string MacrosDigest(const std::vector<std::string>& names) const;

  std::string SourceFingerprint(const model::SourceTable& source) const;

  std::string ModelFingerprint(const model::Model&      model,
                               const std::string&       macros_digest,
                               std::vector<std::string> upstream_fingerprints) const;

  // Own content only: raw text, docs and render context, no upstreams.
  std::string ContentFingerprint(const model::Model& model) const;

  // Fixed per model name; the stored state is overwritten in place.
  std::string StateKey(const std::string& model) const;

  std::string LineageKey(const std::string& fingerprint) const;
  std::string ValidationKey(const std::string& fingerprint) const;

 private:
  const model::Project& project_;
  std::string           dialect_;
  std::string           context_fingerprint_;
};

} // namespace colguard::cache
