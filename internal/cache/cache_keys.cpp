#include "internal/cache/cache_keys.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "internal/util/fingerprint.hpp"

namespace colguard::cache {

namespace {

void AddDocs(util::Fingerprinter& fp, const std::optional<model::ColumnDocs>& docs) {
  if (!docs) {
    fp.Add("undocumented");
    return;
  }
  fp.Add("documented").Add(std::to_string(docs->size()));
  for (const auto& doc : *docs) {
    fp.Add(doc.name).Add(doc.description);
  }
}

} // namespace

CacheKeys::CacheKeys(const model::Project& project, const render::RenderSettings& settings, std::string dialect)
    : project_(project), dialect_(std::move(dialect)) {
  util::Fingerprinter fp;
  fp.Add("context").Add(kAnalyzerVersion);

  // std::map iteration keeps this independent of load order.
  fp.Add(std::to_string(project.vars.size()));
  for (const auto& [name, value] : project.vars) {
    fp.Add(name).Add(value);
  }

  fp.Add(settings.target_schema).Add(std::to_string(settings.macro_depth_limit)).Add(settings.adapter_type);
  context_fingerprint_ = fp.HexDigest();
}

std::string CacheKeys::RenderKey(const model::Model& model) const {
  util::Fingerprinter fp;
  fp.Add("render").Add(kAnalyzerVersion).Add(context_fingerprint_).Add(model.name).Add(model.raw_sql);
  return fp.HexDigest();
}

std::string CacheKeys::MacroFingerprint(const std::string& name) const {
  util::Fingerprinter fp;
  fp.Add("macro").Add(name);

  const auto* macro = project_.FindMacro(name);
  if (!macro) {
    fp.Add("absent");
    return fp.HexDigest();
  }

  fp.Add(std::to_string(macro->params.size()));
  for (const auto& param : macro->params) {
    fp.Add(param.name).Add(param.default_value ? "=" + *param.default_value : "");
  }
  fp.Add(macro->body);
  return fp.HexDigest();
}

std::string CacheKeys::MacrosDigest(const std::vector<std::string>& names) const {
  auto sorted = names;
  std::sort(sorted.begin(), sorted.end());

  util::Fingerprinter fp;
  fp.Add("macros").Add(std::to_string(sorted.size()));
  for (const auto& name : sorted) {
    fp.Add(MacroFingerprint(name));
  }
  return fp.HexDigest();
}

std::string CacheKeys::SourceFingerprint(const model::SourceTable& source) const {
  util::Fingerprinter fp;
  fp.Add("source").Add(source.NodeKey());
  AddDocs(fp, source.docs);
  return fp.HexDigest();
}

std::string CacheKeys::ModelFingerprint(const model::Model&      model,
                                        const std::string&       macros_digest,
                                        std::vector<std::string> upstream_fingerprints) const {
  std::sort(upstream_fingerprints.begin(), upstream_fingerprints.end());

  util::Fingerprinter fp;
  fp.Add("model").Add(context_fingerprint_).Add(model.name).Add(model.raw_sql).Add(macros_digest);
  AddDocs(fp, model.docs);
  fp.Add(std::to_string(upstream_fingerprints.size()));
  for (const auto& upstream : upstream_fingerprints) {
    fp.Add(upstream);
  }
  return fp.HexDigest();
}

std::string CacheKeys::ContentFingerprint(const model::Model& model) const {
  util::Fingerprinter fp;
  fp.Add("content").Add(context_fingerprint_).Add(model.name).Add(model.raw_sql);
  AddDocs(fp, model.docs);
  return fp.HexDigest();
}

std::string CacheKeys::StateKey(const std::string& model) const {
  util::Fingerprinter fp;
  fp.Add("state").Add(model);
  return fp.HexDigest();
}

std::string CacheKeys::LineageKey(const std::string& fingerprint) const {
  util::Fingerprinter fp;
  fp.Add("lineage").Add(kAnalyzerVersion).Add(dialect_).Add(fingerprint);
  return fp.HexDigest();
}

std::string CacheKeys::ValidationKey(const std::string& fingerprint) const {
  util::Fingerprinter fp;
  fp.Add("validation").Add(kAnalyzerVersion).Add(dialect_).Add(fingerprint);
  return fp.HexDigest();
}

} // namespace colguard::cache
