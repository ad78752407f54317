#include "internal/core/change_analysis.hpp"

#include <utility>

namespace colguard::core {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

} // namespace

const char* ChangeReasonCodeName(ChangeReasonCode code) {
  switch (code) {
    case ChangeReasonCode::kModelStale:
      return "MODEL_STALE";
    case ChangeReasonCode::kUpstreamModelsChanged:
      return "UPSTREAM_MODELS_CHANGED";
    case ChangeReasonCode::kUpstreamMacrosChanged:
      return "UPSTREAM_MACROS_CHANGED";
  }
  return "UNKNOWN";
}

ChangeAnalyzer::ChangeAnalyzer(std::uint32_t validity_minutes, std::int64_t now_ms)
    : validity_minutes_(validity_minutes), now_ms_(now_ms) {
}

std::optional<std::string> ChangeAnalyzer::StaleCause(const std::optional<cache::ModelState>& previous,
                                                      const cache::ModelState&                current) const {
  if (!previous) {
    return "model '" + current.model + "' has not been analyzed before";
  }
  if (previous->failed) {
    return "last analysis of model '" + current.model + "' failed";
  }
  if (previous->content_fingerprint != current.content_fingerprint) {
    return "model '" + current.model + "' changed since last analysis";
  }

  const auto window_ms = static_cast<std::int64_t>(validity_minutes_) * 60 * 1000;
  if (previous->analyzed_at_ms + window_ms < now_ms_) {
    return "last analysis of model '" + current.model + "' is older than " + std::to_string(validity_minutes_) + " min";
  }
  return std::nullopt;
}

std::vector<ChangeReason> ChangeAnalyzer::Analyze(const std::optional<cache::ModelState>& previous,
                                                  const cache::ModelState&                current,
                                                  const std::vector<std::string>&         stale_parents) const {
  std::vector<ChangeReason> reasons;

  if (auto cause = StaleCause(previous, current)) {
    reasons.push_back(ChangeReason{ChangeReasonCode::kModelStale, std::move(*cause)});
  }

  if (!stale_parents.empty()) {
    reasons.push_back(
        ChangeReason{ChangeReasonCode::kUpstreamModelsChanged, "upstream models changed: " + JoinNames(stale_parents)});
  }

  // Without a previous state every macro is new; MODEL_STALE already says so.
  if (previous) {
    std::vector<std::string> changed;
    for (const auto& [name, fingerprint] : current.macro_fingerprints) {
      auto it = previous->macro_fingerprints.find(name);
      if (it == previous->macro_fingerprints.end() || it->second != fingerprint) {
        changed.push_back(name);
      }
    }
    if (!changed.empty()) {
      reasons.push_back(
          ChangeReason{ChangeReasonCode::kUpstreamMacrosChanged, "upstream macros changed: " + JoinNames(changed)});
    }
  }
  return reasons;
}

} // namespace colguard::core
