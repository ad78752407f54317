#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/artifact_codec.hpp"

namespace colguard::core {

enum class ChangeReasonCode {
  kModelStale,
  kUpstreamModelsChanged,
  kUpstreamMacrosChanged,
};

// "MODEL_STALE", "UPSTREAM_MODELS_CHANGED", "UPSTREAM_MACROS_CHANGED".
const char* ChangeReasonCodeName(ChangeReasonCode code);

struct ChangeReason {
  ChangeReasonCode code = ChangeReasonCode::kModelStale;
  std::string      description;
};

// A model whose last analysis no longer holds.
struct ModelChange {
  std::string               model;
  std::vector<ChangeReason> reasons;
};

/*
  Compares what the previous run recorded for a model with what this run
  sees.

    MODEL_STALE              never analyzed, own content changed, last
                             analysis failed, or older than the window
    UPSTREAM_MODELS_CHANGED  a direct parent model is MODEL_STALE
    UPSTREAM_MACROS_CHANGED  a project macro the model uses changed

  Reasons come back in that order, at most one of each.
*/
class ChangeAnalyzer {
 public:
  ChangeAnalyzer(std::uint32_t validity_minutes, std::int64_t now_ms);

  std::vector<ChangeReason> Analyze(const std::optional<cache::ModelState>& previous, const cache::ModelState& current,
                                    const std::vector<std::string>& stale_parents) const;

  std::uint32_t ValidityMinutes() const {
    return validity_minutes_;
  }

 private:
  std::optional<std::string> StaleCause(const std::optional<cache::ModelState>& previous,
                                        const cache::ModelState&                current) const;

  std::uint32_t validity_minutes_;
  std::int64_t  now_ms_;
};

} // namespace colguard::core
