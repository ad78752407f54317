#pragma once

#include <optional>
#include <string>

namespace colguard::model {

enum class Severity {
  kWarning,
  kError,
};

inline const char* SeverityName(Severity severity) {
  return severity == Severity::kError ? "error" : "warning";
}

/*
  Validation finding. Produced only by the validator.
*/
struct Diagnostic {
  Severity                   severity = Severity::kError;
  std::string                model;
  std::optional<std::string> column;
  std::string                message;

  bool operator==(const Diagnostic& other) const {
    return severity == other.severity && model == other.model && column == other.column && message == other.message;
  }
};

} // namespace colguard::model
