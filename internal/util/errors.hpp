#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace colguard::util {

inline std::string JoinChain(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += " -> ";
    out += name;
  }
  return out;
}

/*
  Central error types.

  Per-model errors (everything except CyclicDependencyError) are caught by
  the pipeline and reported as model failures; sibling models keep going.
*/

class ModelError : public std::runtime_error {
 public:
  ModelError(std::string model, const std::string& msg) : std::runtime_error(msg), model_(std::move(model)) {
  }

  const std::string& Model() const {
    return model_;
  }

 private:
  std::string model_;
};

class UnresolvedReferenceError : public ModelError {
 public:
  UnresolvedReferenceError(std::string model, std::string target)
      : ModelError(model, "model '" + model + "' references unknown " + target), target_(std::move(target)) {
  }

  const std::string& Target() const {
    return target_;
  }

 private:
  std::string target_;
};

class MacroRecursionError : public ModelError {
 public:
  MacroRecursionError(std::string model, std::vector<std::string> chain, std::size_t limit)
      : ModelError(model, "macro expansion in model '" + model + "' exceeded depth " + std::to_string(limit) + ": " + JoinChain(chain)),
        chain_(std::move(chain)) {
  }

  const std::vector<std::string>& Chain() const {
    return chain_;
  }

 private:
  std::vector<std::string> chain_;
};

class TemplateSyntaxError : public ModelError {
 public:
  TemplateSyntaxError(std::string model, const std::string& detail)
      : ModelError(model, "template error in model '" + model + "': " + detail) {
  }
};

class MalformedQueryError : public ModelError {
 public:
  MalformedQueryError(std::string model, const std::string& detail)
      : ModelError(model, "malformed query in model '" + model + "': " + detail) {
  }
};

// Fatal for the whole run.
class CyclicDependencyError : public std::runtime_error {
 public:
  explicit CyclicDependencyError(std::vector<std::string> cycle)
      : std::runtime_error("cyclic dependency: " + JoinChain(cycle)), cycle_(std::move(cycle)) {
  }

  // Models in reference order; the first model is repeated at the end.
  const std::vector<std::string>& Cycle() const {
    return cycle_;
  }

 private:
  std::vector<std::string> cycle_;
};

} // namespace colguard::util
