#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace colguard::render {

// Type errors while evaluating a template; the renderer rewraps it with the model name.
class TemplateValueError : public std::runtime_error {
 public:
  explicit TemplateValueError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Value;

using List = std::vector<Value>;
using Dict = std::vector<std::pair<std::string, Value>>; // insertion order

struct NoneValue {
  bool operator==(const NoneValue&) const {
    return true;
  }
};

// A macro passed around as a value (adapter.dispatch(...), a bare macro name).
struct MacroHandle {
  std::string name;

  bool operator==(const MacroHandle& other) const {
    return name == other.name;
  }
};

/*
  Runtime value of a template expression.

  Lists and dicts are shared, so `{% do items.append(x) %}` is seen by
  every name bound to the same list. ToString() renders the way Jinja
  prints Python values: True/False/None, and ['a', 1] for lists.
*/
class Value {
 public:
  enum class Kind {
    kNone,
    kBool,
    kInt,
    kFloat,
    kString,
    kList,
    kDict,
    kMacro,
  };

  Value() = default;
  Value(bool b) : data_(b) {
  }
  Value(std::int64_t i) : data_(i) {
  }
  Value(int i) : data_(static_cast<std::int64_t>(i)) {
  }
  Value(double d) : data_(d) {
  }
  Value(std::string s) : data_(std::move(s)) {
  }
  Value(const char* s) : data_(std::string(s)) {
  }
  Value(MacroHandle m) : data_(std::move(m)) {
  }

  static Value MakeList(List items = {});
  static Value MakeDict(Dict entries = {});

  Kind GetKind() const;
  const char* TypeName() const;

  bool IsNone() const {
    return std::holds_alternative<NoneValue>(data_);
  }
  bool IsString() const {
    return std::holds_alternative<std::string>(data_);
  }
  bool IsNumber() const;

  bool               AsBool() const;
  std::int64_t       AsInt() const;
  double             AsFloat() const;
  const std::string& AsString() const;
  List&              AsList() const;
  Dict&              AsDict() const;
  const MacroHandle& AsMacro() const;

  // Dict lookup; nullptr when absent or not a dict.
  const Value* Get(const std::string& key) const;
  void         Set(const std::string& key, Value value) const;

  bool        Truthy() const;
  std::string ToString() const;
  std::string Repr() const;

  // Elements of a list, the keys of a dict, the characters of a string.
  List Iterate() const;

  std::size_t Length() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const {
    return !(*this == other);
  }

  // Numbers compare with numbers, strings with strings.
  static int Compare(const Value& lhs, const Value& rhs);

 private:
  std::variant<NoneValue, bool, std::int64_t, double, std::string, std::shared_ptr<List>, std::shared_ptr<Dict>, MacroHandle>
      data_;
};

} // namespace colguard::render
