#include "internal/render/template_value.hpp"

#include <charconv>
#include <cmath>

namespace colguard::render {

Value Value::MakeList(List items) {
  Value v;
  v.data_ = std::make_shared<List>(std::move(items));
  return v;
}

Value Value::MakeDict(Dict entries) {
  Value v;
  v.data_ = std::make_shared<Dict>(std::move(entries));
  return v;
}

Value::Kind Value::GetKind() const {
  return static_cast<Kind>(data_.index());
}

const char* Value::TypeName() const {
  switch (GetKind()) {
    case Kind::kNone: return "none";
    case Kind::kBool: return "bool";
    case Kind::kInt: return "int";
    case Kind::kFloat: return "float";
    case Kind::kString: return "string";
    case Kind::kList: return "list";
    case Kind::kDict: return "dict";
    case Kind::kMacro: return "macro";
  }
  return "value";
}

bool Value::IsNumber() const {
  const auto kind = GetKind();
  return kind == Kind::kBool || kind == Kind::kInt || kind == Kind::kFloat;
}

bool Value::AsBool() const {
  if (const auto* b = std::get_if<bool>(&data_)) return *b;
  throw TemplateValueError(std::string("expected a bool, got ") + TypeName());
}

std::int64_t Value::AsInt() const {
  switch (GetKind()) {
    case Kind::kBool: return std::get<bool>(data_) ? 1 : 0;
    case Kind::kInt: return std::get<std::int64_t>(data_);
    case Kind::kFloat: return static_cast<std::int64_t>(std::get<double>(data_));
    default: throw TemplateValueError(std::string("expected a number, got ") + TypeName());
  }
}

double Value::AsFloat() const {
  if (const auto* d = std::get_if<double>(&data_)) return *d;
  return static_cast<double>(AsInt());
}

const std::string& Value::AsString() const {
  if (const auto* s = std::get_if<std::string>(&data_)) return *s;
  throw TemplateValueError(std::string("expected a string, got ") + TypeName());
}

List& Value::AsList() const {
  if (const auto* l = std::get_if<std::shared_ptr<List>>(&data_)) return **l;
  throw TemplateValueError(std::string("expected a list, got ") + TypeName());
}

Dict& Value::AsDict() const {
  if (const auto* d = std::get_if<std::shared_ptr<Dict>>(&data_)) return **d;
  throw TemplateValueError(std::string("expected a dict, got ") + TypeName());
}

const MacroHandle& Value::AsMacro() const {
  if (const auto* m = std::get_if<MacroHandle>(&data_)) return *m;
  throw TemplateValueError(std::string("'") + TypeName() + "' value is not callable");
}

const Value* Value::Get(const std::string& key) const {
  const auto* d = std::get_if<std::shared_ptr<Dict>>(&data_);
  if (!d) return nullptr;
  for (const auto& [k, v] : **d) {
    if (k == key) return &v;
  }
  return nullptr;
}

void Value::Set(const std::string& key, Value value) const {
  auto& dict = AsDict();
  for (auto& [k, v] : dict) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  dict.emplace_back(key, std::move(value));
}

bool Value::Truthy() const {
  switch (GetKind()) {
    case Kind::kNone: return false;
    case Kind::kBool: return std::get<bool>(data_);
    case Kind::kInt: return std::get<std::int64_t>(data_) != 0;
    case Kind::kFloat: return std::get<double>(data_) != 0.0;
    case Kind::kString: return !std::get<std::string>(data_).empty();
    case Kind::kList: return !AsList().empty();
    case Kind::kDict: return !AsDict().empty();
    case Kind::kMacro: return true;
  }
  return false;
}

namespace {

std::string FormatFloat(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  std::string out(buf, ec == std::errc() ? end : buf);
  if (out.find_first_of(".en") == std::string::npos) out += ".0";
  return out;
}

std::string QuoteString(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

std::string Value::ToString() const {
  switch (GetKind()) {
    case Kind::kNone: return "None";
    case Kind::kBool: return std::get<bool>(data_) ? "True" : "False";
    case Kind::kInt: return std::to_string(std::get<std::int64_t>(data_));
    case Kind::kFloat: return FormatFloat(std::get<double>(data_));
    case Kind::kString: return std::get<std::string>(data_);
    case Kind::kMacro: return "<macro " + std::get<MacroHandle>(data_).name + ">";
    case Kind::kList: {
      std::string out = "[";
      for (const auto& item : AsList()) {
        if (out.size() > 1) out += ", ";
        out += item.Repr();
      }
      return out + "]";
    }
    case Kind::kDict: {
      std::string out = "{";
      for (const auto& [k, v] : AsDict()) {
        if (out.size() > 1) out += ", ";
        out += QuoteString(k) + ": " + v.Repr();
      }
      return out + "}";
    }
  }
  return "";
}

std::string Value::Repr() const {
  return IsString() ? QuoteString(AsString()) : ToString();
}

List Value::Iterate() const {
  switch (GetKind()) {
    case Kind::kList: return AsList();
    case Kind::kDict: {
      List keys;
      for (const auto& [k, v] : AsDict()) keys.emplace_back(k);
      return keys;
    }
    case Kind::kString: {
      List chars;
      for (char c : AsString()) chars.emplace_back(std::string(1, c));
      return chars;
    }
    case Kind::kNone: return {};
    default: throw TemplateValueError(std::string("'") + TypeName() + "' value is not iterable");
  }
}

std::size_t Value::Length() const {
  switch (GetKind()) {
    case Kind::kList: return AsList().size();
    case Kind::kDict: return AsDict().size();
    case Kind::kString: return AsString().size();
    default: throw TemplateValueError(std::string("'") + TypeName() + "' value has no length");
  }
}

bool Value::operator==(const Value& other) const {
  if (IsNumber() && other.IsNumber()) {
    return AsFloat() == other.AsFloat();
  }
  if (GetKind() != other.GetKind()) return false;

  switch (GetKind()) {
    case Kind::kList: return AsList() == other.AsList();
    case Kind::kDict: return AsDict() == other.AsDict();
    default: return data_ == other.data_;
  }
}

int Value::Compare(const Value& lhs, const Value& rhs) {
  if (lhs.IsNumber() && rhs.IsNumber()) {
    const auto a = lhs.AsFloat();
    const auto b = rhs.AsFloat();
    return a < b ? -1 : a > b ? 1 : 0;
  }
  if (lhs.IsString() && rhs.IsString()) {
    return lhs.AsString().compare(rhs.AsString()) < 0 ? -1 : lhs.AsString() == rhs.AsString() ? 0 : 1;
  }
  throw TemplateValueError(std::string("cannot compare ") + lhs.TypeName() + " with " + rhs.TypeName());
}

} // namespace colguard::render
