#include "internal/render/template_renderer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>
#include <type_traits>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/render/template_parser.hpp"
#include "internal/util/errors.hpp"

namespace colguard::render {

struct TemplateRenderer::Frame {
  const Frame*                 parent = nullptr;
  std::map<std::string, Value> vars;

  const Value* Lookup(const std::string& name) const {
    for (const auto* frame = this; frame; frame = frame->parent) {
      if (auto it = frame->vars.find(name); it != frame->vars.end()) return &it->second;
    }
    return nullptr;
  }
};

struct TemplateRenderer::Context {
  const model::Model&           model;
  MacroTable                    local_macros;
  std::vector<model::Reference> references;
  std::set<std::string>         macros_used;
  std::set<std::string>         macro_lookups;
  std::vector<std::string>      chain;
};

namespace {

// Thrown by return(x); the enclosing macro call evaluates to x.
struct MacroReturn {
  Value value;
};

const std::set<std::string> kBuiltins = {"ref",        "source",         "config", "var",   "env_var", "return",
                                         "run_query",  "is_incremental", "log",    "range", "dict"};

void ExpectArgCount(const model::Model& model, const std::string& callee, std::size_t n, std::size_t min,
                    std::size_t max) {
  if (n < min || n > max) {
    throw util::TemplateSyntaxError(model.name, "'" + callee + "' takes " + std::to_string(min)
                                                    + (min == max ? "" : "-" + std::to_string(max))
                                                    + " arguments, got " + std::to_string(n));
  }
}

void ExpectArgs(const std::string& method, const std::vector<Value>& args, std::size_t min, std::size_t max) {
  if (args.size() < min || args.size() > max) {
    throw TemplateValueError("'" + method + "' takes " + std::to_string(min)
                             + (min == max ? "" : "-" + std::to_string(max)) + " arguments, got "
                             + std::to_string(args.size()));
  }
}

void Bind(std::map<std::string, Value>& vars, const std::vector<std::string>& targets, const Value& value) {
  if (targets.size() == 1) {
    vars[targets.front()] = value;
    return;
  }
  const auto& parts = value.AsList();
  if (parts.size() != targets.size()) {
    throw TemplateValueError("cannot unpack " + std::to_string(parts.size()) + " values into "
                             + std::to_string(targets.size()) + " names");
  }
  for (std::size_t i = 0; i < targets.size(); ++i) {
    vars[targets[i]] = parts[i];
  }
}

std::string Strip(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

std::string ToUpper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string ReplaceAll(std::string s, const std::string& from, const std::string& to) {
  if (from.empty()) return s;
  for (std::size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
  return s;
}

std::string Join(const Value& items, const std::string& sep) {
  std::string out;
  bool        first = true;
  for (const auto& item : items.Iterate()) {
    if (!first) out += sep;
    out += item.ToString();
    first = false;
  }
  return out;
}

List Split(const std::string& s, const Value* sep) {
  List out;
  if (!sep || sep->IsNone()) {
    std::size_t i = 0;
    while (i < s.size()) {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
      const auto begin = i;
      while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
      if (i > begin) out.emplace_back(s.substr(begin, i - begin));
    }
    return out;
  }

  const auto& delim = sep->AsString();
  if (delim.empty()) throw TemplateValueError("empty separator");
  std::size_t begin = 0;
  for (auto pos = s.find(delim); pos != std::string::npos; pos = s.find(delim, begin)) {
    out.emplace_back(s.substr(begin, pos - begin));
    begin = pos + delim.size();
  }
  out.emplace_back(s.substr(begin));
  return out;
}

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
  auto q = a / b;
  if (a % b != 0 && ((a < 0) != (b < 0))) --q;
  return q;
}

std::int64_t FloorMod(std::int64_t a, std::int64_t b) {
  auto r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) r += b;
  return r;
}

Value Arithmetic(const std::string& op, const Value& a, const Value& b) {
  if (op == "+") {
    if (a.IsString() && b.IsString()) return Value(a.AsString() + b.AsString());
    if (a.GetKind() == Value::Kind::kList && b.GetKind() == Value::Kind::kList) {
      List joined = a.AsList();
      joined.insert(joined.end(), b.AsList().begin(), b.AsList().end());
      return Value::MakeList(std::move(joined));
    }
  }
  if (!a.IsNumber() || !b.IsNumber()) {
    throw TemplateValueError("unsupported operand types for " + op + ": " + a.TypeName() + " and " + b.TypeName());
  }

  const bool ints = a.GetKind() != Value::Kind::kFloat && b.GetKind() != Value::Kind::kFloat;
  if (op == "+") return ints ? Value(a.AsInt() + b.AsInt()) : Value(a.AsFloat() + b.AsFloat());
  if (op == "-") return ints ? Value(a.AsInt() - b.AsInt()) : Value(a.AsFloat() - b.AsFloat());
  if (op == "*") return ints ? Value(a.AsInt() * b.AsInt()) : Value(a.AsFloat() * b.AsFloat());

  if (op == "**") {
    if (ints && b.AsInt() >= 0) {
      std::int64_t out = 1;
      for (std::int64_t i = 0; i < b.AsInt(); ++i) out *= a.AsInt();
      return Value(out);
    }
    return Value(std::pow(a.AsFloat(), b.AsFloat()));
  }

  if (b.AsFloat() == 0.0) throw TemplateValueError("division by zero");
  if (op == "/") return Value(a.AsFloat() / b.AsFloat());
  if (op == "//") return ints ? Value(FloorDiv(a.AsInt(), b.AsInt())) : Value(std::floor(a.AsFloat() / b.AsFloat()));
  if (op == "%") {
    if (ints) return Value(FloorMod(a.AsInt(), b.AsInt()));
    const auto r = std::fmod(a.AsFloat(), b.AsFloat());
    return Value(r != 0.0 && ((r < 0) != (b.AsFloat() < 0)) ? r + b.AsFloat() : r);
  }
  throw TemplateValueError("unknown operator '" + op + "'");
}

bool Contains(const Value& container, const Value& item) {
  switch (container.GetKind()) {
    case Value::Kind::kList:
      return std::find(container.AsList().begin(), container.AsList().end(), item) != container.AsList().end();
    case Value::Kind::kDict:
      return item.IsString() && container.Get(item.AsString()) != nullptr;
    case Value::Kind::kString:
      return container.AsString().find(item.AsString()) != std::string::npos;
    default:
      throw TemplateValueError(std::string("'in' needs a list, dict or string, got ") + container.TypeName());
  }
}

Value Subscript(const Value& object, const Value& index) {
  switch (object.GetKind()) {
    case Value::Kind::kDict: {
      const auto* found = object.Get(index.ToString());
      return found ? *found : Value();
    }
    case Value::Kind::kList:
    case Value::Kind::kString: {
      const auto size = static_cast<std::int64_t>(object.Length());
      auto       i    = index.AsInt();
      if (i < 0) i += size;
      if (i < 0 || i >= size) throw TemplateValueError("index " + index.ToString() + " out of range");
      if (object.IsString()) return Value(std::string(1, object.AsString()[static_cast<std::size_t>(i)]));
      return object.AsList()[static_cast<std::size_t>(i)];
    }
    default:
      throw TemplateValueError(std::string("'") + object.TypeName() + "' value is not subscriptable");
  }
}

// str / list / dict methods.
Value CallMethod(const Value& object, const std::string& method, const std::vector<Value>& args) {
  if (object.IsString()) {
    const auto& s = object.AsString();
    if (method == "upper") return Value(ToUpper(s));
    if (method == "lower") return Value(ToLower(s));
    if (method == "strip") return Value(Strip(s));
    if (method == "split") {
      ExpectArgs(method, args, 0, 1);
      return Value::MakeList(Split(s, args.empty() ? nullptr : &args[0]));
    }
    if (method == "replace") {
      ExpectArgs(method, args, 2, 2);
      return Value(ReplaceAll(s, args[0].AsString(), args[1].AsString()));
    }
    if (method == "startswith") {
      ExpectArgs(method, args, 1, 1);
      return Value(s.rfind(args[0].AsString(), 0) == 0);
    }
    if (method == "endswith") {
      ExpectArgs(method, args, 1, 1);
      const auto& suffix = args[0].AsString();
      return Value(s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
    }
    if (method == "join") {
      ExpectArgs(method, args, 1, 1);
      return Value(Join(args[0], s));
    }
  } else if (object.GetKind() == Value::Kind::kList) {
    if (method == "append") {
      ExpectArgs(method, args, 1, 1);
      object.AsList().push_back(args[0]);
      return Value();
    }
    if (method == "extend") {
      ExpectArgs(method, args, 1, 1);
      for (auto& item : args[0].Iterate()) object.AsList().push_back(std::move(item));
      return Value();
    }
  } else if (object.GetKind() == Value::Kind::kDict) {
    if (method == "get") {
      ExpectArgs(method, args, 1, 2);
      const auto* found = object.Get(args[0].ToString());
      return found ? *found : args.size() == 2 ? args[1] : Value();
    }
    if (method == "items" || method == "keys" || method == "values") {
      List out;
      for (const auto& [k, v] : object.AsDict()) {
        if (method == "items") out.push_back(Value::MakeList(List{Value(k), v}));
        if (method == "keys") out.emplace_back(k);
        if (method == "values") out.push_back(v);
      }
      return Value::MakeList(std::move(out));
    }
    if (method == "update") {
      ExpectArgs(method, args, 1, 1);
      for (const auto& [k, v] : args[0].AsDict()) object.Set(k, v);
      return Value();
    }
  }
  throw TemplateValueError(std::string("'") + object.TypeName() + "' value has no method '" + method + "'");
}

} // namespace

TemplateRenderer::TemplateRenderer(const model::Project& project, RenderSettings settings)
    : project_(project), settings_(std::move(settings)) {
  if (settings_.macro_depth_limit == 0) {
    settings_.macro_depth_limit = kDefaultMacroDepthLimit;
  }
  if (settings_.adapter_type.empty()) {
    settings_.adapter_type = "default";
  }

  for (const auto& [name, macro] : project_.macros) {
    auto compiled = Compile(macro);
    if (!compiled.error.empty()) {
      COLGUARD_LOG_WARN("macro failed to parse", {observability::StringField("macro", name),
                                                  observability::StringField("error", compiled.error)});
    }
    macros_.emplace(name, std::move(compiled));
  }
}

TemplateRenderer::CompiledMacro TemplateRenderer::Compile(const model::Macro& macro) {
  CompiledMacro out;
  out.macro = macro;

  try {
    out.body = ParseTemplate(macro.body);
    for (const auto& param : macro.params) {
      out.defaults.push_back(param.default_value ? ParseExpression(*param.default_value) : nullptr);
    }
  } catch (const TemplateParseError& e) {
    out.error = e.what();
  }
  return out;
}

// ------------------------------------------------------------
// Render
// ------------------------------------------------------------

RenderResult TemplateRenderer::Render(const model::Model& model) const {
  Template parsed;
  try {
    parsed = ParseTemplate(model.raw_sql);
  } catch (const TemplateParseError& e) {
    throw util::TemplateSyntaxError(model.name, e.what());
  }

  Context ctx{model, {}, {}, {}, {}, {}};
  for (const auto& macro : parsed.macros) {
    auto compiled = Compile(macro);
    if (!compiled.error.empty()) {
      throw util::TemplateSyntaxError(model.name, "macro '" + macro.name + "': " + compiled.error);
    }
    compiled.local = true;
    ctx.local_macros.insert_or_assign(macro.name, std::move(compiled));
  }

  RenderResult result;
  Frame        globals;
  try {
    RenderBody(parsed.body, globals, ctx, result.sql);
  } catch (const TemplateValueError& e) {
    throw util::TemplateSyntaxError(model.name, e.what());
  } catch (const MacroReturn&) {
    throw util::TemplateSyntaxError(model.name, "return() called outside a macro");
  }

  result.references  = std::move(ctx.references);
  result.macros_used   = std::vector<std::string>(ctx.macros_used.begin(), ctx.macros_used.end());
  result.macro_lookups = std::vector<std::string>(ctx.macro_lookups.begin(), ctx.macro_lookups.end());
  return result;
}

std::string TemplateRenderer::RelationFor(const model::Reference& ref) const {
  if (ref.kind == model::ReferenceKind::kSource) {
    return ref.source_name + "." + ref.name;
  }
  if (settings_.target_schema.empty()) {
    return ref.name;
  }
  return settings_.target_schema + "." + ref.name;
}

void TemplateRenderer::RenderBody(const Body& body, Frame& frame, Context& ctx, std::string& out) const {
  for (const auto& node : body) {
    std::visit(
        [&](const auto& n) {
          using T = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<T, TextNode>) {
            out += n.text;
          } else if constexpr (std::is_same_v<T, OutputNode>) {
            out += Evaluate(*n.expr, frame, ctx).ToString();
          } else if constexpr (std::is_same_v<T, IfNode>) {
            for (const auto& [condition, branch] : n.branches) {
              if (Evaluate(*condition, frame, ctx).Truthy()) {
                RenderBody(branch, frame, ctx, out);
                return;
              }
            }
            RenderBody(n.otherwise, frame, ctx, out);
          } else if constexpr (std::is_same_v<T, ForNode>) {
            RenderFor(n, frame, ctx, out);
          } else if constexpr (std::is_same_v<T, SetNode>) {
            Bind(frame.vars, n.targets, Evaluate(*n.value, frame, ctx));
          } else if constexpr (std::is_same_v<T, SetBlockNode>) {
            std::string captured;
            RenderBody(n.body, frame, ctx, captured);
            frame.vars[n.name] = Value(std::move(captured));
          } else {
            (void)Evaluate(*n.expr, frame, ctx);
          }
        },
        node.node);
  }
}

// Assignments inside the loop body stay in the loop's frame.
void TemplateRenderer::RenderFor(const ForNode& node, Frame& frame, Context& ctx, std::string& out) const {
  List selected;
  for (auto& item : Evaluate(*node.iterable, frame, ctx).Iterate()) {
    if (node.filter) {
      Frame scope;
      scope.parent = &frame;
      Bind(scope.vars, node.targets, item);
      if (!Evaluate(*node.filter, scope, ctx).Truthy()) continue;
    }
    selected.push_back(std::move(item));
  }

  if (selected.empty()) {
    RenderBody(node.otherwise, frame, ctx, out);
    return;
  }

  const auto length = static_cast<std::int64_t>(selected.size());
  for (std::int64_t i = 0; i < length; ++i) {
    Frame scope;
    scope.parent = &frame;
    Bind(scope.vars, node.targets, selected[static_cast<std::size_t>(i)]);
    scope.vars["loop"] = Value::MakeDict(Dict{{"index", Value(i + 1)},
                                              {"index0", Value(i)},
                                              {"first", Value(i == 0)},
                                              {"last", Value(i + 1 == length)},
                                              {"length", Value(length)},
                                              {"revindex", Value(length - i)}});
    RenderBody(node.body, scope, ctx, out);
  }
}

// ------------------------------------------------------------
// Expressions
// ------------------------------------------------------------

Value TemplateRenderer::Evaluate(const TemplateExpr& expr, Frame& frame, Context& ctx) const {
  return std::visit(
      [&](const auto& node) -> Value {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, LiteralExpr>) {
          return node.value;
        } else if constexpr (std::is_same_v<T, NameRef>) {
          return EvaluateName(node.name, frame, ctx);
        } else if constexpr (std::is_same_v<T, ListExpr>) {
          List items;
          for (const auto& item : node.items) items.push_back(Evaluate(*item, frame, ctx));
          return Value::MakeList(std::move(items));
        } else if constexpr (std::is_same_v<T, DictExpr>) {
          auto dict = Value::MakeDict();
          for (const auto& [key, value] : node.entries) {
            dict.Set(Evaluate(*key, frame, ctx).ToString(), Evaluate(*value, frame, ctx));
          }
          return dict;
        } else if constexpr (std::is_same_v<T, AttributeExpr>) {
          const auto object = Evaluate(*node.object, frame, ctx);
          if (object.GetKind() != Value::Kind::kDict) {
            throw TemplateValueError(std::string("'") + object.TypeName() + "' value has no attribute '" + node.name
                                     + "'");
          }
          const auto* found = object.Get(node.name);
          return found ? *found : Value();
        } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
          return Subscript(Evaluate(*node.object, frame, ctx), Evaluate(*node.index, frame, ctx));
        } else if constexpr (std::is_same_v<T, CallExpr>) {
          return EvaluateCall(node, frame, ctx);
        } else if constexpr (std::is_same_v<T, FilterExpr>) {
          return ApplyFilter(node, frame, ctx);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
          const auto operand = Evaluate(*node.operand, frame, ctx);
          if (node.op == "not") return Value(!operand.Truthy());
          if (operand.GetKind() == Value::Kind::kFloat) return Value(-operand.AsFloat());
          return Value(-operand.AsInt());
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
          return EvaluateBinary(node, frame, ctx);
        } else if constexpr (std::is_same_v<T, CondExpr>) {
          if (Evaluate(*node.condition, frame, ctx).Truthy()) return Evaluate(*node.then, frame, ctx);
          return node.otherwise ? Evaluate(*node.otherwise, frame, ctx) : Value();
        } else {
          return EvaluateTest(node, frame, ctx);
        }
      },
      expr.node);
}

Value TemplateRenderer::EvaluateName(const std::string& name, Frame& frame, Context& ctx) const {
  if (const auto* bound = frame.Lookup(name)) {
    return *bound;
  }
  if (name == "this") {
    return Value(RelationFor(model::Reference{model::ReferenceKind::kModel, "", ctx.model.name}));
  }
  if (name == "target") {
    return Value::MakeDict(Dict{{"name", Value("default")},
                                {"schema", Value(settings_.target_schema)},
                                {"type", Value(settings_.adapter_type)},
                                {"database", Value()}});
  }
  // Compilation never executes queries.
  if (name == "execute") {
    return Value(false);
  }
  if (name == "adapter") {
    throw TemplateValueError("'adapter' is only usable through its methods");
  }
  if (kBuiltins.count(name) != 0 || FindMacro(name, ctx)) {
    return Value(MacroHandle{name});
  }

  throw util::UnresolvedReferenceError(ctx.model.name, "name '" + name + "'");
}

bool TemplateRenderer::IsGlobal(const std::string& name, const Frame& frame, Context& ctx) const {
  return frame.Lookup(name) || name == "this" || name == "target" || name == "execute" || kBuiltins.count(name) != 0
         || FindMacro(name, ctx);
}

Value TemplateRenderer::EvaluateCall(const CallExpr& call, Frame& frame, Context& ctx) const {
  std::vector<Value> args;
  for (const auto& arg : call.args) args.push_back(Evaluate(*arg, frame, ctx));
  Kwargs kwargs;
  for (const auto& kwarg : call.kwargs) kwargs.emplace_back(kwarg.name, Evaluate(*kwarg.value, frame, ctx));

  if (const auto* name = std::get_if<NameRef>(&call.callee->node)) {
    if (const auto* bound = frame.Lookup(name->name)) {
      return CallNamed(bound->AsMacro().name, args, kwargs, ctx);
    }
    return CallNamed(name->name, args, kwargs, ctx);
  }

  if (const auto* attr = std::get_if<AttributeExpr>(&call.callee->node)) {
    if (const auto* ns = std::get_if<NameRef>(&attr->object->node)) {
      if (ns->name == "adapter" && !frame.Lookup(ns->name)) {
        return CallAdapter(attr->name, args, ctx);
      }
      // package.macro(...)
      if (!IsGlobal(ns->name, frame, ctx)) {
        return CallNamed(ns->name + "." + attr->name, args, kwargs, ctx);
      }
    }
    return CallMethod(Evaluate(*attr->object, frame, ctx), attr->name, args);
  }

  return CallNamed(Evaluate(*call.callee, frame, ctx).AsMacro().name, args, kwargs, ctx);
}

Value TemplateRenderer::EvaluateBinary(const BinaryExpr& expr, Frame& frame, Context& ctx) const {
  const auto& op  = expr.op;
  auto        lhs = Evaluate(*expr.lhs, frame, ctx);

  if (op == "and") return lhs.Truthy() ? Evaluate(*expr.rhs, frame, ctx) : lhs;
  if (op == "or") return lhs.Truthy() ? lhs : Evaluate(*expr.rhs, frame, ctx);

  const auto rhs = Evaluate(*expr.rhs, frame, ctx);
  if (op == "~") return Value(lhs.ToString() + rhs.ToString());
  if (op == "==") return Value(lhs == rhs);
  if (op == "!=") return Value(lhs != rhs);
  if (op == "<") return Value(Value::Compare(lhs, rhs) < 0);
  if (op == "<=") return Value(Value::Compare(lhs, rhs) <= 0);
  if (op == ">") return Value(Value::Compare(lhs, rhs) > 0);
  if (op == ">=") return Value(Value::Compare(lhs, rhs) >= 0);
  if (op == "in") return Value(Contains(rhs, lhs));
  if (op == "not in") return Value(!Contains(rhs, lhs));
  return Arithmetic(op, lhs, rhs);
}

Value TemplateRenderer::EvaluateTest(const TestExpr& expr, Frame& frame, Context& ctx) const {
  bool result = false;

  if (expr.name == "defined" || expr.name == "undefined") {
    bool defined = false;
    if (const auto* name = std::get_if<NameRef>(&expr.operand->node)) {
      defined = IsGlobal(name->name, frame, ctx);
    } else {
      defined = !Evaluate(*expr.operand, frame, ctx).IsNone();
    }
    result = expr.name == "defined" ? defined : !defined;
  } else {
    const auto value = Evaluate(*expr.operand, frame, ctx);
    const auto kind  = value.GetKind();
    if (expr.name == "none") {
      result = value.IsNone();
    } else if (expr.name == "string") {
      result = value.IsString();
    } else if (expr.name == "number") {
      result = kind == Value::Kind::kInt || kind == Value::Kind::kFloat;
    } else if (expr.name == "mapping") {
      result = kind == Value::Kind::kDict;
    } else if (expr.name == "sequence" || expr.name == "iterable") {
      result = kind == Value::Kind::kList || kind == Value::Kind::kString || kind == Value::Kind::kDict;
    } else if (expr.name == "true" || expr.name == "false") {
      result = kind == Value::Kind::kBool && value.AsBool() == (expr.name == "true");
    } else if (expr.name == "even" || expr.name == "odd") {
      result = FloorMod(value.AsInt(), 2) == (expr.name == "even" ? 0 : 1);
    } else {
      throw util::TemplateSyntaxError(ctx.model.name, "unknown test '" + expr.name + "'");
    }
  }
  return Value(expr.negated ? !result : result);
}

Value TemplateRenderer::ApplyFilter(const FilterExpr& expr, Frame& frame, Context& ctx) const {
  std::vector<Value> args;
  for (const auto& arg : expr.args) args.push_back(Evaluate(*arg, frame, ctx));
  const auto& name = expr.name;

  if (name == "default" || name == "d") {
    ExpectArgs(name, args, 0, 2);
    const auto* ref = std::get_if<NameRef>(&expr.operand->node);
    if (ref && !IsGlobal(ref->name, frame, ctx)) return args.empty() ? Value("") : args[0];
    auto value = Evaluate(*expr.operand, frame, ctx);
    if (value.IsNone()) return args.empty() ? Value("") : args[0];
    return value;
  }

  const auto value = Evaluate(*expr.operand, frame, ctx);
  if (name == "join") {
    ExpectArgs(name, args, 0, 1);
    return Value(Join(value, args.empty() ? std::string() : args[0].AsString()));
  }
  if (name == "upper") return Value(ToUpper(value.AsString()));
  if (name == "lower") return Value(ToLower(value.AsString()));
  if (name == "trim") return Value(Strip(value.AsString()));
  if (name == "length" || name == "count") return Value(static_cast<std::int64_t>(value.Length()));
  if (name == "string") return Value(value.ToString());
  if (name == "list") return Value::MakeList(value.Iterate());
  if (name == "replace") {
    ExpectArgs(name, args, 2, 2);
    return Value(ReplaceAll(value.AsString(), args[0].AsString(), args[1].AsString()));
  }
  if (name == "first" || name == "last") {
    const auto items = value.Iterate();
    if (items.empty()) return Value();
    return name == "first" ? items.front() : items.back();
  }
  if (name == "int") {
    if (value.IsString()) return Value(static_cast<std::int64_t>(std::strtoll(value.AsString().c_str(), nullptr, 10)));
    return Value(value.AsInt());
  }
  throw util::TemplateSyntaxError(ctx.model.name, "unknown filter '" + name + "'");
}

// ------------------------------------------------------------
// Calls
// ------------------------------------------------------------

Value TemplateRenderer::CallNamed(const std::string&        name,
                                  const std::vector<Value>& args,
                                  const Kwargs&             kwargs,
                                  Context&                  ctx) const {
  const auto& model = ctx.model;

  if (name == "ref") {
    ExpectArgCount(model, name, args.size(), 1, 2);
    // ref('package', 'model'): the package is not part of the identity.
    const auto target = args.back().ToString();
    if (!project_.FindModel(target)) {
      throw util::UnresolvedReferenceError(model.name, "model '" + target + "'");
    }
    model::Reference ref{model::ReferenceKind::kModel, "", target};
    if (std::find(ctx.references.begin(), ctx.references.end(), ref) == ctx.references.end()) {
      ctx.references.push_back(ref);
    }
    return Value(RelationFor(ref));
  }

  if (name == "source") {
    ExpectArgCount(model, name, args.size(), 2, 2);
    const auto source_name = args[0].ToString();
    const auto table       = args[1].ToString();
    if (!project_.FindSource(source_name, table)) {
      throw util::UnresolvedReferenceError(model.name, "source '" + source_name + "." + table + "'");
    }
    model::Reference ref{model::ReferenceKind::kSource, source_name, table};
    if (std::find(ctx.references.begin(), ctx.references.end(), ref) == ctx.references.end()) {
      ctx.references.push_back(ref);
    }
    return Value(RelationFor(ref));
  }

  if (name == "var") {
    ExpectArgCount(model, name, args.size(), 1, 2);
    const auto key = args[0].ToString();
    if (auto it = project_.vars.find(key); it != project_.vars.end()) {
      return Value(it->second);
    }
    if (args.size() == 2) {
      return args[1];
    }
    throw util::UnresolvedReferenceError(model.name, "var '" + key + "'");
  }

  if (name == "env_var") {
    ExpectArgCount(model, name, args.size(), 1, 2);
    const auto key = args[0].ToString();
    if (const char* value = std::getenv(key.c_str())) {
      return Value(std::string(value));
    }
    if (args.size() == 2) {
      return args[1];
    }
    throw util::UnresolvedReferenceError(model.name, "env var '" + key + "'");
  }

  if (name == "return") {
    ExpectArgCount(model, name, args.size(), 1, 1);
    throw MacroReturn{args[0]};
  }

  if (name == "config" || name == "log") return Value("");
  if (name == "run_query") return Value();
  if (name == "is_incremental") return Value(false);

  if (name == "dict") {
    return Value::MakeDict(Dict(kwargs.begin(), kwargs.end()));
  }

  if (name == "range") {
    ExpectArgCount(model, name, args.size(), 1, 3);
    const auto start = args.size() == 1 ? 0 : args[0].AsInt();
    const auto stop  = args.size() == 1 ? args[0].AsInt() : args[1].AsInt();
    const auto step  = args.size() == 3 ? args[2].AsInt() : 1;
    if (step == 0) throw TemplateValueError("range() step must not be zero");
    List out;
    for (auto i = start; step > 0 ? i < stop : i > stop; i += step) out.emplace_back(i);
    return Value::MakeList(std::move(out));
  }

  const auto* compiled = FindMacro(name, ctx);
  if (!compiled) {
    throw util::UnresolvedReferenceError(model.name, "macro '" + name + "'");
  }
  return ExpandMacro(*compiled, args, kwargs, ctx);
}

Value TemplateRenderer::CallAdapter(const std::string& method, const std::vector<Value>& args, Context& ctx) const {
  if (method == "dispatch") {
    ExpectArgCount(ctx.model, "adapter.dispatch", args.size(), 1, 2);
    const auto name = args[0].AsString();
    for (const auto& candidate : {settings_.adapter_type + "__" + name, "default__" + name, name}) {
      if (FindMacro(candidate, ctx)) return Value(MacroHandle{candidate});
    }
    throw util::UnresolvedReferenceError(ctx.model.name, "macro '" + name + "'");
  }

  if (method == "quote") {
    ExpectArgCount(ctx.model, "adapter.quote", args.size(), 1, 1);
    const auto& type  = settings_.adapter_type;
    const char  quote = type == "bigquery" || type == "databricks" || type == "spark" ? '`' : '"';
    return Value(std::string(1, quote) + args[0].ToString() + quote);
  }

  if (method == "get_relation") {
    return Value();
  }

  throw util::TemplateSyntaxError(ctx.model.name, "adapter has no method '" + method + "'");
}

// ------------------------------------------------------------
// Macros
// ------------------------------------------------------------

// Model-local macros shadow project macros.
const TemplateRenderer::CompiledMacro* TemplateRenderer::FindMacro(const std::string& callee, Context& ctx) const {
  const auto dot  = callee.rfind('.');
  const auto bare = dot == std::string::npos ? callee : callee.substr(dot + 1);

  for (const auto& name : {callee, bare}) {
    if (auto it = ctx.local_macros.find(name); it != ctx.local_macros.end()) return &it->second;
  }
  for (const auto& name : {callee, bare}) {
    ctx.macro_lookups.insert(name);
    if (auto it = macros_.find(name); it != macros_.end()) return &it->second;
  }
  return nullptr;
}

Value TemplateRenderer::ExpandMacro(const CompiledMacro&      compiled,
                                    const std::vector<Value>& args,
                                    const Kwargs&             kwargs,
                                    Context&                  ctx) const {
  const auto& macro = compiled.macro;
  const auto& model = ctx.model;

  if (!compiled.error.empty()) {
    throw util::TemplateSyntaxError(model.name, "macro '" + macro.name + "': " + compiled.error);
  }

  ctx.chain.push_back(macro.name);
  if (ctx.chain.size() > settings_.macro_depth_limit) {
    throw util::MacroRecursionError(model.name, ctx.chain, settings_.macro_depth_limit);
  }
  if (!compiled.local) {
    ctx.macros_used.insert(macro.name);
  }

  if (args.size() > macro.params.size()) {
    throw util::TemplateSyntaxError(model.name, "macro '" + macro.name + "' takes " + std::to_string(macro.params.size())
                                                    + " arguments, got " + std::to_string(args.size()));
  }

  // Macros see their parameters and globals, never the caller's locals.
  Frame frame;
  for (std::size_t i = 0; i < args.size(); ++i) {
    frame.vars[macro.params[i].name] = args[i];
  }
  for (const auto& [name, value] : kwargs) {
    const auto known = std::any_of(macro.params.begin(), macro.params.end(),
                                   [&](const model::MacroParam& p) { return p.name == name; });
    if (!known) {
      throw util::TemplateSyntaxError(model.name, "macro '" + macro.name + "' has no parameter '" + name + "'");
    }
    frame.vars[name] = value;
  }
  for (std::size_t i = 0; i < macro.params.size(); ++i) {
    const auto& name = macro.params[i].name;
    if (frame.vars.count(name) != 0) continue;
    frame.vars[name] = compiled.defaults[i] ? Evaluate(*compiled.defaults[i], frame, ctx) : Value();
  }

  std::string out;
  try {
    RenderBody(compiled.body.body, frame, ctx, out);
  } catch (const MacroReturn& ret) {
    ctx.chain.pop_back();
    return ret.value;
  }
  ctx.chain.pop_back();
  return Value(std::move(out));
}

} // namespace colguard::render
