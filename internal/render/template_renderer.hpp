#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/model.hpp"
#include "internal/model/reference.hpp"
#include "internal/render/template_ast.hpp"

namespace colguard::render {

inline constexpr std::size_t kDefaultMacroDepthLimit = 32;

struct RenderSettings {
  std::size_t macro_depth_limit = kDefaultMacroDepthLimit;
  std::string target_schema; // empty = unqualified model relations

  // Exposed as target.type and used by adapter.dispatch; empty = "default".
  std::string adapter_type;
};

struct RenderResult {
  std::string                   sql;
  std::vector<model::Reference> references;  // deduplicated, first-use order
  std::vector<std::string>      macros_used; // project macros only, sorted

  // Every project macro name looked up, found or not, sorted. Adding or
  // editing any of them can change the output.
  std::vector<std::string> macro_lookups;
};

/*
  Expands ref / source / var / config / macro directives into plain SQL.

  Control flow ({% if %}, {% for %}, {% set %}, {% do %}) runs over
  template values. Warehouse-facing calls (run_query, adapter.get_relation,
  is_incremental) have fixed offline answers: none, none and false.

  Project macros are parsed once at construction; Render() only reads
  shared state and is safe to call from several threads.
*/
class TemplateRenderer {
 public:
  TemplateRenderer(const model::Project& project, RenderSettings settings);

  RenderResult Render(const model::Model& model) const;

  // Identifier substituted for a reference in rendered SQL.
  std::string RelationFor(const model::Reference& ref) const;

  const RenderSettings& Settings() const {
    return settings_;
  }

 private:
  struct CompiledMacro {
    model::Macro                 macro;
    Template                     body;
    std::vector<TemplateExprPtr> defaults; // parallel to macro.params
    std::string                  error;    // parse failure, raised on first call
    bool                         local = false;
  };

  using MacroTable = std::map<std::string, CompiledMacro>;
  using Kwargs     = std::vector<std::pair<std::string, Value>>;

  struct Frame;
  struct Context;

  static CompiledMacro Compile(const model::Macro& macro);

  void RenderBody(const Body& body, Frame& frame, Context& ctx, std::string& out) const;
  void RenderFor(const ForNode& node, Frame& frame, Context& ctx, std::string& out) const;

  Value Evaluate(const TemplateExpr& expr, Frame& frame, Context& ctx) const;
  Value EvaluateName(const std::string& name, Frame& frame, Context& ctx) const;
  Value EvaluateCall(const CallExpr& call, Frame& frame, Context& ctx) const;
  Value EvaluateBinary(const BinaryExpr& expr, Frame& frame, Context& ctx) const;
  Value EvaluateTest(const TestExpr& expr, Frame& frame, Context& ctx) const;
  Value ApplyFilter(const FilterExpr& expr, Frame& frame, Context& ctx) const;

  // Built-in functions, then macros.
  Value CallNamed(const std::string& name, const std::vector<Value>& args, const Kwargs& kwargs, Context& ctx) const;
  Value CallAdapter(const std::string& method, const std::vector<Value>& args, Context& ctx) const;
  Value ExpandMacro(const CompiledMacro& compiled, const std::vector<Value>& args, const Kwargs& kwargs,
                    Context& ctx) const;

  const CompiledMacro* FindMacro(const std::string& callee, Context& ctx) const;
  bool                 IsGlobal(const std::string& name, const Frame& frame, Context& ctx) const;

  const model::Project& project_;
  RenderSettings        settings_;
  MacroTable            macros_;
};

} // namespace colguard::render
