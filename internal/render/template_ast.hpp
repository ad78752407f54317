#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/model/model.hpp"
#include "internal/render/template_value.hpp"

namespace colguard::render {

/*
  Typed directive tree for one template.

  Text outside directives is kept verbatim, so a template with no
  directives renders to exactly its input.
*/

struct TemplateExpr;
using TemplateExprPtr = std::unique_ptr<TemplateExpr>;

// 'text', 42, 1.5, true, none
struct LiteralExpr {
  Value value;
};

struct NameRef {
  std::string name;
};

struct ListExpr {
  std::vector<TemplateExprPtr> items;
};

struct DictExpr {
  std::vector<std::pair<TemplateExprPtr, TemplateExprPtr>> entries;
};

// obj.name
struct AttributeExpr {
  TemplateExprPtr object;
  std::string     name;
};

// obj[index]
struct SubscriptExpr {
  TemplateExprPtr object;
  TemplateExprPtr index;
};

struct KeywordArg {
  std::string     name;
  TemplateExprPtr value;
};

// ref(...), dbt_utils.star(...), adapter.dispatch('x')(...), ...
struct CallExpr {
  TemplateExprPtr              callee;
  std::vector<TemplateExprPtr> args;
  std::vector<KeywordArg>      kwargs;
};

// value | name(args)
struct FilterExpr {
  TemplateExprPtr              operand;
  std::string                  name;
  std::vector<TemplateExprPtr> args;
};

// `not x`, `-x`
struct UnaryExpr {
  std::string     op;
  TemplateExprPtr operand;
};

// and, or, comparisons, in, arithmetic and ~
struct BinaryExpr {
  std::string     op;
  TemplateExprPtr lhs;
  TemplateExprPtr rhs;
};

// then if condition else otherwise
struct CondExpr {
  TemplateExprPtr then;
  TemplateExprPtr condition;
  TemplateExprPtr otherwise; // null renders as none
};

// x is [not] defined / none / string / ...
struct TestExpr {
  TemplateExprPtr operand;
  std::string     name;
  bool            negated = false;
};

struct TemplateExpr {
  std::variant<LiteralExpr, NameRef, ListExpr, DictExpr, AttributeExpr, SubscriptExpr, CallExpr, FilterExpr, UnaryExpr,
               BinaryExpr, CondExpr, TestExpr>
      node;
};

// ------------------------------------------------------------
// Statements
// ------------------------------------------------------------

struct Node;
using Body = std::vector<Node>;

struct TextNode {
  std::string text;
};

// {{ expr }}
struct OutputNode {
  TemplateExprPtr expr;
};

// {% if %} / {% elif %} / {% else %} / {% endif %}
struct IfNode {
  std::vector<std::pair<TemplateExprPtr, Body>> branches;
  Body                                          otherwise;
};

// {% for a, b in items if cond %} ... {% else %} ... {% endfor %}
struct ForNode {
  std::vector<std::string> targets;
  TemplateExprPtr          iterable;
  TemplateExprPtr          filter; // optional inline `if`
  Body                     body;
  Body                     otherwise; // rendered when nothing was iterated
};

// {% set a, b = expr %}
struct SetNode {
  std::vector<std::string> targets;
  TemplateExprPtr          value;
};

// {% set name %} ... {% endset %}
struct SetBlockNode {
  std::string name;
  Body        body;
};

// {% do expr %}
struct DoNode {
  TemplateExprPtr expr;
};

struct Node {
  std::variant<TextNode, OutputNode, IfNode, ForNode, SetNode, SetBlockNode, DoNode> node;
};

struct Template {
  Body body;

  // {% macro %} blocks defined inline, in definition order.
  std::vector<model::Macro> macros;
};

} // namespace colguard::render
