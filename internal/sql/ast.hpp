#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace colguard::sql {

/*
  Closed representation of the query constructs the resolver understands,
  built from the PostgreSQL parse tree.

  Identifiers are stored already folded for the parse dialect. Every
  variant is visited exhaustively by the resolver.
*/

struct Expr;
struct Query;
struct SetExpr;
struct TableRef;

using ExprPtr     = std::unique_ptr<Expr>;
using QueryPtr    = std::unique_ptr<Query>;
using SetExprPtr  = std::unique_ptr<SetExpr>;
using TableRefPtr = std::unique_ptr<TableRef>;

// ------------------------------------------------------------
// Expressions
// ------------------------------------------------------------

// a / t.a / schema.t.a
struct ColumnRef {
  std::vector<std::string> parts;

  const std::string& Name() const {
    return parts.back();
  }
};

struct Literal {
  std::string text;
};

// count(*) argument, or a bare `t.*` inside an expression.
struct Star {
  std::string qualifier;
};

struct WindowSpec {
  std::vector<ExprPtr> partition_by;
  std::vector<ExprPtr> order_by;
};

struct FunctionCall {
  std::string          name;
  std::vector<ExprPtr> args;
  ExprPtr              filter;       // FILTER (WHERE ...)
  std::vector<ExprPtr> order_by;     // aggregate ORDER BY
  std::vector<ExprPtr> within_group; // WITHIN GROUP (ORDER BY ...)
  std::unique_ptr<WindowSpec> over;
};

// Unary, binary and n-ary operators (BETWEEN, IS, LIKE, subscripts, rows).
struct Operation {
  std::string          op;
  std::vector<ExprPtr> operands;
};

struct Case {
  ExprPtr                                   operand; // CASE x WHEN ...
  std::vector<std::pair<ExprPtr, ExprPtr>>  whens;
  ExprPtr                                   otherwise;
};

struct Cast {
  ExprPtr     expr;
  std::string type;
};

struct Subquery {
  QueryPtr query;
};

struct Exists {
  QueryPtr query;
};

struct InList {
  ExprPtr              expr;
  std::vector<ExprPtr> items;
  QueryPtr             subquery;
};

struct Expr {
  std::variant<ColumnRef, Literal, Star, FunctionCall, Operation, Case, Cast, Subquery, Exists, InList> node;
};

// ------------------------------------------------------------
// FROM clause
// ------------------------------------------------------------

struct NamedTable {
  std::vector<std::string> parts;
  std::string              alias;
  std::vector<std::string> column_aliases;
};

struct DerivedTable {
  QueryPtr                 query;
  std::string              alias;
  std::vector<std::string> column_aliases;
};

// generate_series(...), unnest(...) and other set-returning functions.
struct TableFunction {
  std::string              name;
  std::vector<ExprPtr>     args;
  std::string              alias;
  std::vector<std::string> column_aliases;
};

enum class JoinKind {
  kInner,
  kLeft,
  kRight,
  kFull,
  kCross,
};

struct Join {
  JoinKind                 kind = JoinKind::kInner;
  bool                     natural = false;
  TableRefPtr              left;
  TableRefPtr              right;
  ExprPtr                  on;
  std::vector<std::string> using_columns;
};

struct TableRef {
  std::variant<NamedTable, DerivedTable, TableFunction, Join> node;
};

// ------------------------------------------------------------
// SELECT
// ------------------------------------------------------------

// * or t.*
struct Wildcard {
  std::string qualifier;
};

struct ExprItem {
  ExprPtr     expr;
  std::string alias; // empty = derive from the expression
};

using SelectItem = std::variant<Wildcard, ExprItem>;

struct Select {
  bool                     distinct = false;
  std::vector<ExprPtr>     distinct_on;
  std::vector<SelectItem>  items;
  std::vector<TableRefPtr> from;
  ExprPtr                  where;
  std::vector<ExprPtr>     group_by;
  ExprPtr                  having;
  std::vector<ExprPtr>     window; // named WINDOW definitions, flattened
};

enum class SetOperator {
  kUnion,
  kIntersect,
  kExcept,
};

struct SetOperation {
  SetOperator op = SetOperator::kUnion;
  bool        all = false;
  SetExprPtr  left;
  SetExprPtr  right;
};

struct Values {
  std::vector<std::vector<ExprPtr>> rows;
};

struct SetExpr {
  std::variant<Select, SetOperation, QueryPtr, Values> node;
};

struct Cte {
  std::string              name;
  std::vector<std::string> column_aliases;
  QueryPtr                 query;
};

struct Query {
  bool                 recursive = false;
  std::vector<Cte>     ctes;
  SetExprPtr           body;
  std::vector<ExprPtr> order_by;
  ExprPtr              limit;
  ExprPtr              offset;
};

} // namespace colguard::sql
