#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/sql/ast.hpp"
#include "internal/sql/dialect.hpp"

namespace colguard::sql {

// Parse failure or a statement the resolver cannot use; model-agnostic.
class SqlSyntaxError : public std::runtime_error {
 public:
  explicit SqlSyntaxError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Parses a single SELECT statement with libpg_query and maps the
  PostgreSQL parse tree onto the closed AST.

  The grammar is PostgreSQL's. Dialect quoting differences (backtick
  identifiers, double-quoted strings, backslash escapes) are rewritten
  to PostgreSQL form first, and identifiers are folded for the dialect
  afterwards. Throws SqlSyntaxError.
*/
QueryPtr ParseQuery(std::string_view sql, const Dialect& dialect);

// The text handed to the PostgreSQL parser for `sql`.
std::string ToPostgresQuoting(std::string_view sql, const Dialect& dialect);

} // namespace colguard::sql
