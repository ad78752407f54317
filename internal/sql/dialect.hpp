#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace colguard::sql {

enum class CaseFolding {
  kLower,       // unquoted identifiers fold to lower case
  kUpper,       // unquoted identifiers fold to upper case
  kInsensitive, // every identifier folds to lower case, quoted or not
};

/*
  Identifier rules for one SQL dialect.
*/
struct Dialect {
  std::string name;
  CaseFolding folding = CaseFolding::kLower;

  // `ident` quoting is accepted.
  bool backtick_identifiers = false;

  // "text" is a string literal rather than a quoted identifier.
  bool double_quoted_strings = false;

  // Backslash escapes the next character inside string literals.
  bool backslash_escapes = false;

  std::string NormalizeIdentifier(std::string_view text, bool quoted) const;

  // Documentation column names fold like unquoted identifiers.
  std::string NormalizeDocName(std::string_view text) const {
    return NormalizeIdentifier(text, false);
  }

  // Dotted relation name, each part folded as unquoted.
  std::string NormalizeRelation(std::string_view dotted) const;
};

// Throws std::invalid_argument for unknown dialect names.
Dialect DialectByName(const std::string& name);

std::vector<std::string> SupportedDialects();

} // namespace colguard::sql
