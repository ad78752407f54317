#include "internal/sql/dialect.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace colguard::sql {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string Upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
  return out;
}

} // namespace

std::string Dialect::NormalizeIdentifier(std::string_view text, bool quoted) const {
  switch (folding) {
    case CaseFolding::kInsensitive:
      return Lower(text);
    case CaseFolding::kUpper:
      return quoted ? std::string(text) : Upper(text);
    case CaseFolding::kLower:
      break;
  }
  return quoted ? std::string(text) : Lower(text);
}

std::string Dialect::NormalizeRelation(std::string_view dotted) const {
  std::string out;
  std::size_t start = 0;
  while (true) {
    const auto dot  = dotted.find('.', start);
    const auto part = dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (!out.empty()) out += '.';
    out += NormalizeIdentifier(part, false);
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return out;
}

Dialect DialectByName(const std::string& name) {
  const auto key = Lower(name);

  if (key == "ansi" || key == "postgres" || key == "redshift" || key == "duckdb") {
    return Dialect{key, CaseFolding::kLower, false, false, false};
  }
  if (key == "snowflake") {
    return Dialect{key, CaseFolding::kUpper, false, false, true};
  }
  if (key == "bigquery" || key == "databricks" || key == "spark") {
    return Dialect{key, CaseFolding::kInsensitive, true, true, true};
  }

  throw std::invalid_argument("unknown SQL dialect '" + name + "'");
}

std::vector<std::string> SupportedDialects() {
  return {"ansi", "bigquery", "databricks", "duckdb", "postgres", "redshift", "snowflake", "spark"};
}

} // namespace colguard::sql
