#include "internal/sql/parser.hpp"

extern "C" {
#include <pg_query.h>
}

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

namespace colguard::sql {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

// Owns a libpg_query parse result.
class ParseResult {
 public:
  explicit ParseResult(PgQueryParseResult result) : result_(result) {
  }

  ~ParseResult() {
    pg_query_free_parse_result(result_);
  }

  ParseResult(const ParseResult&)            = delete;
  ParseResult& operator=(const ParseResult&) = delete;

  const PgQueryParseResult* operator->() const {
    return &result_;
  }

 private:
  PgQueryParseResult result_;
};

// ------------------------------------------------------------
// Parse tree access
// ------------------------------------------------------------

// Absent fields and JSON nulls both read as nullptr.
const Value* Field(const Struct& node, const char* key) {
  const auto& fields = node.fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

std::string Str(const Struct& node, const char* key) {
  const auto* v = Field(node, key);
  return v && v->kind_case() == Value::kStringValue ? v->string_value() : std::string();
}

bool Flag(const Struct& node, const char* key) {
  const auto* v = Field(node, key);
  return v && v->kind_case() == Value::kBoolValue && v->bool_value();
}

int Location(const Struct& node) {
  const auto* v = Field(node, "location");
  return v && v->kind_case() == Value::kNumberValue ? static_cast<int>(v->number_value()) : -1;
}

// A tagged node: {"ColumnRef": {...}}.
struct Node {
  std::string   type;
  const Struct* body = nullptr;

  explicit operator bool() const {
    return body != nullptr;
  }
};

Node NodeOf(const Value& value) {
  if (value.kind_case() != Value::kStructValue) return {};
  const auto& fields = value.struct_value().fields();
  if (fields.size() != 1) return {};

  const auto& [type, body] = *fields.begin();
  if (type.empty() || !std::isupper(static_cast<unsigned char>(type.front())) || body.kind_case() != Value::kStructValue) {
    return {};
  }
  return Node{type, &body.struct_value()};
}

// Typed pointer fields appear either tagged or bare; a different tag is nullptr.
const Struct* Body(const Value* value, const char* type) {
  if (!value || value->kind_case() != Value::kStructValue) return nullptr;
  if (auto node = NodeOf(*value)) {
    return node.type == type ? node.body : nullptr;
  }
  return &value->struct_value();
}

const Value& Required(const Struct& node, const char* key, const std::string& what) {
  const auto* v = Field(node, key);
  if (!v) throw SqlSyntaxError(what + " without " + key);
  return *v;
}

// JSON arrays and PostgreSQL List nodes.
std::vector<const Value*> Items(const Value* value) {
  std::vector<const Value*> out;
  if (!value) return out;

  if (value->kind_case() == Value::kListValue) {
    for (const auto& v : value->list_value().values()) out.push_back(&v);
    return out;
  }
  if (auto node = NodeOf(*value); node && node.type == "List") {
    return Items(Field(*node.body, "items"));
  }
  return out;
}

std::vector<const Value*> Items(const Struct& node, const char* key) {
  return Items(Field(node, key));
}

bool IsList(const Value& value) {
  return value.kind_case() == Value::kListValue || NodeOf(value).type == "List";
}

// {"String": {"sval": "x"}}; trees before PostgreSQL 15 use "str".
std::optional<std::string> StringNode(const Value& value) {
  auto node = NodeOf(value);
  if (!node || node.type != "String") return std::nullopt;
  auto s = Str(*node.body, "sval");
  return s.empty() ? Str(*node.body, "str") : s;
}

std::vector<std::string> Strings(const Value* list) {
  std::vector<std::string> out;
  for (const auto* item : Items(list)) {
    if (auto s = StringNode(*item)) out.push_back(std::move(*s));
  }
  return out;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// ------------------------------------------------------------
// Identifier quoting
// ------------------------------------------------------------

bool IsIdentByte(char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

// Which parts of the dotted name starting at `location` are double-quoted.
std::vector<bool> QuotedParts(std::string_view sql, int location, std::size_t count) {
  std::vector<bool> quoted(count, false);
  if (location < 0) return quoted;

  auto skip_space = [&](std::size_t& i) {
    while (i < sql.size() && std::isspace(static_cast<unsigned char>(sql[i]))) ++i;
  };

  std::size_t i = static_cast<std::size_t>(location);
  for (std::size_t part = 0; part < count && i < sql.size(); ++part) {
    skip_space(i);
    if (i < sql.size() && sql[i] == '"') {
      quoted[part] = true;
      for (++i; i < sql.size(); ++i) {
        if (sql[i] != '"') continue;
        if (i + 1 < sql.size() && sql[i + 1] == '"') {
          ++i;
          continue;
        }
        ++i;
        break;
      }
    } else {
      while (i < sql.size() && IsIdentByte(sql[i])) ++i;
    }
    skip_space(i);
    if (i >= sql.size() || sql[i] != '.') break;
    ++i;
  }
  return quoted;
}

// PostgreSQL lowercases unquoted identifiers, so an upper-case letter means quoted.
bool HasUpper(const std::string& s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isupper(c); });
}

// ------------------------------------------------------------
// TreeMapper: PostgreSQL parse tree -> closed AST
// ------------------------------------------------------------

class TreeMapper {
 public:
  TreeMapper(std::string_view text, const Dialect& dialect) : text_(text), dialect_(dialect) {
  }

  QueryPtr MapStatement(const Struct& root) {
    const auto stmts = Items(root, "stmts");
    if (stmts.empty()) {
      throw SqlSyntaxError("no SQL statement");
    }
    if (stmts.size() > 1) {
      throw SqlSyntaxError("expected one statement, found " + std::to_string(stmts.size()));
    }

    const auto* raw  = Body(stmts.front(), "RawStmt");
    const auto  stmt = raw ? NodeOf(Required(*raw, "stmt", "statement")) : Node{};
    if (stmt.type != "SelectStmt") {
      throw SqlSyntaxError("expected a SELECT statement, found " + (stmt.type.empty() ? std::string("nothing") : stmt.type));
    }
    return MapQuery(*stmt.body);
  }

 private:
  std::string Fold(const std::string& name, bool quoted) const {
    return dialect_.NormalizeIdentifier(name, quoted || HasUpper(name));
  }

  std::vector<std::string> FoldParts(const std::vector<std::string>& parts, int location) const {
    const auto               quoted = QuotedParts(text_, location, parts.size());
    std::vector<std::string> out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
      out.push_back(Fold(parts[i], quoted[i]));
    }
    return out;
  }

  // Alias and column lists carry no location of their own.
  std::vector<std::string> FoldNames(const Value* list) const {
    std::vector<std::string> out;
    for (auto& name : Strings(list)) out.push_back(Fold(name, false));
    return out;
  }

  void ReadAlias(const Struct& node, std::string& alias, std::vector<std::string>& columns) const {
    const auto* a = Body(Field(node, "alias"), "Alias");
    if (!a) return;
    alias   = Fold(Str(*a, "aliasname"), false);
    columns = FoldNames(Field(*a, "colnames"));
  }

  // ------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------

  QueryPtr MapQuery(const Struct& stmt) {
    auto query = std::make_unique<Query>();

    if (const auto* with = Body(Field(stmt, "withClause"), "WithClause")) {
      query->recursive = Flag(*with, "recursive");
      for (const auto* item : Items(*with, "ctes")) {
        const auto* cte = Body(item, "CommonTableExpr");
        if (!cte) continue;

        Cte out;
        out.name           = Fold(Str(*cte, "ctename"), QuotedParts(text_, Location(*cte), 1).front());
        out.column_aliases = FoldNames(Field(*cte, "aliascolnames"));

        const auto* body = Body(Field(*cte, "ctequery"), "SelectStmt");
        if (!body) {
          throw SqlSyntaxError("CTE '" + out.name + "' is not a SELECT");
        }
        out.query = MapQuery(*body);
        query->ctes.push_back(std::move(out));
      }
    }

    for (const auto* item : Items(stmt, "sortClause")) {
      query->order_by.push_back(MapSortBy(*item));
    }
    if (const auto* count = Field(stmt, "limitCount")) query->limit = MapExpr(*count);
    if (const auto* offset = Field(stmt, "limitOffset")) query->offset = MapExpr(*offset);

    query->body = MapBody(stmt);
    return query;
  }

  static bool HasQueryClauses(const Struct& stmt) {
    return Field(stmt, "withClause") || Field(stmt, "sortClause") || Field(stmt, "limitCount") || Field(stmt, "limitOffset");
  }

  // A parenthesized branch with its own WITH / ORDER BY / LIMIT stays a nested query.
  SetExprPtr MapOperand(const Struct& stmt) {
    if (!HasQueryClauses(stmt)) return MapBody(stmt);
    auto out  = std::make_unique<SetExpr>();
    out->node = MapQuery(stmt);
    return out;
  }

  SetExprPtr MapBody(const Struct& stmt) {
    auto out = std::make_unique<SetExpr>();

    const auto op = Str(stmt, "op");
    if (!op.empty() && op != "SETOP_NONE") {
      SetOperation set;
      set.op  = op == "SETOP_INTERSECT" ? SetOperator::kIntersect : op == "SETOP_EXCEPT" ? SetOperator::kExcept : SetOperator::kUnion;
      set.all = Flag(stmt, "all");

      const auto* left  = Body(Field(stmt, "larg"), "SelectStmt");
      const auto* right = Body(Field(stmt, "rarg"), "SelectStmt");
      if (!left || !right) {
        throw SqlSyntaxError("set operation is missing a branch");
      }
      set.left  = MapOperand(*left);
      set.right = MapOperand(*right);
      out->node = std::move(set);
      return out;
    }

    if (Field(stmt, "valuesLists")) {
      Values values;
      for (const auto* row : Items(stmt, "valuesLists")) {
        std::vector<ExprPtr> exprs;
        for (const auto* item : Items(row)) exprs.push_back(MapExpr(*item));
        values.rows.push_back(std::move(exprs));
      }
      out->node = std::move(values);
      return out;
    }

    out->node = MapSelect(stmt);
    return out;
  }

  Select MapSelect(const Struct& stmt) {
    if (Field(stmt, "intoClause")) {
      throw SqlSyntaxError("SELECT INTO does not define a relation");
    }

    Select select;

    // Plain DISTINCT is a list holding one empty node.
    select.distinct = Field(stmt, "distinctClause") != nullptr;
    for (const auto* item : Items(stmt, "distinctClause")) {
      if (NodeOf(*item)) select.distinct_on.push_back(MapExpr(*item));
    }

    for (const auto* item : Items(stmt, "targetList")) {
      select.items.push_back(MapTarget(*item));
    }
    // PostgreSQL accepts `select from t`; it defines no columns.
    if (select.items.empty()) {
      throw SqlSyntaxError("SELECT has an empty select list");
    }
    for (const auto* item : Items(stmt, "fromClause")) {
      select.from.push_back(MapTableRef(*item));
    }

    if (const auto* where = Field(stmt, "whereClause")) select.where = MapExpr(*where);
    for (const auto* item : Items(stmt, "groupClause")) {
      select.group_by.push_back(MapExpr(*item));
    }
    if (const auto* having = Field(stmt, "havingClause")) select.having = MapExpr(*having);

    for (const auto* item : Items(stmt, "windowClause")) {
      if (const auto* def = Body(item, "WindowDef")) {
        for (const auto* e : Items(*def, "partitionClause")) select.window.push_back(MapExpr(*e));
        for (const auto* e : Items(*def, "orderClause")) select.window.push_back(MapSortBy(*e));
      }
    }
    return select;
  }

  SelectItem MapTarget(const Value& value) {
    const auto* target = Body(&value, "ResTarget");
    if (!target) {
      throw SqlSyntaxError("unexpected select list entry");
    }
    const auto& val = Required(*target, "val", "select item");

    if (auto node = NodeOf(val); node.type == "ColumnRef") {
      if (auto qualifier = StarQualifier(*node.body)) {
        return Wildcard{std::move(*qualifier)};
      }
    }

    ExprItem item;
    item.expr = MapExpr(val);
    if (const auto name = Str(*target, "name"); !name.empty()) {
      item.alias = Fold(name, false);
    }
    return item;
  }

  // `*` and `t.*`; nullopt for ordinary column references.
  std::optional<std::string> StarQualifier(const Struct& ref) const {
    const auto fields = Items(ref, "fields");
    if (fields.empty() || NodeOf(*fields.back()).type != "A_Star") return std::nullopt;

    std::vector<std::string> parts;
    for (std::size_t i = 0; i + 1 < fields.size(); ++i) {
      if (auto s = StringNode(*fields[i])) parts.push_back(std::move(*s));
    }
    const auto folded = FoldParts(parts, Location(ref));
    return folded.empty() ? std::string() : folded.back();
  }

  // ------------------------------------------------------------
  // FROM
  // ------------------------------------------------------------

  TableRefPtr MapTableRef(const Value& value) {
    const auto node = NodeOf(value);
    if (!node) {
      throw SqlSyntaxError("unexpected FROM entry");
    }
    const auto& b   = *node.body;
    auto        out = std::make_unique<TableRef>();

    if (node.type == "RangeVar") {
      NamedTable table;
      std::vector<std::string> parts;
      for (const char* key : {"catalogname", "schemaname", "relname"}) {
        if (auto part = Str(b, key); !part.empty()) parts.push_back(std::move(part));
      }
      table.parts = FoldParts(parts, Location(b));
      ReadAlias(b, table.alias, table.column_aliases);
      out->node = std::move(table);
    } else if (node.type == "JoinExpr") {
      out->node = MapJoin(b);
    } else if (node.type == "RangeSubselect") {
      DerivedTable derived;
      const auto*  sub = Body(Field(b, "subquery"), "SelectStmt");
      if (!sub) {
        throw SqlSyntaxError("derived table is not a SELECT");
      }
      derived.query = MapQuery(*sub);
      ReadAlias(b, derived.alias, derived.column_aliases);
      out->node = std::move(derived);
    } else if (node.type == "RangeFunction") {
      out->node = MapRangeFunction(b);
    } else if (node.type == "RangeTableSample") {
      return MapTableRef(Required(b, "relation", "TABLESAMPLE"));
    } else {
      throw SqlSyntaxError("unsupported FROM item " + node.type);
    }
    return out;
  }

  Join MapJoin(const Struct& b) {
    Join join;

    const auto type = Str(b, "jointype");
    if (type.empty() || type == "JOIN_INNER") {
      join.kind = JoinKind::kInner;
    } else if (type == "JOIN_LEFT") {
      join.kind = JoinKind::kLeft;
    } else if (type == "JOIN_RIGHT") {
      join.kind = JoinKind::kRight;
    } else if (type == "JOIN_FULL") {
      join.kind = JoinKind::kFull;
    } else {
      throw SqlSyntaxError("unsupported join type " + type);
    }

    join.natural       = Flag(b, "isNatural");
    join.left          = MapTableRef(Required(b, "larg", "join"));
    join.right         = MapTableRef(Required(b, "rarg", "join"));
    join.using_columns = FoldNames(Field(b, "usingClause"));
    if (const auto* quals = Field(b, "quals")) join.on = MapExpr(*quals);

    if (join.kind == JoinKind::kInner && !join.on && join.using_columns.empty() && !join.natural) {
      join.kind = JoinKind::kCross;
    }
    return join;
  }

  TableFunction MapRangeFunction(const Struct& b) {
    TableFunction fn;

    // Each entry pairs a call with its column definition list.
    for (const auto* entry : Items(b, "functions")) {
      const auto pair = Items(entry);
      if (pair.empty()) continue;

      const auto call = NodeOf(*pair.front());
      if (call.type == "FuncCall") {
        auto mapped = MapFunction(*call.body);
        if (fn.name.empty()) fn.name = mapped.name;
        for (auto& arg : mapped.args) fn.args.push_back(std::move(arg));
      } else {
        fn.args.push_back(MapExpr(*pair.front()));
      }
    }
    if (fn.name.empty()) fn.name = "function";

    ReadAlias(b, fn.alias, fn.column_aliases);
    return fn;
  }

  // ------------------------------------------------------------
  // Expressions
  // ------------------------------------------------------------

  ExprPtr MapSortBy(const Value& value) {
    const auto* sort = Body(&value, "SortBy");
    return sort ? MapExpr(Required(*sort, "node", "ORDER BY item")) : MapExpr(value);
  }

  std::vector<ExprPtr> MapList(const Value* list) {
    std::vector<ExprPtr> out;
    for (const auto* item : Items(list)) out.push_back(MapExpr(*item));
    return out;
  }

  static std::string ConstText(const Struct& b) {
    if (Flag(b, "isnull")) return "null";

    for (const char* key : {"sval", "fval", "ival", "boolval", "bsval"}) {
      const auto* v = Field(b, key);
      if (!v) continue;
      const auto* inner = v->kind_case() == Value::kStructValue ? Field(v->struct_value(), key) : v;
      if (!inner) return std::string(key) == "ival" ? "0" : std::string(key) == "boolval" ? "false" : "";

      switch (inner->kind_case()) {
        case Value::kStringValue:
          return inner->string_value();
        case Value::kNumberValue:
          return std::to_string(static_cast<long long>(inner->number_value()));
        case Value::kBoolValue:
          return inner->bool_value() ? "true" : "false";
        default:
          return "";
      }
    }
    return "";
  }

  FunctionCall MapFunction(const Struct& b) {
    FunctionCall call;

    const auto names = Strings(Field(b, "funcname"));
    if (names.empty()) {
      throw SqlSyntaxError("function call without a name");
    }
    call.name = FoldParts(names, Location(b)).back();

    if (Flag(b, "agg_star")) {
      auto star  = std::make_unique<Expr>();
      star->node = Star{};
      call.args.push_back(std::move(star));
    }
    for (const auto* arg : Items(b, "args")) call.args.push_back(MapExpr(*arg));

    if (const auto* filter = Field(b, "agg_filter")) call.filter = MapExpr(*filter);

    auto& ordered = Flag(b, "agg_within_group") ? call.within_group : call.order_by;
    for (const auto* item : Items(b, "agg_order")) ordered.push_back(MapSortBy(*item));

    if (const auto* over = Body(Field(b, "over"), "WindowDef")) {
      call.over = std::make_unique<WindowSpec>();
      for (const auto* e : Items(*over, "partitionClause")) call.over->partition_by.push_back(MapExpr(*e));
      for (const auto* e : Items(*over, "orderClause")) call.over->order_by.push_back(MapSortBy(*e));
    }
    return call;
  }

  Operation MapOperator(const Struct& b) {
    const auto kind  = Str(b, "kind");
    const auto names = Strings(Field(b, "name"));

    Operation operation;
    if (kind.empty() || kind == "AEXPR_OP") {
      operation.op = names.empty() ? "?" : names.back();
    } else {
      operation.op = Lower(kind.rfind("AEXPR_", 0) == 0 ? kind.substr(6) : kind);
    }

    if (const auto* lexpr = Field(b, "lexpr")) operation.operands.push_back(MapExpr(*lexpr));
    if (const auto* rexpr = Field(b, "rexpr")) {
      if (IsList(*rexpr)) {
        for (auto& e : MapList(rexpr)) operation.operands.push_back(std::move(e));
      } else {
        operation.operands.push_back(MapExpr(*rexpr));
      }
    }
    return operation;
  }

  ExprPtr MapSubLink(const Struct& b) {
    auto expr = std::make_unique<Expr>();

    const auto* select = Body(Field(b, "subselect"), "SelectStmt");
    if (!select) {
      throw SqlSyntaxError("subquery is not a SELECT");
    }
    auto query = MapQuery(*select);

    const auto  type    = Str(b, "subLinkType");
    const auto* testexpr = Field(b, "testexpr");

    if (type == "EXISTS_SUBLINK") {
      expr->node = Exists{std::move(query)};
    } else if (type == "ANY_SUBLINK" && testexpr) {
      expr->node = InList{MapExpr(*testexpr), {}, std::move(query)};
    } else if (testexpr) {
      Operation operation;
      operation.op = Lower(type.substr(0, type.find('_')));
      operation.operands.push_back(MapExpr(*testexpr));
      auto sub  = std::make_unique<Expr>();
      sub->node = Subquery{std::move(query)};
      operation.operands.push_back(std::move(sub));
      expr->node = std::move(operation);
    } else {
      expr->node = Subquery{std::move(query)};
    }
    return expr;
  }

  // Node kinds without a dedicated mapping keep their column references.
  std::vector<ExprPtr> Children(const Struct& b) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : b.fields()) {
      if (key != "location") keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());

    std::vector<ExprPtr> out;
    auto add = [&](const Value& value) {
      const auto node = NodeOf(value);
      if (!node) return;
      if (node.type == "SelectStmt") {
        auto sub  = std::make_unique<Expr>();
        sub->node = Subquery{MapQuery(*node.body)};
        out.push_back(std::move(sub));
        return;
      }
      out.push_back(MapExpr(value));
    };

    for (const auto& key : keys) {
      const auto& value = b.fields().at(key);
      if (IsList(value)) {
        for (const auto* item : Items(&value)) add(*item);
      } else {
        add(value);
      }
    }
    return out;
  }

  ExprPtr MapExpr(const Value& value) {
    const auto node = NodeOf(value);
    if (!node) {
      throw SqlSyntaxError("unexpected expression in parse tree");
    }
    const auto& b    = *node.body;
    const auto& type = node.type;
    auto        expr = std::make_unique<Expr>();

    if (type == "ColumnRef") {
      if (auto qualifier = StarQualifier(b)) {
        expr->node = Star{std::move(*qualifier)};
      } else {
        ColumnRef ref;
        ref.parts = FoldParts(Strings(Field(b, "fields")), Location(b));
        if (ref.parts.empty()) {
          throw SqlSyntaxError("column reference without a name");
        }
        expr->node = std::move(ref);
      }
    } else if (type == "A_Const") {
      expr->node = Literal{ConstText(b)};
    } else if (type == "ParamRef" || type == "SQLValueFunction") {
      expr->node = Literal{Lower(type)};
    } else if (type == "TypeCast") {
      Cast cast;
      cast.expr = MapExpr(Required(b, "arg", "cast"));
      if (const auto* type_name = Body(Field(b, "typeName"), "TypeName")) {
        const auto names = Strings(Field(*type_name, "names"));
        if (!names.empty()) cast.type = names.back();
      }
      expr->node = std::move(cast);
    } else if (type == "FuncCall") {
      expr->node = MapFunction(b);
    } else if (type == "CoalesceExpr" || type == "MinMaxExpr" || type == "GroupingFunc") {
      FunctionCall call;
      call.name  = type == "CoalesceExpr" ? "coalesce" : type == "GroupingFunc" ? "grouping"
                 : Str(b, "op") == "IS_LEAST" ? "least" : "greatest";
      call.args  = MapList(Field(b, "args"));
      expr->node = std::move(call);
    } else if (type == "A_Expr") {
      if (Str(b, "kind") == "AEXPR_IN") {
        InList in;
        in.expr  = MapExpr(Required(b, "lexpr", "IN"));
        in.items = MapList(Field(b, "rexpr"));
        expr->node = std::move(in);
      } else {
        expr->node = MapOperator(b);
      }
    } else if (type == "BoolExpr") {
      const auto op = Str(b, "boolop");
      expr->node    = Operation{op == "OR_EXPR" ? "or" : op == "NOT_EXPR" ? "not" : "and", MapList(Field(b, "args"))};
    } else if (type == "NullTest") {
      Operation test{Str(b, "nulltesttype") == "IS_NOT_NULL" ? "is not null" : "is null", {}};
      test.operands.push_back(MapExpr(Required(b, "arg", "IS NULL")));
      expr->node = std::move(test);
    } else if (type == "BooleanTest") {
      Operation test{"is", {}};
      test.operands.push_back(MapExpr(Required(b, "arg", "IS")));
      expr->node = std::move(test);
    } else if (type == "CaseExpr") {
      Case c;
      if (const auto* arg = Field(b, "arg")) c.operand = MapExpr(*arg);
      for (const auto* item : Items(b, "args")) {
        const auto* when = Body(item, "CaseWhen");
        if (!when) continue;
        c.whens.emplace_back(MapExpr(Required(*when, "expr", "WHEN")), MapExpr(Required(*when, "result", "WHEN")));
      }
      if (const auto* otherwise = Field(b, "defresult")) c.otherwise = MapExpr(*otherwise);
      expr->node = std::move(c);
    } else if (type == "SubLink") {
      return MapSubLink(b);
    } else if (type == "RowExpr") {
      expr->node = Operation{"row", MapList(Field(b, "args"))};
    } else if (type == "A_ArrayExpr") {
      expr->node = Operation{"array", MapList(Field(b, "elements"))};
    } else {
      // A_Indirection, CollateClause, GroupingSet, XmlExpr, ...
      expr->node = Operation{Lower(type), Children(b)};
    }
    return expr;
  }

  std::string_view text_;
  const Dialect&   dialect_;
};

} // namespace

// ------------------------------------------------------------
// Quoting
// ------------------------------------------------------------

std::string ToPostgresQuoting(std::string_view sql, const Dialect& dialect) {
  std::string out;
  out.reserve(sql.size());

  std::size_t i = 0;
  const auto  n = sql.size();

  // Copies a quoted run starting at sql[i], rewriting it to use `quote`.
  auto copy_quoted = [&](char open, char quote, bool backslash) {
    out.push_back(quote);
    for (++i; i < n; ++i) {
      const char c = sql[i];
      if (backslash && c == '\\' && i + 1 < n) {
        if (sql[i + 1] == open || sql[i + 1] == quote) {
          out.push_back(sql[i + 1]);
          if (sql[i + 1] == quote) out.push_back(quote);
        } else {
          out.push_back(c);
          out.push_back(sql[i + 1]);
        }
        ++i;
        continue;
      }
      if (c == open) {
        if (i + 1 < n && sql[i + 1] == open) {
          out.push_back(open == quote ? open : sql[i]);
          if (open == quote) out.push_back(open);
          ++i;
          continue;
        }
        out.push_back(quote);
        ++i;
        return;
      }
      if (c == quote && open != quote) {
        out.push_back(quote);
      }
      out.push_back(c);
    }
  };

  while (i < n) {
    const char c = sql[i];

    if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
      const auto end = sql.find('\n', i);
      const auto stop = end == std::string_view::npos ? n : end;
      out.append(sql.substr(i, stop - i));
      i = stop;
    } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
      const auto end  = sql.find("*/", i + 2);
      const auto stop = end == std::string_view::npos ? n : end + 2;
      out.append(sql.substr(i, stop - i));
      i = stop;
    } else if (c == '\'') {
      copy_quoted('\'', '\'', dialect.backslash_escapes);
    } else if (c == '"') {
      if (dialect.double_quoted_strings) {
        copy_quoted('"', '\'', dialect.backslash_escapes);
      } else {
        copy_quoted('"', '"', false);
      }
    } else if (c == '`' && dialect.backtick_identifiers) {
      copy_quoted('`', '"', false);
    } else {
      out.push_back(c);
      ++i;
    }
  }
  return out;
}

// ------------------------------------------------------------
// ParseQuery
// ------------------------------------------------------------

QueryPtr ParseQuery(std::string_view sql, const Dialect& dialect) {
  const auto text = ToPostgresQuoting(sql, dialect);

  ParseResult parsed(pg_query_parse(text.c_str()));
  if (parsed->error) {
    throw SqlSyntaxError(std::string(parsed->error->message) + " at position " + std::to_string(parsed->error->cursorpos));
  }

  Struct tree;
  auto   status = google::protobuf::util::JsonStringToMessage(parsed->parse_tree, &tree);
  if (!status.ok()) {
    throw SqlSyntaxError("unreadable parse tree: " + std::string(status.message()));
  }

  return TreeMapper(text, dialect).MapStatement(tree);
}

} // namespace colguard::sql
