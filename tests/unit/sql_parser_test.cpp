#include "internal/sql/parser.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "internal/sql/dialect.hpp"

namespace {

using namespace colguard::sql;

const Select& BodySelect(const Query& query) {
  return std::get<Select>(query.body->node);
}

const ExprItem& Item(const Select& select, std::size_t i) {
  return std::get<ExprItem>(select.items.at(i));
}

void TestDialectFolding() {
  const auto ansi      = DialectByName("ansi");
  const auto snowflake = DialectByName("Snowflake");
  const auto bigquery  = DialectByName("bigquery");

  assert(ansi.NormalizeIdentifier("Order_ID", false) == "order_id");
  assert(ansi.NormalizeIdentifier("Order_ID", true) == "Order_ID");
  assert(snowflake.NormalizeIdentifier("Order_ID", false) == "ORDER_ID");
  assert(snowflake.NormalizeIdentifier("Order_ID", true) == "Order_ID");
  assert(bigquery.NormalizeIdentifier("Order_ID", true) == "order_id");
  assert(ansi.NormalizeRelation("Analytics.Orders") == "analytics.orders");
  assert(snowflake.NormalizeDocName("customer_id") == "CUSTOMER_ID");

  bool threw = false;
  try {
    (void)DialectByName("cobol");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(SupportedDialects().size() == 8);
}

void TestPostgresQuoting() {
  const auto ansi = DialectByName("ansi");
  const std::string plain = "select \"Mixed Case\", 'it''s' -- it's\n /* `x` */ a || b from t";
  assert(ToPostgresQuoting(plain, ansi) == plain);

  const auto bq = DialectByName("bigquery");
  assert(ToPostgresQuoting("select `proj.ds`.t, \"te'xt\", 'it\\'s' from x", bq)
         == "select \"proj.ds\".t, 'te''xt', 'it''s' from x");

  // Offsets survive the rewrite for dialects that only change escapes.
  const auto        snowflake = DialectByName("snowflake");
  const std::string escaped   = "select 'a\\'b', c from t";
  assert(ToPostgresQuoting(escaped, snowflake).size() == escaped.size());
}

void TestProjectionAndAliases() {
  auto query = ParseQuery("select id as customer_id, name full_name, t.amount * 2, count(*) from raw_customers t;",
                          DialectByName("ansi"));
  const auto& select = BodySelect(*query);

  assert(select.items.size() == 4);
  assert(Item(select, 0).alias == "customer_id");
  assert(std::get<ColumnRef>(Item(select, 0).expr->node).Name() == "id");
  assert(Item(select, 1).alias == "full_name");
  assert(Item(select, 2).alias.empty());
  assert(std::get<Operation>(Item(select, 2).expr->node).op == "*");
  assert(std::get<FunctionCall>(Item(select, 3).expr->node).name == "count");

  assert(select.from.size() == 1);
  const auto& table = std::get<NamedTable>(select.from[0]->node);
  assert((table.parts == std::vector<std::string>{"raw_customers"}));
  assert(table.alias == "t");
}

void TestCtesJoinsAndClauses() {
  auto query = ParseQuery(R"(
    with recursive base (a, b) as (select 1, 2),
    other as materialized (select * from base)
    select o.a, x.*
    from other o
    left join lateral (select 1 as z) x on true
    join items i using (a)
    where o.a > 1 and i.b between 1 and 3
    group by 1, 2
    having count(*) > 0
    window w as (partition by o.a order by o.b desc)
    order by 1
    limit 10 offset 5
  )",
                          DialectByName("duckdb"));

  assert(query->recursive);
  assert(query->ctes.size() == 2);
  assert(query->ctes[0].name == "base");
  assert((query->ctes[0].column_aliases == std::vector<std::string>{"a", "b"}));
  assert(query->limit && query->offset);
  assert(query->order_by.size() == 1);

  const auto& select = BodySelect(*query);
  assert(std::get<Wildcard>(select.items[1]).qualifier == "x");

  const auto& outer = std::get<Join>(select.from[0]->node);
  assert(outer.kind == JoinKind::kInner);
  assert((outer.using_columns == std::vector<std::string>{"a"}));

  const auto& inner = std::get<Join>(outer.left->node);
  assert(inner.kind == JoinKind::kLeft);
  assert(inner.on);
  assert(std::get<DerivedTable>(inner.right->node).alias == "x");

  assert(select.where && select.having);
  assert(select.group_by.size() == 2);
  assert(select.window.size() == 2);
}

void TestSetOperations() {
  auto query = ParseQuery("select * from a union all select * from b except select 1 as x", DialectByName("postgres"));

  const auto& outer = std::get<SetOperation>(query->body->node);
  assert(outer.op == SetOperator::kExcept && !outer.all);
  const auto& inner = std::get<SetOperation>(outer.left->node);
  assert(inner.all && inner.op == SetOperator::kUnion);
  assert(std::get<Wildcard>(std::get<Select>(inner.left->node).items[0]).qualifier.empty());

  // A branch with its own ORDER BY / LIMIT stays a nested query.
  auto nested = ParseQuery("(select a from t order by a limit 1) union select b from u", DialectByName("postgres"));
  const auto& set = std::get<SetOperation>(nested->body->node);
  const auto& left = std::get<QueryPtr>(set.left->node);
  assert(left->limit && left->order_by.size() == 1);
  assert(std::holds_alternative<Select>(set.right->node));
}

void TestDistinctValuesAndSubqueries() {
  const auto pg = DialectByName("postgres");

  assert(BodySelect(*ParseQuery("select distinct a from t", pg)).distinct);
  assert(BodySelect(*ParseQuery("select distinct a from t", pg)).distinct_on.empty());
  assert(BodySelect(*ParseQuery("select distinct on (a) a, b from t", pg)).distinct_on.size() == 1);
  assert(!BodySelect(*ParseQuery("select a from t", pg)).distinct);

  auto        values  = ParseQuery("select n from (values (1, 'a'), (2, 'b')) v (n, s)", pg);
  const auto& derived = std::get<DerivedTable>(BodySelect(*values).from[0]->node);
  assert(derived.alias == "v");
  assert((derived.column_aliases == std::vector<std::string>{"n", "s"}));
  assert(std::get<Values>(derived.query->body->node).rows.size() == 2);

  auto        sub   = ParseQuery("select a from t where b in (select c from u) and d > all (select e from v)", pg);
  const auto& where = std::get<Operation>(BodySelect(*sub).where->node);
  assert(where.op == "and" && where.operands.size() == 2);
  assert(std::get<InList>(where.operands[0]->node).subquery);
  assert(std::get<Operation>(where.operands[1]->node).op == "all");

  auto        agg    = ParseQuery("select string_agg(a, ',' order by b), percentile_cont(0.5) within group (order by c) from t", pg);
  const auto& select = BodySelect(*agg);
  assert(std::get<FunctionCall>(Item(select, 0).expr->node).order_by.size() == 1);
  assert(std::get<FunctionCall>(Item(select, 1).expr->node).within_group.size() == 1);
}

void TestExpressionForms() {
  auto query = ParseQuery(
      "select cast(a as varchar(10)) c1, b::numeric(10,2) c2, case when x in (1,2) then 'y' else 'n' end c3,"
      " coalesce(p.q, 0) c4, exists (select 1 from t) c5, date '2024-01-01' c6, sum(v) filter (where v > 0) c7,"
      " interval '1' day c8 from s",
      DialectByName("postgres"));

  const auto& select = BodySelect(*query);
  assert(select.items.size() == 8);
  assert(std::get<Cast>(Item(select, 0).expr->node).type == "varchar");
  assert(std::get<Cast>(Item(select, 1).expr->node).type == "numeric");
  assert(std::holds_alternative<Case>(Item(select, 2).expr->node));
  assert(std::get<FunctionCall>(Item(select, 3).expr->node).args.size() == 2);
  assert(std::holds_alternative<Exists>(Item(select, 4).expr->node));
  assert(std::get<Cast>(Item(select, 5).expr->node).type == "date");
  assert(std::get<FunctionCall>(Item(select, 6).expr->node).filter);
  assert(std::holds_alternative<Cast>(Item(select, 7).expr->node));
  assert(Item(select, 7).alias == "c8");
}

void TestSnowflakeFoldsIdentifiersUp() {
  auto        query  = ParseQuery("select Id, \"lower\" from Raw.Customers", DialectByName("snowflake"));
  const auto& select = BodySelect(*query);
  assert(std::get<ColumnRef>(Item(select, 0).expr->node).Name() == "ID");
  assert(std::get<ColumnRef>(Item(select, 1).expr->node).Name() == "lower");
  assert((std::get<NamedTable>(select.from[0]->node).parts == std::vector<std::string>{"RAW", "CUSTOMERS"}));

  auto quoted = ParseQuery("select `Mixed Case`, \"text\" from `proj.ds`.Events", DialectByName("bigquery"));
  assert(std::get<ColumnRef>(Item(BodySelect(*quoted), 0).expr->node).Name() == "mixed case");
  assert(std::get<Literal>(Item(BodySelect(*quoted), 1).expr->node).text == "text");
  assert((std::get<NamedTable>(BodySelect(*quoted).from[0]->node).parts == std::vector<std::string>{"proj.ds", "events"}));

  auto kept = ParseQuery("select \"Mixed Case\" from t", DialectByName("postgres"));
  assert(std::get<ColumnRef>(Item(BodySelect(*kept), 0).expr->node).Name() == "Mixed Case");
}

void TestSyntaxErrors() {
  const auto ansi = DialectByName("ansi");
  for (const char* sql : {"select a from", "select (a from t", "selec a", "select from t", "select a from t where", "insert into t values (1)",
                          "select 1; select 2", ""}) {
    bool threw = false;
    try {
      (void)ParseQuery(sql, ansi);
    } catch (const SqlSyntaxError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestDialectFolding();
  TestPostgresQuoting();
  TestProjectionAndAliases();
  TestCtesJoinsAndClauses();
  TestSetOperations();
  TestDistinctValuesAndSubqueries();
  TestExpressionForms();
  TestSnowflakeFoldsIdentifiersUp();
  TestSyntaxErrors();

  std::cout << "colguard_unit_sql_parser: pass\n";
  return 0;
}
