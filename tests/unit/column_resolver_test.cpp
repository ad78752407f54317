#include "internal/sql/column_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using colguard::model::ModelLineage;
using colguard::model::Provenance;
using colguard::model::ReferenceKind;
using namespace colguard::sql;

using Names = std::vector<std::string>;

RelationCatalog MakeCatalog(const Dialect& dialect) {
  RelationCatalog catalog(dialect);
  catalog.Add("analytics.stg", UpstreamRelation{"stg", ReferenceKind::kModel, Names{"a", "b", "c"}});
  catalog.Add("analytics.stg_customers",
              UpstreamRelation{"stg_customers", ReferenceKind::kModel, Names{"customer_id", "first_name", "last_name"}});
  catalog.Add("analytics.stg_orders",
              UpstreamRelation{"stg_orders", ReferenceKind::kModel, Names{"order_id", "customer_id", "order_date", "status"}});
  catalog.Add("raw.payments", UpstreamRelation{"jaffle.payments", ReferenceKind::kSource, std::nullopt});
  catalog.Add("analytics.left_side", UpstreamRelation{"left_side", ReferenceKind::kModel, Names{"id", "x"}});
  catalog.Add("analytics.right_side", UpstreamRelation{"right_side", ReferenceKind::kModel, Names{"id", "y"}});
  return catalog;
}

ModelLineage Resolve(const std::string& sql, const std::string& dialect = "ansi") {
  const auto d = DialectByName(dialect);
  return ColumnResolver(d).Resolve("m", sql, MakeCatalog(d));
}

bool ThrowsMalformed(const std::string& sql) {
  try {
    (void)Resolve(sql);
  } catch (const colguard::util::MalformedQueryError& e) {
    return e.Model() == "m";
  }
  return false;
}

void TestStarExpandsInUpstreamOrder() {
  const auto lineage = Resolve("select * from analytics.stg");

  assert(lineage.model == "m");
  assert((lineage.ColumnNames() == Names{"a", "b", "c"}));
  assert(!lineage.open_wildcard);
  for (const auto& column : lineage.columns) {
    assert(column.provenance.size() == 1);
    assert(column.provenance[0] == Provenance::Upstream("stg", ReferenceKind::kModel, column.name));
  }
}

void TestCatalogSearchPrefixes() {
  const auto d       = DialectByName("ansi");
  auto       catalog = MakeCatalog(d);
  catalog.AddSearchPrefix("Analytics");

  const auto bare = ColumnResolver(d).Resolve("m", "select a from stg", catalog);
  assert(bare.columns[0].provenance[0] == Provenance::Upstream("stg", ReferenceKind::kModel, "a"));

  const auto qualified = ColumnResolver(d).Resolve("m", "select a from analytics.stg", catalog);
  assert(qualified.columns[0].provenance[0] == Provenance::Upstream("stg", ReferenceKind::kModel, "a"));

  // Unregistered qualifiers name a different relation.
  for (const char* sql : {"select a from warehouse.analytics.stg", "select a from staging.stg"}) {
    const auto other = ColumnResolver(d).Resolve("m", sql, catalog);
    assert(other.columns[0].provenance.size() == 1 && other.columns[0].provenance[0].IsOpaque());
  }
}

void TestOtherSchemaIsNotAModel() {
  const auto      d = DialectByName("ansi");
  RelationCatalog catalog(d);
  catalog.Add("src", UpstreamRelation{"src", ReferenceKind::kModel, Names{"id"}});

  const auto other = ColumnResolver(d).Resolve("m", "select id, missing from other_schema.src", catalog);
  assert(other.columns[0].provenance[0].IsOpaque());
  assert(other.columns[1].provenance[0].IsOpaque());

  const auto model = ColumnResolver(d).Resolve("m", "select id from src", catalog);
  assert(model.columns[0].provenance[0] == Provenance::Upstream("src", ReferenceKind::kModel, "id"));
}

void TestCustomersThroughCtes() {
  const auto lineage = Resolve(R"(
    with customers as (
      select * from analytics.stg_customers
    ),
    orders as (
      select * from analytics.stg_orders
    ),
    customer_orders as (
      select customer_id, min(order_date) as first_order, count(order_id) as number_of_orders
      from orders
      group by customer_id
    ),
    final as (
      select customers.customer_id, customers.first_name, customer_orders.first_order, customer_orders.number_of_orders
      from customers
      left join customer_orders on customers.customer_id = customer_orders.customer_id
    )
    select * from final
  )");

  assert((lineage.ColumnNames() == Names{"customer_id", "first_name", "first_order", "number_of_orders"}));
  assert(lineage.columns[0].provenance[0] == Provenance::Upstream("stg_customers", ReferenceKind::kModel, "customer_id"));
  assert(lineage.columns[1].provenance[0] == Provenance::Upstream("stg_customers", ReferenceKind::kModel, "first_name"));
  assert(lineage.columns[2].provenance[0] == Provenance::Upstream("stg_orders", ReferenceKind::kModel, "order_date"));
  assert(lineage.columns[3].provenance[0] == Provenance::Upstream("stg_orders", ReferenceKind::kModel, "order_id"));
  assert(lineage.dangling.empty());

  bool group_by_seen = false;
  for (const auto& ref : lineage.predicate_refs) {
    if (ref.clause == "group by"
        && ref.provenance == Provenance::Upstream("stg_orders", ReferenceKind::kModel, "customer_id")) {
      group_by_seen = true;
    }
  }
  assert(group_by_seen);
}

void TestMissingUpstreamColumnKeepsProvenance() {
  const auto lineage = Resolve("select a, nonexistant_column from analytics.stg");
  assert(lineage.columns[1].name == "nonexistant_column");
  assert(lineage.columns[1].provenance[0] == Provenance::Upstream("stg", ReferenceKind::kModel, "nonexistant_column"));
  assert(lineage.dangling.empty());
}

void TestUnknownRelationsAreOpaque() {
  const auto named = Resolve("select x, 1 as one from some_schema.unmanaged");
  assert(named.columns[0].provenance.size() == 1 && named.columns[0].provenance[0].IsOpaque());
  assert(named.columns[1].provenance[0].IsOpaque());
  assert(!named.open_wildcard);

  const auto star = Resolve("select * from some_schema.unmanaged");
  assert(star.columns.empty());
  assert(star.open_wildcard);
}

void TestSourceWithoutColumnsForwardsName() {
  const auto lineage = Resolve("select amount from raw.payments");
  assert(lineage.columns[0].provenance[0] == Provenance::Upstream("jaffle.payments", ReferenceKind::kSource, "amount"));

  const auto star = Resolve("select * from raw.payments");
  assert(star.open_wildcard);
}

void TestDanglingLocalColumn() {
  const auto lineage = Resolve("with t as (select a from analytics.stg) select t.zzz from t");
  assert(lineage.columns.size() == 1);
  assert(lineage.columns[0].provenance.empty());
  assert(lineage.dangling.size() == 1);
  assert(lineage.dangling[0].relation == "t");
  assert(lineage.dangling[0].column == "zzz");
}

void TestUsingJoinMergesSharedColumn() {
  const auto lineage = Resolve("select * from analytics.left_side join analytics.right_side using (id)");
  assert((lineage.ColumnNames() == Names{"id", "x", "y"}));
  assert(lineage.columns[0].provenance.size() == 2);
}

void TestPredicateReferences() {
  const auto lineage = Resolve("select a, c from analytics.stg where b > 1", "duckdb");
  assert((lineage.ColumnNames() == Names{"a", "c"}));
  assert(lineage.predicate_refs.size() == 1);
  assert(lineage.predicate_refs[0].clause == "where");
  assert(lineage.predicate_refs[0].provenance == Provenance::Upstream("stg", ReferenceKind::kModel, "b"));

  const auto ordered = Resolve("select string_agg(a, ',' order by c) as joined from analytics.stg", "postgres");
  assert(ordered.predicate_refs.size() == 1);
  assert(ordered.predicate_refs[0].clause == "order by");
  assert(ordered.predicate_refs[0].provenance == Provenance::Upstream("stg", ReferenceKind::kModel, "c"));
}

void TestAmbiguousColumnIsReported() {
  const auto lineage = Resolve("select id, x from analytics.left_side l join analytics.right_side r on l.x = r.y");

  assert(lineage.columns[0].name == "id");
  assert(lineage.columns[0].provenance.size() == 2);
  assert(lineage.columns[0].provenance[0] == Provenance::Upstream("left_side", ReferenceKind::kModel, "id"));
  assert(lineage.columns[0].provenance[1] == Provenance::Upstream("right_side", ReferenceKind::kModel, "id"));

  assert(lineage.ambiguous.size() == 1);
  assert(lineage.ambiguous[0].consumer == "id");
  assert(lineage.ambiguous[0].column == "id");
  assert((lineage.ambiguous[0].relations == Names{"l", "r"}));

  // x exists on one side only; USING merges the shared column.
  assert(lineage.columns[1].provenance.size() == 1);
  assert(Resolve("select id from analytics.left_side join analytics.right_side using (id)").ambiguous.empty());
}

void TestUnionMergesProvenance() {
  const auto lineage = Resolve("select a from analytics.stg union all select order_id from analytics.stg_orders");
  assert((lineage.ColumnNames() == Names{"a"}));
  assert(lineage.columns[0].provenance.size() == 2);
}

void TestMalformedQueries() {
  assert(ThrowsMalformed("select a, b from analytics.stg union all select a from analytics.stg"));
  assert(ThrowsMalformed("with t (x) as (select a, b from analytics.stg) select * from t"));
  assert(ThrowsMalformed("select from where"));
  assert(ThrowsMalformed("select q.* from analytics.stg"));
}

} // namespace

int main() {
  TestStarExpandsInUpstreamOrder();
  TestCatalogSearchPrefixes();
  TestOtherSchemaIsNotAModel();
  TestCustomersThroughCtes();
  TestMissingUpstreamColumnKeepsProvenance();
  TestUnknownRelationsAreOpaque();
  TestSourceWithoutColumnsForwardsName();
  TestDanglingLocalColumn();
  TestUsingJoinMergesSharedColumn();
  TestPredicateReferences();
  TestAmbiguousColumnIsReported();
  TestUnionMergesProvenance();
  TestMalformedQueries();

  std::cout << "colguard_unit_column_resolver: pass\n";
  return 0;
}
