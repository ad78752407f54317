#include "internal/lineage/lineage_graph.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using colguard::lineage::LineageGraph;
using colguard::model::Column;
using colguard::model::ModelLineage;
using colguard::model::Provenance;
using colguard::model::Reference;
using colguard::model::ReferenceKind;

using Names = std::vector<std::string>;

Reference Ref(const std::string& name) {
  return Reference{ReferenceKind::kModel, "", name};
}

Reference Source(const std::string& source, const std::string& name) {
  return Reference{ReferenceKind::kSource, source, name};
}

/*
  jaffle.customers -> stg_customers --\
                                       customers -> report
  jaffle.orders    -> stg_orders -----/
*/
LineageGraph MakeJaffleGraph() {
  LineageGraph graph;
  graph.AddSource("jaffle.customers");
  graph.AddSource("jaffle.orders");
  for (const auto* name : {"stg_customers", "stg_orders", "customers", "report"}) {
    graph.AddModel(name);
  }
  graph.AddReference("stg_customers", Source("jaffle", "customers"));
  graph.AddReference("stg_orders", Source("jaffle", "orders"));
  graph.AddReference("customers", Ref("stg_customers"));
  graph.AddReference("customers", Ref("stg_orders"));
  graph.AddReference("customers", Ref("stg_orders"));
  graph.AddReference("report", Ref("customers"));
  return graph;
}

void TestNodesAndEdges() {
  const auto graph = MakeJaffleGraph();

  assert(graph.HasNode("jaffle.orders"));
  assert(!graph.IsModel("jaffle.orders"));
  assert(graph.IsModel("customers"));
  assert((graph.Models() == Names{"customers", "report", "stg_customers", "stg_orders"}));
  assert((graph.Parents("customers") == Names{"stg_customers", "stg_orders"}));
  assert((graph.Children("stg_orders") == Names{"customers"}));
  assert(graph.Parents("jaffle.orders").empty());
  assert(graph.Children("missing").empty());
}

void TestOrderingPutsProducersFirst() {
  const auto graph = MakeJaffleGraph();

  assert((graph.TopologicalOrder() == Names{"stg_customers", "stg_orders", "customers", "report"}));

  const auto layers = graph.Layers();
  assert(layers.size() == 3);
  assert((layers[0] == Names{"stg_customers", "stg_orders"}));
  assert((layers[1] == Names{"customers"}));
  assert((layers[2] == Names{"report"}));
}

void TestTraversalRespectsMaxDepth() {
  const auto graph = MakeJaffleGraph();

  const auto all = graph.Upstream("report");
  assert(all.size() == 5);
  assert(all.front() == "customers");

  assert((graph.Upstream("report", 1) == Names{"customers"}));
  assert((graph.Downstream("jaffle.orders") == Names{"stg_orders", "customers", "report"}));
  assert((graph.Downstream("jaffle.orders", 2) == Names{"stg_orders", "customers"}));
}

void TestCycleIsReportedInReferenceOrder() {
  LineageGraph graph;
  graph.AddModel("a");
  graph.AddModel("b");
  graph.AddModel("c");
  graph.AddReference("a", Ref("b"));
  graph.AddReference("b", Ref("c"));
  graph.AddReference("c", Ref("a"));

  bool threw = false;
  try {
    graph.CheckAcyclic();
  } catch (const colguard::util::CyclicDependencyError& e) {
    threw = true;
    assert((e.Cycle() == Names{"a", "b", "c", "a"}));
    assert(std::string(e.what()) == "cyclic dependency: a -> b -> c -> a");
  }
  assert(threw);

  threw = false;
  try {
    (void)graph.TopologicalOrder();
  } catch (const colguard::util::CyclicDependencyError&) {
    threw = true;
  }
  assert(threw);

  // Traversal still terminates on a cycle.
  assert(graph.Downstream("a").size() == 3);
}

void TestSelfReferenceIsACycle() {
  LineageGraph graph;
  graph.AddModel("loop");
  graph.AddReference("loop", Ref("loop"));

  bool threw = false;
  try {
    (void)graph.Layers();
  } catch (const colguard::util::CyclicDependencyError& e) {
    threw = true;
    assert((e.Cycle() == Names{"loop", "loop"}));
  }
  assert(threw);
}

void TestSelection() {
  const auto graph = MakeJaffleGraph();
  using Set        = std::set<std::string>;

  assert((graph.Select("customers") == Set{"customers"}));
  assert((graph.Select("+customers") == Set{"customers", "stg_customers", "stg_orders"}));
  assert((graph.Select("customers+") == Set{"customers", "report"}));
  assert((graph.Select("1+report") == Set{"customers", "report"}));
  assert((graph.Select("report+1") == Set{"report"}));
  assert((graph.Select("stg_orders+1, report") == Set{"customers", "report", "stg_orders"}));
  assert(graph.Select("jaffle.orders").empty());
  assert(graph.Select("unknown").empty());
}

void TestColumnTraceFollowsProvenance() {
  auto graph = MakeJaffleGraph();

  ModelLineage stg;
  stg.model   = "stg_orders";
  stg.columns = {Column{"order_date", {Provenance::Upstream("jaffle.orders", ReferenceKind::kSource, "order_date")}}};
  graph.SetLineage(stg);

  ModelLineage customers;
  customers.model   = "customers";
  customers.columns = {
      Column{"first_order", {Provenance::Upstream("stg_orders", ReferenceKind::kModel, "order_date")}},
      Column{"loaded_at", {Provenance::Opaque()}},
  };
  graph.SetLineage(customers);

  assert(graph.Lineage("customers") != nullptr);
  assert(graph.Lineage("report") == nullptr);

  const auto trace = graph.TraceColumn("customers", "first_order");
  assert(trace.size() == 2);
  assert(trace[0].node == "stg_orders" && trace[0].column == "order_date" && trace[0].depth == 1);
  assert(trace[1].node == "jaffle.orders" && trace[1].column == "order_date" && trace[1].depth == 2);

  assert(graph.TraceColumn("customers", "loaded_at").empty());
  assert(graph.TraceColumn("customers", "missing").empty());
}

} // namespace

int main() {
  TestNodesAndEdges();
  TestOrderingPutsProducersFirst();
  TestTraversalRespectsMaxDepth();
  TestCycleIsReportedInReferenceOrder();
  TestSelfReferenceIsACycle();
  TestSelection();
  TestColumnTraceFollowsProvenance();

  std::cout << "colguard_unit_lineage_graph: pass\n";
  return 0;
}
