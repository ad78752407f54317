#include "internal/validate/validator.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using colguard::lineage::LineageGraph;
using colguard::model::Column;
using colguard::model::ColumnDoc;
using colguard::model::ColumnDocs;
using colguard::model::Diagnostic;
using colguard::model::ModelLineage;
using colguard::model::Project;
using colguard::model::Provenance;
using colguard::model::ReferenceKind;
using colguard::model::Severity;
using colguard::validate::Validator;

using Names = std::vector<std::string>;

Provenance FromModel(const std::string& model, const std::string& column) {
  return Provenance::Upstream(model, ReferenceKind::kModel, column);
}

ModelLineage MakeLineage(const std::string& model, std::vector<Column> columns) {
  ModelLineage lineage;
  lineage.model   = model;
  lineage.columns = std::move(columns);
  return lineage;
}

void AddModel(Project& project, LineageGraph& graph, const std::string& name, std::optional<ColumnDocs> docs = std::nullopt) {
  project.models[name].name = name;
  project.models[name].docs = std::move(docs);
  graph.AddModel(name);
}

struct Fixture {
  Project      project;
  LineageGraph graph;

  Fixture() {
    AddModel(project, graph, "stg_customers");
    AddModel(project, graph, "customers");
    graph.SetLineage(MakeLineage("stg_customers", {
                                                      Column{"customer_id", {Provenance::Opaque()}},
                                                      Column{"first_name", {Provenance::Opaque()}},
                                                  }));
  }
};

void TestMissingUpstreamColumnIsAnError() {
  Fixture f;
  f.graph.SetLineage(MakeLineage("customers", {
                                                  Column{"customer_id", {FromModel("stg_customers", "customer_id")}},
                                                  Column{"nonexistant_column", {FromModel("stg_customers", "nonexistant_column")}},
                                              }));

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  const auto      diagnostics = validator.ValidateModel("customers");

  assert(diagnostics.size() == 1);
  assert(diagnostics[0].severity == Severity::kError);
  assert(diagnostics[0].model == "customers");
  assert(diagnostics[0].column == std::optional<std::string>("nonexistant_column"));
  assert(diagnostics[0].message
         == "column 'nonexistant_column' references 'stg_customers.nonexistant_column', which model 'stg_customers' does not produce");
}

void TestDuplicateFindingsCollapse() {
  Fixture f;
  f.graph.SetLineage(MakeLineage("customers", {
                                                  Column{"x", {FromModel("stg_customers", "gone"), FromModel("stg_customers", "gone")}},
                                              }));

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  assert(validator.ValidateModel("customers").size() == 1);
}

void TestOpaqueAndUnknownProducersAreNeverViolations() {
  Fixture f;
  AddModel(f.project, f.graph, "wide");
  auto wide          = MakeLineage("wide", {});
  wide.open_wildcard = true;
  f.graph.SetLineage(wide);

  f.graph.SetLineage(MakeLineage("customers", {
                                                  Column{"a", {Provenance::Opaque()}},
                                                  Column{"b", {FromModel("wide", "anything")}},
                                                  Column{"c", {FromModel("not_in_project", "anything")}},
                                              }));

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  assert(validator.ValidateModel("customers").empty());
  assert(!validator.KnownColumns("wide").has_value());
  assert(!validator.KnownColumns("not_in_project").has_value());
}

void TestDocumentationStandsInForUnknownLineage() {
  Fixture f;
  AddModel(f.project, f.graph, "wide", ColumnDocs{ColumnDoc{"ID", ""}, ColumnDoc{"Amount", ""}});
  auto wide          = MakeLineage("wide", {});
  wide.open_wildcard = true;
  f.graph.SetLineage(wide);

  auto& source       = f.project.sources["jaffle.payments"];
  source.source_name = "jaffle";
  source.name        = "payments";
  source.docs        = ColumnDocs{ColumnDoc{"payment_id", ""}};
  f.graph.AddSource("jaffle.payments");

  f.graph.SetLineage(MakeLineage("customers", {
                                                  Column{"id", {FromModel("wide", "id")}},
                                                  Column{"total", {FromModel("wide", "total")}},
                                                  Column{"amt", {Provenance::Upstream("jaffle.payments", ReferenceKind::kSource, "amt")}},
                                              }));

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  assert((validator.KnownColumns("wide") == Names{"id", "amount"}));

  const auto diagnostics = validator.ValidateModel("customers");
  assert(diagnostics.size() == 2);
  assert(diagnostics[0].column == std::optional<std::string>("total"));
  assert(diagnostics[1].message == "column 'amt' references 'jaffle.payments.amt', which source 'jaffle.payments' does not produce");
}

void TestDanglingAndPredicateReferences() {
  Fixture f;
  auto    lineage = MakeLineage("customers", {Column{"zzz", {}}});
  lineage.dangling.push_back({"zzz", "t", "zzz"});
  lineage.dangling.push_back({"where", "", "ghost"});
  lineage.predicate_refs.push_back({"join", FromModel("stg_customers", "customer_key")});
  lineage.predicate_refs.push_back({"where", FromModel("stg_customers", "first_name")});
  f.graph.SetLineage(lineage);

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  const auto      diagnostics = validator.ValidateModel("customers");

  assert(diagnostics.size() == 3);
  assert(diagnostics[0].message == "column 'zzz' is not exposed by relation 't'");
  assert(diagnostics[1].message == "column 'ghost' is not exposed by any relation in scope");
  assert(!diagnostics[2].column.has_value());
  assert(diagnostics[2].message == "join references 'stg_customers.customer_key', which model 'stg_customers' does not produce");
}

void TestAmbiguousColumnIsAnError() {
  Fixture f;
  auto    lineage = MakeLineage("customers", {Column{"customer_id", {FromModel("stg_customers", "customer_id")}}});
  lineage.ambiguous.push_back({"customer_id", "customer_id", {"c", "o"}});
  f.graph.SetLineage(lineage);

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  const auto      diagnostics = validator.ValidateModel("customers");

  assert(diagnostics.size() == 1);
  assert(diagnostics[0].severity == Severity::kError);
  assert(diagnostics[0].column == std::optional<std::string>("customer_id"));
  assert(diagnostics[0].message == "column 'customer_id' is ambiguous between relations 'c', 'o'");
}

void TestDocumentationDriftIsAWarning() {
  Project      project;
  LineageGraph graph;
  AddModel(project, graph, "customers", ColumnDocs{ColumnDoc{"customer_id", ""}, ColumnDoc{"legacy_flag", ""}});
  graph.SetLineage(MakeLineage("customers", {Column{"CUSTOMER_ID", {Provenance::Opaque()}}}));

  const Validator validator(project, graph, colguard::sql::DialectByName("snowflake"));
  const auto      diagnostics = validator.ValidateModel("customers");

  assert(diagnostics.size() == 1);
  assert(diagnostics[0].severity == Severity::kWarning);
  assert(diagnostics[0].column == std::optional<std::string>("LEGACY_FLAG"));
}

void TestValidateAllFollowsOrder() {
  Fixture f;
  AddModel(f.project, f.graph, "orders");
  f.graph.SetLineage(MakeLineage("customers", {Column{"a", {FromModel("stg_customers", "a")}}}));
  f.graph.SetLineage(MakeLineage("orders", {Column{"b", {FromModel("stg_customers", "b")}}}));

  const Validator validator(f.project, f.graph, colguard::sql::DialectByName("ansi"));
  const auto      all = validator.ValidateAll({"orders", "customers", "no_lineage"});

  assert(all.size() == 2);
  assert(all[0].model == "orders");
  assert(all[1].model == "customers");
}

} // namespace

int main() {
  TestMissingUpstreamColumnIsAnError();
  TestDuplicateFindingsCollapse();
  TestOpaqueAndUnknownProducersAreNeverViolations();
  TestDocumentationStandsInForUnknownLineage();
  TestDanglingAndPredicateReferences();
  TestAmbiguousColumnIsAnError();
  TestDocumentationDriftIsAWarning();
  TestValidateAllFollowsOrder();

  std::cout << "colguard_unit_validator: pass\n";
  return 0;
}
