#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/lineage/lineage_graph.hpp"
#include "internal/model/diagnostic.hpp"
#include "internal/model/model.hpp"
#include "internal/sql/dialect.hpp"

namespace colguard::validate {

/*
  Checks that every consumed upstream column exists in its producer.

  A producer's known output columns are its computed lineage when that
  is complete, otherwise its declared documentation, otherwise unknown
  (nothing to check). Opaque provenance is never a violation.
*/
class Validator {
 public:
  Validator(const model::Project& project, const lineage::LineageGraph& graph, sql::Dialect dialect);

  // Deduplicated, in emission order. Empty for models without lineage.
  std::vector<model::Diagnostic> ValidateModel(const std::string& model) const;

  // Concatenation of ValidateModel over `order`.
  std::vector<model::Diagnostic> ValidateAll(const std::vector<std::string>& order) const;

  std::optional<std::vector<std::string>> KnownColumns(const std::string& node) const;

 private:
  std::optional<std::vector<std::string>> DocumentedColumns(const std::optional<model::ColumnDocs>& docs) const;

  const model::Project&        project_;
  const lineage::LineageGraph& graph_;
  sql::Dialect                 dialect_;
};

} // namespace colguard::validate
