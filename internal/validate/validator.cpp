#include "internal/validate/validator.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace colguard::validate {

namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void Emit(std::vector<model::Diagnostic>& out, model::Diagnostic diagnostic) {
  if (std::find(out.begin(), out.end(), diagnostic) == out.end()) {
    out.push_back(std::move(diagnostic));
  }
}

} // namespace

Validator::Validator(const model::Project& project, const lineage::LineageGraph& graph, sql::Dialect dialect)
    : project_(project), graph_(graph), dialect_(std::move(dialect)) {
}

std::optional<std::vector<std::string>> Validator::DocumentedColumns(const std::optional<model::ColumnDocs>& docs) const {
  if (!docs) return std::nullopt;

  std::vector<std::string> names;
  for (const auto& doc : *docs) {
    names.push_back(dialect_.NormalizeDocName(doc.name));
  }
  return names;
}

std::optional<std::vector<std::string>> Validator::KnownColumns(const std::string& node) const {
  if (const auto* model = project_.FindModel(node)) {
    const auto* lineage = graph_.Lineage(node);
    if (lineage && !lineage->open_wildcard) {
      return lineage->ColumnNames();
    }
    return DocumentedColumns(model->docs);
  }

  auto it = project_.sources.find(node);
  if (it != project_.sources.end()) {
    return DocumentedColumns(it->second.docs);
  }
  return std::nullopt;
}

std::vector<model::Diagnostic> Validator::ValidateModel(const std::string& name) const {
  std::vector<model::Diagnostic> out;

  const auto* lineage = graph_.Lineage(name);
  if (!lineage) return out;

  for (const auto& d : lineage->dangling) {
    const auto where = d.relation.empty() ? std::string("any relation in scope") : "relation '" + d.relation + "'";
    Emit(out, model::Diagnostic{model::Severity::kError, name, d.consumer,
                                "column '" + d.column + "' is not exposed by " + where});
  }

  for (const auto& a : lineage->ambiguous) {
    std::string relations;
    for (const auto& r : a.relations) relations += (relations.empty() ? "'" : ", '") + r + "'";
    Emit(out, model::Diagnostic{model::Severity::kError, name, a.consumer,
                                "column '" + a.column + "' is ambiguous between relations " + relations});
  }

  for (const auto& column : lineage->columns) {
    for (const auto& p : column.provenance) {
      if (p.IsOpaque() || p.column.empty()) continue;

      const auto known = KnownColumns(p.producer);
      if (!known || Contains(*known, p.column)) continue;

      Emit(out, model::Diagnostic{model::Severity::kError, name, column.name,
                                  "column '" + column.name + "' references '" + p.producer + "." + p.column + "', which "
                                      + ReferenceKindName(p.producer_kind) + " '" + p.producer + "' does not produce"});
    }
  }

  for (const auto& ref : lineage->predicate_refs) {
    const auto& p = ref.provenance;
    if (p.IsOpaque() || p.column.empty()) continue;

    const auto known = KnownColumns(p.producer);
    if (!known || Contains(*known, p.column)) continue;

    Emit(out, model::Diagnostic{model::Severity::kError, name, std::nullopt,
                                ref.clause + " references '" + p.producer + "." + p.column + "', which "
                                    + ReferenceKindName(p.producer_kind) + " '" + p.producer + "' does not produce"});
  }

  // Documentation drift.
  const auto* model = project_.FindModel(name);
  if (model && !lineage->open_wildcard) {
    const auto computed = lineage->ColumnNames();
    if (const auto documented = DocumentedColumns(model->docs)) {
      for (const auto& doc : *documented) {
        if (Contains(computed, doc)) continue;
        Emit(out, model::Diagnostic{model::Severity::kWarning, name, doc,
                                    "documented column '" + doc + "' is not produced by model '" + name + "'"});
      }
    }
  }

  return out;
}

std::vector<model::Diagnostic> Validator::ValidateAll(const std::vector<std::string>& order) const {
  std::vector<model::Diagnostic> out;
  for (const auto& name : order) {
    auto diagnostics = ValidateModel(name);
    out.insert(out.end(), std::make_move_iterator(diagnostics.begin()), std::make_move_iterator(diagnostics.end()));
  }
  return out;
}

} // namespace colguard::validate
