#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/column.hpp"
#include "internal/model/reference.hpp"
#include "internal/sql/dialect.hpp"

namespace colguard::sql {

// Upstream node a rendered relation identifier stands for.
struct UpstreamRelation {
  std::string          producer; // node key
  model::ReferenceKind kind = model::ReferenceKind::kModel;

  // Known output columns, already folded. nullopt = unknown.
  std::optional<std::vector<std::string>> columns;
};

/*
  Maps relation identifiers as they appear in rendered SQL to upstream
  nodes.

  A lookup matches the identifier exactly. Leading qualifiers are dropped
  or supplied only when they are registered search prefixes (the target
  schema), so with prefix "analytics" both "analytics.orders" and
  "orders" find "analytics.orders", while "staging.orders" finds nothing
  unless "staging.orders" itself is registered.
*/
class RelationCatalog {
 public:
  explicit RelationCatalog(Dialect dialect) : dialect_(std::move(dialect)) {
  }

  void Add(const std::string& relation, UpstreamRelation upstream);

  void AddSearchPrefix(const std::string& prefix);

  // parts are already folded.
  const UpstreamRelation* Find(const std::vector<std::string>& parts) const;

  std::size_t Size() const {
    return relations_.size();
  }

 private:
  const UpstreamRelation* Lookup(const std::string& key) const;

  Dialect                                 dialect_;
  std::map<std::string, UpstreamRelation> relations_;
  std::set<std::string>                   prefixes_;
};

/*
  Computes column-level lineage for one rendered model.

  Output columns keep projection order; `select *` expands in FROM
  order and each relation's column order. CTEs and derived tables are
  resolved first and bound as local relations.

  Throws util::MalformedQueryError on parse failures, set-operation
  arity mismatches and column alias list mismatches.
*/
class ColumnResolver {
 public:
  explicit ColumnResolver(Dialect dialect) : dialect_(std::move(dialect)) {
  }

  model::ModelLineage Resolve(const std::string& model, std::string_view sql, const RelationCatalog& catalog) const;

  const Dialect& GetDialect() const {
    return dialect_;
  }

 private:
  Dialect dialect_;
};

} // namespace colguard::sql
