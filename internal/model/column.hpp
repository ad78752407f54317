#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/model/reference.hpp"

namespace colguard::model {

/*
  One source of an output column.

  kUpstream: (producer node, producer column)
  kOpaque:   derived from a literal, an unknown function, or a relation
             whose columns cannot be known. Never a violation.
*/
struct Provenance {
  enum class Kind {
    kUpstream,
    kOpaque,
  };

  Kind          kind = Kind::kOpaque;
  std::string   producer; // node key
  ReferenceKind producer_kind = ReferenceKind::kModel;
  std::string   column;

  static Provenance Opaque() {
    return {};
  }

  static Provenance Upstream(std::string producer, ReferenceKind producer_kind, std::string column) {
    Provenance p;
    p.kind          = Kind::kUpstream;
    p.producer      = std::move(producer);
    p.producer_kind = producer_kind;
    p.column        = std::move(column);
    return p;
  }

  bool IsOpaque() const {
    return kind == Kind::kOpaque;
  }

  bool operator==(const Provenance& other) const {
    return kind == other.kind && producer == other.producer && producer_kind == other.producer_kind && column == other.column;
  }
};

struct Column {
  std::string             name;
  std::vector<Provenance> provenance;
};

// A column requested from a relation inside the query that does not expose it.
struct DanglingReference {
  std::string consumer; // output column or clause name
  std::string relation; // empty when no relation in scope matched
  std::string column;
};

// Upstream column read outside the projection (join, where, group by, ...).
struct PredicateReference {
  std::string clause;
  Provenance  provenance;
};

// An unqualified column that more than one relation in the same scope exposes.
struct AmbiguousReference {
  std::string              consumer;
  std::string              column;
  std::vector<std::string> relations; // aliases, FROM order
};

struct ModelLineage {
  std::string         model;
  std::vector<Column> columns;

  // Output also expands a relation with unknown columns.
  bool open_wildcard = false;

  std::vector<DanglingReference>  dangling;
  std::vector<PredicateReference> predicate_refs;
  std::vector<AmbiguousReference> ambiguous;

  std::vector<std::string> ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) names.push_back(c.name);
    return names;
  }
};

} // namespace colguard::model
