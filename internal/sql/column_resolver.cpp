#include "internal/sql/column_resolver.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <type_traits>
#include <variant>

#include "internal/sql/ast.hpp"
#include "internal/sql/parser.hpp"
#include "internal/util/errors.hpp"

namespace colguard::sql {

using model::Column;
using model::Provenance;

// ------------------------------------------------------------
// RelationCatalog
// ------------------------------------------------------------

void RelationCatalog::Add(const std::string& relation, UpstreamRelation upstream) {
  relations_.insert_or_assign(dialect_.NormalizeRelation(relation), std::move(upstream));
}

void RelationCatalog::AddSearchPrefix(const std::string& prefix) {
  if (!prefix.empty()) prefixes_.insert(dialect_.NormalizeRelation(prefix));
}

const UpstreamRelation* RelationCatalog::Lookup(const std::string& key) const {
  auto it = relations_.find(key);
  return it == relations_.end() ? nullptr : &it->second;
}

const UpstreamRelation* RelationCatalog::Find(const std::vector<std::string>& parts) const {
  auto joined = [&](std::size_t skip) {
    std::string key;
    for (std::size_t i = skip; i < parts.size(); ++i) {
      if (!key.empty()) key += '.';
      key += parts[i];
    }
    return key;
  };

  const auto key = joined(0);
  if (const auto* found = Lookup(key)) return found;

  // Only configured qualifiers may be dropped; other schemas are different relations.
  for (std::size_t skip = 0; skip + 1 < parts.size() && prefixes_.contains(parts[skip]); ++skip) {
    if (const auto* found = Lookup(joined(skip + 1))) return found;
  }
  for (const auto& prefix : prefixes_) {
    if (const auto* found = Lookup(prefix + "." + key)) return found;
  }
  return nullptr;
}

namespace {

void AppendUnique(std::vector<Provenance>& dst, const Provenance& p) {
  if (std::find(dst.begin(), dst.end(), p) == dst.end()) {
    dst.push_back(p);
  }
}

void AppendAll(std::vector<Provenance>& dst, const std::vector<Provenance>& src) {
  for (const auto& p : src) AppendUnique(dst, p);
}

/*
  Columns a query or relation exposes.

  An open shape may expose more columns than listed; unlisted columns
  take their provenance from unknown_origins, where an upstream origin
  with an empty column means "the same column of that producer".
*/
struct Shape {
  std::vector<Column>     columns;
  bool                    open = false;
  std::vector<Provenance> unknown_origins;

  const Column* Find(const std::string& name) const {
    for (const auto& c : columns) {
      if (c.name == name) return &c;
    }
    return nullptr;
  }
};

struct Binding {
  std::string alias;
  Shape       shape;
  bool        local = false; // CTE or derived table

  // Set for upstream relations with a known column list.
  std::optional<Provenance> upstream;

  bool Exposes(const std::string& column) const {
    return shape.Find(column) != nullptr;
  }
};

struct CteEnv {
  const CteEnv*                                  parent = nullptr;
  std::map<std::string, std::shared_ptr<Shape>>  ctes;

  const Shape* Find(const std::string& name) const {
    for (const auto* env = this; env; env = env->parent) {
      if (auto it = env->ctes.find(name); it != env->ctes.end()) return it->second.get();
    }
    return nullptr;
  }
};

struct Scope {
  const Scope*                                   parent = nullptr;
  const CteEnv*                                  env    = nullptr;
  std::vector<Binding>                           bindings;
  std::set<std::string>                          using_columns;
  std::map<std::string, std::vector<Provenance>> aliases; // projection aliases seen so far

  const Binding* FindBinding(const std::string& alias) const {
    for (const auto& b : bindings) {
      if (b.alias == alias) return &b;
    }
    return nullptr;
  }
};

struct RefSet {
  std::vector<Provenance> provenance;
  bool                    saw_column = false;
};

std::string SetOperatorName(SetOperator op) {
  switch (op) {
    case SetOperator::kUnion: return "UNION";
    case SetOperator::kIntersect: return "INTERSECT";
    case SetOperator::kExcept: return "EXCEPT";
  }
  return "UNION";
}

// ------------------------------------------------------------
// QueryResolver: state for one Resolve() call
// ------------------------------------------------------------

class QueryResolver {
 public:
  QueryResolver(const std::string& model, const RelationCatalog& catalog, model::ModelLineage& out)
      : model_(model), catalog_(catalog), out_(out) {
  }

  Shape ResolveQuery(const Query& query, const CteEnv* parent_env, const Scope* outer) {
    CteEnv env;
    env.parent = parent_env;

    for (const auto& cte : query.ctes) {
      if (query.recursive) {
        // Self-references inside a recursive CTE see an opaque relation.
        auto placeholder  = std::make_shared<Shape>();
        placeholder->open = true;
        placeholder->unknown_origins.push_back(Provenance::Opaque());
        for (const auto& name : cte.column_aliases) {
          placeholder->columns.push_back(Column{name, {Provenance::Opaque()}});
        }
        env.ctes[cte.name] = placeholder;
      }

      auto shape = ResolveQuery(*cte.query, &env, outer);
      ApplyColumnAliases(shape, cte.column_aliases, true, "CTE '" + cte.name + "'");
      env.ctes[cte.name] = std::make_shared<Shape>(std::move(shape));
    }

    return ResolveSetExpr(*query.body, &env, outer, &query.order_by);
  }

 private:
  // ------------------------------------------------------------
  // Set expressions
  // ------------------------------------------------------------

  Shape ResolveSetExpr(const SetExpr& set, const CteEnv* env, const Scope* outer, const std::vector<ExprPtr>* order_by) {
    if (const auto* select = std::get_if<Select>(&set.node)) {
      return ResolveSelect(*select, env, outer, order_by);
    }

    Shape shape;
    if (const auto* nested = std::get_if<QueryPtr>(&set.node)) {
      shape = ResolveQuery(**nested, env, outer);
    } else if (const auto* values = std::get_if<Values>(&set.node)) {
      shape = ResolveValues(*values, env, outer);
    } else {
      const auto& op = std::get<SetOperation>(set.node);
      shape          = ResolveSetOperation(op, env, outer);
    }

    if (order_by) {
      ResolveOutputOrder(*order_by, shape);
    }
    return shape;
  }

  Shape ResolveSetOperation(const SetOperation& op, const CteEnv* env, const Scope* outer) {
    auto left  = ResolveSetExpr(*op.left, env, outer, nullptr);
    auto right = ResolveSetExpr(*op.right, env, outer, nullptr);

    Shape out = std::move(left);
    AppendAll(out.unknown_origins, right.unknown_origins);

    if (!out.open && !right.open && out.columns.size() != right.columns.size()) {
      throw util::MalformedQueryError(model_, SetOperatorName(op.op) + " branches return " + std::to_string(out.columns.size())
                                                  + " and " + std::to_string(right.columns.size()) + " columns");
    }

    const auto common = std::min(out.columns.size(), right.columns.size());
    for (std::size_t i = 0; i < common; ++i) {
      AppendAll(out.columns[i].provenance, right.columns[i].provenance);
    }
    out.open = out.open || right.open;
    return out;
  }

  Shape ResolveValues(const Values& values, const CteEnv* env, const Scope* outer) {
    Scope scope;
    scope.parent = outer;
    scope.env    = env;

    Shape shape;
    for (const auto& row : values.rows) {
      if (!shape.columns.empty() && row.size() != shape.columns.size()) {
        throw util::MalformedQueryError(model_, "VALUES rows have " + std::to_string(shape.columns.size()) + " and "
                                                    + std::to_string(row.size()) + " columns");
      }
      for (std::size_t i = 0; i < row.size(); ++i) {
        if (shape.columns.size() <= i) {
          shape.columns.push_back(Column{"column" + std::to_string(i + 1), {}});
        }
        auto name = shape.columns[i].name;
        auto refs = Collect(*row[i], scope, name);
        AppendAll(shape.columns[i].provenance, refs.saw_column ? refs.provenance : std::vector<Provenance>{Provenance::Opaque()});
      }
    }
    return shape;
  }

  // ORDER BY after a set operation sees only the output columns.
  void ResolveOutputOrder(const std::vector<ExprPtr>& order_by, const Shape& shape) {
    for (const auto& expr : order_by) {
      const auto* ref = std::get_if<ColumnRef>(&expr->node);
      if (!ref) continue;
      if (const auto* column = shape.Find(ref->Name())) {
        RecordPredicates("order by", column->provenance);
      }
    }
  }

  // ------------------------------------------------------------
  // SELECT
  // ------------------------------------------------------------

  Shape ResolveSelect(const Select& select, const CteEnv* env, const Scope* outer, const std::vector<ExprPtr>* order_by) {
    Scope scope;
    scope.parent = outer;
    scope.env    = env;

    for (const auto& ref : select.from) {
      Bind(*ref, scope);
    }
    if (select.where) {
      RecordPredicate(*select.where, scope, "where");
    }

    Shape shape;
    for (const auto& item : select.items) {
      if (const auto* wildcard = std::get_if<Wildcard>(&item)) {
        ExpandWildcard(*wildcard, scope, shape);
        continue;
      }

      const auto& expr_item = std::get<ExprItem>(item);
      Column      column;
      column.name = expr_item.alias.empty() ? DeriveName(*expr_item.expr) : expr_item.alias;

      auto refs         = Collect(*expr_item.expr, scope, column.name);
      column.provenance = refs.saw_column ? std::move(refs.provenance) : std::vector<Provenance>{Provenance::Opaque()};

      if (!scope.aliases.contains(column.name)) {
        scope.aliases[column.name] = column.provenance;
      }
      shape.columns.push_back(std::move(column));
    }

    for (const auto& expr : select.distinct_on) RecordPredicate(*expr, scope, "distinct on");
    for (const auto& expr : select.group_by) RecordPredicate(*expr, scope, "group by");
    if (select.having) RecordPredicate(*select.having, scope, "having");
    for (const auto& expr : select.window) RecordPredicate(*expr, scope, "window");
    if (order_by) {
      for (const auto& expr : *order_by) RecordPredicate(*expr, scope, "order by");
    }
    return shape;
  }

  std::string DeriveName(const Expr& expr) const {
    if (const auto* ref = std::get_if<ColumnRef>(&expr.node)) {
      return ref->Name();
    }
    if (const auto* call = std::get_if<FunctionCall>(&expr.node)) {
      const auto dot = call->name.rfind('.');
      return dot == std::string::npos ? call->name : call->name.substr(dot + 1);
    }
    if (const auto* cast = std::get_if<Cast>(&expr.node)) {
      if (const auto* ref = std::get_if<ColumnRef>(&cast->expr->node)) {
        return ref->Name();
      }
    }
    return "?column?";
  }

  void ExpandWildcard(const Wildcard& wildcard, const Scope& scope, Shape& shape) {
    std::vector<const Binding*> targets;
    if (!wildcard.qualifier.empty()) {
      const auto* binding = scope.FindBinding(wildcard.qualifier);
      if (!binding) {
        throw util::MalformedQueryError(model_, "unknown relation '" + wildcard.qualifier + "' in " + wildcard.qualifier + ".*");
      }
      targets.push_back(binding);
    } else {
      for (const auto& b : scope.bindings) targets.push_back(&b);
    }

    std::set<std::string> emitted_using;
    for (const auto* binding : targets) {
      for (const auto& source : binding->shape.columns) {
        Column column = source;
        if (wildcard.qualifier.empty() && scope.using_columns.contains(source.name)) {
          if (!emitted_using.insert(source.name).second) continue;
          for (const auto& other : scope.bindings) {
            if (const auto* shared = other.shape.Find(source.name)) AppendAll(column.provenance, shared->provenance);
          }
        }
        shape.columns.push_back(std::move(column));
      }

      if (binding->shape.open) {
        shape.open = true;
        if (binding->shape.unknown_origins.empty()) {
          AppendUnique(shape.unknown_origins, Provenance::Opaque());
        }
        AppendAll(shape.unknown_origins, binding->shape.unknown_origins);
      }
    }
  }

  // ------------------------------------------------------------
  // FROM bindings
  // ------------------------------------------------------------

  void Bind(const TableRef& ref, Scope& scope) {
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, NamedTable>) {
            BindNamed(node, scope);
          } else if constexpr (std::is_same_v<T, DerivedTable>) {
            Binding binding;
            binding.alias = node.alias;
            binding.local = true;
            binding.shape = ResolveQuery(*node.query, scope.env, scope.parent);
            ApplyColumnAliases(binding.shape, node.column_aliases, true, "derived table '" + node.alias + "'");
            scope.bindings.push_back(std::move(binding));
          } else if constexpr (std::is_same_v<T, TableFunction>) {
            BindFunction(node, scope);
          } else {
            BindJoin(node, scope);
          }
        },
        ref.node);
  }

  void BindNamed(const NamedTable& table, Scope& scope) {
    Binding binding;
    binding.alias = table.alias.empty() ? table.parts.back() : table.alias;

    const Shape* cte = table.parts.size() == 1 && scope.env ? scope.env->Find(table.parts.front()) : nullptr;
    if (cte) {
      binding.local = true;
      binding.shape = *cte;
    } else if (const auto* upstream = catalog_.Find(table.parts)) {
      if (upstream->columns) {
        binding.upstream = Provenance::Upstream(upstream->producer, upstream->kind, "");
        for (const auto& name : *upstream->columns) {
          binding.shape.columns.push_back(Column{name, {Provenance::Upstream(upstream->producer, upstream->kind, name)}});
        }
      } else {
        binding.shape.open = true;
        binding.shape.unknown_origins.push_back(Provenance::Upstream(upstream->producer, upstream->kind, ""));
      }
    } else {
      // Neither a reference nor a CTE: columns cannot be known.
      binding.shape.open = true;
      binding.shape.unknown_origins.push_back(Provenance::Opaque());
    }

    ApplyColumnAliases(binding.shape, table.column_aliases, false, "table '" + binding.alias + "'");
    scope.bindings.push_back(std::move(binding));
  }

  void BindFunction(const TableFunction& fn, Scope& scope) {
    Binding binding;
    binding.alias = fn.alias.empty() ? fn.name : fn.alias;

    // Arguments may read columns of relations bound earlier (lateral).
    RefSet refs;
    for (const auto& arg : fn.args) {
      auto r = Collect(*arg, scope, binding.alias);
      AppendAll(refs.provenance, r.provenance);
      refs.saw_column = refs.saw_column || r.saw_column;
    }
    auto origins = refs.provenance.empty() ? std::vector<Provenance>{Provenance::Opaque()} : refs.provenance;

    if (fn.column_aliases.empty()) {
      binding.shape.open            = true;
      binding.shape.unknown_origins = std::move(origins);
    } else {
      for (const auto& name : fn.column_aliases) {
        binding.shape.columns.push_back(Column{name, origins});
      }
    }
    scope.bindings.push_back(std::move(binding));
  }

  void BindJoin(const Join& join, Scope& scope) {
    const auto left_count = scope.bindings.size();
    Bind(*join.left, scope);
    const auto right_start = scope.bindings.size();
    Bind(*join.right, scope);

    for (const auto& name : join.using_columns) {
      scope.using_columns.insert(name);
    }

    if (join.natural) {
      for (std::size_t r = right_start; r < scope.bindings.size(); ++r) {
        for (const auto& column : scope.bindings[r].shape.columns) {
          for (std::size_t l = left_count; l < right_start; ++l) {
            if (scope.bindings[l].Exposes(column.name)) scope.using_columns.insert(column.name);
          }
        }
      }
    }

    if (join.on) {
      RecordPredicate(*join.on, scope, "join");
    }
    for (const auto& name : join.using_columns) {
      for (const auto& b : scope.bindings) {
        if (const auto* column = b.shape.Find(name)) RecordPredicates("join", column->provenance);
      }
    }
  }

  void ApplyColumnAliases(Shape& shape, const std::vector<std::string>& aliases, bool strict, const std::string& what) {
    if (aliases.empty()) return;

    const auto known = shape.columns.size();
    if (!shape.open && (aliases.size() > known || (strict && aliases.size() != known))) {
      throw util::MalformedQueryError(model_, what + " has " + std::to_string(known) + " columns but "
                                                  + std::to_string(aliases.size()) + " column aliases");
    }

    for (std::size_t i = 0; i < aliases.size(); ++i) {
      if (i < known) {
        shape.columns[i].name = aliases[i];
      } else {
        // Positional aliases over unlisted columns cannot name the producer column.
        std::vector<Provenance> provenance;
        for (const auto& origin : shape.unknown_origins) {
          AppendUnique(provenance, origin.column.empty() ? Provenance::Opaque() : origin);
        }
        shape.columns.push_back(Column{aliases[i], std::move(provenance)});
      }
    }
    // Aliases name every output column.
    if (shape.open && aliases.size() >= known) shape.open = false;
  }

  // ------------------------------------------------------------
  // Column references
  // ------------------------------------------------------------

  std::vector<Provenance> Attribute(const Binding& binding, const std::string& column, const std::string& consumer) {
    if (const auto* found = binding.shape.Find(column)) {
      return found->provenance;
    }
    if (binding.shape.open) {
      std::vector<Provenance> out;
      for (auto origin : binding.shape.unknown_origins) {
        if (!origin.IsOpaque() && origin.column.empty()) origin.column = column;
        AppendUnique(out, origin);
      }
      if (out.empty()) out.push_back(Provenance::Opaque());
      return out;
    }
    if (binding.upstream) {
      // Missing upstream columns are reported by the validator.
      auto p   = *binding.upstream;
      p.column = column;
      return {p};
    }
    out_.dangling.push_back(model::DanglingReference{consumer, binding.alias, column});
    return {};
  }

  std::vector<Provenance> ResolveColumn(const ColumnRef& ref, const Scope& scope, const std::string& consumer) {
    const auto& name = ref.Name();

    if (ref.parts.size() >= 2) {
      const auto& qualifier = ref.parts[ref.parts.size() - 2];
      for (const auto* s = &scope; s; s = s->parent) {
        if (const auto* binding = s->FindBinding(qualifier)) {
          return Attribute(*binding, name, consumer);
        }
      }
      // struct field access: col.field
      const auto& head = ref.parts.front();
      for (const auto* s = &scope; s; s = s->parent) {
        for (const auto& b : s->bindings) {
          if (b.Exposes(head)) return Attribute(b, head, consumer);
        }
      }
      return {Provenance::Opaque()};
    }

    if (scope.using_columns.contains(name)) {
      std::vector<Provenance> out;
      for (const auto& b : scope.bindings) {
        if (const auto* column = b.shape.Find(name)) AppendAll(out, column->provenance);
      }
      if (!out.empty()) return out;
    }

    // Enclosing scopes are searched until one holds a relation with unknown columns.
    for (const auto* s = &scope; s; s = s->parent) {
      std::vector<const Binding*> exposing;
      for (const auto& b : s->bindings) {
        if (b.Exposes(name)) exposing.push_back(&b);
      }
      if (exposing.size() == 1) return Attribute(*exposing.front(), name, consumer);
      if (exposing.size() > 1) return ResolveAmbiguous(exposing, name, consumer);

      const auto has_open = std::any_of(s->bindings.begin(), s->bindings.end(), [](const Binding& b) { return b.shape.open; });
      if (has_open) break;
    }

    if (auto it = scope.aliases.find(name); it != scope.aliases.end()) {
      return it->second;
    }

    const Scope* home = &scope;
    while (home->bindings.empty() && home->parent) home = home->parent;

    std::vector<const Binding*> open;
    for (const auto& b : home->bindings) {
      if (b.shape.open) open.push_back(&b);
    }
    if (open.size() == 1) {
      return Attribute(*open.front(), name, consumer);
    }
    if (open.size() > 1) {
      return {Provenance::Opaque()};
    }
    if (home->bindings.size() == 1) {
      return Attribute(home->bindings.front(), name, consumer);
    }

    out_.dangling.push_back(model::DanglingReference{consumer, "", name});
    return {};
  }

  // Every candidate is a possible source; the reference itself is reported.
  std::vector<Provenance> ResolveAmbiguous(const std::vector<const Binding*>& candidates, const std::string& name,
                                           const std::string& consumer) {
    model::AmbiguousReference ambiguous{consumer, name, {}};
    std::vector<Provenance>   out;
    for (const auto* b : candidates) {
      ambiguous.relations.push_back(b->alias);
      AppendAll(out, Attribute(*b, name, consumer));
    }
    out_.ambiguous.push_back(std::move(ambiguous));
    return out;
  }

  // ------------------------------------------------------------
  // Expressions
  // ------------------------------------------------------------

  RefSet Collect(const Expr& expr, const Scope& scope, const std::string& consumer) {
    RefSet out;
    CollectInto(expr, scope, consumer, out);
    return out;
  }

  void CollectQuery(const Query& query, const Scope& scope, RefSet& out) {
    auto shape     = ResolveQuery(query, scope.env, &scope);
    out.saw_column = true;
    for (const auto& column : shape.columns) AppendAll(out.provenance, column.provenance);
    if (shape.open) {
      for (const auto& origin : shape.unknown_origins) {
        if (origin.IsOpaque()) AppendUnique(out.provenance, origin);
      }
    }
  }

  void CollectInto(const Expr& expr, const Scope& scope, const std::string& consumer, RefSet& out) {
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, ColumnRef>) {
            out.saw_column = true;
            AppendAll(out.provenance, ResolveColumn(node, scope, consumer));
          } else if constexpr (std::is_same_v<T, Literal> || std::is_same_v<T, Star>) {
            // no column references
          } else if constexpr (std::is_same_v<T, FunctionCall>) {
            for (const auto& arg : node.args) CollectInto(*arg, scope, consumer, out);
            if (node.filter) RecordPredicate(*node.filter, scope, "filter");
            for (const auto& e : node.order_by) RecordPredicate(*e, scope, "order by");
            for (const auto& e : node.within_group) RecordPredicate(*e, scope, "within group");
            if (node.over) {
              for (const auto& e : node.over->partition_by) RecordPredicate(*e, scope, "window");
              for (const auto& e : node.over->order_by) RecordPredicate(*e, scope, "window");
            }
          } else if constexpr (std::is_same_v<T, Operation>) {
            for (const auto& operand : node.operands) CollectInto(*operand, scope, consumer, out);
          } else if constexpr (std::is_same_v<T, Case>) {
            if (node.operand) CollectInto(*node.operand, scope, consumer, out);
            for (const auto& [when, then] : node.whens) {
              CollectInto(*when, scope, consumer, out);
              CollectInto(*then, scope, consumer, out);
            }
            if (node.otherwise) CollectInto(*node.otherwise, scope, consumer, out);
          } else if constexpr (std::is_same_v<T, Cast>) {
            CollectInto(*node.expr, scope, consumer, out);
          } else if constexpr (std::is_same_v<T, Subquery>) {
            CollectQuery(*node.query, scope, out);
          } else if constexpr (std::is_same_v<T, Exists>) {
            ResolveQuery(*node.query, scope.env, &scope);
          } else {
            static_assert(std::is_same_v<T, InList>);
            CollectInto(*node.expr, scope, consumer, out);
            for (const auto& item : node.items) CollectInto(*item, scope, consumer, out);
            if (node.subquery) CollectQuery(*node.subquery, scope, out);
          }
        },
        expr.node);
  }

  void RecordPredicate(const Expr& expr, const Scope& scope, const std::string& clause) {
    auto refs = Collect(expr, scope, clause);
    RecordPredicates(clause, refs.provenance);
  }

  void RecordPredicates(const std::string& clause, const std::vector<Provenance>& provenance) {
    for (const auto& p : provenance) {
      if (p.IsOpaque()) continue;
      const auto exists = std::any_of(out_.predicate_refs.begin(), out_.predicate_refs.end(),
                                      [&](const model::PredicateReference& r) { return r.clause == clause && r.provenance == p; });
      if (!exists) out_.predicate_refs.push_back(model::PredicateReference{clause, p});
    }
  }

  const std::string&     model_;
  const RelationCatalog& catalog_;
  model::ModelLineage&   out_;
};

} // namespace

model::ModelLineage ColumnResolver::Resolve(const std::string& model, std::string_view sql, const RelationCatalog& catalog) const {
  QueryPtr query;
  try {
    query = ParseQuery(sql, dialect_);
  } catch (const SqlSyntaxError& e) {
    throw util::MalformedQueryError(model, e.what());
  }

  model::ModelLineage lineage;
  lineage.model = model;

  QueryResolver resolver(model, catalog, lineage);
  auto          shape = resolver.ResolveQuery(*query, nullptr, nullptr);

  lineage.columns       = std::move(shape.columns);
  lineage.open_wildcard = shape.open;
  return lineage;
}

} // namespace colguard::sql
