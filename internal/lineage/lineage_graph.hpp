#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/column.hpp"
#include "internal/model/reference.hpp"

namespace colguard::lineage {

enum class NodeKind {
  kModel,
  kSource,
};

// One step of a transitive column trace.
struct TracedColumn {
  std::string   node;
  std::string   column;
  std::uint32_t depth = 0;
};

/*
  Project-wide dependency graph.

  Edges run consumer -> producer (parents) and producer -> consumer
  (children). Only model-to-model edges take part in ordering and cycle
  detection; sources are always leaves.

  Built by one thread, then read concurrently.
*/
class LineageGraph {
 public:
  void AddModel(const std::string& name);
  void AddSource(const std::string& key);

  // Adds consumer -> ref.NodeKey(); duplicates collapse.
  void AddReference(const std::string& consumer, const model::Reference& ref);

  void SetLineage(model::ModelLineage lineage);

  bool HasNode(const std::string& node) const;
  bool IsModel(const std::string& node) const;

  // Sorted model names.
  std::vector<std::string> Models() const;

  // Immediate producers / consumers in insertion order.
  const std::vector<std::string>& Parents(const std::string& node) const;
  const std::vector<std::string>& Children(const std::string& node) const;

  // Breadth-first, excluding the start node. max_depth 0 = unlimited.
  std::vector<std::string> Upstream(const std::string& node, std::uint32_t max_depth = 0) const;
  std::vector<std::string> Downstream(const std::string& node, std::uint32_t max_depth = 0) const;

  // Throws util::CyclicDependencyError naming the cycle in reference order.
  void CheckAcyclic() const;

  // Producers before consumers; ties broken by name.
  std::vector<std::string> TopologicalOrder() const;

  // Groups of models whose producers all sit in earlier groups.
  std::vector<std::vector<std::string>> Layers() const;

  const model::ModelLineage* Lineage(const std::string& model) const;

  // Every upstream (node, column) the column derives from, nearest first.
  std::vector<TracedColumn> TraceColumn(const std::string& model, const std::string& column) const;

  /*
    Model selection:
      name      the model
      +name     with ancestors      2+name  ancestors up to depth 2
      name+     with descendants    name+1  descendants up to depth 1
    Selectors are separated by commas or whitespace. Unknown names select nothing.
  */
  std::set<std::string> Select(std::string_view selection) const;

 private:
  std::vector<std::string> Traverse(const std::string& start, bool upstream, std::uint32_t max_depth) const;

  std::map<std::string, NodeKind>                 nodes_;
  std::map<std::string, std::vector<std::string>> parents_;
  std::map<std::string, std::vector<std::string>> children_;
  std::map<std::string, model::ModelLineage>      lineage_;
};

} // namespace colguard::lineage
