#include "internal/lineage/lineage_graph.hpp"

#include <algorithm>
#include <cctype>
#include <queue>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace colguard::lineage {

namespace {

const std::vector<std::string> kNoEdges;

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

void LineageGraph::AddModel(const std::string& name) {
  nodes_[name] = NodeKind::kModel;
}

void LineageGraph::AddSource(const std::string& key) {
  nodes_.emplace(key, NodeKind::kSource);
}

void LineageGraph::AddReference(const std::string& consumer, const model::Reference& ref) {
  const auto producer = ref.NodeKey();

  if (!nodes_.contains(producer)) {
    nodes_[producer] = ref.kind == model::ReferenceKind::kSource ? NodeKind::kSource : NodeKind::kModel;
  }

  auto& parents = parents_[consumer];
  if (std::find(parents.begin(), parents.end(), producer) != parents.end()) {
    return;
  }
  parents.push_back(producer);
  children_[producer].push_back(consumer);
}

void LineageGraph::SetLineage(model::ModelLineage lineage) {
  auto name      = lineage.model;
  lineage_[name] = std::move(lineage);
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

bool LineageGraph::HasNode(const std::string& node) const {
  return nodes_.contains(node);
}

bool LineageGraph::IsModel(const std::string& node) const {
  auto it = nodes_.find(node);
  return it != nodes_.end() && it->second == NodeKind::kModel;
}

std::vector<std::string> LineageGraph::Models() const {
  std::vector<std::string> out;
  for (const auto& [name, kind] : nodes_) {
    if (kind == NodeKind::kModel) out.push_back(name);
  }
  return out;
}

const std::vector<std::string>& LineageGraph::Parents(const std::string& node) const {
  auto it = parents_.find(node);
  return it == parents_.end() ? kNoEdges : it->second;
}

const std::vector<std::string>& LineageGraph::Children(const std::string& node) const {
  auto it = children_.find(node);
  return it == children_.end() ? kNoEdges : it->second;
}

const model::ModelLineage* LineageGraph::Lineage(const std::string& model) const {
  auto it = lineage_.find(model);
  return it == lineage_.end() ? nullptr : &it->second;
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

std::vector<std::string> LineageGraph::Upstream(const std::string& node, std::uint32_t max_depth) const {
  return Traverse(node, true, max_depth);
}

std::vector<std::string> LineageGraph::Downstream(const std::string& node, std::uint32_t max_depth) const {
  return Traverse(node, false, max_depth);
}

std::vector<std::string> LineageGraph::Traverse(const std::string& start, bool upstream, std::uint32_t max_depth) const {
  std::vector<std::string> result;

  std::queue<std::pair<std::string, std::uint32_t>> q;
  std::unordered_set<std::string>                   visited;

  q.emplace(start, 0);
  visited.insert(start);

  while (!q.empty()) {
    auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth) continue;

    const auto& map = upstream ? parents_ : children_;
    auto        it  = map.find(node);
    if (it == map.end()) continue;

    for (const auto& other : it->second) {
      if (!visited.insert(other).second) continue;
      result.push_back(other);
      q.emplace(other, depth + 1);
    }
  }

  return result;
}

// ------------------------------------------------------------
// Ordering
// ------------------------------------------------------------

void LineageGraph::CheckAcyclic() const {
  enum class Color { kWhite, kGray, kBlack };

  std::map<std::string, Color> color;
  std::vector<std::string>     stack;

  // Iterative DFS along consumer -> producer edges, models only.
  for (const auto& root : Models()) {
    if (color[root] != Color::kWhite) continue;

    std::vector<std::pair<std::string, std::size_t>> frames{{root, 0}};
    color[root] = Color::kGray;
    stack.push_back(root);

    while (!frames.empty()) {
      auto& [node, next] = frames.back();
      const auto& parents = Parents(node);

      if (next == parents.size()) {
        color[node] = Color::kBlack;
        stack.pop_back();
        frames.pop_back();
        continue;
      }

      const auto producer = parents[next++];
      if (!IsModel(producer)) continue;

      const auto c = color[producer];
      if (c == Color::kGray) {
        auto                     from = std::find(stack.begin(), stack.end(), producer);
        std::vector<std::string> cycle(from, stack.end());
        cycle.push_back(producer);
        throw util::CyclicDependencyError(std::move(cycle));
      }
      if (c == Color::kWhite) {
        color[producer] = Color::kGray;
        stack.push_back(producer);
        frames.emplace_back(producer, 0);
      }
    }
  }
}

std::vector<std::vector<std::string>> LineageGraph::Layers() const {
  CheckAcyclic();

  std::map<std::string, std::size_t> pending;
  for (const auto& model : Models()) {
    std::size_t n = 0;
    for (const auto& producer : Parents(model)) {
      if (IsModel(producer)) ++n;
    }
    pending[model] = n;
  }

  std::vector<std::vector<std::string>> layers;
  std::vector<std::string>              ready;
  for (const auto& [model, n] : pending) {
    if (n == 0) ready.push_back(model);
  }

  while (!ready.empty()) {
    std::sort(ready.begin(), ready.end());
    std::vector<std::string> next;
    for (const auto& model : ready) {
      for (const auto& consumer : Children(model)) {
        if (!IsModel(consumer)) continue;
        if (--pending[consumer] == 0) next.push_back(consumer);
      }
    }
    layers.push_back(std::move(ready));
    ready = std::move(next);
  }
  return layers;
}

std::vector<std::string> LineageGraph::TopologicalOrder() const {
  CheckAcyclic();

  std::map<std::string, std::size_t> pending;
  for (const auto& model : Models()) {
    std::size_t n = 0;
    for (const auto& producer : Parents(model)) {
      if (IsModel(producer)) ++n;
    }
    pending[model] = n;
  }

  std::set<std::string> ready;
  for (const auto& [model, n] : pending) {
    if (n == 0) ready.insert(model);
  }

  std::vector<std::string> order;
  while (!ready.empty()) {
    auto model = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(model);

    for (const auto& consumer : Children(model)) {
      if (!IsModel(consumer)) continue;
      if (--pending[consumer] == 0) ready.insert(consumer);
    }
  }
  return order;
}

// ------------------------------------------------------------
// Column tracing
// ------------------------------------------------------------

std::vector<TracedColumn> LineageGraph::TraceColumn(const std::string& model, const std::string& column) const {
  std::vector<TracedColumn> result;

  std::queue<TracedColumn>        q;
  std::unordered_set<std::string> visited;

  q.push(TracedColumn{model, column, 0});
  visited.insert(model + "\n" + column);

  while (!q.empty()) {
    auto current = q.front();
    q.pop();

    const auto* lineage = Lineage(current.node);
    if (!lineage) continue;

    for (const auto& c : lineage->columns) {
      if (c.name != current.column) continue;

      for (const auto& p : c.provenance) {
        if (p.IsOpaque()) continue;
        if (!visited.insert(p.producer + "\n" + p.column).second) continue;

        TracedColumn step{p.producer, p.column, current.depth + 1};
        result.push_back(step);
        q.push(step);
      }
    }
  }

  return result;
}

// ------------------------------------------------------------
// Selection
// ------------------------------------------------------------

namespace {

// Leading or trailing "[n]+"; returns whether present and sets depth (0 = unlimited).
bool StripPlus(std::string& token, bool leading, std::uint32_t& depth) {
  depth = 0;
  if (leading) {
    auto plus = token.find('+');
    if (plus == std::string::npos) return false;
    const auto digits = token.substr(0, plus);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    if (!digits.empty()) depth = static_cast<std::uint32_t>(std::stoul(digits));
    token.erase(0, plus + 1);
    return true;
  }

  auto plus = token.rfind('+');
  if (plus == std::string::npos) return false;
  const auto digits = token.substr(plus + 1);
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
  if (!digits.empty()) depth = static_cast<std::uint32_t>(std::stoul(digits));
  token.erase(plus);
  return true;
}

} // namespace

std::set<std::string> LineageGraph::Select(std::string_view selection) const {
  std::set<std::string> selected;

  std::string token;
  auto        flush = [&]() {
    if (token.empty()) return;

    std::uint32_t up_depth   = 0;
    std::uint32_t down_depth = 0;
    const bool    up         = StripPlus(token, true, up_depth);
    const bool    down       = StripPlus(token, false, down_depth);

    if (IsModel(token)) {
      selected.insert(token);
      if (up) {
        for (const auto& n : Upstream(token, up_depth)) {
          if (IsModel(n)) selected.insert(n);
        }
      }
      if (down) {
        for (const auto& n : Downstream(token, down_depth)) {
          if (IsModel(n)) selected.insert(n);
        }
      }
    }
    token.clear();
  };

  for (char c : selection) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
      flush();
    } else {
      token.push_back(c);
    }
  }
  flush();
  return selected;
}

} // namespace colguard::lineage
