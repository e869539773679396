// include/ffweave/builder/Graph.h
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ffweave/builder/Node.h"
#include "ffweave/pipeline/Errors.h"

namespace ffweave {

/**
 * @brief Frozen view of a filter graph: Nodes plus labelled edges (STL-only).
 *
 * FilterComplex fills it while walking the Stream structure and uses it for
 * ordering; GraphPrinter renders it for humans. It doesn't know about ffmpeg
 * syntax.
 *
 * NodeIds follow insertion order, and topo_order() breaks ties by the
 * smallest id, so the order is deterministic for a given insertion order.
 */
class Graph final {
public:
  using NodePtr = std::shared_ptr<Node>;
  using NodeId = std::size_t;

  struct Edge {
    NodeId from{};
    NodeId to{};
    std::size_t from_slot{};
    std::size_t to_slot{};
    std::string label; // stream label, may be empty
  };

  static constexpr NodeId kInvalid = static_cast<NodeId>(-1);

  Graph() = default;

  // ---------------------------
  // Node management
  // ---------------------------

  /// Add a node to the graph. Returns its NodeId.
  NodeId add(NodePtr node) {
    if (!node) {
      throw std::invalid_argument("Graph::add: node is null");
    }
    const NodeId id = nodes_.size();
    nodes_.push_back(std::move(node));
    out_.emplace_back();
    in_.emplace_back();
    return id;
  }

  /// NodeId of `node`, or kInvalid.
  NodeId find(const Node* node) const noexcept {
    for (NodeId i = 0; i < nodes_.size(); ++i) {
      if (nodes_[i].get() == node) return i;
    }
    return kInvalid;
  }

  const NodePtr& node(NodeId id) const {
    validate_id_(id, "Graph::node");
    return nodes_[id];
  }

  std::size_t node_count() const noexcept { return nodes_.size(); }
  bool empty() const noexcept { return nodes_.empty(); }

  // ---------------------------
  // Edge management
  // ---------------------------

  /// Add a directed edge `from -> to` between output and input slots. Returns the edge index.
  std::size_t add_edge(NodeId from, NodeId to, std::size_t from_slot = 0, std::size_t to_slot = 0) {
    validate_id_(from, "Graph::add_edge(from)");
    validate_id_(to, "Graph::add_edge(to)");
    if (from == to) {
      throw CyclicGraphError("Graph::add_edge: " + nodes_[from]->kind() + " feeds itself");
    }
    for (std::size_t i = 0; i < edges_.size(); ++i) {
      const auto& e = edges_[i];
      if (e.from == from && e.to == to && e.from_slot == from_slot && e.to_slot == to_slot) return i;
    }

    out_[from].push_back(to);
    in_[to].push_back(from);
    edges_.push_back({from, to, from_slot, to_slot, ""});
    return edges_.size() - 1;
  }

  void set_edge_label(std::size_t edge, std::string label) {
    if (edge >= edges_.size()) {
      throw std::out_of_range("Graph::set_edge_label: invalid edge index");
    }
    edges_[edge].label = std::move(label);
  }

  /// Return all edges (in insertion order).
  const std::vector<Edge>& edges() const noexcept { return edges_; }

  const std::vector<NodeId>& out_neighbors(NodeId id) const {
    validate_id_(id, "Graph::out_neighbors");
    return out_[id];
  }

  const std::vector<NodeId>& in_neighbors(NodeId id) const {
    validate_id_(id, "Graph::in_neighbors");
    return in_[id];
  }

  std::size_t out_degree(NodeId id) const {
    validate_id_(id, "Graph::out_degree");
    return out_[id].size();
  }

  std::size_t in_degree(NodeId id) const {
    validate_id_(id, "Graph::in_degree");
    return in_[id].size();
  }

  // ---------------------------
  // Validation / ordering
  // ---------------------------

  /**
   * @brief Topologically sort the graph, smallest NodeId first among ready nodes.
   * @throws CyclicGraphError if the graph has a cycle.
   */
  std::vector<NodeId> topo_order() const {
    const std::size_t n = nodes_.size();
    std::vector<std::size_t> indeg(n, 0);
    for (NodeId i = 0; i < n; ++i) indeg[i] = in_[i].size();

    std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> q;
    for (NodeId i = 0; i < n; ++i) {
      if (indeg[i] == 0) q.push(i);
    }

    std::vector<NodeId> order;
    order.reserve(n);

    while (!q.empty()) {
      NodeId u = q.top();
      q.pop();
      order.push_back(u);

      for (NodeId v : out_[u]) {
        if (indeg[v] == 0) continue;
        indeg[v]--;
        if (indeg[v] == 0) q.push(v);
      }
    }

    if (order.size() != n) {
      throw CyclicGraphError("Graph::topo_order: cycle detected (graph is not a DAG)");
    }
    return order;
  }

  /// True if the graph has no cycles.
  bool is_dag() const {
    try {
      (void)topo_order();
      return true;
    } catch (const CyclicGraphError&) {
      return false;
    }
  }

private:
  void validate_id_(NodeId id, const char* where) const {
    if (id >= nodes_.size()) {
      throw std::out_of_range(std::string(where) + ": invalid NodeId");
    }
  }

  std::vector<NodePtr> nodes_;
  std::vector<std::vector<NodeId>> out_;
  std::vector<std::vector<NodeId>> in_;
  std::vector<Edge> edges_;
};

} // namespace ffweave
