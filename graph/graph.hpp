#ifndef CHROMAMAP_GRAPH_HPP
#define CHROMAMAP_GRAPH_HPP

#include <region/region.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace chromamap {

using NodeId = std::string;

// An abstract puzzle unit. Each node later becomes one Region.
struct Node {
    NodeId id;
    std::set<NodeId> neighbors;

    size_t degree() const { return neighbors.size(); }
};

// Undirected graph keyed by node id. Nodes keep their creation order,
// which is also the order the partitioner assigns shapes in.
class Graph {
public:
    Graph() = default;

    // Build the adjacency graph of a region collection
    static Graph from_regions(const Regions& regions);

    // Adds a node if it does not exist yet
    void add_node(const NodeId& id);

    // Adds a symmetric edge, creating missing endpoints.
    // Returns false if the edge already existed.
    bool add_edge(const NodeId& a, const NodeId& b);

    bool has_node(const NodeId& id) const;
    bool are_adjacent(const NodeId& a, const NodeId& b) const;

    Node& node(const NodeId& id);
    const Node& node(const NodeId& id) const;
    const std::vector<Node>& nodes() const { return nodes_; }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_count_; }
    size_t degree(const NodeId& id) const { return node(id).degree(); }

    // Every node reachable from the first one (true for empty graphs)
    bool is_connected() const;

    // Connected components as lists of node ids, in creation order
    std::vector<std::vector<NodeId>> components() const;

    // Graphviz export for debugging
    std::string to_dot() const;

private:
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    size_t edge_count_ = 0;
};

}  // namespace chromamap

#endif // CHROMAMAP_GRAPH_HPP
