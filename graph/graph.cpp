#include "graph.hpp"
#include <sstream>
#include <stdexcept>

namespace chromamap {

Graph Graph::from_regions(const Regions& regions) {
    Graph graph;
    for (const auto& region : regions) {
        graph.add_node(region.id);
    }
    for (const auto& region : regions) {
        for (const auto& other : region.adjacent_regions) {
            if (graph.has_node(other) && other != region.id) {
                graph.add_edge(region.id, other);
            }
        }
    }
    return graph;
}

void Graph::add_node(const NodeId& id) {
    if (has_node(id)) {
        return;
    }

    index_[id] = nodes_.size();
    Node node;
    node.id = id;
    nodes_.push_back(node);
}

bool Graph::add_edge(const NodeId& a, const NodeId& b) {
    if (a == b) {
        throw std::invalid_argument("Graph::add_edge: self edge on " + a);
    }

    add_node(a);
    add_node(b);

    bool inserted = node(a).neighbors.insert(b).second;
    node(b).neighbors.insert(a);
    if (inserted) {
        ++edge_count_;
    }
    return inserted;
}

bool Graph::has_node(const NodeId& id) const {
    return index_.find(id) != index_.end();
}

bool Graph::are_adjacent(const NodeId& a, const NodeId& b) const {
    auto it = index_.find(a);
    if (it == index_.end()) {
        return false;
    }
    return nodes_[it->second].neighbors.count(b) > 0;
}

Node& Graph::node(const NodeId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Graph::node: unknown node " + id);
    }
    return nodes_[it->second];
}

const Node& Graph::node(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Graph::node: unknown node " + id);
    }
    return nodes_[it->second];
}

std::vector<std::vector<NodeId>> Graph::components() const {
    std::vector<std::vector<NodeId>> result;
    std::vector<bool> visited(nodes_.size(), false);

    for (size_t start = 0; start < nodes_.size(); ++start) {
        if (visited[start]) continue;

        std::vector<NodeId> component;
        std::vector<size_t> stack{start};
        visited[start] = true;
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            component.push_back(nodes_[current].id);
            for (const auto& neighbor : nodes_[current].neighbors) {
                size_t next = index_.at(neighbor);
                if (!visited[next]) {
                    visited[next] = true;
                    stack.push_back(next);
                }
            }
        }
        result.push_back(std::move(component));
    }
    return result;
}

bool Graph::is_connected() const {
    return components().size() <= 1;
}

std::string Graph::to_dot() const {
    std::ostringstream ss;

    ss << "graph Regions {\n";
    ss << "  node [shape=circle];\n";
    ss << "  \n";

    for (const auto& node : nodes_) {
        ss << "  \"" << node.id << "\";\n";
    }
    ss << "  \n";

    // Each undirected edge once
    for (const auto& node : nodes_) {
        for (const auto& neighbor : node.neighbors) {
            if (index_.at(neighbor) > index_.at(node.id)) {
                ss << "  \"" << node.id << "\" -- \"" << neighbor << "\";\n";
            }
        }
    }

    ss << "}\n";
    return ss.str();
}

}  // namespace chromamap
