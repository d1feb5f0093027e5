#include "graph_synthesizer.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace chromamap {

std::string GraphSynthesizer::node_name(int index) {
    return "region-" + std::to_string(index);
}

int GraphSynthesizer::max_extra_edges(int node_count, double target_connectivity) {
    int requested = static_cast<int>(std::floor(target_connectivity * node_count / 2.0));
    // Planar maximum minus the edges already spent on the spanning tree
    int planar_room = 3 * node_count - 6 - (node_count - 1);
    return std::max(0, std::min(requested, planar_room));
}

Graph GraphSynthesizer::synthesize(int node_count, double target_connectivity, std::mt19937& rng) {
    auto log = chromamap::logging::get_logger();

    if (node_count < 0) {
        throw std::invalid_argument("GraphSynthesizer: node_count must be non-negative");
    }
    if (target_connectivity < 0.0) {
        throw std::invalid_argument("GraphSynthesizer: target_connectivity must be non-negative");
    }

    Graph graph;
    for (int i = 1; i <= node_count; ++i) {
        graph.add_node(node_name(i));
    }

    // Spanning tree: node i attaches to a uniformly chosen earlier node
    for (int i = 2; i <= node_count; ++i) {
        std::uniform_int_distribution<int> parent_dist(1, i - 1);
        graph.add_edge(node_name(i), node_name(parent_dist(rng)));
    }

    int extra_target = max_extra_edges(node_count, target_connectivity);
    int extra_added = 0;
    if (extra_target > 0) {
        std::uniform_int_distribution<int> node_dist(1, node_count);
        int attempts = extra_target * kAttemptsPerEdge;
        while (extra_added < extra_target && attempts-- > 0) {
            int a = node_dist(rng);
            int b = node_dist(rng);
            if (a == b || graph.are_adjacent(node_name(a), node_name(b))) {
                continue;
            }
            graph.add_edge(node_name(a), node_name(b));
            ++extra_added;
        }
        if (extra_added < extra_target) {
            log->debug("GraphSynthesizer: placed {} of {} extra edges before running out of attempts",
                       extra_added, extra_target);
        }
    }

    log->debug("GraphSynthesizer: {} nodes, {} edges ({} extra)",
               graph.node_count(), graph.edge_count(), extra_added);
    return graph;
}

}  // namespace chromamap
