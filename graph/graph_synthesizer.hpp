#ifndef CHROMAMAP_GRAPH_SYNTHESIZER_HPP
#define CHROMAMAP_GRAPH_SYNTHESIZER_HPP

#include "graph.hpp"
#include <random>
#include <string>

namespace chromamap {

// Builds random connected graphs whose edge count stays under the
// simple planar bound 3N - 6.
class GraphSynthesizer {
public:
    // Creates node_count nodes named region-1..region-N, joins them with a
    // random spanning tree and then adds extra random edges, up to
    // min(target_connectivity * N / 2, 3N - 6 - (N - 1)).
    static Graph synthesize(int node_count, double target_connectivity, std::mt19937& rng);

    // Upper bound on the extra (non-tree) edges for a graph of node_count nodes
    static int max_extra_edges(int node_count, double target_connectivity);

    static std::string node_name(int index);

private:
    // Random pair draws allowed per requested extra edge
    static constexpr int kAttemptsPerEdge = 20;
};

}  // namespace chromamap

#endif // CHROMAMAP_GRAPH_SYNTHESIZER_HPP
