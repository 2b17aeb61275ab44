#pragma once

#include "graph/link_graph.hpp"

#include <cstddef>

namespace linksim {

/// Structural summary of a link graph. Density follows the directed
/// definition E / (N * (N - 1)).
struct GraphStats {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    double density = 0.0;
    size_t weakly_connected_components = 0;
    size_t strongly_connected_components = 0;
    bool is_strongly_connected = false;
};

GraphStats computeGraphStats(const LinkGraph& graph);

/// Convenience overload for callers holding raw page/edge lists.
GraphStats computeGraphStats(const std::vector<Page>& pages, const std::vector<Edge>& edges);

} // namespace linksim
