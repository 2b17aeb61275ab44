#include "graph/graph_stats.hpp"

#include <algorithm>
#include <numeric>
#include <stack>
#include <vector>

namespace linksim {

namespace {

// Adjacency in dense index space.
std::vector<std::vector<size_t>> buildAdjacency(const LinkGraph& graph) {
    std::vector<std::vector<size_t>> adj(graph.pageCount());
    graph.forEachEdge([&](const Edge& e) {
        adj[*graph.indexOf(e.from)].push_back(*graph.indexOf(e.to));
    });
    return adj;
}

size_t findRoot(std::vector<size_t>& parent, size_t x) {
    while (parent[x] != x) {
        parent[x] = parent[parent[x]];
        x = parent[x];
    }
    return x;
}

size_t countWeakComponents(const std::vector<std::vector<size_t>>& adj) {
    size_t n = adj.size();
    std::vector<size_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);
    size_t components = n;
    for (size_t u = 0; u < n; u++) {
        for (size_t v : adj[u]) {
            size_t ru = findRoot(parent, u);
            size_t rv = findRoot(parent, v);
            if (ru != rv) {
                parent[ru] = rv;
                components--;
            }
        }
    }
    return components;
}

// Iterative Tarjan; recursion would overflow on long chains.
size_t countStrongComponents(const std::vector<std::vector<size_t>>& adj) {
    const size_t n = adj.size();
    const size_t unvisited = static_cast<size_t>(-1);
    std::vector<size_t> index(n, unvisited), low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> scc_stack;
    size_t next_index = 0;
    size_t components = 0;

    struct Frame { size_t node; size_t edge_pos; };

    for (size_t start = 0; start < n; start++) {
        if (index[start] != unvisited) continue;

        std::stack<Frame> call;
        call.push({start, 0});
        index[start] = low[start] = next_index++;
        scc_stack.push_back(start);
        on_stack[start] = true;

        while (!call.empty()) {
            Frame& f = call.top();
            size_t u = f.node;
            if (f.edge_pos < adj[u].size()) {
                size_t v = adj[u][f.edge_pos++];
                if (index[v] == unvisited) {
                    index[v] = low[v] = next_index++;
                    scc_stack.push_back(v);
                    on_stack[v] = true;
                    call.push({v, 0});
                } else if (on_stack[v]) {
                    low[u] = std::min(low[u], index[v]);
                }
                continue;
            }

            if (low[u] == index[u]) {
                size_t w;
                do {
                    w = scc_stack.back();
                    scc_stack.pop_back();
                    on_stack[w] = false;
                } while (w != u);
                components++;
            }
            call.pop();
            if (!call.empty()) {
                size_t parent = call.top().node;
                low[parent] = std::min(low[parent], low[u]);
            }
        }
    }
    return components;
}

} // namespace

GraphStats computeGraphStats(const LinkGraph& graph) {
    GraphStats stats;
    stats.num_nodes = graph.pageCount();
    stats.num_edges = graph.edgeCount();

    if (stats.num_nodes > 1) {
        double n = static_cast<double>(stats.num_nodes);
        stats.density = static_cast<double>(stats.num_edges) / (n * (n - 1.0));
    }

    auto adj = buildAdjacency(graph);
    stats.weakly_connected_components = countWeakComponents(adj);
    stats.strongly_connected_components = countStrongComponents(adj);
    stats.is_strongly_connected = stats.num_nodes > 0 && stats.strongly_connected_components == 1;
    return stats;
}

GraphStats computeGraphStats(const std::vector<Page>& pages, const std::vector<Edge>& edges) {
    return computeGraphStats(LinkGraph(pages, edges));
}

} // namespace linksim
