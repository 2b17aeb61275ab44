#pragma once

#include "graph/page.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace linksim {

// ─── EdgeEditScript ────────────────────────────────────────────
// The edge mutations produced by the rule engine for one run.
// Removals are applied after all additions.

struct EdgeEditScript {
    std::vector<Edge> added_edges;
    std::vector<Edge> removed_edges;

    bool empty() const {
        return added_edges.empty() && removed_edges.empty();
    }
};

// ─── LinkGraph ─────────────────────────────────────────────────
// Snapshot of a site's pages and directed links for one run.
// Pages keep insertion order, which fixes the solver's index space.
// Duplicate directed edges are never stored.

class LinkGraph {
public:
    LinkGraph() = default;

    /// Build a snapshot. Throws ValidationError on a duplicate page id
    /// or an edge with an unknown endpoint. Duplicate edges are merged
    /// and self-loops in the input are dropped.
    LinkGraph(const std::vector<Page>& pages, const std::vector<Edge>& edges);

    // ── Page operations ──
    void addPage(const Page& page);
    std::optional<size_t> indexOf(PageId id) const;
    const std::vector<Page>& pages() const { return pages_; }
    size_t pageCount() const { return pages_.size(); }

    // ── Edge operations ──
    /// Returns false if the edge already exists, or if it is a self-loop
    /// and `allow_self_loop` is false.
    bool addEdge(const Edge& edge, bool allow_self_loop = false);
    bool removeEdge(PageId from, PageId to);
    bool hasEdge(PageId from, PageId to) const;
    const Edge* getEdge(PageId from, PageId to) const;
    std::vector<Edge> edges() const;
    size_t edgeCount() const { return edges_.size(); }

    /// Additions first, then removals.
    void applyEditScript(const EdgeEditScript& script);

    void forEachEdge(std::function<void(const Edge&)> fn) const;

private:
    void requirePage(PageId id, const char* role) const;

    std::vector<Page> pages_;
    std::unordered_map<PageId, size_t> index_;

    // Dense edge storage; removal moves the last edge into the freed slot.
    std::vector<Edge> edges_;
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> edge_index_;
};

} // namespace linksim
