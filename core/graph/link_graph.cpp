#include "graph/link_graph.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>


namespace linksim {

LinkGraph::LinkGraph(const std::vector<Page>& pages, const std::vector<Edge>& edges) {
    pages_.reserve(pages.size());
    for (const Page& p : pages) {
        addPage(p);
    }

    size_t duplicates = 0;
    size_t self_loops = 0;
    edges_.reserve(edges.size());
    for (const Edge& e : edges) {
        if (e.isSelfLoop()) {
            requirePage(e.from, "Source");
            self_loops++;
            continue;
        }
        if (!addEdge(e)) duplicates++;
    }
    if (duplicates > 0 || self_loops > 0) {
        spdlog::debug("LinkGraph: merged {} duplicate edges, dropped {} self-loops",
                      duplicates, self_loops);
    }
}

// ─── Page operations ───────────────────────────────────────────

void LinkGraph::addPage(const Page& page) {
    if (index_.count(page.id)) {
        throw ValidationError("Page ID already exists: " + std::to_string(page.id));
    }
    index_.emplace(page.id, pages_.size());
    pages_.push_back(page);
}

std::optional<size_t> LinkGraph::indexOf(PageId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void LinkGraph::requirePage(PageId id, const char* role) const {
    if (!index_.count(id)) {
        throw ValidationError(std::string(role) + " page not found: " + std::to_string(id));
    }
}

// ─── Edge operations ───────────────────────────────────────────

bool LinkGraph::addEdge(const Edge& edge, bool allow_self_loop) {
    requirePage(edge.from, "Source");
    requirePage(edge.to, "Target");
    if (edge.isSelfLoop() && !allow_self_loop) return false;

    EdgeKey key = keyOf(edge);
    if (edge_index_.count(key)) return false;

    edge_index_.emplace(key, edges_.size());
    edges_.push_back(edge);
    return true;
}

bool LinkGraph::removeEdge(PageId from, PageId to) {
    auto it = edge_index_.find({from, to});
    if (it == edge_index_.end()) return false;

    // Swap-and-pop keeps removal O(1).
    size_t slot = it->second;
    edge_index_.erase(it);
    if (slot + 1 != edges_.size()) {
        edges_[slot] = edges_.back();
        edge_index_[keyOf(edges_[slot])] = slot;
    }
    edges_.pop_back();
    return true;
}

bool LinkGraph::hasEdge(PageId from, PageId to) const {
    return edge_index_.count({from, to}) > 0;
}

const Edge* LinkGraph::getEdge(PageId from, PageId to) const {
    auto it = edge_index_.find({from, to});
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

std::vector<Edge> LinkGraph::edges() const {
    return edges_;
}

// ─── Edit scripts ──────────────────────────────────────────────

void LinkGraph::applyEditScript(const EdgeEditScript& script) {
    for (const Edge& e : script.added_edges) {
        addEdge(e, true);
    }
    for (const Edge& e : script.removed_edges) {
        removeEdge(e.from, e.to);
    }
}

void LinkGraph::forEachEdge(std::function<void(const Edge&)> fn) const {
    for (const Edge& e : edges_) {
        fn(e);
    }
}

} // namespace linksim
