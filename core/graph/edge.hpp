#pragma once

#include "graph/page.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace linksim {

/// Where a link sits on the source page. Drives the position weight.
enum class LinkPosition {
    Header,
    ContentTop,
    Content,
    ContentBottom,
    Sidebar,
    Footer
};

/// A directed link from -> to.
/// `position` is empty for links that existed before the run.
struct Edge {
    PageId from = 0;
    PageId to = 0;
    double weight = 1.0;
    std::optional<LinkPosition> position;

    Edge() = default;
    Edge(PageId from, PageId to, double weight = 1.0)
        : from(from), to(to), weight(weight) {}
    Edge(PageId from, PageId to, LinkPosition position)
        : from(from), to(to), position(position) {}

    bool isSelfLoop() const { return from == to; }
};

/// Ordered (from, to) pair used for duplicate detection.
struct EdgeKey {
    PageId from = 0;
    PageId to = 0;

    bool operator==(const EdgeKey& other) const {
        return from == other.from && to == other.to;
    }
};

inline EdgeKey keyOf(const Edge& e) { return {e.from, e.to}; }

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& k) const {
        size_t h = std::hash<PageId>()(k.from);
        return h ^ (std::hash<PageId>()(k.to) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

} // namespace linksim
