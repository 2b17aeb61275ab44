#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace linksim {

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

/// Mass deficits smaller than this are accepted without adjustment.
constexpr double kProjectionSlack = 1e-10;

/// Per-entry bounds. Unconstrained entries carry floor 0 and
/// ceiling kUnbounded.
struct Bounds {
    std::vector<double> floor;
    std::vector<double> ceiling;

    explicit Bounds(size_t n = 0) : floor(n, 0.0), ceiling(n, kUnbounded) {}

    size_t size() const { return floor.size(); }
};

struct ProjectionOutcome {
    bool degenerate = false;       // no entry could absorb the deficit
    bool ceilings_relaxed = false;
    bool floors_relaxed = false;
    int passes = 0;
};

// ─── Water-filling projection ─────────────────────────────────
// Moves `p` into [floor, ceiling] with sum(p) == 1. Surplus or deficit
// after clamping is spread over the entries that can still move in the
// needed direction, in proportion to their remaining room.
//
// When the bounds are jointly infeasible, floors outrank ceilings:
// mass that no ceiling can hold is added by proportional rescale (so
// only ceilings are exceeded), and floors are given up only when
// sum(floor) > 1.

ProjectionOutcome projectOntoBounds(std::vector<double>& p, const Bounds& bounds);

} // namespace linksim
