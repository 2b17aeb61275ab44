#include "solver/water_filling.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace linksim {

namespace {

constexpr int kMaxPasses = 64;

double total(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

void clampTo(std::vector<double>& p, const Bounds& b) {
    for (size_t i = 0; i < p.size(); ++i) {
        p[i] = std::min(std::max(p[i], b.floor[i]), b.ceiling[i]);
    }
}

void rescaleToUnit(std::vector<double>& p) {
    double s = total(p);
    if (s <= 0.0) {
        std::fill(p.begin(), p.end(), 1.0 / static_cast<double>(p.size()));
        return;
    }
    for (double& x : p) x /= s;
}

/// Add `delta` > 0 to entries below their ceiling. Returns false when
/// no entry has room.
bool fillUp(std::vector<double>& p, const Bounds& b, double delta) {
    std::vector<size_t> finite_room;
    std::vector<size_t> open;
    double room = 0.0;
    for (size_t i = 0; i < p.size(); ++i) {
        if (p[i] >= b.ceiling[i]) continue;
        if (std::isinf(b.ceiling[i])) {
            open.push_back(i);
        } else {
            finite_room.push_back(i);
            room += b.ceiling[i] - p[i];
        }
    }
    if (finite_room.empty() && open.empty()) return false;

    if (!open.empty()) {
        double share = delta / static_cast<double>(open.size());
        for (size_t i : open) p[i] += share;
        return true;
    }
    if (room >= delta) {
        for (size_t i : finite_room) {
            p[i] += delta * (b.ceiling[i] - p[i]) / room;
        }
    } else {
        // Not enough room below the ceilings; spread evenly and let the
        // next pass clamp and retry.
        double share = delta / static_cast<double>(finite_room.size());
        for (size_t i : finite_room) p[i] += share;
    }
    return true;
}

/// Remove `excess` > 0 from entries above their floor. Returns false
/// when no entry has room.
bool drainDown(std::vector<double>& p, const Bounds& b, double excess) {
    std::vector<size_t> movable;
    double room = 0.0;
    for (size_t i = 0; i < p.size(); ++i) {
        if (p[i] <= b.floor[i]) continue;
        movable.push_back(i);
        room += p[i] - b.floor[i];
    }
    if (movable.empty()) return false;

    if (room >= excess) {
        for (size_t i : movable) {
            p[i] -= excess * (p[i] - b.floor[i]) / room;
        }
    } else {
        double share = excess / static_cast<double>(movable.size());
        for (size_t i : movable) p[i] -= share;
    }
    return true;
}

} // namespace

ProjectionOutcome projectOntoBounds(std::vector<double>& p, const Bounds& bounds) {
    if (p.size() != bounds.size()) {
        throw ValidationError("Projection bounds do not match vector size");
    }
    ProjectionOutcome outcome;
    if (p.empty()) return outcome;

    for (int pass = 0; pass < kMaxPasses; ++pass) {
        outcome.passes = pass + 1;
        clampTo(p, bounds);
        double delta = 1.0 - total(p);
        if (std::fabs(delta) < kProjectionSlack) break;

        bool moved = delta > 0.0 ? fillUp(p, bounds, delta)
                                 : drainDown(p, bounds, -delta);
        if (!moved) {
            outcome.degenerate = true;
            if (delta > 0.0) {
                outcome.ceilings_relaxed = true;
            } else {
                outcome.floors_relaxed = true;
            }
            rescaleToUnit(p);
            return outcome;
        }
    }

    // Exact renormalization; the residual here is below kProjectionSlack.
    double s = total(p);
    if (s > 0.0) {
        for (double& x : p) x /= s;
    }
    return outcome;
}

} // namespace linksim
