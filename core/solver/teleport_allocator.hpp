#pragma once

#include <cstddef>
#include <vector>

namespace linksim {

/// A page that wants extra teleport mass until it reaches `goal`.
struct TeleportTarget {
    size_t index = 0;
    double goal = 0.0;
};

struct AllocationSample {
    double protect_used = 0.0;
    double boost_used = 0.0;
};

// ─── TeleportAllocator ────────────────────────────────────────
// Builds the conditional teleport vector for one iteration.
// Each group (protected, boosted) owns a budget eta. Pages below their
// goal split the whole budget in proportion to their shortfall, never
// more than eta in total. A group with no shortfall spends nothing and
// its budget goes back to the uniform component.

class TeleportAllocator {
public:
    TeleportAllocator(size_t n, double eta_protect, double eta_boost,
                      std::vector<TeleportTarget> protect,
                      std::vector<TeleportTarget> boost);

    /// Fill `teleport` (size n, sums to 1) for the current score vector.
    AllocationSample build(const std::vector<double>& current,
                           std::vector<double>& teleport) const;

private:
    double allocate(const std::vector<TeleportTarget>& targets, double eta,
                    const std::vector<double>& current,
                    std::vector<double>& teleport) const;

    size_t n_;
    double eta_protect_;
    double eta_boost_;
    std::vector<TeleportTarget> protect_;
    std::vector<TeleportTarget> boost_;
};

} // namespace linksim
