#pragma once

#include "graph/page.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace linksim {

/// Closed set of target-selection policies.
enum class SelectionMethod {
    Category,      // same category as the source
    RelevanceMix,  // 70% same category, remainder other categories
    Random,
    RankHigh,      // highest baseline score first
    RankLow,       // lowest baseline score first
    CrossCategory, // other categories only
    Popular        // random among the top-scored pool
};

/// Parse an API-layer name ("category", "semantic", "random",
/// "pagerank_high", "pagerank_low", "cross_sell", "popular_products").
/// Unknown names fall back to Category with a logged warning.
SelectionMethod parseSelectionMethod(const std::string& name);

std::string toString(SelectionMethod method);

/// Base class for target selection.
/// select : (source, candidates, k) -> at most k candidates.
/// Randomized strategies draw only from the injected generator, so a
/// fixed seed reproduces the same choice.
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    virtual SelectionMethod method() const = 0;

    /// Human-readable description of the policy.
    virtual std::string describe() const = 0;

    virtual std::vector<const Page*> select(const Page& source,
                                            const std::vector<const Page*>& candidates,
                                            size_t max_targets,
                                            std::mt19937_64& rng) const = 0;
};

} // namespace linksim
