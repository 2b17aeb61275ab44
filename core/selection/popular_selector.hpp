#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Size of the pool of highest-scoring candidates that PopularSelector
/// samples from.
constexpr size_t kPopularPoolSize = 50;

/// Random pick among the `kPopularPoolSize` candidates with the highest
/// baseline score. Unlike RankHigh, sources do not all converge on the
/// same few targets.
class PopularSelector : public SelectionStrategy {
public:
    SelectionMethod method() const override { return SelectionMethod::Popular; }
    std::string describe() const override;
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;
};

} // namespace linksim
