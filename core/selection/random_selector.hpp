#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Uniform sample over all candidates, ignoring category.
class RandomSelector : public SelectionStrategy {
public:
    SelectionMethod method() const override { return SelectionMethod::Random; }
    std::string describe() const override { return "Selects pages at random"; }
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;
};

} // namespace linksim
