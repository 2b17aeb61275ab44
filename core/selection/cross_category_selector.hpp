#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Cross-sell: uniform sample over candidates whose category differs
/// from the source's. Never returns a same-category page.
class CrossCategorySelector : public SelectionStrategy {
public:
    SelectionMethod method() const override { return SelectionMethod::CrossCategory; }
    std::string describe() const override;
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;
};

} // namespace linksim
