#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Picks candidates sharing the source's category. If there are more
/// than `max_targets`, a uniform sample is returned.
class CategorySelector : public SelectionStrategy {
public:
    SelectionMethod method() const override { return SelectionMethod::Category; }
    std::string describe() const override;
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;
};

} // namespace linksim
