#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Category/diversity blend. floor(0.7 * k) slots go to same-category
/// candidates; the remaining slots go to other categories. Each bucket
/// is sampled uniformly and skipped when empty.
class RelevanceMixSelector : public SelectionStrategy {
public:
    static constexpr double kSameCategoryShare = 0.7;

    SelectionMethod method() const override { return SelectionMethod::RelevanceMix; }
    std::string describe() const override;
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;
};

} // namespace linksim
