#pragma once

#include "selection/selection_strategy.hpp"

namespace linksim {

/// Deterministic selection by baseline score. Ties keep candidate order.
class RankSelector : public SelectionStrategy {
public:
    explicit RankSelector(bool prefer_high) : prefer_high_(prefer_high) {}

    SelectionMethod method() const override {
        return prefer_high_ ? SelectionMethod::RankHigh : SelectionMethod::RankLow;
    }
    std::string describe() const override;
    std::vector<const Page*> select(const Page& source,
                                    const std::vector<const Page*>& candidates,
                                    size_t max_targets,
                                    std::mt19937_64& rng) const override;

private:
    bool prefer_high_;
};

} // namespace linksim
