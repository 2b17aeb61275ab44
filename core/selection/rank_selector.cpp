#include "selection/rank_selector.hpp"

#include <algorithm>

namespace linksim {

std::string RankSelector::describe() const {
    return prefer_high_ ? "Selects pages with the highest importance score"
                        : "Selects pages with the lowest importance score";
}

std::vector<const Page*> RankSelector::select(const Page& /*source*/,
                                              const std::vector<const Page*>& candidates,
                                              size_t max_targets,
                                              std::mt19937_64& /*rng*/) const {
    std::vector<const Page*> sorted = candidates;
    if (prefer_high_) {
        std::stable_sort(sorted.begin(), sorted.end(), [](const Page* a, const Page* b) {
            return a->baseline_score > b->baseline_score;
        });
    } else {
        std::stable_sort(sorted.begin(), sorted.end(), [](const Page* a, const Page* b) {
            return a->baseline_score < b->baseline_score;
        });
    }
    if (sorted.size() > max_targets) sorted.resize(max_targets);
    return sorted;
}

} // namespace linksim
