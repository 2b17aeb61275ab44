#include "selection/relevance_mix_selector.hpp"
#include "selection/sampling.hpp"

#include <algorithm>
#include <cmath>

namespace linksim {

std::string RelevanceMixSelector::describe() const {
    return "Selects pages by relevance (mix of same category and other categories)";
}

std::vector<const Page*> RelevanceMixSelector::select(const Page& source,
                                                      const std::vector<const Page*>& candidates,
                                                      size_t max_targets,
                                                      std::mt19937_64& rng) const {
    std::vector<const Page*> same_category;
    std::vector<const Page*> other;
    for (const Page* p : candidates) {
        if (p->category == source.category) {
            same_category.push_back(p);
        } else {
            other.push_back(p);
        }
    }

    size_t same_slots = static_cast<size_t>(
        std::floor(static_cast<double>(max_targets) * kSameCategoryShare));
    size_t same_count = std::min(same_category.size(), same_slots);
    size_t other_count = std::min(other.size(), max_targets - same_count);

    std::vector<const Page*> targets;
    targets.reserve(same_count + other_count);
    if (same_count > 0) {
        auto picked = sampleWithoutReplacement(same_category, same_count, rng);
        targets.insert(targets.end(), picked.begin(), picked.end());
    }
    if (other_count > 0) {
        auto picked = sampleWithoutReplacement(other, other_count, rng);
        targets.insert(targets.end(), picked.begin(), picked.end());
    }
    return targets;
}

} // namespace linksim
