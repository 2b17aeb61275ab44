#include "selection/cross_category_selector.hpp"
#include "selection/sampling.hpp"

namespace linksim {

std::string CrossCategorySelector::describe() const {
    return "Selects pages from other categories for cross-selling";
}

std::vector<const Page*> CrossCategorySelector::select(const Page& source,
                                                       const std::vector<const Page*>& candidates,
                                                       size_t max_targets,
                                                       std::mt19937_64& rng) const {
    std::vector<const Page*> other_category;
    for (const Page* p : candidates) {
        if (p->category != source.category) other_category.push_back(p);
    }
    return sampleWithoutReplacement(other_category, max_targets, rng);
}

} // namespace linksim
