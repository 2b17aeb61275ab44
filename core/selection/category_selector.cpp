#include "selection/category_selector.hpp"
#include "selection/sampling.hpp"

namespace linksim {

std::string CategorySelector::describe() const {
    return "Selects pages from the same category";
}

std::vector<const Page*> CategorySelector::select(const Page& source,
                                                  const std::vector<const Page*>& candidates,
                                                  size_t max_targets,
                                                  std::mt19937_64& rng) const {
    std::vector<const Page*> same_category;
    for (const Page* p : candidates) {
        if (p->category == source.category) same_category.push_back(p);
    }
    return sampleWithoutReplacement(same_category, max_targets, rng);
}

} // namespace linksim
