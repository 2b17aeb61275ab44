#include "selection/popular_selector.hpp"
#include "selection/sampling.hpp"

#include <algorithm>

namespace linksim {

std::string PopularSelector::describe() const {
    return "Selects at random among the most important pages";
}

std::vector<const Page*> PopularSelector::select(const Page& /*source*/,
                                                 const std::vector<const Page*>& candidates,
                                                 size_t max_targets,
                                                 std::mt19937_64& rng) const {
    std::vector<const Page*> pool = candidates;
    std::stable_sort(pool.begin(), pool.end(), [](const Page* a, const Page* b) {
        return a->baseline_score > b->baseline_score;
    });
    if (pool.size() > kPopularPoolSize) pool.resize(kPopularPoolSize);
    return sampleWithoutReplacement(pool, max_targets, rng);
}

} // namespace linksim
