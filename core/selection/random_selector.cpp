#include "selection/random_selector.hpp"
#include "selection/sampling.hpp"

namespace linksim {

std::vector<const Page*> RandomSelector::select(const Page& /*source*/,
                                                const std::vector<const Page*>& candidates,
                                                size_t max_targets,
                                                std::mt19937_64& rng) const {
    return sampleWithoutReplacement(candidates, max_targets, rng);
}

} // namespace linksim
