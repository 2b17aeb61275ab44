#include "solver/teleport_allocator.hpp"

#include <algorithm>
#include <numeric>

namespace linksim {

TeleportAllocator::TeleportAllocator(size_t n, double eta_protect, double eta_boost,
                                     std::vector<TeleportTarget> protect,
                                     std::vector<TeleportTarget> boost)
    : n_(n), eta_protect_(eta_protect), eta_boost_(eta_boost),
      protect_(std::move(protect)), boost_(std::move(boost)) {}

double TeleportAllocator::allocate(const std::vector<TeleportTarget>& targets, double eta,
                                   const std::vector<double>& current,
                                   std::vector<double>& teleport) const {
    if (eta <= 0.0 || targets.empty()) return 0.0;

    double total_need = 0.0;
    for (const auto& t : targets) {
        total_need += std::max(0.0, t.goal - current[t.index]);
    }
    if (total_need <= 0.0) return 0.0;

    double scale = eta / total_need;
    double used = 0.0;
    for (const auto& t : targets) {
        double need = std::max(0.0, t.goal - current[t.index]);
        if (need <= 0.0) continue;
        double give = std::min(need * scale, eta - used);
        if (give <= 0.0) break;
        teleport[t.index] += give;
        used += give;
    }
    return used;
}

AllocationSample TeleportAllocator::build(const std::vector<double>& current,
                                          std::vector<double>& teleport) const {
    teleport.assign(n_, 0.0);
    AllocationSample sample;
    if (n_ == 0) return sample;

    sample.protect_used = allocate(protect_, eta_protect_, current, teleport);
    sample.boost_used = allocate(boost_, eta_boost_, current, teleport);

    // (1 - eta_p - eta_b + unused_p + unused_b) goes to the uniform part.
    double uniform_mass = std::max(0.0, 1.0 - sample.protect_used - sample.boost_used);
    double u = uniform_mass / static_cast<double>(n_);
    for (double& x : teleport) x += u;

    double s = std::accumulate(teleport.begin(), teleport.end(), 0.0);
    if (s > 0.0) {
        for (double& x : teleport) x /= s;
    }
    return sample;
}

} // namespace linksim
