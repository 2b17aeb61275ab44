#pragma once

#include <cstdint>
#include <optional>

namespace linksim {

/// Run-level defaults applied by the SimulationOrchestrator.
/// The solver itself carries stricter defaults in SolverConfig.
struct SimulationSettings {
    double damping = 0.85;
    int max_iter = 200;
    double tolerance = 1e-6;

    double eta_protect = 0.05;      // protection teleport budget
    double eta_boost = 0.08;        // boost teleport budget

    bool use_semantic_weights = false;
    double semantic_threshold = 0.4;

    // Persist new scores as the page baseline once a run completes.
    bool apply_scores_on_completion = false;

    int num_threads = 1;
    std::optional<uint64_t> rng_seed;  // unset = seeded from std::random_device

    /// Defaults overlaid with LINKSIM_* environment variables.
    /// Throws ConfigError on a malformed value.
    static SimulationSettings fromEnvironment();
};

} // namespace linksim
