#pragma once

#include "common/settings.hpp"
#include "graph/graph_stats.hpp"
#include "simulation/run_types.hpp"
#include "simulation/simulation_store.hpp"
#include "solver/constrained_solver.hpp"
#include "solver/solver_control.hpp"
#include "weights/similarity_source.hpp"

#include <random>
#include <string>
#include <vector>

namespace linksim {

// ─── SimulationOrchestrator ───────────────────────────────────
// Runs one simulation end to end and owns its status transitions:
//   1. validate input, create the run record (pending), mark running
//   2. compute and persist baseline scores if any page has none
//   3. rule engine -> edit script, applied to the snapshot
//   4. weight blending over the full edge set
//   5. constrained solve with the converted boost/protect specs
//   6. deltas, results persisted, status completed
// Any failure after step 1 marks the run failed; results are only
// persisted once every step has succeeded.

class SimulationOrchestrator {
public:
    SimulationOrchestrator(SimulationStore& store,
                           SimulationSettings settings = {},
                           SimilaritySource* similarity = nullptr,
                           SolverControl control = {});

    /// Throws ValidationError for bad input (the run is never created),
    /// RunCancelled or RunFailure once the run has started.
    RunSummary runSimulation(const std::string& project_id,
                             const std::string& name,
                             const std::vector<LinkRule>& rules,
                             const std::vector<BoostSpec>& boosts = {},
                             const std::vector<ProtectSpec>& protections = {});

    /// Rule engine only; nothing is solved or persisted.
    RulePreview previewRules(const std::string& project_id,
                             const std::vector<LinkRule>& rules,
                             size_t preview_count = 10);

    /// Result rows of a finished run joined with the project's pages.
    std::vector<DetailedResult> detailedResults(const std::string& project_id, RunId run_id);

    static GraphStats graphStats(const std::vector<Page>& pages, const std::vector<Edge>& edges);

    /// Convert specs into solver constraints. Negative protection
    /// factors become absolute floors from the current score; such a
    /// spec is skipped when the page is unknown or has a zero score.
    static SolverConstraints buildConstraints(const std::vector<Page>& pages,
                                              const std::vector<BoostSpec>& boosts,
                                              const std::vector<ProtectSpec>& protections);

    static SummaryStats summarize(const std::vector<PageResult>& results,
                                  size_t links_added, size_t links_removed);

    SolverConfig solverConfig() const;
    const SimulationSettings& settings() const { return settings_; }

private:
    static void validateSpecs(const std::vector<BoostSpec>& boosts,
                              const std::vector<ProtectSpec>& protections);

    std::vector<Page> loadPages(const std::string& project_id);
    bool ensureBaseline(const std::string& project_id, std::vector<Page>& pages,
                        const std::vector<Edge>& edges);
    RunSummary execute(RunId run_id, const std::string& project_id,
                       std::vector<Page> pages, const std::vector<LinkRule>& rules,
                       const std::vector<BoostSpec>& boosts,
                       const std::vector<ProtectSpec>& protections);
    void markFailed(RunId run_id, const std::string& error);

    SimulationStore& store_;
    SimulationSettings settings_;
    SimilaritySource* similarity_;  // non-owning, may be null
    SolverControl control_;
    std::mt19937_64 rng_;
};

} // namespace linksim
