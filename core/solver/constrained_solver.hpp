#pragma once

#include "graph/edge.hpp"
#include "graph/page.hpp"
#include "solver/solver_config.hpp"
#include "solver/solver_control.hpp"
#include "solver/teleport_allocator.hpp"
#include "solver/transition_matrix.hpp"
#include "solver/water_filling.hpp"

#include <vector>

namespace linksim {

/// Outcome of one damped power iteration.
struct PowerIterationResult {
    std::vector<double> scores;
    bool converged = false;
    int iterations = 0;
    double residual = 0.0;
};

// ─── ConstrainedSolver ────────────────────────────────────────
// Importance scores by damped power iteration
//     p <- d * M p + (1 - d) * t
// Unconstrained runs use a uniform t. Constrained runs first compute a
// baseline on the same graph, derive per-page floors and ceilings from
// it, then iterate with a conditional teleport vector and project every
// iterate onto the bounds by water-filling.
//
// Only the fast path exists. The size heuristic still reports which
// mode a request would have selected.

class ConstrainedSolver {
public:
    explicit ConstrainedSolver(SolverConfig config = {}, SolverControl control = {});

    /// Throws ValidationError on out-of-range parameters.
    static void validate(const SolverConfig& config);

    static double estimateSeconds(size_t num_pages, size_t num_links, int max_iter);

    /// Exact when the estimate fits under the threshold, Fast otherwise.
    SolverMode selectMode(size_t num_pages, size_t num_links) const;

    /// Unconstrained scores. Throws ValidationError on an empty page set,
    /// RunCancelled when the control token fires.
    SolverResult solveBaseline(const std::vector<Page>& pages,
                               const std::vector<Edge>& edges) const;

    /// Scores under protect, boost and outflow-cap constraints. With no
    /// constraints this is the baseline solve.
    SolverResult solve(const std::vector<Page>& pages,
                       const std::vector<Edge>& edges,
                       const SolverConstraints& constraints = {}) const;

    const SolverConfig& config() const { return config_; }

private:
    PowerIterationResult iterate(const TransitionMatrix& matrix,
                                 const std::vector<double>& start,
                                 const TeleportAllocator* allocator,
                                 const Bounds* bounds,
                                 const char* phase,
                                 SolverDiagnostics& diag) const;

    void clampBudgets(SolverDiagnostics& diag) const;

    SolverConfig config_;
    SolverControl control_;
};

} // namespace linksim
