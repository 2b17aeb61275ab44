#pragma once

#include "graph/page.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace linksim {

/// Boosted pages may not exceed this multiple of their target.
constexpr double kBoostCeilingMultiplier = 2.0;

/// Budget clamp applied when eta_protect + eta_boost > 1.
constexpr double kMaxProtectBudgetOnOverflow = 0.4;
constexpr double kCombinedBudgetOnOverflow = 0.6;

/// Size heuristic: base + (per_page * n + per_link * m) * min(cap, max_iter).
constexpr double kEstimateBaseSeconds = 0.1;
constexpr double kEstimatePerPageSeconds = 0.00001;
constexpr double kEstimatePerLinkSeconds = 0.000001;
constexpr int kEstimateIterationCap = 100;

enum class SolverMode {
    Fast,   // conditional teleportation + water-filling (implemented)
    Exact   // reserved; requests are served by Fast
};

std::string toString(SolverMode mode);

struct SolverConfig {
    double damping = 0.85;
    double tolerance = 1e-8;
    int max_iter = 1000;
    int check_interval = 10;         // convergence is tested every N iterations
    double performance_threshold_seconds = 15.0 * 60.0;
    double eta_protect = 0.05;
    double eta_boost = 0.03;
    size_t num_threads = 1;          // matrix-vector fan-out
};

/// Protection floor for one page. By default `value` is a fraction of
/// the page's baseline score; `absolute` floors are used as-is.
struct ProtectFloor {
    double value = 0.0;
    bool absolute = false;

    static ProtectFloor factor(double f) { return {f, false}; }
    static ProtectFloor fixed(double v) { return {v, true}; }
};

/// Per-URL constraints. URLs that match no page are ignored.
struct SolverConstraints {
    std::unordered_map<std::string, ProtectFloor> protect;
    std::unordered_map<std::string, double> boost;         // url -> target factor (> 0)
    std::unordered_map<std::string, double> outflow_caps;  // url -> cap in (0, 1]

    bool empty() const { return protect.empty() && boost.empty() && outflow_caps.empty(); }
};

struct BudgetSample {
    int iteration = 0;
    double protect_used = 0.0;
    double boost_used = 0.0;
};

struct SolverDiagnostics {
    bool converged = false;
    int iterations_run = 0;
    double final_l1_residual = 0.0;

    double eta_protect = 0.0;        // effective budgets after clamping
    double eta_boost = 0.0;
    bool budget_clamped = false;
    double protect_budget_used = 0.0;
    double boost_budget_used = 0.0;
    std::vector<BudgetSample> budget_trace;

    int degenerate_projections = 0;

    size_t protected_pages = 0;
    size_t boosted_pages = 0;
    size_t capped_pages = 0;
    double protected_mass = 0.0;
    double boosted_mass = 0.0;

    double estimated_seconds = 0.0;
    SolverMode selected_mode = SolverMode::Fast;
    SolverMode executed_mode = SolverMode::Fast;
    double elapsed_seconds = 0.0;
};

/// Scores are index-aligned with the page list passed to the solver.
struct SolverResult {
    std::vector<PageId> page_ids;
    std::vector<double> scores;
    std::vector<double> baseline;  // unconstrained scores on the same graph
    SolverDiagnostics diagnostics;

    std::unordered_map<PageId, double> scoreMap() const;
};

} // namespace linksim
