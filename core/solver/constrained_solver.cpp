#include "solver/constrained_solver.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <string>
#include <unordered_map>

namespace linksim {

namespace {

double l1Distance(const std::vector<double>& a, const std::vector<double>& b) {
    double d = 0.0;
    for (size_t i = 0; i < a.size(); ++i) d += std::fabs(a[i] - b[i]);
    return d;
}

void normalize(std::vector<double>& p) {
    double s = std::accumulate(p.begin(), p.end(), 0.0);
    if (s <= 0.0) return;
    for (double& x : p) x /= s;
}

std::vector<PageId> idsOf(const std::vector<Page>& pages) {
    std::vector<PageId> ids;
    ids.reserve(pages.size());
    for (const Page& p : pages) ids.push_back(p.id);
    return ids;
}

} // namespace

ConstrainedSolver::ConstrainedSolver(SolverConfig config, SolverControl control)
    : config_(config), control_(std::move(control)) {
    validate(config_);
}

void ConstrainedSolver::validate(const SolverConfig& config) {
    if (!(config.damping > 0.0 && config.damping < 1.0)) {
        throw ValidationError("Damping must be in (0, 1), got " + std::to_string(config.damping));
    }
    if (!(config.tolerance > 0.0)) {
        throw ValidationError("Tolerance must be positive, got " + std::to_string(config.tolerance));
    }
    if (config.max_iter <= 0) {
        throw ValidationError("max_iter must be positive, got " + std::to_string(config.max_iter));
    }
    if (config.check_interval <= 0) {
        throw ValidationError("check_interval must be positive");
    }
    if (config.eta_protect < 0.0 || config.eta_protect > 1.0 ||
        config.eta_boost < 0.0 || config.eta_boost > 1.0) {
        throw ValidationError("Teleport budgets must be in [0, 1]");
    }
    if (config.num_threads == 0) {
        throw ValidationError("num_threads must be at least 1");
    }
}

// ─── Mode selection ───────────────────────────────────────────

double ConstrainedSolver::estimateSeconds(size_t num_pages, size_t num_links, int max_iter) {
    double per_iter = kEstimatePerPageSeconds * static_cast<double>(num_pages) +
                      kEstimatePerLinkSeconds * static_cast<double>(num_links);
    return kEstimateBaseSeconds + per_iter * std::min(kEstimateIterationCap, max_iter);
}

SolverMode ConstrainedSolver::selectMode(size_t num_pages, size_t num_links) const {
    double estimate = estimateSeconds(num_pages, num_links, config_.max_iter);
    return estimate > config_.performance_threshold_seconds ? SolverMode::Fast
                                                            : SolverMode::Exact;
}

void ConstrainedSolver::clampBudgets(SolverDiagnostics& diag) const {
    diag.eta_protect = config_.eta_protect;
    diag.eta_boost = config_.eta_boost;
    if (diag.eta_protect + diag.eta_boost > 1.0) {
        diag.eta_protect = std::min(diag.eta_protect, kMaxProtectBudgetOnOverflow);
        diag.eta_boost = std::min(diag.eta_boost, kCombinedBudgetOnOverflow - diag.eta_protect);
        diag.budget_clamped = true;
        spdlog::warn("Teleport budgets {} + {} exceed 1, clamped to protect={} boost={}",
                     config_.eta_protect, config_.eta_boost, diag.eta_protect, diag.eta_boost);
    }
}

// ─── Power iteration ──────────────────────────────────────────

PowerIterationResult ConstrainedSolver::iterate(const TransitionMatrix& matrix,
                                                const std::vector<double>& start,
                                                const TeleportAllocator* allocator,
                                                const Bounds* bounds,
                                                const char* phase,
                                                SolverDiagnostics& diag) const {
    const size_t n = matrix.size();
    const double d = config_.damping;

    IterationCheckpoint checkpoint(control_, phase);

    PowerIterationResult result;
    std::vector<double> p = start;
    std::vector<double> mp(n, 0.0);
    std::vector<double> next(n, 0.0);
    std::vector<double> teleport(n, 1.0 / static_cast<double>(n));

    for (int it = 0; it < config_.max_iter; ++it) {
        checkpoint.reached(it);

        matrix.multiply(p, mp, config_.num_threads);

        if (allocator) {
            AllocationSample sample = allocator->build(p, teleport);
            diag.budget_trace.push_back({it, sample.protect_used, sample.boost_used});
            diag.protect_budget_used = sample.protect_used;
            diag.boost_budget_used = sample.boost_used;
        }

        for (size_t i = 0; i < n; ++i) {
            next[i] = d * mp[i] + (1.0 - d) * teleport[i];
        }

        if (bounds) {
            ProjectionOutcome outcome = projectOntoBounds(next, *bounds);
            if (outcome.degenerate) {
                if (diag.degenerate_projections == 0) {
                    spdlog::warn("{}: no adjustable entries at iteration {}, rescaled ({} relaxed)",
                                 phase, it, outcome.floors_relaxed ? "floors" : "ceilings");
                }
                diag.degenerate_projections++;
            }
        } else {
            normalize(next);
        }

        result.iterations = it + 1;
        bool check = (it + 1) % config_.check_interval == 0 || it + 1 == config_.max_iter;
        if (check) {
            result.residual = l1Distance(next, p);
            spdlog::debug("{}: iteration {} residual {:.3e}", phase, it + 1, result.residual);
            if (result.residual < config_.tolerance) {
                result.converged = true;
                p.swap(next);
                break;
            }
        }
        p.swap(next);
    }

    result.scores = std::move(p);
    return result;
}

// ─── Solves ───────────────────────────────────────────────────

SolverResult ConstrainedSolver::solveBaseline(const std::vector<Page>& pages,
                                              const std::vector<Edge>& edges) const {
    return solve(pages, edges, SolverConstraints{});
}

SolverResult ConstrainedSolver::solve(const std::vector<Page>& pages,
                                      const std::vector<Edge>& edges,
                                      const SolverConstraints& constraints) const {
    if (pages.empty()) {
        throw ValidationError("Cannot solve an empty page set");
    }
    auto started = std::chrono::steady_clock::now();

    SolverResult result;
    result.page_ids = idsOf(pages);
    SolverDiagnostics& diag = result.diagnostics;
    const size_t n = pages.size();

    diag.estimated_seconds = estimateSeconds(n, edges.size(), config_.max_iter);
    diag.selected_mode = selectMode(n, edges.size());
    diag.executed_mode = SolverMode::Fast;
    if (diag.selected_mode == SolverMode::Exact) {
        spdlog::debug("Estimate {:.2f}s selects exact mode; running fast path",
                      diag.estimated_seconds);
    }
    clampBudgets(diag);

    spdlog::info("Solving {} pages, {} links (damping={}, tol={}, max_iter={})",
                 n, edges.size(), config_.damping, config_.tolerance, config_.max_iter);

    TransitionMatrix plain(result.page_ids, edges);
    std::vector<double> uniform(n, 1.0 / static_cast<double>(n));
    PowerIterationResult base = iterate(plain, uniform, nullptr, nullptr, "baseline", diag);
    result.baseline = base.scores;

    PowerIterationResult final_pass;
    if (constraints.empty()) {
        final_pass = std::move(base);
    } else {
        std::unordered_map<std::string, size_t> by_url;
        for (size_t i = 0; i < n; ++i) {
            by_url.emplace(pages[i].url, i);
        }

        Bounds bounds(n);
        std::vector<TeleportTarget> protect_targets;
        std::vector<TeleportTarget> boost_targets;
        std::vector<bool> is_protected(n, false);
        std::vector<bool> is_boosted(n, false);

        for (const auto& [url, spec] : constraints.protect) {
            auto it = by_url.find(url);
            if (it == by_url.end()) {
                spdlog::warn("Protect constraint for unknown URL {} ignored", url);
                continue;
            }
            if (!std::isfinite(spec.value) || spec.value < 0.0) {
                throw ValidationError("Invalid protection floor for " + url);
            }
            size_t i = it->second;
            double floor = spec.absolute ? spec.value : spec.value * result.baseline[i];
            bounds.floor[i] = std::max(bounds.floor[i], floor);
            is_protected[i] = true;
        }
        for (const auto& [url, factor] : constraints.boost) {
            auto it = by_url.find(url);
            if (it == by_url.end()) {
                spdlog::warn("Boost constraint for unknown URL {} ignored", url);
                continue;
            }
            if (!std::isfinite(factor) || factor <= 0.0) {
                throw ValidationError("Boost target factor must be positive for " + url);
            }
            size_t i = it->second;
            double target = factor * result.baseline[i];
            bounds.ceiling[i] = std::min(bounds.ceiling[i], kBoostCeilingMultiplier * target);
            boost_targets.push_back({i, target});
            is_boosted[i] = true;
        }

        double floor_sum = 0.0;
        for (size_t i = 0; i < n; ++i) {
            // A page both protected and boosted keeps its floor.
            bounds.ceiling[i] = std::max(bounds.ceiling[i], bounds.floor[i]);
            if (is_protected[i]) protect_targets.push_back({i, bounds.floor[i]});
            floor_sum += bounds.floor[i];
        }
        if (floor_sum > 1.0) {
            spdlog::warn("Protection floors sum to {:.4f} > 1; floors cannot all hold", floor_sum);
        }

        std::unordered_map<PageId, double> caps;
        for (const auto& [url, cap] : constraints.outflow_caps) {
            auto it = by_url.find(url);
            if (it == by_url.end()) {
                spdlog::warn("Outflow cap for unknown URL {} ignored", url);
                continue;
            }
            caps[result.page_ids[it->second]] = cap;
        }

        diag.protected_pages = protect_targets.size();
        diag.boosted_pages = boost_targets.size();
        diag.capped_pages = caps.size();

        TransitionMatrix capped(result.page_ids, edges, caps);
        TeleportAllocator allocator(n, diag.eta_protect, diag.eta_boost,
                                    std::move(protect_targets), std::move(boost_targets));

        spdlog::info("Constrained pass: {} protected, {} boosted, {} capped (eta_p={}, eta_b={})",
                     diag.protected_pages, diag.boosted_pages, diag.capped_pages,
                     diag.eta_protect, diag.eta_boost);

        final_pass = iterate(capped, result.baseline, &allocator, &bounds, "constrained", diag);

        for (size_t i = 0; i < n; ++i) {
            if (is_protected[i]) diag.protected_mass += final_pass.scores[i];
            if (is_boosted[i]) diag.boosted_mass += final_pass.scores[i];
        }
    }

    result.scores = std::move(final_pass.scores);
    diag.converged = final_pass.converged;
    diag.iterations_run = final_pass.iterations;
    diag.final_l1_residual = final_pass.residual;
    diag.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    if (!diag.converged) {
        spdlog::warn("Solver stopped after {} iterations without converging (residual {:.3e})",
                     diag.iterations_run, diag.final_l1_residual);
    }
    spdlog::info("Solver finished: {} iterations, residual {:.3e}, protect used {:.4f}, "
                 "boost used {:.4f}, {:.3f}s",
                 diag.iterations_run, diag.final_l1_residual, diag.protect_budget_used,
                 diag.boost_budget_used, diag.elapsed_seconds);
    return result;
}

} // namespace linksim
