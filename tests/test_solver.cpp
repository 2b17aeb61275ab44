#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "solver/constrained_solver.hpp"
#include "solver/teleport_allocator.hpp"
#include "solver/transition_matrix.hpp"

#include <numeric>

using namespace linksim;

namespace {

std::vector<Page> makePages(size_t n) {
    std::vector<Page> pages;
    for (size_t i = 1; i <= n; i++) {
        pages.emplace_back(i, "/p" + std::to_string(i), "product", "/c/");
    }
    return pages;
}

// Page 1 is the hub: every leaf links to it.
std::vector<Edge> hubEdges() {
    return {Edge(2, 1), Edge(3, 1), Edge(4, 1), Edge(1, 2), Edge(1, 3), Edge(2, 3), Edge(3, 4)};
}

double sum(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

} // namespace

// ─── Transition matrix ────────────────────────────────────────

TEST(TransitionMatrixTest, ColumnsAreStochastic) {
    std::vector<PageId> ids = {1, 2, 3, 4};
    std::vector<Edge> edges = {Edge(1, 2, 3.0), Edge(1, 3, 1.0), Edge(2, 3)};
    TransitionMatrix m(ids, edges, {{2, 0.25}});
    EXPECT_EQ(m.size(), 4u);
    EXPECT_EQ(m.danglingCount(), 2u);  // pages 3 and 4
    for (double s : m.columnSums()) {
        EXPECT_NEAR(s, 1.0, 1e-12);
    }
}

TEST(TransitionMatrixTest, WeightsAndCapShapeRows) {
    std::vector<PageId> ids = {1, 2, 3};
    std::vector<Edge> edges = {Edge(1, 2, 3.0), Edge(1, 3, 1.0), Edge(2, 3), Edge(3, 1)};
    TransitionMatrix m(ids, edges, {{2, 0.4}});

    std::vector<double> out;
    m.multiply({1.0, 0.0, 0.0}, out);
    EXPECT_NEAR(out[1], 0.75, 1e-12);
    EXPECT_NEAR(out[2], 0.25, 1e-12);

    m.multiply({0.0, 1.0, 0.0}, out);
    EXPECT_NEAR(out[1], 0.6, 1e-12);  // self-loop
    EXPECT_NEAR(out[2], 0.4, 1e-12);
}

TEST(TransitionMatrixTest, DanglingMassSpreadsUniformly) {
    TransitionMatrix m({1, 2, 3, 4}, {Edge(1, 2)});
    std::vector<double> out;
    m.multiply({0.0, 1.0, 0.0, 0.0}, out);
    for (double x : out) EXPECT_NEAR(x, 0.25, 1e-12);
}

TEST(TransitionMatrixTest, SkipsUnknownEndpoints) {
    TransitionMatrix m({1, 2}, {Edge(1, 2), Edge(1, 9)});
    EXPECT_EQ(m.skippedEdges(), 1u);
    EXPECT_EQ(m.nonZeros(), 1u);
}

TEST(TransitionMatrixTest, RejectsBadInput) {
    EXPECT_THROW(TransitionMatrix({1, 2}, {Edge(1, 2, -1.0)}), ValidationError);
    EXPECT_THROW(TransitionMatrix({1, 2}, {Edge(1, 2)}, {{1, 0.0}}), ValidationError);
    EXPECT_THROW(TransitionMatrix({1, 2}, {Edge(1, 2)}, {{1, 1.5}}), ValidationError);
}

TEST(TransitionMatrixTest, ThreadedMultiplyMatchesSerial) {
    const size_t n = 997;
    std::vector<PageId> ids;
    std::vector<Edge> edges;
    for (size_t i = 1; i <= n; i++) {
        ids.push_back(i);
        edges.emplace_back(i, i % n + 1);
        edges.emplace_back(i, (i * 7) % n + 1, 0.5);
    }
    TransitionMatrix m(ids, edges);
    std::vector<double> p(n);
    for (size_t i = 0; i < n; i++) p[i] = static_cast<double>(i % 13 + 1);

    std::vector<double> serial, threaded;
    m.multiply(p, serial, 1);
    m.multiply(p, threaded, 4);
    ASSERT_EQ(serial.size(), threaded.size());
    for (size_t i = 0; i < n; i++) {
        EXPECT_DOUBLE_EQ(serial[i], threaded[i]);
    }
}

// ─── Teleport allocation ──────────────────────────────────────

TEST(TeleportAllocatorTest, UnusedBudgetReturnsToUniform) {
    TeleportAllocator alloc(4, 0.05, 0.08, {{0, 0.1}}, {});
    std::vector<double> t;
    auto sample = alloc.build({0.3, 0.3, 0.2, 0.2}, t);  // floor already met
    EXPECT_DOUBLE_EQ(sample.protect_used, 0.0);
    for (double x : t) EXPECT_NEAR(x, 0.25, 1e-12);
}

TEST(TeleportAllocatorTest, SmallShortfallStillReceivesWholeBudget) {
    TeleportAllocator alloc(4, 0.05, 0.0, {{0, 0.22}}, {});
    std::vector<double> t;
    auto sample = alloc.build({0.2, 0.3, 0.3, 0.2}, t);  // need 0.02 < eta
    EXPECT_NEAR(sample.protect_used, 0.05, 1e-12);
    EXPECT_NEAR(t[0], 0.05 + 0.95 / 4.0, 1e-12);
    EXPECT_NEAR(t[1], 0.95 / 4.0, 1e-12);
    EXPECT_NEAR(sum(t), 1.0, 1e-12);
}

TEST(TeleportAllocatorTest, BudgetSplitInProportionToNeed) {
    TeleportAllocator alloc(4, 0.0, 0.06, {}, {{0, 0.3}, {1, 0.5}});
    std::vector<double> t;
    auto sample = alloc.build({0.2, 0.3, 0.3, 0.2}, t);  // needs 0.1 and 0.2
    EXPECT_NEAR(sample.boost_used, 0.06, 1e-12);
    double u = 0.94 / 4.0;
    EXPECT_NEAR(t[0] - u, 0.02, 1e-12);
    EXPECT_NEAR(t[1] - u, 0.04, 1e-12);
    EXPECT_NEAR(sum(t), 1.0, 1e-12);
}

// ─── Unconstrained solves ─────────────────────────────────────

TEST(ConstrainedSolverTest, SymmetricCycleIsUniform) {
    ConstrainedSolver solver;
    auto r = solver.solveBaseline(makePages(3), {Edge(1, 2), Edge(2, 3), Edge(3, 1)});
    ASSERT_EQ(r.scores.size(), 3u);
    for (double s : r.scores) EXPECT_NEAR(s, 1.0 / 3.0, 1e-3);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
    EXPECT_TRUE(r.diagnostics.converged);
}

TEST(ConstrainedSolverTest, NoEdgesGivesUniformScores) {
    ConstrainedSolver solver;
    auto r = solver.solveBaseline(makePages(5), {});
    for (double s : r.scores) EXPECT_NEAR(s, 0.2, 1e-3);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
}

TEST(ConstrainedSolverTest, HubOutranksLeaves) {
    ConstrainedSolver solver;
    auto r = solver.solveBaseline(makePages(4), hubEdges());
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
    EXPECT_NEAR(r.scores[0], 0.371, 1e-3);
    for (size_t i = 1; i < 4; i++) {
        EXPECT_GT(r.scores[0], r.scores[i]);
    }
}

TEST(ConstrainedSolverTest, DanglingChainSumsToOne) {
    ConstrainedSolver solver;
    auto r = solver.solveBaseline(makePages(4), {Edge(1, 2), Edge(2, 3), Edge(3, 4)});
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
    EXPECT_GT(r.scores[3], r.scores[0]);
}

TEST(ConstrainedSolverTest, ReportsNonConvergence) {
    SolverConfig config;
    config.max_iter = 3;
    config.tolerance = 1e-15;
    ConstrainedSolver solver(config);
    auto r = solver.solveBaseline(makePages(4), hubEdges());
    EXPECT_FALSE(r.diagnostics.converged);
    EXPECT_EQ(r.diagnostics.iterations_run, 3);
    EXPECT_GT(r.diagnostics.final_l1_residual, 0.0);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
}

TEST(ConstrainedSolverTest, ThreadCountDoesNotChangeScores) {
    SolverConfig config;
    config.num_threads = 3;
    auto threaded = ConstrainedSolver(config).solveBaseline(makePages(4), hubEdges());
    auto serial = ConstrainedSolver().solveBaseline(makePages(4), hubEdges());
    for (size_t i = 0; i < 4; i++) {
        EXPECT_NEAR(threaded.scores[i], serial.scores[i], 1e-12);
    }
}

// ─── Constrained solves ───────────────────────────────────────

TEST(ConstrainedSolverTest, ProtectedPageKeepsFloor) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.protect["/p4"] = ProtectFloor::factor(1.5);
    auto r = solver.solve(makePages(4), hubEdges(), c);

    double floor = 1.5 * r.baseline[3];
    EXPECT_GE(r.scores[3], floor - 1e-6);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
    EXPECT_EQ(r.diagnostics.protected_pages, 1u);
    EXPECT_NEAR(r.diagnostics.protected_mass, r.scores[3], 1e-12);
    EXPECT_TRUE(r.diagnostics.converged);
}

TEST(ConstrainedSolverTest, AbsoluteFloor) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.protect["/p2"] = ProtectFloor::fixed(0.3);
    auto r = solver.solve(makePages(4), hubEdges(), c);
    EXPECT_GE(r.scores[1], 0.3 - 1e-6);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
}

TEST(ConstrainedSolverTest, BoostRaisesScoreWithinCeiling) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.boost["/p2"] = 1.5;
    auto r = solver.solve(makePages(4), hubEdges(), c);

    EXPECT_GT(r.scores[1], r.baseline[1]);
    EXPECT_LE(r.scores[1], kBoostCeilingMultiplier * 1.5 * r.baseline[1] + 1e-9);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
    EXPECT_GT(r.diagnostics.boost_budget_used, 0.0);
    EXPECT_LE(r.diagnostics.boost_budget_used, SolverConfig{}.eta_boost + 1e-12);
    EXPECT_FALSE(r.diagnostics.budget_trace.empty());
}

TEST(ConstrainedSolverTest, BoostCeilingCapsScore) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.boost["/p1"] = 0.25;  // ceiling at half the hub's baseline
    auto r = solver.solve(makePages(4), hubEdges(), c);
    EXPECT_LE(r.scores[0], kBoostCeilingMultiplier * 0.25 * r.baseline[0] + 1e-9);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
}

TEST(ConstrainedSolverTest, OutflowCapKeepsMassOnPage) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.outflow_caps["/p1"] = 0.5;
    auto r = solver.solve(makePages(4), hubEdges(), c);
    EXPECT_NEAR(r.scores[0], 0.516, 1e-3);
    EXPECT_GT(r.scores[0], r.baseline[0]);
    EXPECT_EQ(r.diagnostics.capped_pages, 1u);
}

TEST(ConstrainedSolverTest, UnknownUrlsAreIgnored) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.boost["/missing"] = 2.0;
    c.protect["/also-missing"] = ProtectFloor::factor(1.0);
    auto r = solver.solve(makePages(4), hubEdges(), c);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_NEAR(r.scores[i], r.baseline[i], 1e-6);
    }
    EXPECT_EQ(r.diagnostics.boosted_pages, 0u);
}

TEST(ConstrainedSolverTest, BudgetOverflowIsClamped) {
    SolverConfig config;
    config.eta_protect = 0.7;
    config.eta_boost = 0.6;
    ConstrainedSolver solver(config);
    SolverConstraints c;
    c.protect["/p4"] = ProtectFloor::factor(1.2);
    auto r = solver.solve(makePages(4), hubEdges(), c);
    EXPECT_TRUE(r.diagnostics.budget_clamped);
    EXPECT_DOUBLE_EQ(r.diagnostics.eta_protect, 0.4);
    EXPECT_NEAR(r.diagnostics.eta_boost, 0.2, 1e-12);
}

TEST(ConstrainedSolverTest, InfeasibleFloorsAreReported) {
    ConstrainedSolver solver;
    SolverConstraints c;
    c.protect["/p1"] = ProtectFloor::fixed(0.7);
    c.protect["/p2"] = ProtectFloor::fixed(0.6);
    auto r = solver.solve(makePages(4), hubEdges(), c);
    EXPECT_GT(r.diagnostics.degenerate_projections, 0);
    EXPECT_NEAR(sum(r.scores), 1.0, 1e-6);
}

TEST(ConstrainedSolverTest, InvalidConstraintValues) {
    ConstrainedSolver solver;
    SolverConstraints bad_boost;
    bad_boost.boost["/p1"] = 0.0;
    EXPECT_THROW(solver.solve(makePages(2), {}, bad_boost), ValidationError);

    SolverConstraints bad_floor;
    bad_floor.protect["/p1"] = ProtectFloor::fixed(-0.1);
    EXPECT_THROW(solver.solve(makePages(2), {}, bad_floor), ValidationError);
}

// ─── Configuration and control ────────────────────────────────

TEST(ConstrainedSolverTest, RejectsInvalidConfig) {
    SolverConfig config;
    config.damping = 1.0;
    EXPECT_THROW(ConstrainedSolver{config}, ValidationError);
    config = SolverConfig{};
    config.tolerance = 0.0;
    EXPECT_THROW(ConstrainedSolver{config}, ValidationError);
    config = SolverConfig{};
    config.max_iter = 0;
    EXPECT_THROW(ConstrainedSolver{config}, ValidationError);
}

TEST(ConstrainedSolverTest, EmptyPageSetThrows) {
    ConstrainedSolver solver;
    EXPECT_THROW(solver.solveBaseline({}, {}), ValidationError);
}

TEST(ConstrainedSolverTest, ModeEstimate) {
    EXPECT_NEAR(ConstrainedSolver::estimateSeconds(1000, 5000, 1000), 1.6, 1e-9);
    EXPECT_NEAR(ConstrainedSolver::estimateSeconds(1000, 5000, 10), 0.25, 1e-9);

    ConstrainedSolver small;
    EXPECT_EQ(small.selectMode(4, 7), SolverMode::Exact);

    SolverConfig config;
    config.performance_threshold_seconds = 0.05;
    ConstrainedSolver strict(config);
    EXPECT_EQ(strict.selectMode(4, 7), SolverMode::Fast);

    auto r = small.solveBaseline(makePages(4), hubEdges());
    EXPECT_EQ(r.diagnostics.selected_mode, SolverMode::Exact);
    EXPECT_EQ(r.diagnostics.executed_mode, SolverMode::Fast);
}

TEST(ConstrainedSolverTest, CancellationStopsSolve) {
    CancellationToken token;
    token.cancel();
    SolverControl control;
    control.cancel = &token;
    ConstrainedSolver solver(SolverConfig{}, control);
    EXPECT_THROW(solver.solveBaseline(makePages(4), hubEdges()), RunCancelled);
}

TEST(ConstrainedSolverTest, YieldHookRunsOnSchedule) {
    std::vector<int> seen;
    SolverControl control;
    control.yield = [&seen](int iteration) { seen.push_back(iteration); };
    control.yield_interval = 5;

    SolverConfig config;
    config.max_iter = 12;
    config.tolerance = 1e-15;
    ConstrainedSolver solver(config, control);
    solver.solveBaseline(makePages(4), hubEdges());
    EXPECT_EQ(seen, (std::vector<int>{0, 5, 10}));
}

TEST(ConstrainedSolverTest, ScoreMapByPageId) {
    ConstrainedSolver solver;
    auto r = solver.solveBaseline(makePages(3), {Edge(1, 2)});
    auto scores = r.scoreMap();
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_DOUBLE_EQ(scores.at(2), r.scores[1]);
}
