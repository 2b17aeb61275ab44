#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "solver/water_filling.hpp"

#include <numeric>
#include <random>

using namespace linksim;

namespace {

double sum(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

} // namespace

TEST(WaterFillingTest, FeasibleVectorUnchanged) {
    std::vector<double> p = {0.2, 0.3, 0.5};
    Bounds b(3);
    b.floor[0] = 0.1;
    b.ceiling[2] = 0.6;
    auto outcome = projectOntoBounds(p, b);
    EXPECT_FALSE(outcome.degenerate);
    EXPECT_NEAR(p[0], 0.2, 1e-12);
    EXPECT_NEAR(p[1], 0.3, 1e-12);
    EXPECT_NEAR(p[2], 0.5, 1e-12);
}

TEST(WaterFillingTest, RaisesToFloorAndDrainsOthers) {
    std::vector<double> p = {0.1, 0.45, 0.45};
    Bounds b(3);
    b.floor[0] = 0.3;
    projectOntoBounds(p, b);
    EXPECT_NEAR(p[0], 0.3, 1e-12);
    // Surplus is removed in proportion to room above the floor.
    EXPECT_NEAR(p[1], 0.35, 1e-12);
    EXPECT_NEAR(p[2], 0.35, 1e-12);
    EXPECT_NEAR(sum(p), 1.0, 1e-12);
}

TEST(WaterFillingTest, CapsCeilingAndSpreadsSurplus) {
    std::vector<double> p = {0.7, 0.2, 0.1};
    Bounds b(3);
    b.ceiling[0] = 0.4;
    projectOntoBounds(p, b);
    EXPECT_NEAR(p[0], 0.4, 1e-12);
    EXPECT_NEAR(p[1], 0.35, 1e-12);
    EXPECT_NEAR(p[2], 0.25, 1e-12);
}

TEST(WaterFillingTest, SurplusFollowsRemainingRoom) {
    std::vector<double> p = {0.5, 0.1, 0.1};
    Bounds b(3);
    b.ceiling = {0.5, 0.2, 0.4};
    projectOntoBounds(p, b);
    // Deficit 0.3 split over room 0.1 and 0.3.
    EXPECT_NEAR(p[1], 0.175, 1e-12);
    EXPECT_NEAR(p[2], 0.325, 1e-12);
    EXPECT_NEAR(sum(p), 1.0, 1e-12);
}

TEST(WaterFillingTest, RandomInputsRespectBounds) {
    std::mt19937_64 rng(99);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (int trial = 0; trial < 200; trial++) {
        const size_t n = 2 + trial % 30;
        std::vector<double> p(n);
        for (double& x : p) x = unit(rng);
        double s = sum(p);
        for (double& x : p) x /= s;

        Bounds b(n);
        double floor_budget = 0.9 * unit(rng);
        std::vector<double> raw(n);
        for (double& x : raw) x = unit(rng);
        double raw_sum = sum(raw);
        for (size_t i = 0; i < n; i++) {
            if (unit(rng) < 0.5) b.floor[i] = floor_budget * raw[i] / raw_sum;
            // Keep the last entry unbounded so the ceilings stay feasible.
            if (i + 1 < n && unit(rng) < 0.4) {
                b.ceiling[i] = b.floor[i] + 0.5 * unit(rng) / static_cast<double>(n);
            }
        }

        auto outcome = projectOntoBounds(p, b);
        ASSERT_FALSE(outcome.degenerate) << "trial " << trial;
        EXPECT_NEAR(sum(p), 1.0, 1e-9) << "trial " << trial;
        for (size_t i = 0; i < n; i++) {
            EXPECT_GE(p[i], b.floor[i] - 1e-9) << "trial " << trial << " entry " << i;
            EXPECT_LE(p[i], b.ceiling[i] + 1e-9) << "trial " << trial << " entry " << i;
        }
    }
}

TEST(WaterFillingTest, InfeasibleFloorsRescale) {
    std::vector<double> p = {0.5, 0.5};
    Bounds b(2);
    b.floor = {0.7, 0.6};
    auto outcome = projectOntoBounds(p, b);
    EXPECT_TRUE(outcome.degenerate);
    EXPECT_TRUE(outcome.floors_relaxed);
    EXPECT_NEAR(sum(p), 1.0, 1e-12);
    EXPECT_NEAR(p[0], 0.7 / 1.3, 1e-12);
}

TEST(WaterFillingTest, InfeasibleCeilingsKeepFloors) {
    std::vector<double> p = {0.6, 0.4};
    Bounds b(2);
    b.floor = {0.1, 0.3};
    b.ceiling = {0.2, 0.4};
    auto outcome = projectOntoBounds(p, b);
    EXPECT_TRUE(outcome.degenerate);
    EXPECT_TRUE(outcome.ceilings_relaxed);
    EXPECT_FALSE(outcome.floors_relaxed);
    EXPECT_NEAR(sum(p), 1.0, 1e-12);
    EXPECT_GE(p[0], b.floor[0]);
    EXPECT_GE(p[1], b.floor[1]);
}

TEST(WaterFillingTest, SizeMismatchThrows) {
    std::vector<double> p = {1.0};
    EXPECT_THROW(projectOntoBounds(p, Bounds(2)), ValidationError);
}
