// SPDX-License-Identifier: MIT
#include "volscan/math/root_finding.hpp"
#include <gtest/gtest.h>
#include <cmath>

TEST(RootFindingConfigTest, DefaultValues) {
    volscan::RootFindingConfig config;

    EXPECT_EQ(config.max_iter, 100);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(config.max_step, 0.5);
    EXPECT_EQ(config.max_divergent_steps, 3);
}

TEST(RootFindingConfigTest, CustomValues) {
    volscan::RootFindingConfig config{
        .max_iter = 50,
        .tolerance = 1e-8
    };

    EXPECT_EQ(config.max_iter, 50);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-8);
}

// ============================================================================
// Bisection
// ============================================================================

TEST(BisectionTest, FindsSqrtTwo) {
    auto f = [](double x) { return x*x - 2.0; };
    volscan::RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};

    auto result = volscan::bisect_find_root(f, 0.0, 2.0, config);

    ASSERT_TRUE(result.converged);
    ASSERT_TRUE(result.root.has_value());
    EXPECT_NEAR(*result.root, std::sqrt(2.0), 1e-8);
}

TEST(BisectionTest, EndpointRoot) {
    auto f = [](double x) { return x - 1.0; };
    auto result = volscan::bisect_find_root(f, 1.0, 3.0, volscan::RootFindingConfig{});

    ASSERT_TRUE(result.converged);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_DOUBLE_EQ(*result.root, 1.0);
}

TEST(BisectionTest, NotBracketedReturnsBetterEndpoint) {
    auto f = [](double x) { return x*x + 1.0; };
    auto result = volscan::bisect_find_root(f, 0.5, 3.0, volscan::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    ASSERT_TRUE(result.failure_reason.has_value());
    ASSERT_TRUE(result.root.has_value());
    EXPECT_DOUBLE_EQ(*result.root, 0.5);
}

TEST(BisectionTest, InvalidBounds) {
    auto f = [](double x) { return x; };
    auto result = volscan::bisect_find_root(f, 2.0, 1.0, volscan::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    EXPECT_FALSE(result.root.has_value());
}

// ============================================================================
// Newton
// ============================================================================

TEST(NewtonTest, QuadraticConvergence) {
    auto f = [](double x) { return x*x - 2.0; };
    auto df = [](double x) { return 2.0*x; };
    volscan::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-12};

    auto result = volscan::newton_find_root(f, df, 1.0, 0.0, 2.0, config);

    ASSERT_TRUE(result.converged);
    EXPECT_NEAR(*result.root, std::sqrt(2.0), 1e-10);
    EXPECT_LT(result.iterations, 10);
}

TEST(NewtonTest, FlatDerivativeFails) {
    auto f = [](double) { return 1.0; };
    auto df = [](double) { return 0.0; };

    auto result = volscan::newton_find_root(f, df, 1.0, 0.0, 2.0, volscan::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    ASSERT_TRUE(result.failure_reason.has_value());
    ASSERT_TRUE(result.root.has_value());
}

TEST(NewtonTest, StaysInsideBounds) {
    // Root at x = 5 lies outside [0, 2]; iterates must not escape
    auto f = [](double x) { return x - 5.0; };
    auto df = [](double) { return 1.0; };

    auto result = volscan::newton_find_root(f, df, 1.0, 0.0, 2.0, volscan::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    ASSERT_TRUE(result.root.has_value());
    EXPECT_GE(*result.root, 0.0);
    EXPECT_LE(*result.root, 2.0);
}

TEST(NewtonTest, IterationCapRespected) {
    auto f = [](double x) { return std::atan(x - 1.0); };
    auto df = [](double x) { return 1.0 / (1.0 + (x - 1.0) * (x - 1.0)); };
    volscan::RootFindingConfig config{.max_iter = 3, .tolerance = 1e-14, .max_step = 0.1};

    auto result = volscan::newton_find_root(f, df, -1.0, -5.0, 5.0, config);

    EXPECT_LE(result.iterations, 3);
}
