// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/option/european_option.hpp"
#include <cmath>

namespace volscan {
namespace {

class EuropeanOptionTest : public ::testing::Test {
protected:
    static constexpr double tolerance = 1e-6;
    static constexpr double loose_tolerance = 1e-2;

    static EuropeanOptionResult solve(double S, double K, double T, double r, double q,
                                      OptionType type, double sigma) {
        return EuropeanOptionSolver(PricingParams(S, K, T, r, q, type, sigma)).solve();
    }
};

// ============================================================================
// Reference scenario
// ============================================================================

TEST_F(EuropeanOptionTest, ReferenceCallQuarterYear) {
    auto result = price(PricingParams(100.0, 100.0, 0.25, 0.05, 0.0, OptionType::CALL, 0.20));
    ASSERT_TRUE(result.has_value());

    EXPECT_NEAR(result->price, 4.61, loose_tolerance);
    EXPECT_NEAR(result->greeks.delta, 0.57, loose_tolerance);
    EXPECT_GT(result->greeks.gamma, 0.0);
    EXPECT_LT(result->greeks.theta, 0.0);
    EXPECT_GT(result->greeks.vega, 0.0);
    EXPECT_GT(result->greeks.rho, 0.0);
    ASSERT_TRUE(result->d1.has_value());
    EXPECT_NEAR(*result->d1 - *result->d2, 0.20 * 0.5, 1e-12);
}

TEST_F(EuropeanOptionTest, DeskUnits) {
    auto raw = solve(100.0, 100.0, 0.25, 0.05, 0.0, OptionType::CALL, 0.20);
    auto desk = raw.priced();

    EXPECT_NEAR(desk.greeks.theta, raw.theta() / 365.0, 1e-14);
    EXPECT_NEAR(desk.greeks.vega, raw.vega() * 0.01, 1e-14);
    EXPECT_NEAR(desk.greeks.rho, raw.rho() * 0.01, 1e-14);
    EXPECT_NEAR(desk.carry_theta, desk.greeks.theta, 1e-14);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(EuropeanOptionTest, PutCallParity) {
    for (double S : {80.0, 100.0, 125.0}) {
        for (double T : {0.05, 0.5, 2.0}) {
            for (double q : {0.0, 0.03}) {
                const double K = 100.0, r = 0.04, sigma = 0.3;
                double call = solve(S, K, T, r, q, OptionType::CALL, sigma).value();
                double put = solve(S, K, T, r, q, OptionType::PUT, sigma).value();
                double forward_diff = S * std::exp(-q * T) - K * std::exp(-r * T);
                EXPECT_NEAR(call - put, forward_diff,
                            1e-10 * std::max(1.0, std::abs(forward_diff)))
                    << "S=" << S << " T=" << T << " q=" << q;
            }
        }
    }
}

TEST_F(EuropeanOptionTest, AtmDeltaApproachesHalf) {
    auto result = solve(100.0, 100.0, 1e-6, 0.05, 0.0, OptionType::CALL, 0.2);
    EXPECT_NEAR(result.delta(), 0.5, 1e-3);
}

TEST_F(EuropeanOptionTest, LongThetaNonPositive) {
    for (auto type : {OptionType::CALL, OptionType::PUT}) {
        for (double S : {50.0, 90.0, 100.0, 110.0, 200.0}) {
            for (double r : {0.0, 0.05, 0.15}) {
                auto result = solve(S, 100.0, 0.75, r, 0.02, type, 0.25);
                EXPECT_LE(result.theta(), 0.0) << "S=" << S << " r=" << r;
            }
        }
    }
}

TEST_F(EuropeanOptionTest, DeltaBounds) {
    for (double S : {60.0, 100.0, 140.0}) {
        auto call = solve(S, 100.0, 0.5, 0.03, 0.0, OptionType::CALL, 0.3);
        auto put = solve(S, 100.0, 0.5, 0.03, 0.0, OptionType::PUT, 0.3);
        EXPECT_GE(call.delta(), 0.0);
        EXPECT_LE(call.delta(), 1.0);
        EXPECT_GE(put.delta(), -1.0);
        EXPECT_LE(put.delta(), 0.0);
        EXPECT_NEAR(call.delta() - put.delta(), 1.0, tolerance);
        EXPECT_NEAR(call.gamma(), put.gamma(), tolerance);
    }
}

TEST_F(EuropeanOptionTest, DeltaMatchesFiniteDifference) {
    auto result = solve(100.0, 105.0, 0.5, 0.03, 0.01, OptionType::PUT, 0.25);
    const double h = 1e-4;
    const double fd = (result.value_at(100.0 + h) - result.value_at(100.0 - h)) / (2.0 * h);
    EXPECT_NEAR(result.delta(), fd, 1e-6);
}

// ============================================================================
// Degenerate inputs
// ============================================================================

TEST_F(EuropeanOptionTest, DeepOtmPutAtExpiry) {
    auto result = price(PricingParams(150.0, 100.0, 0.0, 0.05, 0.0, OptionType::PUT, 0.2));
    ASSERT_TRUE(result.has_value());

    EXPECT_DOUBLE_EQ(result->price, 0.0);
    EXPECT_DOUBLE_EQ(result->greeks.delta, 0.0);
    EXPECT_DOUBLE_EQ(result->greeks.gamma, 0.0);
    EXPECT_DOUBLE_EQ(result->greeks.theta, 0.0);
    EXPECT_DOUBLE_EQ(result->greeks.vega, 0.0);
    EXPECT_DOUBLE_EQ(result->greeks.rho, 0.0);
    EXPECT_FALSE(result->d1.has_value());
}

TEST_F(EuropeanOptionTest, ItmCallAtExpiry) {
    auto result = solve(110.0, 100.0, 0.0, 0.05, 0.0, OptionType::CALL, 0.2);
    EXPECT_DOUBLE_EQ(result.value(), 10.0);
    EXPECT_DOUBLE_EQ(result.delta(), 1.0);
    EXPECT_DOUBLE_EQ(result.gamma(), 0.0);
}

TEST_F(EuropeanOptionTest, ZeroVolatilityIsDeterministic) {
    auto result = solve(100.0, 90.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.0);
    EXPECT_NEAR(result.value(), 100.0 - 90.0 * std::exp(-0.05), 1e-12);
    EXPECT_DOUBLE_EQ(result.delta(), 1.0);
    EXPECT_DOUBLE_EQ(result.gamma(), 0.0);
    EXPECT_DOUBLE_EQ(result.vega(), 0.0);
    EXPECT_LE(result.theta(), 0.0);
}

TEST_F(EuropeanOptionTest, DeepItmPutCarryTheta) {
    // rK e^(-rT) N(-d2) outweighs the decay term
    auto result = solve(50.0, 100.0, 1.0, 0.05, 0.0, OptionType::PUT, 0.2);
    EXPECT_NEAR(result.carry_theta(), 4.738419, 1e-5);
    EXPECT_DOUBLE_EQ(result.theta(), 0.0);

    auto desk = result.priced();
    EXPECT_NEAR(desk.carry_theta, 0.012982, 1e-6);
    EXPECT_DOUBLE_EQ(desk.greeks.theta, 0.0);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(EuropeanOptionTest, RejectsInvalidInputs) {
    auto bad_spot = price(PricingParams(-1.0, 100.0, 0.5, 0.05, 0.0, OptionType::CALL, 0.2));
    ASSERT_FALSE(bad_spot.has_value());
    EXPECT_EQ(bad_spot.error().code, ValidationErrorCode::InvalidSpotPrice);

    auto bad_vol = price(PricingParams(100.0, 100.0, 0.5, 0.05, 0.0, OptionType::CALL, -0.2));
    ASSERT_FALSE(bad_vol.has_value());
    EXPECT_EQ(bad_vol.error().code, ValidationErrorCode::InvalidVolatility);

    auto bad_strike = price(PricingParams(100.0, 0.0, 0.5, 0.05, 0.0, OptionType::CALL, 0.2));
    ASSERT_FALSE(bad_strike.has_value());
    EXPECT_EQ(bad_strike.error().code, ValidationErrorCode::InvalidStrike);
}

TEST_F(EuropeanOptionTest, PricesContractAsOf) {
    auto contract = Contract::create("SPY", 100.0, Timestamp{"2024-04-01"}, OptionType::CALL);
    ASSERT_TRUE(contract.has_value());

    auto result = price(*contract, 100.0, 0.05, 0.0, 0.2, Timestamp{"2024-01-01"},
                        OptionType::CALL);
    ASSERT_TRUE(result.has_value());
    // 91 days
    auto reference = solve(100.0, 100.0, 91.0 / 365.0, 0.05, 0.0, OptionType::CALL, 0.2);
    EXPECT_NEAR(result->price, reference.value(), 1e-10);
}

TEST_F(EuropeanOptionTest, ExpiredContractRejectedByDefault) {
    auto contract = Contract::create("SPY", 100.0, Timestamp{"2024-01-01"}, OptionType::PUT);
    ASSERT_TRUE(contract.has_value());

    auto rejected = price(*contract, 90.0, 0.05, 0.0, 0.2, Timestamp{"2024-02-01"},
                          OptionType::PUT);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ValidationErrorCode::ExpiredContract);

    auto expired = price(*contract, 90.0, 0.05, 0.0, 0.2, Timestamp{"2024-02-01"},
                         OptionType::PUT, ExpiryPolicy::TreatAsExpired);
    ASSERT_TRUE(expired.has_value());
    EXPECT_DOUBLE_EQ(expired->price, 10.0);
}

}  // namespace
}  // namespace volscan
