// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/option/option_spec.hpp"
#include <cmath>
#include <limits>

using namespace volscan;

namespace {

OptionSpec put_spec() {
    return OptionSpec{.spot = 100.0, .strike = 100.0, .maturity = 1.0, .rate = 0.05,
                      .dividend_yield = 0.0, .type = OptionType::PUT};
}

}  // namespace

// ===========================================================================
// validate_option_spec tests
// ===========================================================================

TEST(OptionSpecValidationTest, ValidSpecPasses) {
    EXPECT_TRUE(validate_option_spec(put_spec()).has_value());
}

TEST(OptionSpecValidationTest, NonPositiveSpot) {
    for (double spot : {-100.0, 0.0, std::numeric_limits<double>::quiet_NaN()}) {
        auto spec = put_spec();
        spec.spot = spot;
        auto result = validate_option_spec(spec);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidSpotPrice);
    }
}

TEST(OptionSpecValidationTest, NegativeStrike) {
    auto spec = put_spec();
    spec.strike = -100.0;
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidStrike);
}

TEST(OptionSpecValidationTest, NegativeMaturity) {
    auto spec = put_spec();
    spec.maturity = -1.0;
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidMaturity);
}

TEST(OptionSpecValidationTest, ZeroMaturityAllowed) {
    auto spec = put_spec();
    spec.maturity = 0.0;
    EXPECT_TRUE(validate_option_spec(spec).has_value());
}

TEST(OptionSpecValidationTest, NegativeRateAllowed) {
    auto spec = put_spec();
    spec.rate = -0.01;
    EXPECT_TRUE(validate_option_spec(spec).has_value());
}

TEST(OptionSpecValidationTest, NegativeDividendYield) {
    auto spec = put_spec();
    spec.dividend_yield = -0.01;
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidDividend);
}

// ===========================================================================
// validate_iv_query tests
// ===========================================================================

TEST(IVQueryValidationTest, ValidQueryPasses) {
    IVQuery query(put_spec(), 10.0);
    EXPECT_TRUE(validate_iv_query(query).has_value());
}

TEST(IVQueryValidationTest, NegativeMarketPrice) {
    IVQuery query(put_spec(), -5.0);
    auto result = validate_iv_query(query);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidMarketPrice);
}

TEST(IVQueryValidationTest, ExpiredQueryRejected) {
    auto spec = put_spec();
    spec.maturity = 0.0;
    auto result = validate_iv_query(IVQuery(spec, 1.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidMaturity);
}

TEST(IVQueryValidationTest, ArbitrageCallExceedsSpot) {
    auto spec = put_spec();
    spec.type = OptionType::CALL;
    auto result = validate_iv_query(IVQuery(spec, 150.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::ArbitrageViolation);
}

TEST(IVQueryValidationTest, ArbitragePutExceedsDiscountedStrike) {
    // K e^{-rT} ≈ 95.12 < 96
    auto result = validate_iv_query(IVQuery(put_spec(), 96.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::ArbitrageViolation);
}

TEST(IVQueryValidationTest, BelowIntrinsicRejected) {
    // Deep ITM call: lower bound S - K e^{-rT} ≈ 54.88
    OptionSpec spec{.spot = 150.0, .strike = 100.0, .maturity = 1.0, .rate = 0.05,
                    .dividend_yield = 0.0, .type = OptionType::CALL};
    auto result = validate_iv_query(IVQuery(spec, 50.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::ArbitrageViolation);
}

TEST(PriceBoundsTest, EuropeanBounds) {
    auto bounds = european_price_bounds(put_spec());
    EXPECT_DOUBLE_EQ(bounds.lower, 0.0);
    EXPECT_NEAR(bounds.upper, 100.0 * std::exp(-0.05), 1e-12);
}

// ===========================================================================
// validate_pricing_params tests
// ===========================================================================

TEST(PricingParamsValidationTest, ZeroVolatilityAllowed) {
    EXPECT_TRUE(validate_pricing_params(PricingParams(put_spec(), 0.0)).has_value());
}

TEST(PricingParamsValidationTest, NegativeVolatilityRejected) {
    auto result = validate_pricing_params(PricingParams(put_spec(), -0.1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}
