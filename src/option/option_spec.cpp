// SPDX-License-Identifier: MIT
#include "volscan/option/option_spec.hpp"
#include "volscan/support/volscan_trace.h"
#include <cmath>
#include <algorithm>

namespace volscan {

namespace {

// Absorbs rounding when a model price sits exactly on a no-arbitrage bound
constexpr double kArbitrageSlack = 1e-10;

std::expected<void, ValidationError> reject(ValidationErrorCode code, double value) {
    VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_VALIDATION, static_cast<int>(code), value, 0.0);
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<void, ValidationError> validate_option_spec(const OptionSpec& spec) {
    // Validate spot price
    if (spec.spot <= 0.0 || !std::isfinite(spec.spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, spec.spot);
    }

    // Validate strike price
    if (spec.strike <= 0.0 || !std::isfinite(spec.strike)) {
        return reject(ValidationErrorCode::InvalidStrike, spec.strike);
    }

    // Validate maturity (zero is an expired contract)
    if (spec.maturity < 0.0 || !std::isfinite(spec.maturity)) {
        return reject(ValidationErrorCode::InvalidMaturity, spec.maturity);
    }

    // Validate rate (allow negative but must be finite)
    if (!std::isfinite(spec.rate)) {
        return reject(ValidationErrorCode::InvalidRate, spec.rate);
    }

    // Validate dividend yield (must be non-negative and finite)
    if (spec.dividend_yield < 0.0 || !std::isfinite(spec.dividend_yield)) {
        return reject(ValidationErrorCode::InvalidDividend, spec.dividend_yield);
    }

    return {};
}

PriceBounds european_price_bounds(const OptionSpec& spec) {
    const double tau = std::max(spec.maturity, 0.0);
    const double S_disc = spec.spot * std::exp(-spec.dividend_yield * tau);
    const double K_disc = spec.strike * std::exp(-spec.rate * tau);

    if (spec.type == OptionType::CALL) {
        return PriceBounds{.lower = std::max(S_disc - K_disc, 0.0), .upper = S_disc};
    }
    return PriceBounds{.lower = std::max(K_disc - S_disc, 0.0), .upper = K_disc};
}

std::expected<void, ValidationError> validate_iv_query(const IVQuery& query) {
    // Validate base option spec first (using slicing)
    auto spec_validation = validate_option_spec(static_cast<const OptionSpec&>(query));
    if (!spec_validation) {
        return spec_validation;
    }

    // Volatility has no effect on an expired contract
    if (query.maturity <= 0.0) {
        return reject(ValidationErrorCode::InvalidMaturity, query.maturity);
    }

    // Validate market price: must be finite and positive
    if (!std::isfinite(query.market_price) || query.market_price <= 0.0) {
        return reject(ValidationErrorCode::InvalidMarketPrice, query.market_price);
    }

    // Check for arbitrage violations
    const auto bounds = european_price_bounds(query);
    const double slack = kArbitrageSlack * std::max(1.0, bounds.upper);
    if (query.market_price < bounds.lower - slack ||
        query.market_price > bounds.upper + slack) {
        return reject(ValidationErrorCode::ArbitrageViolation, query.market_price);
    }

    return {};
}

std::expected<void, ValidationError> validate_pricing_params(const PricingParams& params) {
    // Validate base option spec first (using slicing)
    auto spec_validation = validate_option_spec(static_cast<const OptionSpec&>(params));
    if (!spec_validation) {
        return spec_validation;
    }

    // Zero volatility is valid (deterministic forward payoff)
    if (params.volatility < 0.0 || !std::isfinite(params.volatility)) {
        return reject(ValidationErrorCode::InvalidVolatility, params.volatility);
    }

    return {};
}

} // namespace volscan
