// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes-Merton formulas
 *
 * Provides EuropeanOptionResult (raw analytic sensitivities),
 * EuropeanOptionSolver (validated construction) and PricedOption, the
 * price + Greeks record in trading-desk units returned by price().
 */

#pragma once

#include "volscan/option/option_spec.hpp"
#include "volscan/option/contract.hpp"
#include "volscan/option/greeks.hpp"
#include <expected>
#include <optional>
#include <utility>

namespace volscan {

/// Price and Greeks of one contract, Greeks in trading-desk units
struct PricedOption {
    double price = 0.0;
    Greeks greeks;
    double carry_theta = 0.0;  ///< Unfloored theta per day; positive when carry outweighs decay
    std::optional<double> d1;  ///< nullopt when σ√T = 0 (no diffusion term)
    std::optional<double> d2;
};

/**
 * @brief European option pricing result with closed-form Greeks
 *
 * Stores all pricing parameters and computes price and sensitivities
 * analytically. Sensitivities are raw derivatives (per unit of spot, vol,
 * rate, year); priced() converts them to desk units.
 *
 * Degenerate inputs:
 * - T = 0: intrinsic value, delta = ±1 when in the money, other Greeks 0
 * - σ = 0, T > 0: discounted forward intrinsic, delta = ±e^(-qT) when the
 *   forward is in the money, gamma = vega = 0, theta and rho from carry
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class EuropeanOptionResult {
public:
    explicit EuropeanOptionResult(const PricingParams& params);

    /// Option value at current spot
    double value() const;

    /// Option value at arbitrary spot price
    double value_at(double S) const;

    /// Delta: dV/dS
    double delta() const;

    /// Gamma: d²V/dS²
    double gamma() const;

    /// Vega: dV/dσ (per unit volatility)
    double vega() const;

    /// Theta of a long holding: carry_theta() floored at zero from above
    double theta() const;

    /// Unfloored dV/dt per year (calendar time)
    ///
    /// Positive for deep in-the-money puts, and calls with q > r, where
    /// carry outweighs time decay. Short positions report this value.
    double carry_theta() const;

    /// Rho: dV/dr (per unit rate)
    double rho() const;

    /// Price + Greeks in desk units (theta per day, vega/rho per point)
    PricedOption priced() const;

    // Parameter accessors
    double spot() const { return params_.spot; }
    double strike() const { return params_.strike; }
    double maturity() const { return params_.maturity; }
    double volatility() const { return params_.volatility; }
    OptionType option_type() const { return params_.type; }

private:
    /// True when σ√T = 0 and the closed form degenerates
    bool degenerate() const;

    /// Compute d1, d2 for given spot price
    std::pair<double, double> compute_d1_d2(double S) const;

    /// Compute price for given spot (used by value() and value_at())
    double compute_price(double S) const;

    PricingParams params_;
};

/**
 * @brief European option solver using closed-form Black-Scholes
 *
 * Lightweight solver that delegates to analytical formulas.
 */
class EuropeanOptionSolver {
public:
    /// Construct solver from pricing parameters (no validation)
    explicit EuropeanOptionSolver(const PricingParams& params);

    /// Construct from option spec + volatility (convenience)
    EuropeanOptionSolver(const OptionSpec& spec, double sigma);

    /// Factory with validation via validate_pricing_params()
    static std::expected<EuropeanOptionSolver, ValidationError>
    create(const PricingParams& params) noexcept;

    /// Compute European option price and Greeks (always succeeds)
    EuropeanOptionResult solve() const;

private:
    PricingParams params_;
};

/// Price validated parameters in one call
std::expected<PricedOption, ValidationError> price(const PricingParams& params);

/// Price a listed contract as of `asof`
///
/// Maturity is (expiration - asof) / 365 days. `option_type` selects the
/// payoff priced on the contract's strike and expiry; pass contract.type()
/// to price the contract itself.
///
/// @return PricedOption, or ValidationError for bad inputs or an expiration
///         before `asof` under ExpiryPolicy::Reject
std::expected<PricedOption, ValidationError>
price(const Contract& contract, double spot, double rate, double dividend_yield,
      double volatility, const Timestamp& asof, OptionType option_type,
      ExpiryPolicy policy = ExpiryPolicy::Reject);

}  // namespace volscan
