// SPDX-License-Identifier: MIT
/**
 * @file implied_volatility.hpp
 * @brief Black-Scholes implied volatility solver with std::expected error handling
 *
 * Inverts the closed-form European price: finds σ such that
 * bs_price(σ) matches an observed market price.
 *
 * Algorithm:
 * 1. Seed with the Brenner-Subrahmanyam ATM approximation
 *    σ0 = √(2π/T) · price / S, clamped into [vol_min, vol_max]
 * 2. Bounded Newton-Raphson on vega with a clamped step
 * 3. Bisection over [vol_min, vol_max] with the remaining iteration budget
 *    when Newton hits a flat vega, diverges or leaves the range
 *
 * Error Handling:
 * - Invalid inputs (spot, strike, maturity, price, arbitrage bounds) are
 *   ValidationErrors, raised before any iteration
 * - Non-convergence returns IVResult{converged = false} with the best estimate
 *
 * Example:
 * @code
 * IVQuery query(100.0, 100.0, 0.25, 0.05, 0.0, OptionType::CALL, 4.61);
 * auto solver = ImpliedVolatilitySolver::create().value();
 * auto result = solver.solve(query);
 *
 * if (result.has_value() && result->converged) {
 *     std::cout << "IV: " << result->implied_vol << "\n";
 * }
 * @endcode
 */

#pragma once

#include "volscan/option/option_spec.hpp"
#include "volscan/option/iv_result.hpp"
#include "volscan/option/contract.hpp"
#include "volscan/math/root_finding.hpp"
#include "volscan/support/error_types.hpp"
#include <expected>
#include <variant>
#include <vector>

namespace volscan {

/// Configuration for the implied volatility solver
struct IVSolverConfig {
    /// Shared iteration budget and price tolerance for Newton + bisection
    RootFindingConfig root_config{
        .max_iter = 100,
        .tolerance = 1e-4,
        .max_step = 0.5,
        .min_derivative = 1e-8,
        .max_divergent_steps = 3,
        .bracket_tolerance = 1e-12
    };

    double vol_min = 1e-4;       ///< Lower end of the volatility search range
    double vol_max = 5.0;        ///< Upper end of the volatility search range
    double fallback_seed = 0.3;  ///< Seed when the ATM approximation is not finite
};

/// Validate solver configuration
std::expected<void, ConfigurationError> validate_iv_solver_config(const IVSolverConfig& config);

/// Implied volatility solver for European options
///
/// **Thread Safety:** stateless after construction; solve() and
/// solve_batch() may be called concurrently.
///
/// **USDT Tracing:**
/// Emits MODULE_IMPLIED_VOL traces for monitoring:
/// - iv_start / iv_complete: per query
/// - iv_fallback: Newton abandoned in favour of bisection
/// - validation_error: input validation failures
class ImpliedVolatilitySolver {
public:
    /// Factory with configuration validation
    static std::expected<ImpliedVolatilitySolver, ConfigurationError>
    create(const IVSolverConfig& config = {});

    /// Solve for implied volatility (single query)
    ///
    /// @param query Option specification and market price
    /// @return IVResult (possibly not converged) or ValidationError
    std::expected<IVResult, ValidationError> solve(const IVQuery& query) const;

    /// Solve for a listed contract as of `asof`
    ///
    /// @return IVResult, or ValidationError for bad inputs, an expiration
    ///         before `asof` or a zero time to expiry
    std::expected<IVResult, ValidationError>
    solve(const Contract& contract, double market_price, double spot,
          double rate, double dividend_yield, const Timestamp& asof) const;

    /// Solve for implied volatility (batch with OpenMP)
    ///
    /// Each query is solved independently; results keep input order.
    ///
    /// @param queries Input queries
    /// @return BatchIVResult with individual results and failure counts
    BatchIVResult solve_batch(const std::vector<IVQuery>& queries) const;

    const IVSolverConfig& config() const { return config_; }

private:
    explicit ImpliedVolatilitySolver(const IVSolverConfig& config);

    /// Brenner-Subrahmanyam seed, clamped into the search range
    double initial_guess(const IVQuery& query) const;

    /// Spec, market price and no-arbitrage checks, traced on failure
    std::expected<std::monostate, ValidationError> validate_query(const IVQuery& query) const;

    /// Newton, then bisection on the remaining budget
    std::expected<IVResult, ValidationError> solve_hybrid(const IVQuery& query) const;

    IVSolverConfig config_;
};

}  // namespace volscan
