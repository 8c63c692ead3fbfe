// SPDX-License-Identifier: MIT
#include "volscan/option/implied_volatility.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include "volscan/support/parallel.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace volscan {

std::expected<void, ConfigurationError> validate_iv_solver_config(const IVSolverConfig& config) {
    if (!(config.vol_min > 0.0) || !(config.vol_max > config.vol_min) ||
        !std::isfinite(config.vol_max)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidSolverBounds, config.vol_min, config.vol_max));
    }
    if (!(config.root_config.tolerance > 0.0)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidTolerance, config.root_config.tolerance));
    }
    if (config.root_config.max_iter == 0) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidIterationCap, 0.0));
    }
    return {};
}

ImpliedVolatilitySolver::ImpliedVolatilitySolver(const IVSolverConfig& config)
    : config_(config) {}

std::expected<ImpliedVolatilitySolver, ConfigurationError>
ImpliedVolatilitySolver::create(const IVSolverConfig& config) {
    auto validation = validate_iv_solver_config(config);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return ImpliedVolatilitySolver(config);
}

double ImpliedVolatilitySolver::initial_guess(const IVQuery& query) const {
    // Brenner-Subrahmanyam: ATM call ≈ 0.4·S·σ·√T
    double seed = std::sqrt(2.0 * std::numbers::pi / query.maturity) *
                  query.market_price / query.spot;
    if (!std::isfinite(seed)) {
        seed = config_.fallback_seed;
    }
    return std::clamp(seed, config_.vol_min, config_.vol_max);
}

std::expected<std::monostate, ValidationError>
ImpliedVolatilitySolver::validate_query(const IVQuery& query) const {
    auto validation = validate_iv_query(query);
    if (!validation) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_IMPLIED_VOL,
            static_cast<int>(validation.error().code), validation.error().value, 0.0);
        return std::unexpected(validation.error());
    }
    return std::monostate{};
}

std::expected<IVResult, ValidationError>
ImpliedVolatilitySolver::solve_hybrid(const IVQuery& query) const {
    VOLSCAN_TRACE_IV_START(query.spot, query.strike, query.maturity, query.market_price);

    auto objective = [&query](double vol) {
        return bs_price(query.spot, query.strike, query.maturity, vol,
                        query.rate, query.dividend_yield, query.type) - query.market_price;
    };
    auto derivative = [&query](double vol) {
        return bs_vega(query.spot, query.strike, query.maturity, vol,
                       query.rate, query.dividend_yield);
    };

    const auto& root_config = config_.root_config;
    auto newton = newton_find_root(objective, derivative, initial_guess(query),
                                   config_.vol_min, config_.vol_max, root_config);

    if (newton.converged) {
        VOLSCAN_TRACE_IV_COMPLETE(*newton.root, newton.iterations, 1);
        return IVResult{
            .implied_vol = *newton.root,
            .converged = true,
            .iterations = newton.iterations,
            .final_error = newton.final_error,
            .method = IVMethod::Newton
        };
    }

    IVResult best{
        .implied_vol = newton.root.value_or(config_.fallback_seed),
        .converged = false,
        .iterations = newton.iterations,
        .final_error = newton.final_error,
        .method = IVMethod::Newton
    };

    [[maybe_unused]] double last_vega = newton.root ? derivative(*newton.root) : 0.0;
    VOLSCAN_TRACE_IV_FALLBACK(newton.iterations, best.implied_vol, last_vega);

    if (newton.iterations >= root_config.max_iter) {
        VOLSCAN_TRACE_IV_COMPLETE(best.implied_vol, best.iterations, 0);
        return best;
    }

    RootFindingConfig bisect_config = root_config;
    bisect_config.max_iter = root_config.max_iter - newton.iterations;
    auto bisect = bisect_find_root(objective, config_.vol_min, config_.vol_max, bisect_config);

    best.iterations += bisect.iterations;
    if (bisect.root && (bisect.converged || !std::isfinite(best.final_error) ||
                        bisect.final_error < best.final_error)) {
        best.implied_vol = *bisect.root;
        best.final_error = bisect.final_error;
        best.converged = bisect.converged;
        best.method = IVMethod::Bisection;
    }

    VOLSCAN_TRACE_IV_COMPLETE(best.implied_vol, best.iterations, best.converged ? 1 : 0);
    if (!best.converged) {
        VOLSCAN_TRACE_CONVERGENCE_FAILED(MODULE_IMPLIED_VOL, best.iterations, best.final_error);
    }
    return best;
}

std::expected<IVResult, ValidationError>
ImpliedVolatilitySolver::solve(const IVQuery& query) const {
    // C++23 monadic validation pipeline: validate → solve
    return validate_query(query)
        .and_then([this, &query](auto) { return solve_hybrid(query); });
}

std::expected<IVResult, ValidationError>
ImpliedVolatilitySolver::solve(const Contract& contract, double market_price, double spot,
                               double rate, double dividend_yield,
                               const Timestamp& asof) const {
    return contract.time_to_expiry(asof)
        .and_then([&](const TimeToExpiry& tte) {
            OptionSpec spec{
                .spot = spot,
                .strike = contract.strike(),
                .maturity = tte.years,
                .rate = rate,
                .dividend_yield = dividend_yield,
                .type = contract.type()
            };
            return solve(IVQuery(spec, market_price));
        });
}

BatchIVResult ImpliedVolatilitySolver::solve_batch(const std::vector<IVQuery>& queries) const {
    const size_t n = queries.size();
    std::vector<std::expected<IVResult, ValidationError>> results(
        n, std::unexpected(ValidationError(ValidationErrorCode::InvalidMarketPrice)));
    size_t failed_count = 0;
    size_t unconverged_count = 0;

    VOLSCAN_TRACE_ALGO_START(MODULE_IMPLIED_VOL, n, config_.root_config.tolerance,
                             config_.root_config.max_iter);

    VOLSCAN_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < n; ++i) {
        results[i] = solve(queries[i]);
        if (!results[i].has_value()) {
            VOLSCAN_PRAGMA_ATOMIC
            ++failed_count;
        } else if (!results[i]->converged) {
            VOLSCAN_PRAGMA_ATOMIC
            ++unconverged_count;
        }
    }

    VOLSCAN_TRACE_ALGO_COMPLETE(MODULE_IMPLIED_VOL, n, failed_count + unconverged_count);

    return BatchIVResult{
        .results = std::move(results),
        .failed_count = failed_count,
        .unconverged_count = unconverged_count
    };
}

}  // namespace volscan
