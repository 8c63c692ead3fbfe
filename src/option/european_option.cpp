// SPDX-License-Identifier: MIT
#include "volscan/option/european_option.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>

namespace volscan {

namespace {

constexpr double kDaysPerYear = 365.0;
constexpr double kPerPoint = 0.01;

}  // namespace

// ===========================================================================
// EuropeanOptionResult
// ===========================================================================

EuropeanOptionResult::EuropeanOptionResult(const PricingParams& params)
    : params_(params)
{}

bool EuropeanOptionResult::degenerate() const {
    return params_.maturity <= 0.0 || params_.volatility <= 0.0;
}

std::pair<double, double> EuropeanOptionResult::compute_d1_d2(double S) const {
    double tau = params_.maturity;
    double sigma = params_.volatility;
    double d1 = bs_d1(S, params_.strike, tau, sigma, params_.rate, params_.dividend_yield);
    double d2 = d1 - sigma * std::sqrt(tau);
    return {d1, d2};
}

double EuropeanOptionResult::compute_price(double S) const {
    return bs_price(S, params_.strike, params_.maturity, params_.volatility,
                    params_.rate, params_.dividend_yield, params_.type);
}

double EuropeanOptionResult::value() const {
    return compute_price(params_.spot);
}

double EuropeanOptionResult::value_at(double S) const {
    return compute_price(S);
}

double EuropeanOptionResult::delta() const {
    double tau = params_.maturity;
    double S = params_.spot;
    double K = params_.strike;
    double q = params_.dividend_yield;

    if (tau <= 0.0) {
        // At expiry: step function of moneyness
        if (!is_in_the_money(S, K, params_.type)) {
            return 0.0;
        }
        return params_.type == OptionType::CALL ? 1.0 : -1.0;
    }

    double exp_qt = std::exp(-q * tau);

    if (params_.volatility <= 0.0) {
        // Deterministic forward: ITM when discounted spot beats discounted strike
        double S_fwd = S * exp_qt;
        double K_disc = K * std::exp(-params_.rate * tau);
        if (!is_in_the_money(S_fwd, K_disc, params_.type)) {
            return 0.0;
        }
        return params_.type == OptionType::CALL ? exp_qt : -exp_qt;
    }

    auto [d1, d2] = compute_d1_d2(S);
    double call_delta = exp_qt * norm_cdf(d1);
    return params_.type == OptionType::CALL ? call_delta : call_delta - exp_qt;
}

double EuropeanOptionResult::gamma() const {
    if (degenerate()) {
        return 0.0;
    }

    double tau = params_.maturity;
    double sigma = params_.volatility;
    double S = params_.spot;

    auto [d1, d2] = compute_d1_d2(S);
    double exp_qt = std::exp(-params_.dividend_yield * tau);
    return exp_qt * norm_pdf(d1) / (S * sigma * std::sqrt(tau));
}

double EuropeanOptionResult::vega() const {
    return bs_vega(params_.spot, params_.strike, params_.maturity,
                   params_.volatility, params_.rate, params_.dividend_yield);
}

double EuropeanOptionResult::theta() const {
    // Long options never report positive decay
    return std::min(carry_theta(), 0.0);
}

double EuropeanOptionResult::carry_theta() const {
    double tau = params_.maturity;
    double sigma = params_.volatility;
    double S = params_.spot;
    double K = params_.strike;
    double r = params_.rate;
    double q = params_.dividend_yield;

    if (tau <= 0.0) {
        return 0.0;
    }

    double exp_qt = std::exp(-q * tau);
    double exp_rt = std::exp(-r * tau);
    double theta = 0.0;

    if (sigma <= 0.0) {
        // Deterministic carry of the discounted forward payoff
        double S_fwd = S * exp_qt;
        double K_disc = K * exp_rt;
        if (is_in_the_money(S_fwd, K_disc, params_.type)) {
            theta = (params_.type == OptionType::CALL)
                ? q * S_fwd - r * K_disc
                : r * K_disc - q * S_fwd;
        }
    } else {
        auto [d1, d2] = compute_d1_d2(S);
        double sqrt_tau = std::sqrt(tau);

        // Common term: -S·e^(-qτ)·φ(d1)·σ/(2√τ)
        double common = -S * exp_qt * norm_pdf(d1) * sigma / (2.0 * sqrt_tau);

        if (params_.type == OptionType::PUT) {
            theta = common + r * K * exp_rt * norm_cdf(-d2) - q * S * exp_qt * norm_cdf(-d1);
        } else {
            theta = common - r * K * exp_rt * norm_cdf(d2) + q * S * exp_qt * norm_cdf(d1);
        }
    }

    return theta;
}

double EuropeanOptionResult::rho() const {
    double tau = params_.maturity;
    double K = params_.strike;
    double r = params_.rate;

    if (tau <= 0.0) {
        return 0.0;
    }

    double exp_rt = std::exp(-r * tau);

    if (params_.volatility <= 0.0) {
        double S_fwd = params_.spot * std::exp(-params_.dividend_yield * tau);
        double K_disc = K * exp_rt;
        if (!is_in_the_money(S_fwd, K_disc, params_.type)) {
            return 0.0;
        }
        return params_.type == OptionType::CALL ? K * tau * exp_rt : -K * tau * exp_rt;
    }

    auto [d1, d2] = compute_d1_d2(params_.spot);

    if (params_.type == OptionType::PUT) {
        return -K * tau * exp_rt * norm_cdf(-d2);
    } else {
        return K * tau * exp_rt * norm_cdf(d2);
    }
}

PricedOption EuropeanOptionResult::priced() const {
    PricedOption out{
        .price = value(),
        .greeks = Greeks{
            .delta = delta(),
            .gamma = gamma(),
            .theta = theta() / kDaysPerYear,
            .vega = vega() * kPerPoint,
            .rho = rho() * kPerPoint
        },
        .carry_theta = carry_theta() / kDaysPerYear,
        .d1 = std::nullopt,
        .d2 = std::nullopt
    };
    if (!degenerate()) {
        auto [d1, d2] = compute_d1_d2(params_.spot);
        out.d1 = d1;
        out.d2 = d2;
    }
    return out;
}

// ===========================================================================
// EuropeanOptionSolver
// ===========================================================================

EuropeanOptionSolver::EuropeanOptionSolver(const PricingParams& params)
    : params_(params)
{}

EuropeanOptionSolver::EuropeanOptionSolver(const OptionSpec& spec, double sigma)
    : params_(spec, sigma)
{}

std::expected<EuropeanOptionSolver, ValidationError>
EuropeanOptionSolver::create(const PricingParams& params) noexcept {
    auto validation = validate_pricing_params(params);
    if (!validation.has_value()) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_PRICING, static_cast<int>(validation.error().code),
                                       validation.error().value, params.volatility);
        return std::unexpected(validation.error());
    }
    return EuropeanOptionSolver(params);
}

EuropeanOptionResult EuropeanOptionSolver::solve() const {
    return EuropeanOptionResult(params_);
}

// ===========================================================================
// Free functions
// ===========================================================================

std::expected<PricedOption, ValidationError> price(const PricingParams& params) {
    return EuropeanOptionSolver::create(params)
        .transform([](const EuropeanOptionSolver& solver) {
            return solver.solve().priced();
        });
}

std::expected<PricedOption, ValidationError>
price(const Contract& contract, double spot, double rate, double dividend_yield,
      double volatility, const Timestamp& asof, OptionType option_type,
      ExpiryPolicy policy) {
    return contract.time_to_expiry(asof, policy)
        .and_then([&](const TimeToExpiry& tte) {
            return price(PricingParams(spot, contract.strike(), tte.years, rate,
                                       dividend_yield, option_type, volatility));
        });
}

}  // namespace volscan
