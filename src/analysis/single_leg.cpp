// SPDX-License-Identifier: MIT
#include "volscan/analysis/single_leg.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>

namespace volscan {

namespace {

// Two grid samples closer than this are the same point
constexpr double kGridEpsilon = 1e-9;

struct ResolvedVolatility {
    double value;
    VolatilitySource source;
};

std::expected<double, ErrorVariant>
resolve_premium(const Contract& contract, const LegOverrides& overrides) {
    if (overrides.premium) {
        double premium = *overrides.premium;
        if (premium < 0.0 || !std::isfinite(premium)) {
            VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_SINGLE_LEG,
                static_cast<int>(ValidationErrorCode::InvalidPremium), premium, 0.0);
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidPremium, premium));
        }
        return premium;
    }
    if (auto premium = contract.quote().premium()) {
        return *premium;
    }
    return std::unexpected(DataQualityError{
        .code = DataQualityErrorCode::MissingPremium, .value = contract.strike()});
}

std::expected<ResolvedVolatility, ErrorVariant>
resolve_volatility(const OptionSpec& spec, double premium, const Contract& contract,
                   const LegOverrides& overrides, const AnalysisConfig& config) {
    if (overrides.volatility) {
        double vol = *overrides.volatility;
        if (vol < 0.0 || !std::isfinite(vol)) {
            VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_SINGLE_LEG,
                static_cast<int>(ValidationErrorCode::InvalidVolatility), vol, 0.0);
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, vol));
        }
        return ResolvedVolatility{vol, VolatilitySource::Explicit};
    }

    if (spec.maturity <= 0.0) {
        return ResolvedVolatility{0.0, VolatilitySource::NotRequired};
    }

    const auto& quoted = contract.quote().implied_vol;
    if (quoted && *quoted > 0.0 && std::isfinite(*quoted)) {
        return ResolvedVolatility{*quoted, VolatilitySource::Quote};
    }

    auto solver = ImpliedVolatilitySolver::create(config.iv_config);
    if (!solver) {
        return std::unexpected(solver.error());
    }
    auto iv = solver->solve(IVQuery(spec, premium));
    if (!iv) {
        return std::unexpected(DataQualityError{
            .code = DataQualityErrorCode::MissingVolatility, .value = premium});
    }
    if (!iv->converged) {
        return std::unexpected(DataQualityError{
            .code = DataQualityErrorCode::ImpliedVolNotConverged, .value = iv->implied_vol});
    }
    return ResolvedVolatility{iv->implied_vol, VolatilitySource::Implied};
}

}  // namespace

std::expected<void, ConfigurationError> validate_analysis_config(const AnalysisConfig& config) {
    if (!(config.contract_multiplier > 0.0) || !std::isfinite(config.contract_multiplier)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidContractMultiplier, config.contract_multiplier));
    }
    if (config.payoff_points < 2) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidPayoffGrid, static_cast<double>(config.payoff_points), 2.0));
    }
    if (!(config.payoff_stddevs > 0.0)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidPayoffGrid, config.payoff_stddevs));
    }
    if (!(config.payoff_fallback_range > 0.0) || config.payoff_fallback_range > 1.0) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidPayoffGrid, config.payoff_fallback_range, 1.0));
    }
    return validate_iv_solver_config(config.iv_config);
}

double leg_pnl_at_expiry(OptionType type, Direction direction, double strike,
                         double premium, double spot_at_expiry) {
    return direction_sign(direction) * (intrinsic_value(spot_at_expiry, strike, type) - premium);
}

double probability_of_profit(ProfitSide side, double breakeven, double spot, double tau,
                             double volatility, double rate, double dividend_yield) {
    double above = prob_finish_above(spot, breakeven, tau, volatility, rate, dividend_yield);
    double p = (side == ProfitSide::AboveBreakeven) ? above : 1.0 - above;
    return std::clamp(p * 100.0, 0.0, 100.0);
}

std::vector<double> payoff_spot_grid(double spot, double sigma_sqrt_tau,
                                     const std::vector<double>& anchors,
                                     const AnalysisConfig& config) {
    double half_width = sigma_sqrt_tau > 0.0
        ? config.payoff_stddevs * sigma_sqrt_tau
        : config.payoff_fallback_range;

    double lo = std::max(spot * (1.0 - half_width), 0.0);
    double hi = spot * (1.0 + half_width);
    for (double a : anchors) {
        if (a > 0.0) {
            lo = std::min(lo, a);
            hi = std::max(hi, a);
        }
    }

    const size_t n = config.payoff_points;
    std::vector<double> grid;
    grid.reserve(n + anchors.size());
    for (size_t i = 0; i < n; ++i) {
        grid.push_back(lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1));
    }
    for (double a : anchors) {
        if (a > 0.0) {
            grid.push_back(a);
        }
    }

    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end(),
                           [](double x, double y) { return std::abs(x - y) < kGridEpsilon; }),
               grid.end());
    return grid;
}

std::expected<SingleLegAnalysis, ErrorVariant>
analyze_single_leg(const Contract& contract, Direction direction, int quantity,
                   const MarketInputs& market, const Timestamp& asof,
                   const LegOverrides& overrides, const AnalysisConfig& config) {
    if (auto cfg = validate_analysis_config(config); !cfg) {
        return std::unexpected(cfg.error());
    }
    if (quantity <= 0) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_SINGLE_LEG,
            static_cast<int>(ValidationErrorCode::InvalidQuantity), quantity, 0.0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidQuantity, quantity));
    }

    auto tte = contract.time_to_expiry(asof, config.expiry_policy);
    if (!tte) {
        return std::unexpected(tte.error());
    }

    OptionSpec spec{
        .spot = market.spot,
        .strike = contract.strike(),
        .maturity = tte->years,
        .rate = market.rate,
        .dividend_yield = market.dividend_yield,
        .type = contract.type()
    };
    if (auto valid = validate_option_spec(spec); !valid) {
        return std::unexpected(valid.error());
    }

    auto premium = resolve_premium(contract, overrides);
    if (!premium) {
        return std::unexpected(premium.error());
    }

    auto vol = resolve_volatility(spec, *premium, contract, overrides, config);
    if (!vol) {
        return std::unexpected(vol.error());
    }

    auto priced = price(PricingParams(spec, vol->value));
    if (!priced) {
        return std::unexpected(priced.error());
    }

    const double K = contract.strike();
    const double S = market.spot;
    const double prem = *premium;
    const double sign = direction_sign(direction);
    const double units = static_cast<double>(quantity) * config.contract_multiplier;
    const bool is_call = contract.type() == OptionType::CALL;
    const bool is_long = direction == Direction::Long;

    // Short positions carry the unfloored theta
    Greeks held = priced->greeks;
    if (!is_long) {
        held.theta = priced->carry_theta;
    }

    SingleLegAnalysis out{
        .contract = contract,
        .direction = direction,
        .quantity = quantity,
        .contract_multiplier = config.contract_multiplier,
        .spot = S,
        .maturity = tte->years,
        .days_to_expiry = tte->days_to_expiry,
        .volatility = vol->value,
        .volatility_source = vol->source,
        .theoretical_price = priced->price,
        .premium = prem,
        .intrinsic_value = intrinsic_value(S, K, contract.type()),
        .extrinsic_value = 0.0,
        .cost_basis = -sign * prem * units,
        .greeks = priced->greeks,
        .position_greeks = held.scaled(sign * quantity),
        .daily_theta_pnl = held.theta * sign * units,
        .breakeven = is_call ? K + prem : K - prem,
        .max_profit = std::nullopt,
        .max_loss = std::nullopt,
        .max_profit_position = std::nullopt,
        .max_loss_position = std::nullopt,
        .risk_reward = std::nullopt,
        .probability_of_profit = 0.0,
        .payoff_curve = {}
    };
    out.extrinsic_value = std::max(prem - out.intrinsic_value, 0.0);

    // Puts are bounded below by a worthless underlying
    const double put_floor_value = std::max(K - prem, 0.0);
    if (is_call) {
        if (is_long) {
            out.max_loss = prem;
        } else {
            out.max_profit = prem;
        }
    } else {
        out.max_profit = is_long ? put_floor_value : prem;
        out.max_loss = is_long ? prem : put_floor_value;
    }

    if (out.max_profit) out.max_profit_position = *out.max_profit * units;
    if (out.max_loss) out.max_loss_position = *out.max_loss * units;
    if (out.max_profit && out.max_loss && *out.max_loss > 0.0) {
        out.risk_reward = *out.max_profit / *out.max_loss;
    }

    const ProfitSide side = (is_call == is_long) ? ProfitSide::AboveBreakeven
                                                  : ProfitSide::BelowBreakeven;
    out.probability_of_profit = probability_of_profit(
        side, out.breakeven, S, tte->years, vol->value, market.rate, market.dividend_yield);

    const double sigma_sqrt_tau = vol->value * std::sqrt(tte->years);
    for (double s : payoff_spot_grid(S, sigma_sqrt_tau, {K, out.breakeven}, config)) {
        out.payoff_curve.push_back(PayoffPoint{
            .spot = s,
            .pnl = leg_pnl_at_expiry(contract.type(), direction, K, prem, s) * units
        });
    }

    return out;
}

}  // namespace volscan
