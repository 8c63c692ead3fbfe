// SPDX-License-Identifier: MIT
#include "volscan/strategy/strategy_composer.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>

namespace volscan {

namespace {

std::expected<void, ValidationError>
reject(ValidationErrorCode code, double value, size_t index = 0) {
    VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_STRATEGY, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

/// Shape every vertical shares: option type, and which leg sits at the higher strike
struct VerticalShape {
    OptionType type;
    bool long_leg_higher;  ///< true when the long leg carries the higher strike
};

VerticalShape vertical_shape(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::BullCallSpread: return {OptionType::CALL, false};
        case StrategyKind::BearPutSpread:  return {OptionType::PUT, true};
        case StrategyKind::BullPutSpread:  return {OptionType::PUT, false};
        case StrategyKind::BearCallSpread: return {OptionType::CALL, true};
        case StrategyKind::CoveredCall:    break;
    }
    return {OptionType::CALL, false};
}

std::expected<void, ValidationError> validate_vertical(const MultiLegStrategy& strategy) {
    const auto& legs = strategy.legs;
    if (legs.size() != 2) {
        return reject(ValidationErrorCode::InvalidLegStructure, static_cast<double>(legs.size()));
    }

    const auto shape = vertical_shape(strategy.kind);
    for (size_t i = 0; i < legs.size(); ++i) {
        if (legs[i].contract.type() != shape.type) {
            return reject(ValidationErrorCode::InvalidLegStructure, legs[i].contract.strike(), i);
        }
    }
    if (legs[0].direction == legs[1].direction) {
        return reject(ValidationErrorCode::InvalidLegStructure, legs[1].contract.strike(), 1);
    }
    if (legs[0].quantity != legs[1].quantity) {
        return reject(ValidationErrorCode::InvalidQuantity, legs[1].quantity, 1);
    }

    const size_t long_idx = legs[0].direction == Direction::Long ? 0 : 1;
    const size_t short_idx = 1 - long_idx;
    const double long_strike = legs[long_idx].contract.strike();
    const double short_strike = legs[short_idx].contract.strike();
    const bool ordered = shape.long_leg_higher ? long_strike > short_strike
                                               : long_strike < short_strike;
    if (!ordered) {
        return reject(ValidationErrorCode::InvalidLegStructure, short_strike, short_idx);
    }
    return {};
}

std::expected<void, ValidationError>
validate_covered_call(const MultiLegStrategy& strategy, double contract_multiplier) {
    const auto& legs = strategy.legs;
    if (legs.size() != 1) {
        return reject(ValidationErrorCode::InvalidLegStructure, static_cast<double>(legs.size()));
    }
    const auto& call = legs[0];
    if (call.contract.type() != OptionType::CALL || call.direction != Direction::Short) {
        return reject(ValidationErrorCode::InvalidLegStructure, call.contract.strike(), 0);
    }
    const double needed = call.quantity * contract_multiplier;
    if (strategy.shares_held < needed) {
        return reject(ValidationErrorCode::InsufficientShares, strategy.shares_held);
    }
    return {};
}

}  // namespace

std::string_view strategy_kind_name(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::CoveredCall:    return "covered_call";
        case StrategyKind::BullCallSpread: return "bull_call_spread";
        case StrategyKind::BearPutSpread:  return "bear_put_spread";
        case StrategyKind::BullPutSpread:  return "bull_put_spread";
        case StrategyKind::BearCallSpread: return "bear_call_spread";
    }
    return "unknown";
}

std::expected<void, ValidationError>
validate_strategy(const MultiLegStrategy& strategy, double contract_multiplier) {
    const auto& legs = strategy.legs;
    if (legs.empty()) {
        return reject(ValidationErrorCode::EmptyStrategy, 0.0);
    }

    const Contract& first = legs.front().contract;
    for (size_t i = 0; i < legs.size(); ++i) {
        const Contract& c = legs[i].contract;
        if (legs[i].quantity <= 0) {
            return reject(ValidationErrorCode::InvalidQuantity, legs[i].quantity, i);
        }
        if (c.underlying() != first.underlying()) {
            return reject(ValidationErrorCode::MismatchedUnderlying, c.strike(), i);
        }
        if (c.expiration_time() != first.expiration_time()) {
            return reject(ValidationErrorCode::MismatchedExpiration, c.strike(), i);
        }
    }

    if (strategy.kind == StrategyKind::CoveredCall) {
        return validate_covered_call(strategy, contract_multiplier);
    }
    return validate_vertical(strategy);
}

std::expected<StrategyResult, ErrorVariant>
compose_strategy(const MultiLegStrategy& strategy, const MarketInputs& market,
                 const Timestamp& asof, const AnalysisConfig& config) {
    if (auto cfg = validate_analysis_config(config); !cfg) {
        return std::unexpected(cfg.error());
    }
    if (auto valid = validate_strategy(strategy, config.contract_multiplier); !valid) {
        return std::unexpected(valid.error());
    }

    VOLSCAN_TRACE_ALGO_START(MODULE_STRATEGY, static_cast<int>(strategy.kind),
                             strategy.legs.size(), market.spot);

    StrategyResult result{
        .kind = strategy.kind,
        .legs = {},
        .net_premium = 0.0,
        .net_premium_position = 0.0,
        .net_greeks = {},
        .breakevens = {},
        .max_profit = std::nullopt,
        .max_loss = std::nullopt,
        .max_profit_position = std::nullopt,
        .max_loss_position = std::nullopt,
        .risk_reward = std::nullopt,
        .max_return_pct = std::nullopt,
        .probability_of_profit = 0.0,
        .spread_width = std::nullopt,
        .covered_call = std::nullopt,
        .days_to_expiry = 0,
        .payoff_curve = {}
    };
    result.legs.reserve(strategy.legs.size());

    for (const auto& leg : strategy.legs) {
        auto analysis = analyze_single_leg(
            leg.contract, leg.direction, leg.quantity, market, asof,
            LegOverrides{.premium = leg.premium, .volatility = leg.volatility}, config);
        if (!analysis) {
            return std::unexpected(analysis.error());
        }
        result.legs.push_back(std::move(*analysis));
    }

    const double mult = config.contract_multiplier;
    const double units = static_cast<double>(strategy.legs.front().quantity);
    const double S = market.spot;

    double vol_sum = 0.0;
    for (const auto& leg : result.legs) {
        const double signed_qty = direction_sign(leg.direction) * leg.quantity;
        result.net_premium_position += signed_qty * leg.premium * mult;
        result.net_greeks += leg.position_greeks;
        vol_sum += leg.volatility;
    }
    result.net_premium = result.net_premium_position / (units * mult);

    const double tau = result.legs.front().maturity;
    const double vol = vol_sum / static_cast<double>(result.legs.size());
    result.days_to_expiry = result.legs.front().days_to_expiry;

    ProfitSide side = ProfitSide::AboveBreakeven;
    double covered_shares = 0.0;
    double breakeven = 0.0;

    if (strategy.kind == StrategyKind::CoveredCall) {
        const auto& call = result.legs.front();
        const double K = call.contract.strike();
        const double credit = call.premium;
        covered_shares = call.quantity * mult;

        result.net_greeks.delta += static_cast<double>(strategy.shares_held) / mult;

        breakeven = S - credit;
        result.max_profit = K - S + credit;
        result.max_loss = S - credit;

        const double return_if_called = (K - S + credit) / S * 100.0;
        result.covered_call = CoveredCallMetrics{
            .downside_protection_pct = credit / S * 100.0,
            .return_if_called_pct = return_if_called,
            .annualized_return_pct = result.days_to_expiry > 0
                ? return_if_called * 365.0 / result.days_to_expiry
                : 0.0,
            .probability_max_profit = probability_of_profit(
                ProfitSide::AboveBreakeven, K, S, tau, call.volatility,
                market.rate, market.dividend_yield),
            .upside_cap = K,
            .covered_shares = static_cast<int>(covered_shares)
        };
    } else {
        const size_t long_idx = result.legs[0].direction == Direction::Long ? 0 : 1;
        const double long_strike = result.legs[long_idx].contract.strike();
        const double short_strike = result.legs[1 - long_idx].contract.strike();
        const double width = std::abs(short_strike - long_strike);
        const double debit = result.net_premium;
        const double credit = -result.net_premium;
        result.spread_width = width;

        switch (strategy.kind) {
            case StrategyKind::BullCallSpread:
                result.max_profit = width - debit;
                result.max_loss = debit;
                breakeven = long_strike + debit;
                side = ProfitSide::AboveBreakeven;
                break;
            case StrategyKind::BearPutSpread:
                result.max_profit = width - debit;
                result.max_loss = debit;
                breakeven = long_strike - debit;
                side = ProfitSide::BelowBreakeven;
                break;
            case StrategyKind::BullPutSpread:
                result.max_profit = credit;
                result.max_loss = width - credit;
                breakeven = short_strike - credit;
                side = ProfitSide::AboveBreakeven;
                break;
            case StrategyKind::BearCallSpread:
                result.max_profit = credit;
                result.max_loss = width - credit;
                breakeven = short_strike + credit;
                side = ProfitSide::BelowBreakeven;
                break;
            case StrategyKind::CoveredCall:
                break;
        }
    }

    result.breakevens.push_back(breakeven);
    result.max_profit_position = *result.max_profit * units * mult;
    result.max_loss_position = *result.max_loss * units * mult;
    if (*result.max_loss > 0.0) {
        result.risk_reward = *result.max_profit / *result.max_loss;
        result.max_return_pct = *result.risk_reward * 100.0;
    }
    result.probability_of_profit = probability_of_profit(
        side, breakeven, S, tau, vol, market.rate, market.dividend_yield);

    std::vector<double> anchors{breakeven};
    for (const auto& leg : result.legs) {
        anchors.push_back(leg.contract.strike());
    }
    const double sigma_sqrt_tau = vol * std::sqrt(tau);
    for (double s : payoff_spot_grid(S, sigma_sqrt_tau, anchors, config)) {
        double pnl = (s - S) * covered_shares;
        for (const auto& leg : result.legs) {
            pnl += leg_pnl_at_expiry(leg.contract.type(), leg.direction, leg.contract.strike(),
                                     leg.premium, s) * leg.quantity * mult;
        }
        result.payoff_curve.push_back(PayoffPoint{.spot = s, .pnl = pnl});
    }

    VOLSCAN_TRACE_ALGO_COMPLETE(MODULE_STRATEGY, result.legs.size(), result.net_premium);
    return result;
}

}  // namespace volscan
