// SPDX-License-Identifier: MIT
/**
 * @file strategy_composer.hpp
 * @brief Multi-leg option strategies: covered call and vertical spreads
 *
 * Combines per-leg SingleLegAnalysis results into net premium, net Greeks
 * and the analytic breakeven / max profit / max loss of each strategy shape.
 *
 * Supported shapes (per share of one spread unit, debit D, credit C,
 * width W = |K_high - K_low|):
 *
 * | Kind            | Legs                          | Max profit | Max loss | Breakeven   |
 * |-----------------|-------------------------------|------------|----------|-------------|
 * | BullCallSpread  | long K_low call, short K_high | W - D      | D        | K_long + D  |
 * | BearPutSpread   | long K_high put, short K_low  | W - D      | D        | K_long - D  |
 * | BullPutSpread   | short K_high put, long K_low  | C          | W - C    | K_short - C |
 * | BearCallSpread  | short K_low call, long K_high | C          | W - C    | K_short + C |
 * | CoveredCall     | short call + shares held      | K - S + C  | S - C    | S - C       |
 */

#pragma once

#include "volscan/analysis/single_leg.hpp"
#include "volscan/option/contract.hpp"
#include "volscan/option/greeks.hpp"
#include "volscan/support/error_types.hpp"
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

namespace volscan {

/// Supported strategy templates
enum class StrategyKind {
    CoveredCall,
    BullCallSpread,
    BearPutSpread,
    BullPutSpread,
    BearCallSpread
};

/// Human-readable name, e.g. "bull_call_spread"
std::string_view strategy_kind_name(StrategyKind kind);

/// One leg of a strategy
struct StrategyLeg {
    Contract contract;
    Direction direction;
    int quantity = 1;
    std::optional<double> premium;     ///< Overrides the quote-derived premium
    std::optional<double> volatility;  ///< Overrides the quote IV
};

/// Ordered, non-empty set of legs on one underlying
struct MultiLegStrategy {
    StrategyKind kind;
    std::vector<StrategyLeg> legs;
    int shares_held = 0;  ///< Underlying shares owned (covered call only)
};

/// Covered-call specific metrics
struct CoveredCallMetrics {
    double downside_protection_pct;  ///< premium / spot × 100
    double return_if_called_pct;     ///< (K - S + premium) / S × 100
    double annualized_return_pct;    ///< return_if_called × 365 / DTE (0 at DTE 0)
    double probability_max_profit;   ///< P(S_T ≥ K) × 100
    double upside_cap;               ///< Strike: stock gains above it are called away
    int covered_shares;              ///< contracts × multiplier
};

/// Composite strategy metrics
///
/// Per-share values refer to one spread unit (one contract per leg);
/// position values cover every unit in dollars.
struct StrategyResult {
    StrategyKind kind;
    std::vector<SingleLegAnalysis> legs;

    double net_premium;           ///< Per share; positive = debit, negative = credit
    double net_premium_position;  ///< Dollars; positive = paid
    Greeks net_greeks;            ///< Σ leg Greeks × direction × quantity (+ stock delta)

    std::vector<double> breakevens;
    std::optional<double> max_profit;           ///< Per share, nullopt = unbounded
    std::optional<double> max_loss;
    std::optional<double> max_profit_position;  ///< Dollars
    std::optional<double> max_loss_position;
    std::optional<double> risk_reward;          ///< max_profit / max_loss
    std::optional<double> max_return_pct;       ///< risk_reward × 100
    double probability_of_profit;               ///< 0-100

    std::optional<double> spread_width;          ///< Verticals only
    std::optional<CoveredCallMetrics> covered_call;

    int days_to_expiry;
    std::vector<PayoffPoint> payoff_curve;       ///< Combined position at expiry
};

/// Check leg compatibility before any computation
///
/// Non-empty, one underlying, one expiration, the leg count/types/directions
/// the kind requires, strike ordering, equal quantities for verticals and
/// enough shares for a covered call.
///
/// @return void, or ValidationError whose index names the offending leg
std::expected<void, ValidationError>
validate_strategy(const MultiLegStrategy& strategy, double contract_multiplier = 100.0);

/// Compose a multi-leg strategy
///
/// @return StrategyResult, or an ErrorVariant holding the first leg-level
///         error (ValidationError, ConfigurationError or DataQualityError)
std::expected<StrategyResult, ErrorVariant>
compose_strategy(const MultiLegStrategy& strategy, const MarketInputs& market,
                 const Timestamp& asof, const AnalysisConfig& config = {});

}  // namespace volscan
