// SPDX-License-Identifier: MIT
/**
 * @file single_leg.hpp
 * @brief Trade-level risk metrics for one option position
 *
 * Breakeven, max profit/loss, probability of profit and an expiry payoff
 * curve for a long or short position in a single contract.
 */

#pragma once

#include "volscan/option/contract.hpp"
#include "volscan/option/european_option.hpp"
#include "volscan/option/greeks.hpp"
#include "volscan/option/implied_volatility.hpp"
#include "volscan/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace volscan {

/// Position direction
enum class Direction {
    Long,
    Short
};

/// +1 for long, -1 for short
inline double direction_sign(Direction direction) {
    return direction == Direction::Long ? 1.0 : -1.0;
}

/// Where the volatility used for pricing came from
enum class VolatilitySource {
    Explicit,     ///< Caller-supplied
    Quote,        ///< Quote's observed implied volatility
    Implied,      ///< Solved from the premium
    NotRequired   ///< Expired contract; volatility has no effect
};

/// Side of the breakeven on which a position makes money
enum class ProfitSide {
    AboveBreakeven,
    BelowBreakeven
};

/// Market inputs shared by every leg on one underlying
struct MarketInputs {
    double spot = 0.0;
    double rate = 0.0;            ///< Continuously-compounded risk-free rate
    double dividend_yield = 0.0;  ///< Continuous dividend yield
};

/// Analysis configuration
struct AnalysisConfig {
    double contract_multiplier = 100.0;  ///< Shares per contract
    size_t payoff_points = 61;           ///< Evenly spaced samples before strike/breakeven insertion
    double payoff_stddevs = 3.0;         ///< Half-width of the payoff range in σ√T
    double payoff_fallback_range = 0.30; ///< Half-width as a fraction of spot when σ√T = 0
    ExpiryPolicy expiry_policy = ExpiryPolicy::Reject;
    IVSolverConfig iv_config;            ///< Used when volatility must be implied from premium
};

/// Validate analysis configuration
std::expected<void, ConfigurationError> validate_analysis_config(const AnalysisConfig& config);

/// Optional per-leg inputs that take precedence over the quote
struct LegOverrides {
    std::optional<double> premium;     ///< Premium per share
    std::optional<double> volatility;  ///< Annualized volatility (decimal)
};

/// One sample of the expiry payoff curve
struct PayoffPoint {
    double spot;  ///< Underlying price at expiration
    double pnl;   ///< Position P&L in dollars
};

/// Single-leg trade analysis
///
/// Max profit/loss use std::nullopt for unbounded. Per-share values are in
/// option premium units; position values are multiplied by quantity and the
/// contract multiplier.
struct SingleLegAnalysis {
    Contract contract;
    Direction direction;
    int quantity;                  ///< Contracts
    double contract_multiplier;    ///< Shares per contract

    double spot;
    double maturity;               ///< Years to expiry
    int days_to_expiry;
    double volatility;
    VolatilitySource volatility_source;

    double theoretical_price;      ///< Model value per share
    double premium;                ///< Premium per share paid (long) or received (short)
    double intrinsic_value;
    double extrinsic_value;        ///< max(premium - intrinsic, 0)
    double cost_basis;             ///< Signed cash flow at entry (debit negative)

    Greeks greeks;                 ///< Per-share Greeks of the contract
    Greeks position_greeks;        ///< Greeks × direction × quantity
    double daily_theta_pnl;        ///< Position P&L from one day of decay, in dollars

    double breakeven;
    std::optional<double> max_profit;           ///< Per share
    std::optional<double> max_loss;             ///< Per share
    std::optional<double> max_profit_position;  ///< Dollars
    std::optional<double> max_loss_position;    ///< Dollars
    std::optional<double> risk_reward;          ///< max_profit / max_loss when both bounded
    double probability_of_profit;               ///< 0-100

    std::vector<PayoffPoint> payoff_curve;      ///< Ordered by spot
};

/// Analyze a single option position
///
/// Premium: overrides.premium, else quote mid, else quote last.
/// Volatility: overrides.volatility, else quote IV, else implied from the premium.
///
/// @return SingleLegAnalysis, or an ErrorVariant holding
///         - ValidationError for bad quantity/premium/market inputs or an
///           expiration before `asof` under ExpiryPolicy::Reject
///         - ConfigurationError for a bad AnalysisConfig
///         - DataQualityError when no premium or volatility can be resolved
std::expected<SingleLegAnalysis, ErrorVariant>
analyze_single_leg(const Contract& contract, Direction direction, int quantity,
                   const MarketInputs& market, const Timestamp& asof,
                   const LegOverrides& overrides = {},
                   const AnalysisConfig& config = {});

/// Per-share P&L of one leg at expiration
double leg_pnl_at_expiry(OptionType type, Direction direction, double strike,
                         double premium, double spot_at_expiry);

/// Risk-neutral probability (0-100) that S_T finishes on the profitable side
/// of `breakeven`
double probability_of_profit(ProfitSide side, double breakeven, double spot, double tau,
                             double volatility, double rate, double dividend_yield);

/// Spot grid for a payoff curve
///
/// config.payoff_points evenly spaced spots over spot·(1 ± n·σ√T), or
/// ±payoff_fallback_range when σ√T = 0, floored at zero and widened to
/// contain every positive anchor. Anchors are inserted as exact samples.
std::vector<double> payoff_spot_grid(double spot, double sigma_sqrt_tau,
                                     const std::vector<double>& anchors,
                                     const AnalysisConfig& config);

}  // namespace volscan
