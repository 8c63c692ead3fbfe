// SPDX-License-Identifier: MIT
/**
 * @file analytics.hpp
 * @brief One-call entry points for the analytics core
 *
 * Thin wrappers over the component APIs that unify their error types into
 * ErrorVariant, plus scan_market(), which pulls its inputs from an injected
 * MarketDataProvider. analyze_single_leg() and compose_strategy() already
 * report ErrorVariant and are re-exported unchanged.
 *
 * Example:
 * @code
 * auto contract = volscan::Contract::create("SPY", 450.0,
 *     volscan::Timestamp{"2024-07-19"}, volscan::OptionType::CALL).value();
 * auto iv = volscan::simple::solve_implied_vol(
 *     contract, 5.20, 448.0, 0.05, 0.013, volscan::Timestamp{"2024-06-21"});
 * @endcode
 */

#pragma once

#include "volscan/analysis/single_leg.hpp"
#include "volscan/option/european_option.hpp"
#include "volscan/option/implied_volatility.hpp"
#include "volscan/regime/regime_classifier.hpp"
#include "volscan/screener/opportunity_screener.hpp"
#include "volscan/simple/market_data_provider.hpp"
#include "volscan/strategy/strategy_composer.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace volscan::simple {

/// Price a contract and compute its Greeks
std::expected<PricedOption, ErrorVariant>
price(const Contract& contract, double spot, double rate, double dividend_yield,
      double volatility, const Timestamp& asof, OptionType option_type);

/// Implied volatility of a contract from its market price
std::expected<IVResult, ErrorVariant>
solve_implied_vol(const Contract& contract, double market_price, double spot, double rate,
                  double dividend_yield, const Timestamp& asof,
                  const IVSolverConfig& config = {});

// Already report ErrorVariant; re-exported so both namespaces name one function
using volscan::analyze_single_leg;
using volscan::compose_strategy;

/// Volatility regime of the current index level
std::expected<RegimeClassification, ErrorVariant>
classify_regime(double current_level, std::span<const double> history,
                const RegimeConfig& config = {});

/// Screen and rank a universe
std::expected<ScreenResult, ErrorVariant>
screen(const std::vector<SymbolUniverse>& universe, const ScreeningCriteria& criteria,
       const std::optional<RegimeClassification>& regime, const Timestamp& asof,
       const ScreenerConfig& config = {});

/// Symbol dropped from a market scan
struct SkippedSymbol {
    std::string symbol;
    std::string reason;
};

/// Inputs of a market scan
struct ScanRequest {
    std::vector<std::string> symbols;
    std::vector<Timestamp> expirations;
    ScreeningCriteria criteria;
    std::string volatility_index = "^VIX";
    size_t history_window = 252;
    RegimeConfig regime_config;
    ScreenerConfig screener_config;
};

/// Output of a market scan
struct MarketScan {
    std::optional<RegimeClassification> regime;  ///< Absent when the index history is unavailable
    std::optional<std::string> regime_error;
    ScreenResult result;
    std::vector<SkippedSymbol> skipped;
};

/// Fetch inputs from `provider`, classify the regime and screen
///
/// The rate is shared by every symbol, so a rate failure aborts the scan.
/// A failure fetching spot, yield or any chain of one symbol drops that
/// symbol only. When the index history is unavailable the screen runs
/// without a regime.
std::expected<MarketScan, ErrorVariant>
scan_market(MarketDataProvider& provider, const ScanRequest& request, const Timestamp& asof);

}  // namespace volscan::simple
