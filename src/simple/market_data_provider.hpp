// SPDX-License-Identifier: MIT
/**
 * @file market_data_provider.hpp
 * @brief Interface to an external market-data source
 *
 * volscan never fetches data itself. Callers inject an implementation
 * (broker API, yfinance dump, test fixture) into scan_market().
 * Failures are reported as plain messages; the facade decides whether a
 * failure drops one symbol or the whole request.
 */

#pragma once

#include "volscan/option/contract.hpp"
#include "volscan/option/timestamp.hpp"
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace volscan::simple {

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /// Listed contracts of `symbol` expiring at `expiration`, with quotes
    virtual std::expected<std::vector<Contract>, std::string>
    get_chain(const std::string& symbol, const Timestamp& expiration) = 0;

    /// Current underlying price
    virtual std::expected<double, std::string> get_spot(const std::string& symbol) = 0;

    /// Continuously-compounded risk-free rate as of `asof`
    virtual std::expected<double, std::string> get_risk_free_rate(const Timestamp& asof) = 0;

    /// Continuous dividend yield of `symbol` as of `asof`
    virtual std::expected<double, std::string>
    get_dividend_yield(const std::string& symbol, const Timestamp& asof) = 0;

    /// Most recent `window` closing levels of a volatility index, oldest first
    virtual std::expected<std::vector<double>, std::string>
    get_historical_index_levels(const std::string& index, size_t window) = 0;
};

}  // namespace volscan::simple
