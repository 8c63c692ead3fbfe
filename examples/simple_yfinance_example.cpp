// SPDX-License-Identifier: MIT
/**
 * @file simple_yfinance_example.cpp
 * @brief End-to-end example: yfinance rows → implied vols → ranked calls
 */

#include "volscan/simple/simple.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace volscan;
using namespace volscan::simple;

int main() {
    // ============================================
    // Step 1: Simulated yfinance data
    // ============================================

    // In practice, this comes from Python via pybind11
    Converter<YFinanceSource>::RawOption spy_calls[] = {
        {.expiry = "2024-07-19", .type = "call", .strike = 575.0, .bid = 14.10, .ask = 14.30, .lastPrice = 14.20, .volume = 15420, .openInterest = 28300, .impliedVolatility = 0.142},
        {.expiry = "2024-07-19", .type = "call", .strike = 585.0, .bid = 8.05, .ask = 8.20, .lastPrice = 8.12, .volume = 42150, .openInterest = 51200, .impliedVolatility = 0.131},
        {.expiry = "2024-07-19", .type = "call", .strike = 590.0, .bid = 5.60, .ask = 5.75, .lastPrice = 5.66, .volume = 31200, .openInterest = 39100, .impliedVolatility = 0.128},
        {.expiry = "2024-07-19", .type = "call", .strike = 595.0, .bid = 3.65, .ask = 3.80, .lastPrice = 3.70, .volume = 18900, .openInterest = 22400, .impliedVolatility = 0.126},
        {.expiry = "2024-07-19", .type = "call", .strike = 600.0, .bid = 2.20, .ask = 2.32, .lastPrice = 2.25, .volume = 22750, .openInterest = 41800, .impliedVolatility = 0.125},
        {.expiry = "2024-07-19", .type = "call", .strike = 610.0, .bid = 0.62, .ask = 0.70, .lastPrice = 0.66, .volume = 9100, .openInterest = 18300, .impliedVolatility = 0.131},
        // yfinance reports a missing quote as zeros
        {.expiry = "2024-07-19", .type = "call", .strike = 650.0, .bid = 0.0, .ask = 0.0, .lastPrice = 0.0, .volume = 0, .openInterest = 0, .impliedVolatility = 0.0},
    };

    const double spot = 580.50;
    const double rate = 0.053;
    const double dividend_yield = 0.013;
    const Timestamp asof{"2024-06-21T14:30:00"};

    // ============================================
    // Step 2: Convert rows into contracts
    // ============================================

    std::vector<Contract> contracts;
    for (const auto& row : spy_calls) {
        contracts.push_back(Converter<YFinanceSource>::to_contract("SPY", row));
    }

    // ============================================
    // Step 3: Solve implied volatility from the mid
    // ============================================

    std::cout << "# SPY calls, spot " << spot << ", as of " << asof.to_string() << "\n";
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& c : contracts) {
        auto premium = c.quote().premium();
        if (!premium) {
            std::cout << "K=" << c.strike() << "  no quote\n";
            continue;
        }
        auto iv = solve_implied_vol(c, *premium, spot, rate, dividend_yield, asof);
        if (!iv) {
            std::cout << "K=" << c.strike() << "  IV failed: " << iv.error() << "\n";
            continue;
        }
        std::cout << "K=" << c.strike() << "  mid=" << *premium
                  << "  iv=" << iv->implied_vol
                  << "  yfinance=" << c.quote().implied_vol.value_or(0.0)
                  << "  iterations=" << iv->iterations << "\n";
    }

    // ============================================
    // Step 4: Screen the chain for OTM calls
    // ============================================

    std::vector<SymbolUniverse> universe{{
        .symbol = "SPY",
        .market = MarketInputs{.spot = spot, .rate = rate, .dividend_yield = dividend_yield},
        .contracts = contracts
    }};
    ScreeningCriteria criteria;
    criteria.dte_min = 7;
    criteria.top_n = 5;

    auto result = screen(universe, criteria, std::nullopt, asof);
    if (!result) {
        std::cerr << "screen failed: " << result.error() << "\n";
        return 1;
    }

    std::cout << "\n# Top calls (" << result->summary.count << " of "
              << result->considered << " considered, "
              << result->rejected.size() << " rejected)\n";
    std::cout << std::setprecision(2);
    for (const auto& o : result->opportunities) {
        std::cout << "K=" << o.contract.strike()
                  << "  score=" << o.score
                  << "  delta=" << o.analysis.greeks.delta
                  << "  breakeven=" << o.analysis.breakeven
                  << "  pop=" << o.analysis.probability_of_profit << "%\n";
    }
    return 0;
}
