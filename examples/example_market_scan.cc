// SPDX-License-Identifier: MIT
/**
 * @file example_market_scan.cc
 * @brief Regime-aware market scan plus a bull call spread on the top pick
 *
 * Uses an in-memory MarketDataProvider; swap in a broker or data-vendor
 * implementation for live use.
 */

#include "volscan/simple/simple.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace volscan;
using namespace volscan::simple;

namespace {

class StaticProvider : public MarketDataProvider {
public:
    explicit StaticProvider(Timestamp asof) : asof_(std::move(asof)) {}

    std::expected<std::vector<Contract>, std::string>
    get_chain(const std::string& symbol, const Timestamp& expiration) override {
        auto spot = get_spot(symbol);
        if (!spot) {
            return std::unexpected(spot.error());
        }
        auto atm = Contract::create(symbol, *spot, expiration, OptionType::CALL);
        if (!atm) {
            return std::unexpected("bad expiration " + expiration.to_string());
        }
        auto tte = atm->time_to_expiry(asof_);
        if (!tte) {
            return std::unexpected("expired " + expiration.to_string());
        }

        // Synthetic chain with a mild skew
        std::vector<Contract> chain;
        for (int i = -10; i <= 10; ++i) {
            const double strike = std::round(*spot * (1.0 + 0.02 * i));
            const double vol = 0.28 - 0.004 * i;
            for (auto type : {OptionType::CALL, OptionType::PUT}) {
                const double p = bs_price(*spot, strike, tte->years, vol, 0.05, 0.0, type);
                Quote quote{.bid = p * 0.98, .ask = p * 1.02, .last = p,
                            .volume = 300 + 40 * (10 - std::abs(i)),
                            .open_interest = 1200 + 100 * (10 - std::abs(i))};
                auto c = Contract::create(symbol, strike, expiration, type, quote);
                if (c) {
                    chain.push_back(std::move(*c));
                }
            }
        }
        return chain;
    }

    std::expected<double, std::string> get_spot(const std::string& symbol) override {
        auto it = spots_.find(symbol);
        if (it == spots_.end()) {
            return std::unexpected("no quote for " + symbol);
        }
        return it->second;
    }

    std::expected<double, std::string> get_risk_free_rate(const Timestamp&) override {
        return 0.05;
    }

    std::expected<double, std::string>
    get_dividend_yield(const std::string&, const Timestamp&) override {
        return 0.0;
    }

    std::expected<std::vector<double>, std::string>
    get_historical_index_levels(const std::string&, size_t window) override {
        std::vector<double> levels;
        for (size_t i = 0; i < window; ++i) {
            levels.push_back(14.0 + 6.0 * std::sin(0.05 * static_cast<double>(i)));
        }
        levels.back() = 19.5;
        return levels;
    }

private:
    Timestamp asof_;
    std::map<std::string, double> spots_{{"AAPL", 192.0}, {"MSFT", 374.0}, {"NVDA", 495.0}};
};

}  // namespace

int main() {
    const Timestamp asof{"2024-01-02"};
    StaticProvider provider(asof);

    ScanRequest request;
    request.symbols = {"AAPL", "MSFT", "NVDA", "TSLA"};
    request.expirations = {Timestamp{"2024-02-02"}, Timestamp{"2024-02-16"}};
    request.criteria.top_n = 5;

    auto scan = scan_market(provider, request, asof);
    if (!scan) {
        std::cerr << "scan failed: " << scan.error() << "\n";
        return 1;
    }

    if (scan->regime) {
        std::cout << "# Regime: " << regime_name(scan->regime->regime)
                  << " (VIX " << scan->regime->current_level
                  << ", percentile " << scan->regime->percentile << ")\n"
                  << "# " << scan->regime->trading_implication << "\n";
    }
    for (const auto& s : scan->skipped) {
        std::cout << "# skipped " << s.symbol << ": " << s.reason << "\n";
    }

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& o : scan->result.opportunities) {
        std::cout << o.contract.underlying() << " " << o.contract.expiration().to_string()
                  << " K=" << o.contract.strike() << "  score=" << o.score
                  << "  delta=" << o.analysis.greeks.delta << "\n";
    }
    if (scan->result.opportunities.empty()) {
        return 0;
    }

    // Finance the top pick by selling the next strike up
    const auto& top = scan->result.opportunities.front().contract;
    auto chain = provider.get_chain(top.underlying(), top.expiration());
    if (!chain) {
        std::cerr << chain.error() << "\n";
        return 1;
    }
    const Contract* upper = nullptr;
    for (const auto& c : *chain) {
        if (c.type() == OptionType::CALL && c.strike() > top.strike() &&
            (!upper || c.strike() < upper->strike())) {
            upper = &c;
        }
    }
    if (!upper) {
        return 0;
    }

    MultiLegStrategy spread{
        .kind = StrategyKind::BullCallSpread,
        .legs = {StrategyLeg{.contract = top, .direction = Direction::Long},
                 StrategyLeg{.contract = *upper, .direction = Direction::Short}}
    };
    auto spot = provider.get_spot(top.underlying());
    if (!spot) {
        std::cerr << spot.error() << "\n";
        return 1;
    }
    auto result = volscan::compose_strategy(spread, MarketInputs{.spot = *spot, .rate = 0.05}, asof);
    if (!result) {
        std::cerr << "spread failed: " << result.error() << "\n";
        return 1;
    }
    std::cout << "\n# " << strategy_kind_name(result->kind) << " "
              << top.strike() << "/" << upper->strike() << "\n"
              << "net debit " << result->net_premium
              << ", max profit " << *result->max_profit
              << ", max loss " << *result->max_loss
              << ", breakeven " << result->breakevens.front()
              << ", POP " << result->probability_of_profit << "%\n";
    return 0;
}
