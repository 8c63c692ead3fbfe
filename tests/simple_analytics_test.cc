// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/simple/simple.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace volscan;
using namespace volscan::simple;

namespace {

/// In-memory provider with switchable failures
class FakeProvider : public MarketDataProvider {
public:
    std::map<std::string, double> spots;
    std::set<std::string> broken_chains;
    bool rate_available = true;
    std::vector<double> index_history;
    int chain_calls = 0;

    std::expected<std::vector<Contract>, std::string>
    get_chain(const std::string& symbol, const Timestamp& expiration) override {
        ++chain_calls;
        if (broken_chains.contains(symbol)) {
            return std::unexpected("chain unavailable");
        }
        const double spot = spots.at(symbol);
        std::vector<Contract> contracts;
        for (double k = spot * 0.9; k <= spot * 1.2; k += spot * 0.025) {
            const double tau = 35.0 / 365.0;
            const double p = bs_price(spot, k, tau, 0.25, 0.05, 0.0, OptionType::CALL);
            Quote quote{.bid = p * 0.98, .ask = p * 1.02, .last = p,
                        .volume = 800, .open_interest = 2000, .implied_vol = 0.25};
            contracts.push_back(
                Contract::create(symbol, k, expiration, OptionType::CALL, quote).value());
        }
        return contracts;
    }

    std::expected<double, std::string> get_spot(const std::string& symbol) override {
        auto it = spots.find(symbol);
        if (it == spots.end()) {
            return std::unexpected("unknown symbol " + symbol);
        }
        return it->second;
    }

    std::expected<double, std::string> get_risk_free_rate(const Timestamp&) override {
        if (!rate_available) {
            return std::unexpected("rate feed down");
        }
        return 0.05;
    }

    std::expected<double, std::string>
    get_dividend_yield(const std::string&, const Timestamp&) override {
        return 0.0;
    }

    std::expected<std::vector<double>, std::string>
    get_historical_index_levels(const std::string&, size_t window) override {
        if (index_history.empty()) {
            return std::unexpected("no index data");
        }
        std::vector<double> out = index_history;
        if (out.size() > window) {
            out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(window));
        }
        return out;
    }
};

class SimpleAnalyticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_.spots = {{"AAA", 100.0}, {"BBB", 50.0}, {"CCC", 200.0}};
        for (int i = 0; i < 100; ++i) {
            provider_.index_history.push_back(12.0 + 0.1 * i);
        }
        request_.symbols = {"AAA", "BBB", "CCC"};
        request_.expirations = {Timestamp{"2024-02-05"}};
    }

    FakeProvider provider_;
    ScanRequest request_;
    Timestamp asof_{"2024-01-01"};
};

// ===========================================================================
// scan_market
// ===========================================================================

TEST_F(SimpleAnalyticsTest, ScansEverySymbol) {
    auto scan = scan_market(provider_, request_, asof_);
    ASSERT_TRUE(scan.has_value());

    EXPECT_TRUE(scan->skipped.empty());
    ASSERT_TRUE(scan->regime.has_value());
    EXPECT_FALSE(scan->regime_error.has_value());
    // Latest level is the top of a rising history
    EXPECT_DOUBLE_EQ(scan->regime->percentile, 100.0);
    EXPECT_EQ(scan->regime->regime, VolatilityRegime::High);

    ASSERT_FALSE(scan->result.opportunities.empty());
    std::set<std::string> seen;
    for (const auto& o : scan->result.opportunities) {
        seen.insert(o.contract.underlying());
    }
    EXPECT_EQ(seen.size(), 3);
    // High regime raises the delta band
    EXPECT_NEAR(scan->result.effective_criteria.delta_min, 0.30, 1e-12);
}

TEST_F(SimpleAnalyticsTest, FailingSymbolIsSkipped) {
    provider_.broken_chains.insert("BBB");
    request_.symbols.push_back("MISSING");

    auto scan = scan_market(provider_, request_, asof_);
    ASSERT_TRUE(scan.has_value());

    ASSERT_EQ(scan->skipped.size(), 2);
    EXPECT_EQ(scan->skipped[0].symbol, "BBB");
    EXPECT_NE(scan->skipped[0].reason.find("chain unavailable"), std::string::npos);
    EXPECT_EQ(scan->skipped[1].symbol, "MISSING");

    for (const auto& o : scan->result.opportunities) {
        EXPECT_NE(o.contract.underlying(), "BBB");
    }
    EXPECT_FALSE(scan->result.opportunities.empty());
}

TEST_F(SimpleAnalyticsTest, RateFailureAbortsScan) {
    provider_.rate_available = false;

    auto scan = scan_market(provider_, request_, asof_);
    ASSERT_FALSE(scan.has_value());
    ASSERT_TRUE(std::holds_alternative<std::string>(scan.error()));
    EXPECT_NE(std::get<std::string>(scan.error()).find("rate feed down"), std::string::npos);
    EXPECT_EQ(provider_.chain_calls, 0);
}

TEST_F(SimpleAnalyticsTest, MissingIndexDegradesToNoRegime) {
    provider_.index_history.clear();

    auto scan = scan_market(provider_, request_, asof_);
    ASSERT_TRUE(scan.has_value());
    EXPECT_FALSE(scan->regime.has_value());
    ASSERT_TRUE(scan->regime_error.has_value());
    EXPECT_DOUBLE_EQ(scan->result.effective_criteria.delta_min, 0.20);
}

TEST_F(SimpleAnalyticsTest, BadCriteriaFailsBeforeFetching) {
    request_.criteria.top_n = 0;

    auto scan = scan_market(provider_, request_, asof_);
    ASSERT_FALSE(scan.has_value());
    ASSERT_TRUE(std::holds_alternative<ConfigurationError>(scan.error()));
    EXPECT_EQ(provider_.chain_calls, 0);
}

// ===========================================================================
// One-call wrappers
// ===========================================================================

TEST_F(SimpleAnalyticsTest, PriceAndImpliedVolRoundTrip) {
    auto contract = Contract::create("AAA", 105.0, Timestamp{"2024-02-05"},
                                     OptionType::CALL).value();
    auto priced = simple::price(contract, 100.0, 0.05, 0.0, 0.3, asof_, OptionType::CALL);
    ASSERT_TRUE(priced.has_value());

    auto iv = simple::solve_implied_vol(contract, priced->price, 100.0, 0.05, 0.0, asof_);
    ASSERT_TRUE(iv.has_value());
    EXPECT_TRUE(iv->converged);
    EXPECT_NEAR(iv->implied_vol, 0.3, 1e-4);
}

TEST_F(SimpleAnalyticsTest, WrappersWidenErrors) {
    auto contract = Contract::create("AAA", 105.0, Timestamp{"2024-02-05"},
                                     OptionType::CALL).value();

    auto priced = simple::price(contract, -1.0, 0.05, 0.0, 0.3, asof_, OptionType::CALL);
    ASSERT_FALSE(priced.has_value());
    EXPECT_TRUE(std::holds_alternative<ValidationError>(priced.error()));

    IVSolverConfig bad;
    bad.root_config.max_iter = 0;
    auto iv = simple::solve_implied_vol(contract, 2.0, 100.0, 0.05, 0.0, asof_, bad);
    ASSERT_FALSE(iv.has_value());
    EXPECT_TRUE(std::holds_alternative<ConfigurationError>(iv.error()));

    std::vector<double> empty;
    auto regime = simple::classify_regime(20.0, empty);
    ASSERT_FALSE(regime.has_value());
    EXPECT_EQ(std::get<ValidationError>(regime.error()).code, ValidationErrorCode::EmptyHistory);
}

TEST_F(SimpleAnalyticsTest, ScreenWrapper) {
    auto chain = provider_.get_chain("AAA", Timestamp{"2024-02-05"});
    ASSERT_TRUE(chain.has_value());
    std::vector<SymbolUniverse> universe{
        {.symbol = "AAA", .market = {.spot = 100.0, .rate = 0.05}, .contracts = *chain}};

    auto result = simple::screen(universe, ScreeningCriteria{}, std::nullopt, asof_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->opportunities.empty());
}

}  // namespace

// Both namespaces are open at file scope; unqualified calls must resolve
TEST_F(SimpleAnalyticsTest, UnqualifiedCallsResolveThroughBothNamespaces) {
    auto lower = Contract::create("AAA", 100.0, Timestamp{"2024-02-05"},
                                  OptionType::CALL).value();
    auto upper = Contract::create("AAA", 110.0, Timestamp{"2024-02-05"},
                                  OptionType::CALL).value();
    const MarketInputs market{.spot = 100.0, .rate = 0.05, .dividend_yield = 0.0};

    auto single = analyze_single_leg(lower, Direction::Long, 1, market, asof_,
                                     LegOverrides{.premium = 4.0, .volatility = 0.25});
    ASSERT_TRUE(single.has_value());
    EXPECT_NEAR(single->breakeven, 104.0, 1e-12);

    MultiLegStrategy spread{
        .kind = StrategyKind::BullCallSpread,
        .legs = {StrategyLeg{.contract = lower, .direction = Direction::Long,
                             .premium = 4.0, .volatility = 0.25},
                 StrategyLeg{.contract = upper, .direction = Direction::Short,
                             .premium = 1.0, .volatility = 0.25}}
    };
    auto result = compose_strategy(spread, market, asof_);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->net_premium, 3.0, 1e-12);
    ASSERT_EQ(result->breakevens.size(), 1);
    EXPECT_NEAR(result->breakevens[0], 103.0, 1e-12);

    // Same entity under either name
    EXPECT_TRUE(&simple::compose_strategy == &volscan::compose_strategy);
}
