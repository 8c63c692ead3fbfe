// SPDX-License-Identifier: MIT
/// @file screener_benchmark.cc
/// @brief Throughput of single-leg analysis and universe screening
///
/// The universe is synthetic: each symbol carries a 41-strike call and put
/// chain at three expirations, quoted at a flat 25% volatility. Chains
/// without quote IV force the implied-volatility path.

#include "volscan/analysis/single_leg.hpp"
#include "volscan/math/black_scholes_analytics.hpp"
#include "volscan/screener/opportunity_screener.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>
#include <cstdint>
#include <string>
#include <vector>

using namespace volscan;

namespace {

const Timestamp kAsof{"2024-01-02"};
const char* const kExpiries[] = {"2024-01-26", "2024-02-16", "2024-03-15"};

std::vector<SymbolUniverse> MakeUniverse(size_t symbols, bool quote_iv) {
    std::vector<SymbolUniverse> universe;
    for (size_t s = 0; s < symbols; ++s) {
        const double spot = 50.0 + 10.0 * static_cast<double>(s);
        SymbolUniverse u{
            .symbol = "SYM" + std::to_string(s),
            .market = MarketInputs{.spot = spot, .rate = 0.05, .dividend_yield = 0.01},
            .contracts = {}
        };
        for (const char* expiry : kExpiries) {
            Timestamp ts{expiry};
            auto tte = Contract::create(u.symbol, spot, ts, OptionType::CALL)
                           ->time_to_expiry(kAsof);
            if (!tte) throw std::runtime_error("bad expiry");
            for (int i = -20; i <= 20; ++i) {
                const double strike = spot * (1.0 + 0.01 * i);
                for (auto type : {OptionType::CALL, OptionType::PUT}) {
                    const double p = bs_price(spot, strike, tte->years, 0.25, 0.05, 0.01, type);
                    Quote quote{.bid = p * 0.97, .ask = p * 1.03, .last = p,
                                .volume = 150 + 20 * (i + 20),
                                .open_interest = static_cast<int64_t>(400 + 50 * s)};
                    if (quote_iv) quote.implied_vol = 0.25;
                    auto contract = Contract::create(u.symbol, strike, ts, type, quote);
                    if (!contract) throw std::runtime_error("bad contract");
                    u.contracts.push_back(std::move(*contract));
                }
            }
        }
        universe.push_back(std::move(u));
    }
    return universe;
}

}  // namespace

static void BM_AnalyzeSingleLeg(benchmark::State& state) {
    auto universe = MakeUniverse(1, state.range(0) != 0);
    const auto& contract = universe[0].contracts[50];
    for (auto _ : state) {
        auto result = analyze_single_leg(contract, Direction::Long, 1, universe[0].market, kAsof);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_AnalyzeSingleLeg)->ArgName("quote_iv")->Arg(1)->Arg(0);

static void BM_Screen(benchmark::State& state) {
    const auto universe = MakeUniverse(static_cast<size_t>(state.range(0)), false);
    auto screener = OpportunityScreener::create();
    if (!screener) throw std::runtime_error("screener: bad default config");

    RegimeClassification regime{};
    regime.regime = VolatilityRegime::Elevated;
    regime.percentile = 72.0;

    size_t contracts = 0;
    for (const auto& u : universe) contracts += u.contracts.size();

    for (auto _ : state) {
        auto result = screener->screen(universe, ScreeningCriteria{}, regime, kAsof);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(contracts));
}
BENCHMARK(BM_Screen)->Arg(1)->Arg(10)->Arg(50)->UseRealTime();

BENCHMARK_MAIN();
