// SPDX-License-Identifier: MIT
/// @file pricing_benchmark.cc
/// @brief Latency of closed-form pricing, Greeks and implied volatility
///
/// Usage:
///   ./build/benchmarks/pricing_benchmark --benchmark_filter=IV

#include "volscan/math/black_scholes_analytics.hpp"
#include "volscan/option/european_option.hpp"
#include "volscan/option/implied_volatility.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace volscan;

namespace {

constexpr double S = 100.0, K = 105.0, tau = 0.25, sigma = 0.25, rate = 0.05, q = 0.01;

const ImpliedVolatilitySolver& Solver() {
    static const ImpliedVolatilitySolver solver = [] {
        auto s = ImpliedVolatilitySolver::create();
        if (!s) throw std::runtime_error("IV solver: bad default config");
        return std::move(*s);
    }();
    return solver;
}

std::vector<IVQuery> MakeQueries(size_t n) {
    std::vector<IVQuery> queries;
    queries.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double strike = 80.0 + 40.0 * static_cast<double>(i) / static_cast<double>(n);
        const double vol = 0.15 + 0.25 * static_cast<double>(i % 7) / 7.0;
        const auto type = (i % 2 == 0) ? OptionType::CALL : OptionType::PUT;
        const double p = bs_price(S, strike, tau, vol, rate, q, type);
        queries.emplace_back(S, strike, tau, rate, q, type, p);
    }
    return queries;
}

}  // namespace

// ===========================================================================
// Pricing
// ===========================================================================

static void BM_BlackScholesPrice(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, K, tau, sigma, rate, q, OptionType::CALL));
    }
}
BENCHMARK(BM_BlackScholesPrice);

static void BM_PriceWithGreeks(benchmark::State& state) {
    const PricingParams params(S, K, tau, rate, q, OptionType::PUT, sigma);
    for (auto _ : state) {
        auto result = price(params);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_PriceWithGreeks);

// ===========================================================================
// Implied volatility
// ===========================================================================

static void BM_IVSingle(benchmark::State& state) {
    const double p = bs_price(S, K, tau, sigma, rate, q, OptionType::CALL);
    const IVQuery query(S, K, tau, rate, q, OptionType::CALL, p);
    const auto& solver = Solver();
    for (auto _ : state) {
        auto result = solver.solve(query);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_IVSingle);

static void BM_IVDeepOTM(benchmark::State& state) {
    const double p = bs_price(S, 150.0, tau, sigma, rate, q, OptionType::CALL);
    const IVQuery query(S, 150.0, tau, rate, q, OptionType::CALL, p);
    const auto& solver = Solver();
    for (auto _ : state) {
        auto result = solver.solve(query);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_IVDeepOTM);

static void BM_IVBatch(benchmark::State& state) {
    const auto queries = MakeQueries(static_cast<size_t>(state.range(0)));
    const auto& solver = Solver();
    for (auto _ : state) {
        auto result = solver.solve_batch(queries);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_IVBatch)->Arg(64)->Arg(1024)->Arg(16384)->UseRealTime();

BENCHMARK_MAIN();
