// SPDX-License-Identifier: MIT
/**
 * @file quantlib_comparison.cc
 * @brief Closed-form pricing and implied volatility against QuantLib
 *
 * Both sides price the same European contract with an analytic engine.
 * The accuracy pass aborts on a price mismatch above 1e-8.
 *
 * Requires: libquantlib-dev (apt-get install libquantlib-dev)
 */

#include "volscan/option/european_option.hpp"
#include "volscan/option/implied_volatility.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <stdexcept>

// QuantLib includes
#include <ql/quantlib.hpp>

using namespace volscan;
namespace ql = QuantLib;

namespace {

constexpr double S = 100.0, K = 105.0, sigma = 0.25, rate = 0.05, q = 0.01;
constexpr int kDays = 91;

struct QuantLibEuropean {
    ql::Date today;
    ql::ext::shared_ptr<ql::SimpleQuote> vol_quote;
    ql::ext::shared_ptr<ql::VanillaOption> option;
    ql::ext::shared_ptr<ql::GeneralizedBlackScholesProcess> process;

    QuantLibEuropean(bool is_call) : today(15, ql::January, 2024) {
        ql::Settings::instance().evaluationDate() = today;
        ql::DayCounter dc = ql::Actual365Fixed();

        auto payoff = ql::ext::make_shared<ql::PlainVanillaPayoff>(
            is_call ? ql::Option::Call : ql::Option::Put, K);
        auto exercise = ql::ext::make_shared<ql::EuropeanExercise>(today + kDays);
        option = ql::ext::make_shared<ql::VanillaOption>(payoff, exercise);

        vol_quote = ql::ext::make_shared<ql::SimpleQuote>(sigma);
        ql::Handle<ql::Quote> spot(ql::ext::make_shared<ql::SimpleQuote>(S));
        ql::Handle<ql::YieldTermStructure> r_ts(
            ql::ext::make_shared<ql::FlatForward>(today, rate, dc));
        ql::Handle<ql::YieldTermStructure> q_ts(
            ql::ext::make_shared<ql::FlatForward>(today, q, dc));
        ql::Handle<ql::BlackVolTermStructure> v_ts(
            ql::ext::make_shared<ql::BlackConstantVol>(today, ql::NullCalendar(),
                                                       ql::Handle<ql::Quote>(vol_quote), dc));
        process = ql::ext::make_shared<ql::BlackScholesMertonProcess>(spot, q_ts, r_ts, v_ts);
        option->setPricingEngine(ql::ext::make_shared<ql::AnalyticEuropeanEngine>(process));
    }
};

PricingParams Params(OptionType type) {
    return PricingParams(S, K, kDays / 365.0, rate, q, type, sigma);
}

void CheckAgreement() {
    for (bool is_call : {true, false}) {
        QuantLibEuropean ql_opt(is_call);
        auto ours = price(Params(is_call ? OptionType::CALL : OptionType::PUT));
        if (!ours) throw std::runtime_error("volscan pricing failed");
        const double diff = std::abs(ours->price - ql_opt.option->NPV());
        if (diff > 1e-8) throw std::runtime_error("price mismatch against QuantLib");
    }
}

}  // namespace

static void BM_VolscanEuropean(benchmark::State& state) {
    CheckAgreement();
    const auto params = Params(OptionType::CALL);
    for (auto _ : state) {
        auto result = price(params);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_VolscanEuropean);

static void BM_QuantLibEuropean(benchmark::State& state) {
    QuantLibEuropean ql_opt(true);
    for (auto _ : state) {
        ql_opt.vol_quote->setValue(sigma);  // Invalidate cached NPV
        benchmark::DoNotOptimize(ql_opt.option->NPV());
        benchmark::DoNotOptimize(ql_opt.option->delta());
        benchmark::DoNotOptimize(ql_opt.option->vega());
    }
}
BENCHMARK(BM_QuantLibEuropean);

static void BM_VolscanIV(benchmark::State& state) {
    auto solver = ImpliedVolatilitySolver::create();
    if (!solver) throw std::runtime_error("IV solver: bad default config");
    QuantLibEuropean ql_opt(true);
    const IVQuery query(S, K, kDays / 365.0, rate, q, OptionType::CALL, ql_opt.option->NPV());
    for (auto _ : state) {
        auto result = solver->solve(query);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_VolscanIV);

static void BM_QuantLibIV(benchmark::State& state) {
    QuantLibEuropean ql_opt(true);
    const double target = ql_opt.option->NPV();
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            ql_opt.option->impliedVolatility(target, ql_opt.process, 1e-6, 100, 1e-4, 4.0));
    }
}
BENCHMARK(BM_QuantLibIV);

BENCHMARK_MAIN();
