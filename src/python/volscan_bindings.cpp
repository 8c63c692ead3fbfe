// SPDX-License-Identifier: MIT
/**
 * @file volscan_bindings.cpp
 * @brief Python bindings for the volscan analytics core using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include "volscan/simple/analytics.hpp"

namespace py = pybind11;

namespace {

std::string describe(const volscan::ErrorVariant& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

// Raise ValueError for a failed operation
template <typename T>
T unwrap(std::expected<T, volscan::ErrorVariant>&& result) {
    if (!result) {
        throw py::value_error(describe(result.error()));
    }
    return std::move(*result);
}

volscan::Timestamp to_timestamp(const std::string& s) {
    return volscan::Timestamp{s, volscan::TimestampFormat::ISO};
}

}  // namespace

PYBIND11_MODULE(volscan, m) {
    m.doc() = "Python bindings for volscan option analytics and opportunity screening";

    py::enum_<volscan::OptionType>(m, "OptionType")
        .value("CALL", volscan::OptionType::CALL)
        .value("PUT", volscan::OptionType::PUT);

    py::enum_<volscan::Direction>(m, "Direction")
        .value("LONG", volscan::Direction::Long)
        .value("SHORT", volscan::Direction::Short);

    py::enum_<volscan::StrategyKind>(m, "StrategyKind")
        .value("COVERED_CALL", volscan::StrategyKind::CoveredCall)
        .value("BULL_CALL_SPREAD", volscan::StrategyKind::BullCallSpread)
        .value("BEAR_PUT_SPREAD", volscan::StrategyKind::BearPutSpread)
        .value("BULL_PUT_SPREAD", volscan::StrategyKind::BullPutSpread)
        .value("BEAR_CALL_SPREAD", volscan::StrategyKind::BearCallSpread);

    py::enum_<volscan::VolatilityRegime>(m, "VolatilityRegime")
        .value("LOW", volscan::VolatilityRegime::Low)
        .value("NORMAL", volscan::VolatilityRegime::Normal)
        .value("ELEVATED", volscan::VolatilityRegime::Elevated)
        .value("HIGH", volscan::VolatilityRegime::High);

    py::enum_<volscan::ScreenType>(m, "ScreenType")
        .value("OTM_CALLS", volscan::ScreenType::OtmCalls)
        .value("OTM_PUTS", volscan::ScreenType::OtmPuts);

    py::class_<volscan::Quote>(m, "Quote")
        .def(py::init<>())
        .def_readwrite("bid", &volscan::Quote::bid)
        .def_readwrite("ask", &volscan::Quote::ask)
        .def_readwrite("last", &volscan::Quote::last)
        .def_readwrite("volume", &volscan::Quote::volume)
        .def_readwrite("open_interest", &volscan::Quote::open_interest)
        .def_readwrite("implied_vol", &volscan::Quote::implied_vol)
        .def("mid", &volscan::Quote::mid);

    py::class_<volscan::Contract>(m, "Contract")
        .def(py::init([](const std::string& underlying, double strike,
                         const std::string& expiration, volscan::OptionType type,
                         const volscan::Quote& quote) {
                 auto contract = volscan::Contract::create(underlying, strike,
                                                           to_timestamp(expiration), type, quote);
                 if (!contract) {
                     throw py::value_error(describe(contract.error()));
                 }
                 return std::move(*contract);
             }),
             py::arg("underlying"), py::arg("strike"), py::arg("expiration"),
             py::arg("type"), py::arg("quote") = volscan::Quote{})
        .def_property_readonly("underlying", &volscan::Contract::underlying)
        .def_property_readonly("strike", &volscan::Contract::strike)
        .def_property_readonly("type", &volscan::Contract::type)
        .def_property_readonly("quote", &volscan::Contract::quote)
        .def("__repr__", [](const volscan::Contract& c) {
            return "<Contract " + c.underlying() + " " + c.expiration().to_string() +
                   " " + std::to_string(c.strike()) +
                   (c.type() == volscan::OptionType::CALL ? " CALL>" : " PUT>");
        });

    py::class_<volscan::Greeks>(m, "Greeks")
        .def_readonly("delta", &volscan::Greeks::delta)
        .def_readonly("gamma", &volscan::Greeks::gamma)
        .def_readonly("theta", &volscan::Greeks::theta)
        .def_readonly("vega", &volscan::Greeks::vega)
        .def_readonly("rho", &volscan::Greeks::rho);

    py::class_<volscan::PricedOption>(m, "PricedOption")
        .def_readonly("price", &volscan::PricedOption::price)
        .def_readonly("greeks", &volscan::PricedOption::greeks)
        .def_readonly("carry_theta", &volscan::PricedOption::carry_theta)
        .def_readonly("d1", &volscan::PricedOption::d1)
        .def_readonly("d2", &volscan::PricedOption::d2);

    py::class_<volscan::IVResult>(m, "IVResult")
        .def_readonly("implied_vol", &volscan::IVResult::implied_vol)
        .def_readonly("converged", &volscan::IVResult::converged)
        .def_readonly("iterations", &volscan::IVResult::iterations)
        .def_readonly("final_error", &volscan::IVResult::final_error)
        .def("__repr__", [](const volscan::IVResult& r) {
            return "<IVResult iv=" + std::to_string(r.implied_vol) +
                   " iters=" + std::to_string(r.iterations) +
                   (r.converged ? " converged>" : " unconverged>");
        });

    py::class_<volscan::MarketInputs>(m, "MarketInputs")
        .def(py::init([](double spot, double rate, double dividend_yield) {
                 return volscan::MarketInputs{.spot = spot, .rate = rate,
                                              .dividend_yield = dividend_yield};
             }),
             py::arg("spot"), py::arg("rate") = 0.0, py::arg("dividend_yield") = 0.0)
        .def_readwrite("spot", &volscan::MarketInputs::spot)
        .def_readwrite("rate", &volscan::MarketInputs::rate)
        .def_readwrite("dividend_yield", &volscan::MarketInputs::dividend_yield);

    py::class_<volscan::PayoffPoint>(m, "PayoffPoint")
        .def_readonly("spot", &volscan::PayoffPoint::spot)
        .def_readonly("pnl", &volscan::PayoffPoint::pnl);

    py::class_<volscan::SingleLegAnalysis>(m, "SingleLegAnalysis")
        .def_readonly("premium", &volscan::SingleLegAnalysis::premium)
        .def_readonly("theoretical_price", &volscan::SingleLegAnalysis::theoretical_price)
        .def_readonly("volatility", &volscan::SingleLegAnalysis::volatility)
        .def_readonly("days_to_expiry", &volscan::SingleLegAnalysis::days_to_expiry)
        .def_readonly("intrinsic_value", &volscan::SingleLegAnalysis::intrinsic_value)
        .def_readonly("extrinsic_value", &volscan::SingleLegAnalysis::extrinsic_value)
        .def_readonly("greeks", &volscan::SingleLegAnalysis::greeks)
        .def_readonly("position_greeks", &volscan::SingleLegAnalysis::position_greeks)
        .def_readonly("breakeven", &volscan::SingleLegAnalysis::breakeven)
        .def_readonly("max_profit", &volscan::SingleLegAnalysis::max_profit)
        .def_readonly("max_loss", &volscan::SingleLegAnalysis::max_loss)
        .def_readonly("risk_reward", &volscan::SingleLegAnalysis::risk_reward)
        .def_readonly("probability_of_profit", &volscan::SingleLegAnalysis::probability_of_profit)
        .def_readonly("payoff_curve", &volscan::SingleLegAnalysis::payoff_curve);

    py::class_<volscan::StrategyLeg>(m, "StrategyLeg")
        .def(py::init([](const volscan::Contract& contract, volscan::Direction direction,
                         int quantity, std::optional<double> premium) {
                 return volscan::StrategyLeg{.contract = contract, .direction = direction,
                                             .quantity = quantity, .premium = premium,
                                             .volatility = std::nullopt};
             }),
             py::arg("contract"), py::arg("direction"), py::arg("quantity") = 1,
             py::arg("premium") = py::none());

    py::class_<volscan::StrategyResult>(m, "StrategyResult")
        .def_readonly("net_premium", &volscan::StrategyResult::net_premium)
        .def_readonly("net_greeks", &volscan::StrategyResult::net_greeks)
        .def_readonly("breakevens", &volscan::StrategyResult::breakevens)
        .def_readonly("max_profit", &volscan::StrategyResult::max_profit)
        .def_readonly("max_loss", &volscan::StrategyResult::max_loss)
        .def_readonly("risk_reward", &volscan::StrategyResult::risk_reward)
        .def_readonly("probability_of_profit", &volscan::StrategyResult::probability_of_profit)
        .def_readonly("payoff_curve", &volscan::StrategyResult::payoff_curve);

    py::class_<volscan::RegimeClassification>(m, "RegimeClassification")
        .def_readonly("current_level", &volscan::RegimeClassification::current_level)
        .def_readonly("percentile", &volscan::RegimeClassification::percentile)
        .def_readonly("regime", &volscan::RegimeClassification::regime)
        .def_readonly("description", &volscan::RegimeClassification::description)
        .def_readonly("trading_implication", &volscan::RegimeClassification::trading_implication)
        .def_readonly("implications", &volscan::RegimeClassification::implications);

    py::class_<volscan::ScreeningCriteria>(m, "ScreeningCriteria")
        .def(py::init<>())
        .def_readwrite("screen_type", &volscan::ScreeningCriteria::screen_type)
        .def_readwrite("delta_min", &volscan::ScreeningCriteria::delta_min)
        .def_readwrite("delta_max", &volscan::ScreeningCriteria::delta_max)
        .def_readwrite("dte_min", &volscan::ScreeningCriteria::dte_min)
        .def_readwrite("dte_max", &volscan::ScreeningCriteria::dte_max)
        .def_readwrite("min_volume", &volscan::ScreeningCriteria::min_volume)
        .def_readwrite("min_open_interest", &volscan::ScreeningCriteria::min_open_interest)
        .def_readwrite("regime_aware", &volscan::ScreeningCriteria::regime_aware)
        .def_readwrite("top_n", &volscan::ScreeningCriteria::top_n)
        .def_readwrite("otm_only", &volscan::ScreeningCriteria::otm_only);

    py::class_<volscan::SymbolUniverse>(m, "SymbolUniverse")
        .def(py::init([](const std::string& symbol, const volscan::MarketInputs& market,
                         std::vector<volscan::Contract> contracts) {
                 return volscan::SymbolUniverse{.symbol = symbol, .market = market,
                                                .contracts = std::move(contracts)};
             }),
             py::arg("symbol"), py::arg("market"), py::arg("contracts"));

    py::class_<volscan::ScoredOpportunity>(m, "ScoredOpportunity")
        .def_readonly("contract", &volscan::ScoredOpportunity::contract)
        .def_readonly("analysis", &volscan::ScoredOpportunity::analysis)
        .def_readonly("score", &volscan::ScoredOpportunity::score);

    py::class_<volscan::ScreenResult>(m, "ScreenResult")
        .def_readonly("opportunities", &volscan::ScreenResult::opportunities)
        .def_readonly("effective_criteria", &volscan::ScreenResult::effective_criteria)
        .def_readonly("considered", &volscan::ScreenResult::considered)
        .def_readonly("filtered", &volscan::ScreenResult::filtered)
        .def_property_readonly("rejected_count", [](const volscan::ScreenResult& r) {
            return r.rejected.size();
        });

    m.def("price",
        [](const volscan::Contract& contract, double spot, double rate, double dividend_yield,
           double volatility, const std::string& asof) {
            return unwrap(volscan::simple::price(contract, spot, rate, dividend_yield, volatility,
                                                 to_timestamp(asof), contract.type()));
        },
        py::arg("contract"), py::arg("spot"), py::arg("rate"), py::arg("dividend_yield"),
        py::arg("volatility"), py::arg("asof"),
        "Black-Scholes-Merton price and Greeks of a contract");

    m.def("solve_implied_vol",
        [](const volscan::Contract& contract, double market_price, double spot, double rate,
           double dividend_yield, const std::string& asof) {
            return unwrap(volscan::simple::solve_implied_vol(
                contract, market_price, spot, rate, dividend_yield, to_timestamp(asof)));
        },
        py::arg("contract"), py::arg("market_price"), py::arg("spot"), py::arg("rate"),
        py::arg("dividend_yield"), py::arg("asof"),
        "Implied volatility from a market price");

    m.def("analyze_single_leg",
        [](const volscan::Contract& contract, volscan::Direction direction, int quantity,
           const volscan::MarketInputs& market, const std::string& asof,
           std::optional<double> premium, std::optional<double> volatility) {
            return unwrap(volscan::simple::analyze_single_leg(
                contract, direction, quantity, market, to_timestamp(asof),
                volscan::LegOverrides{.premium = premium, .volatility = volatility}));
        },
        py::arg("contract"), py::arg("direction"), py::arg("quantity"), py::arg("market"),
        py::arg("asof"), py::arg("premium") = py::none(), py::arg("volatility") = py::none());

    m.def("compose_strategy",
        [](volscan::StrategyKind kind, std::vector<volscan::StrategyLeg> legs,
           const volscan::MarketInputs& market, const std::string& asof, int shares_held) {
            volscan::MultiLegStrategy strategy{.kind = kind, .legs = std::move(legs),
                                               .shares_held = shares_held};
            return unwrap(volscan::simple::compose_strategy(strategy, market, to_timestamp(asof)));
        },
        py::arg("kind"), py::arg("legs"), py::arg("market"), py::arg("asof"),
        py::arg("shares_held") = 0);

    m.def("classify_regime",
        [](double current_level, const std::vector<double>& history) {
            return unwrap(volscan::simple::classify_regime(current_level, history));
        },
        py::arg("current_level"), py::arg("history"));

    m.def("screen",
        [](const std::vector<volscan::SymbolUniverse>& universe,
           const volscan::ScreeningCriteria& criteria, const std::string& asof,
           std::optional<volscan::RegimeClassification> regime) {
            return unwrap(volscan::simple::screen(universe, criteria, regime, to_timestamp(asof)));
        },
        py::arg("universe"), py::arg("criteria"), py::arg("asof"),
        py::arg("regime") = py::none());
}
