// SPDX-License-Identifier: MIT
#include "volscan/simple/analytics.hpp"
#include "volscan/support/volscan_trace.h"
#include <iterator>
#include <sstream>

namespace volscan::simple {

namespace {

/// Lift an expected with a component error type into ErrorVariant
template <typename T, typename E>
std::expected<T, ErrorVariant> widen(std::expected<T, E>&& result) {
    if (!result) {
        return std::unexpected(ErrorVariant{std::move(result.error())});
    }
    return std::move(*result);
}

/// Gather one symbol's inputs; any provider failure drops the symbol
std::expected<SymbolUniverse, std::string>
fetch_symbol(MarketDataProvider& provider, const std::string& symbol, double rate,
             const std::vector<Timestamp>& expirations, const Timestamp& asof) {
    auto spot = provider.get_spot(symbol);
    if (!spot) {
        return std::unexpected("spot: " + spot.error());
    }
    auto yield = provider.get_dividend_yield(symbol, asof);
    if (!yield) {
        return std::unexpected("dividend yield: " + yield.error());
    }

    SymbolUniverse universe{
        .symbol = symbol,
        .market = MarketInputs{.spot = *spot, .rate = rate, .dividend_yield = *yield},
        .contracts = {}
    };
    for (const auto& expiration : expirations) {
        auto chain = provider.get_chain(symbol, expiration);
        if (!chain) {
            return std::unexpected("chain " + expiration.to_string() + ": " + chain.error());
        }
        universe.contracts.insert(universe.contracts.end(),
                                  std::make_move_iterator(chain->begin()),
                                  std::make_move_iterator(chain->end()));
    }

    if (auto valid = validate_option_spec(OptionSpec{
            .spot = universe.market.spot, .strike = 1.0, .maturity = 0.0,
            .rate = rate, .dividend_yield = universe.market.dividend_yield});
        !valid) {
        std::ostringstream oss;
        oss << valid.error();
        return std::unexpected("market inputs: " + oss.str());
    }
    return universe;
}

}  // namespace

std::expected<PricedOption, ErrorVariant>
price(const Contract& contract, double spot, double rate, double dividend_yield,
      double volatility, const Timestamp& asof, OptionType option_type) {
    return widen(volscan::price(contract, spot, rate, dividend_yield, volatility, asof,
                                option_type));
}

std::expected<IVResult, ErrorVariant>
solve_implied_vol(const Contract& contract, double market_price, double spot, double rate,
                  double dividend_yield, const Timestamp& asof, const IVSolverConfig& config) {
    auto solver = ImpliedVolatilitySolver::create(config);
    if (!solver) {
        return std::unexpected(ErrorVariant{solver.error()});
    }
    return widen(solver->solve(contract, market_price, spot, rate, dividend_yield, asof));
}

std::expected<RegimeClassification, ErrorVariant>
classify_regime(double current_level, std::span<const double> history,
                const RegimeConfig& config) {
    auto classifier = RegimeClassifier::create(config);
    if (!classifier) {
        return std::unexpected(ErrorVariant{classifier.error()});
    }
    return widen(classifier->classify(current_level, history));
}

std::expected<ScreenResult, ErrorVariant>
screen(const std::vector<SymbolUniverse>& universe, const ScreeningCriteria& criteria,
       const std::optional<RegimeClassification>& regime, const Timestamp& asof,
       const ScreenerConfig& config) {
    auto screener = OpportunityScreener::create(config);
    if (!screener) {
        return std::unexpected(ErrorVariant{screener.error()});
    }
    return screener->screen(universe, criteria, regime, asof);
}

std::expected<MarketScan, ErrorVariant>
scan_market(MarketDataProvider& provider, const ScanRequest& request, const Timestamp& asof) {
    // Reject bad configuration before touching the provider
    auto screener = OpportunityScreener::create(request.screener_config);
    if (!screener) {
        return std::unexpected(ErrorVariant{screener.error()});
    }
    auto classifier = RegimeClassifier::create(request.regime_config);
    if (!classifier) {
        return std::unexpected(ErrorVariant{classifier.error()});
    }
    if (auto valid = validate_screening_criteria(request.criteria); !valid) {
        return std::unexpected(ErrorVariant{valid.error()});
    }

    auto rate = provider.get_risk_free_rate(asof);
    if (!rate) {
        VOLSCAN_TRACE_RUNTIME_ERROR(MODULE_SCREENER, 1, 0.0);
        return std::unexpected(ErrorVariant{"risk-free rate: " + rate.error()});
    }

    MarketScan scan;

    auto levels = provider.get_historical_index_levels(request.volatility_index,
                                                       request.history_window);
    if (!levels) {
        scan.regime_error = levels.error();
    } else if (levels->empty()) {
        scan.regime_error = "empty history for " + request.volatility_index;
    } else {
        // Latest close is the current reading
        auto regime = classifier->classify(levels->back(), *levels);
        if (regime) {
            scan.regime = std::move(*regime);
        } else {
            std::ostringstream oss;
            oss << regime.error();
            scan.regime_error = oss.str();
        }
    }

    std::vector<SymbolUniverse> universe;
    universe.reserve(request.symbols.size());
    for (const auto& symbol : request.symbols) {
        auto fetched = fetch_symbol(provider, symbol, *rate, request.expirations, asof);
        if (!fetched) {
            VOLSCAN_TRACE_RUNTIME_ERROR(MODULE_SCREENER, 2, static_cast<double>(universe.size()));
            scan.skipped.push_back(SkippedSymbol{.symbol = symbol, .reason = fetched.error()});
            continue;
        }
        universe.push_back(std::move(*fetched));
    }

    auto result = screener->screen(universe, request.criteria, scan.regime, asof);
    if (!result) {
        return std::unexpected(result.error());
    }
    scan.result = std::move(*result);
    return scan;
}

}  // namespace volscan::simple
