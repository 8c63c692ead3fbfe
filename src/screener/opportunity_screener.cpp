// SPDX-License-Identifier: MIT
#include "volscan/screener/opportunity_screener.hpp"
#include "volscan/support/parallel.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <tuple>

namespace volscan {

namespace {

// Full marks of each tier table; weights rescale them
constexpr double kLiquidityPoints = 20.0;
constexpr double kProbabilityPoints = 25.0;
constexpr double kRiskRewardPoints = 20.0;
constexpr double kTimeValuePoints = 15.0;
constexpr double kMacroPoints = 20.0;

double activity_tier(int64_t count) {
    if (count > 500) return 10.0;
    if (count > 200) return 7.0;
    if (count > 100) return 5.0;
    if (count > 0) return 2.0;
    return 0.0;
}

double probability_tier(double pop) {
    if (pop > 60.0) return 25.0;
    if (pop > 50.0) return 20.0;
    if (pop > 40.0) return 15.0;
    if (pop > 30.0) return 10.0;
    return 5.0;
}

double ratio_tier(double ratio) {
    if (ratio > 3.0) return 20.0;
    if (ratio > 2.0) return 15.0;
    if (ratio > 1.5) return 10.0;
    if (ratio > 1.0) return 5.0;
    return 2.0;
}

/// Unbounded upside: distance to breakeven per premium dollar, nearer is better
double breakeven_distance_tier(double distance_per_premium) {
    if (distance_per_premium <= 1.0) return 20.0;
    if (distance_per_premium <= 2.0) return 15.0;
    if (distance_per_premium <= 3.0) return 10.0;
    if (distance_per_premium <= 5.0) return 5.0;
    return 2.0;
}

double dte_tier(int dte) {
    if (dte >= 30 && dte <= 45) return 15.0;
    if (dte >= 21 && dte <= 60) return 12.0;
    if (dte >= 14 && dte <= 21) return 8.0;
    return 5.0;
}

double macro_points(ScreenType type, const std::optional<RegimeClassification>& regime) {
    if (!regime) {
        return 10.0;  // Neutral
    }

    double points = 0.0;
    const bool calls = type == ScreenType::OtmCalls;
    switch (regime->regime) {
        case VolatilityRegime::Low:      points = calls ? 8.0 : 15.0; break;
        case VolatilityRegime::Normal:   points = calls ? 15.0 : 12.0; break;
        case VolatilityRegime::Elevated: points = calls ? 18.0 : 14.0; break;
        case VolatilityRegime::High:     points = calls ? 12.0 : 10.0; break;
    }

    // Cheap volatility favors buyers; expensive volatility penalizes them
    if (regime->percentile < 30.0) {
        points += 5.0;
    } else if (regime->percentile > 70.0) {
        points -= 3.0;
    }
    return std::clamp(points, 0.0, kMacroPoints);
}

OptionType screen_option_type(ScreenType type) {
    return type == ScreenType::OtmCalls ? OptionType::CALL : OptionType::PUT;
}

std::optional<DataQualityError> check_quote(const Quote& quote) {
    for (const auto& field : {quote.bid, quote.ask, quote.last}) {
        if (field && (*field < 0.0 || !std::isfinite(*field))) {
            return DataQualityError{.code = DataQualityErrorCode::InvalidQuote, .value = *field};
        }
    }
    if (!quote.premium()) {
        return DataQualityError{.code = DataQualityErrorCode::MissingPremium};
    }
    const bool no_volume = quote.volume.value_or(0) <= 0;
    const bool no_interest = quote.open_interest.value_or(0) <= 0;
    const bool no_last = !(quote.last && *quote.last > 0.0);
    if (no_volume && no_interest && no_last) {
        return DataQualityError{.code = DataQualityErrorCode::NoLiquidity};
    }
    return std::nullopt;
}

DataQualityError as_data_quality(const ErrorVariant& error) {
    if (const auto* dq = std::get_if<DataQualityError>(&error)) {
        return *dq;
    }
    return DataQualityError{.code = DataQualityErrorCode::InvalidQuote,
                            .value = static_cast<double>(error_code(error))};
}

}  // namespace

const RegimeAdjustment& RegimeAdjustmentTable::for_regime(VolatilityRegime regime) const {
    switch (regime) {
        case VolatilityRegime::Low:      return low;
        case VolatilityRegime::Normal:   return normal;
        case VolatilityRegime::Elevated: return elevated;
        case VolatilityRegime::High:     return high;
    }
    return normal;
}

std::expected<void, ConfigurationError> validate_screening_criteria(const ScreeningCriteria& c) {
    if (c.delta_min < 0.0 || c.delta_max > 1.0 ||
        !std::isfinite(c.delta_min) || !std::isfinite(c.delta_max)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::DeltaOutOfRange, c.delta_min, c.delta_max));
    }
    if (c.delta_min > c.delta_max) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvertedDeltaBand, c.delta_min, c.delta_max));
    }
    if (c.dte_min < 0 || c.dte_min > c.dte_max) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvertedExpiryBand, c.dte_min, c.dte_max));
    }
    if (c.min_volume < 0 || c.min_open_interest < 0) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::NegativeLiquidityThreshold,
            static_cast<double>(std::min(c.min_volume, c.min_open_interest))));
    }
    if (c.top_n == 0) {
        return std::unexpected(ConfigurationError(ConfigurationErrorCode::InvalidTopN, 0.0));
    }
    return {};
}

std::expected<void, ConfigurationError> validate_score_weights(const ScoreWeights& w) {
    for (double weight : {w.liquidity, w.probability, w.risk_reward, w.time_value, w.macro}) {
        if (weight < 0.0 || !std::isfinite(weight)) {
            return std::unexpected(ConfigurationError(
                ConfigurationErrorCode::InvalidScoreWeights, weight));
        }
    }
    if (!(w.sum() > 0.0)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidScoreWeights, w.sum()));
    }
    return {};
}

ScreeningCriteria adjust_for_regime(const ScreeningCriteria& criteria,
                                    const RegimeClassification& regime,
                                    const RegimeAdjustmentTable& table) {
    const auto& adj = table.for_regime(regime.regime);
    ScreeningCriteria out = criteria;

    out.delta_min = std::clamp(criteria.delta_min + adj.delta_min_shift, 0.0, 1.0);
    out.delta_max = std::clamp(criteria.delta_max + adj.delta_max_shift, 0.0, 1.0);
    out.delta_min = std::min(out.delta_min, out.delta_max);

    const int scaled_max = static_cast<int>(std::floor(criteria.dte_max * adj.dte_max_scale));
    out.dte_max = std::max(criteria.dte_min, scaled_max);
    return out;
}

OpportunityScreener::OpportunityScreener(const ScreenerConfig& config)
    : config_(config) {
    config_.analysis.expiry_policy = ExpiryPolicy::TreatAsExpired;
}

std::expected<OpportunityScreener, ConfigurationError>
OpportunityScreener::create(const ScreenerConfig& config) {
    auto validation = validate_score_weights(config.weights)
        .and_then([&] { return validate_analysis_config(config.analysis); });
    if (!validation) {
        return std::unexpected(validation.error());
    }
    for (const auto* adj : {&config.adjustments.low, &config.adjustments.normal,
                            &config.adjustments.elevated, &config.adjustments.high}) {
        if (!(adj->dte_max_scale > 0.0) || !std::isfinite(adj->delta_min_shift) ||
            !std::isfinite(adj->delta_max_shift)) {
            return std::unexpected(ConfigurationError(
                ConfigurationErrorCode::InvalidRegimeThresholds, adj->dte_max_scale));
        }
    }
    return OpportunityScreener(config);
}

ScoreBreakdown OpportunityScreener::score(const SingleLegAnalysis& analysis,
                                          ScreenType screen_type,
                                          const std::optional<RegimeClassification>& regime) const {
    const auto& w = config_.weights;
    const auto& quote = analysis.contract.quote();

    const double liquidity = activity_tier(quote.volume.value_or(0)) +
                             activity_tier(quote.open_interest.value_or(0));

    double risk_reward = 0.0;
    if (analysis.risk_reward) {
        risk_reward = ratio_tier(*analysis.risk_reward);
    } else {
        const double distance = std::abs(analysis.breakeven - analysis.spot);
        risk_reward = analysis.premium > 0.0
            ? breakeven_distance_tier(distance / analysis.premium)
            : 2.0;
    }

    const double extrinsic_ratio = analysis.premium > 0.0
        ? std::clamp(analysis.extrinsic_value / analysis.premium, 0.0, 1.0)
        : 0.0;
    const double time_value = 0.5 * extrinsic_ratio * kTimeValuePoints +
                              0.5 * dte_tier(analysis.days_to_expiry);

    return ScoreBreakdown{
        .liquidity = liquidity / kLiquidityPoints * w.liquidity,
        .probability = probability_tier(analysis.probability_of_profit) /
                       kProbabilityPoints * w.probability,
        .risk_reward = risk_reward / kRiskRewardPoints * w.risk_reward,
        .time_value = time_value / kTimeValuePoints * w.time_value,
        .macro = macro_points(screen_type, regime) / kMacroPoints * w.macro
    };
}

OpportunityScreener::SymbolOutcome
OpportunityScreener::screen_symbol(const SymbolUniverse& symbol, const ScreeningCriteria& criteria,
                                   const std::optional<RegimeClassification>& regime,
                                   const Timestamp& asof) const {
    SymbolOutcome outcome;
    const OptionType wanted = screen_option_type(criteria.screen_type);
    const double spot = symbol.market.spot;
    const double weight_sum = config_.weights.sum();

    for (const auto& contract : symbol.contracts) {
        ++outcome.considered;

        // Structural filter
        auto tte = contract.time_to_expiry(asof, ExpiryPolicy::TreatAsExpired);
        const auto& quote = contract.quote();
        const bool otm = !is_in_the_money(spot, contract.strike(), wanted) &&
                         contract.strike() != spot;
        if (contract.type() != wanted || (criteria.otm_only && !otm) || !tte ||
            tte->days_to_expiry < criteria.dte_min || tte->days_to_expiry > criteria.dte_max ||
            quote.volume.value_or(0) < criteria.min_volume ||
            quote.open_interest.value_or(0) < criteria.min_open_interest) {
            ++outcome.filtered;
            continue;
        }

        // Data quality
        if (auto problem = check_quote(quote)) {
            VOLSCAN_TRACE_SCREEN_REJECTED(contract.strike(), static_cast<int>(problem->code),
                                          problem->value);
            outcome.rejected.push_back(RejectedContract{contract, *problem});
            continue;
        }

        auto analysis = analyze_single_leg(contract, Direction::Long, 1, symbol.market, asof,
                                           {}, config_.analysis);
        if (!analysis) {
            auto reason = as_data_quality(analysis.error());
            VOLSCAN_TRACE_SCREEN_REJECTED(contract.strike(), static_cast<int>(reason.code),
                                          reason.value);
            outcome.rejected.push_back(RejectedContract{contract, reason});
            continue;
        }

        const double abs_delta = std::abs(analysis->greeks.delta);
        if (abs_delta < criteria.delta_min || abs_delta > criteria.delta_max) {
            ++outcome.filtered;
            continue;
        }

        auto components = score(*analysis, criteria.screen_type, regime);
        const double total = components.sum() / weight_sum * 100.0;
        outcome.opportunities.push_back(ScoredOpportunity{
            .contract = contract,
            .analysis = std::move(*analysis),
            .score = total,
            .components = components
        });
    }

    return outcome;
}

std::expected<ScreenResult, ErrorVariant>
OpportunityScreener::screen(const std::vector<SymbolUniverse>& universe,
                            const ScreeningCriteria& criteria,
                            const std::optional<RegimeClassification>& regime,
                            const Timestamp& asof) const {
    if (auto valid = validate_screening_criteria(criteria); !valid) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_SCREENER, static_cast<int>(valid.error().code),
                                       valid.error().value, valid.error().bound);
        return std::unexpected(valid.error());
    }
    for (size_t i = 0; i < universe.size(); ++i) {
        const auto& m = universe[i].market;
        auto valid = validate_option_spec(OptionSpec{
            .spot = m.spot, .strike = 1.0, .maturity = 0.0,
            .rate = m.rate, .dividend_yield = m.dividend_yield});
        if (!valid) {
            auto err = valid.error();
            err.index = i;
            return std::unexpected(err);
        }
    }

    ScreeningCriteria effective = criteria;
    if (criteria.regime_aware && regime) {
        effective = adjust_for_regime(criteria, *regime, config_.adjustments);
    }

    VOLSCAN_TRACE_ALGO_START(MODULE_SCREENER, universe.size(), effective.delta_min,
                             effective.delta_max);

    // Fan out per symbol; each iteration writes only its own slot
    std::vector<SymbolOutcome> outcomes(universe.size());
    VOLSCAN_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < universe.size(); ++i) {
        outcomes[i] = screen_symbol(universe[i], effective, regime, asof);
    }

    ScreenResult result;
    result.effective_criteria = effective;
    for (auto& outcome : outcomes) {
        result.considered += outcome.considered;
        result.filtered += outcome.filtered;
        std::move(outcome.opportunities.begin(), outcome.opportunities.end(),
                  std::back_inserter(result.opportunities));
        std::move(outcome.rejected.begin(), outcome.rejected.end(),
                  std::back_inserter(result.rejected));
    }

    const double target_delta = 0.5 * (effective.delta_min + effective.delta_max);
    auto rank_key = [target_delta](const ScoredOpportunity& o) {
        return std::make_tuple(
            -o.score,
            -o.contract.quote().open_interest.value_or(0),
            std::abs(std::abs(o.analysis.greeks.delta) - target_delta),
            std::cref(o.contract.underlying()),
            o.contract.expiration_time(),
            o.contract.strike());
    };
    std::sort(result.opportunities.begin(), result.opportunities.end(),
              [&rank_key](const ScoredOpportunity& a, const ScoredOpportunity& b) {
                  return rank_key(a) < rank_key(b);
              });

    if (result.opportunities.size() > effective.top_n) {
        result.opportunities.erase(result.opportunities.begin() + effective.top_n,
                                   result.opportunities.end());
    }

    auto& summary = result.summary;
    summary.count = result.opportunities.size();
    if (summary.count > 0) {
        for (const auto& o : result.opportunities) {
            summary.average_score += o.score;
            summary.average_probability += o.analysis.probability_of_profit;
            summary.average_delta += o.analysis.greeks.delta;
        }
        const double n = static_cast<double>(summary.count);
        summary.average_score /= n;
        summary.average_probability /= n;
        summary.average_delta /= n;
    }

    VOLSCAN_TRACE_ALGO_COMPLETE(MODULE_SCREENER, result.considered, summary.count);
    return result;
}

}  // namespace volscan
