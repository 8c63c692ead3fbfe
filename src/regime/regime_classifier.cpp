// SPDX-License-Identifier: MIT
#include "volscan/regime/regime_classifier.hpp"
#include "volscan/support/volscan_trace.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace volscan {

namespace {

struct RegimeProfile {
    RiskLevel risk_level;
    const char* description;
    const char* trading_implication;
    std::vector<std::string> implications;
};

RegimeProfile regime_profile(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::Low:
            return {RiskLevel::Low,
                    "Low volatility environment - complacent market",
                    "Options are cheap: favor premium selling and stay alert for volatility spikes",
                    {"Favorable for selling premium (covered calls, cash-secured puts)",
                     "Consider calendar spreads to benefit from time decay",
                     "Be cautious of sudden volatility spikes",
                     "Earnings plays may offer better premium opportunities"}};
        case VolatilityRegime::Normal:
            return {RiskLevel::Moderate,
                    "Normal volatility - balanced market conditions",
                    "Balanced pricing: directional plays with defined risk work well",
                    {"Good environment for directional plays with defined risk",
                     "Bull call spreads and bear put spreads work well",
                     "Consider iron condors if expecting range-bound movement",
                     "Both buying and selling premium viable"}};
        case VolatilityRegime::Elevated:
            return {RiskLevel::High,
                    "Elevated volatility - increased uncertainty",
                    "Rich premiums with larger swings: sell premium selectively with defined risk",
                    {"Premium selling more profitable but riskier",
                     "Use wider spreads for defined-risk strategies",
                     "Be selective with naked positions",
                     "Consider ratio spreads to reduce net cost"}};
        case VolatilityRegime::High:
            return {RiskLevel::VeryHigh,
                    "High volatility - fearful market, major uncertainty",
                    "Fearful market: use defined-risk structures and avoid naked short options",
                    {"Favor defined-risk strategies (spreads, butterflies)",
                     "Avoid naked short options - risk is elevated",
                     "Look for mean reversion opportunities",
                     "Consider longer-dated options to avoid extreme theta decay",
                     "Volatility may contract - selling premium profitable if timed well"}};
    }
    return {RiskLevel::Moderate, "", "", {}};
}

std::expected<void, ConfigurationError> check_thresholds(const RegimeThresholds& t,
                                                         double lo, double hi) {
    const bool increasing = t.normal_from < t.elevated_from && t.elevated_from < t.high_from;
    if (!increasing || !(t.normal_from >= lo) || !(t.high_from <= hi)) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidRegimeThresholds, t.normal_from, t.high_from));
    }
    return {};
}

HistoryStatistics history_statistics(double current, std::span<const double> history,
                                     size_t trend_window) {
    const size_t n = history.size();
    const double mean = std::accumulate(history.begin(), history.end(), 0.0) / n;

    double sq = 0.0;
    for (double x : history) {
        sq += (x - mean) * (x - mean);
    }
    const double stddev = n > 1 ? std::sqrt(sq / static_cast<double>(n - 1)) : 0.0;

    auto [min_it, max_it] = std::minmax_element(history.begin(), history.end());

    const double reference = history[n - std::min(trend_window, n)];
    const double change = current - reference;

    return HistoryStatistics{
        .mean = mean,
        .stddev = stddev,
        .min = *min_it,
        .max = *max_it,
        .sample_count = n,
        .change = change,
        .change_pct = reference != 0.0 ? change / reference * 100.0 : 0.0
    };
}

}  // namespace

std::string_view regime_name(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::Low:      return "low";
        case VolatilityRegime::Normal:   return "normal";
        case VolatilityRegime::Elevated: return "elevated";
        case VolatilityRegime::High:     return "high";
    }
    return "unknown";
}

std::string_view risk_level_name(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:      return "low";
        case RiskLevel::Moderate: return "moderate";
        case RiskLevel::High:     return "high";
        case RiskLevel::VeryHigh: return "very_high";
    }
    return "unknown";
}

std::expected<void, ConfigurationError> validate_regime_config(const RegimeConfig& config) {
    if (config.trend_window == 0) {
        return std::unexpected(ConfigurationError(
            ConfigurationErrorCode::InvalidRegimeThresholds, 0.0));
    }
    return check_thresholds(config.percentile_thresholds, 0.0, 100.0)
        .and_then([&] {
            return check_thresholds(config.level_thresholds, 0.0,
                                    std::numeric_limits<double>::max());
        });
}

double percentile_rank(double level, std::span<const double> history) {
    if (history.empty()) {
        return 0.0;
    }
    const auto at_or_below = std::count_if(history.begin(), history.end(),
                                           [level](double x) { return x <= level; });
    return static_cast<double>(at_or_below) / static_cast<double>(history.size()) * 100.0;
}

RegimeClassifier::RegimeClassifier(const RegimeConfig& config)
    : config_(config) {}

std::expected<RegimeClassifier, ConfigurationError>
RegimeClassifier::create(const RegimeConfig& config) {
    auto validation = validate_regime_config(config);
    if (!validation) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_REGIME, static_cast<int>(validation.error().code),
                                       validation.error().value, validation.error().bound);
        return std::unexpected(validation.error());
    }
    return RegimeClassifier(config);
}

std::expected<RegimeClassification, ValidationError>
RegimeClassifier::classify(double current_level, std::span<const double> history) const {
    if (history.empty()) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_REGIME,
            static_cast<int>(ValidationErrorCode::EmptyHistory), current_level, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::EmptyHistory, current_level));
    }
    if (!std::isfinite(current_level)) {
        return std::unexpected(ValidationError(ValidationErrorCode::NonFiniteHistory, current_level));
    }
    for (size_t i = 0; i < history.size(); ++i) {
        if (!std::isfinite(history[i])) {
            VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_REGIME,
                static_cast<int>(ValidationErrorCode::NonFiniteHistory), history[i], i);
            return std::unexpected(ValidationError(ValidationErrorCode::NonFiniteHistory,
                                                   history[i], i));
        }
    }

    const double percentile = percentile_rank(current_level, history);

    const bool by_percentile = config_.mode == RegimeMode::Percentile;
    const RegimeThresholds& t = by_percentile ? config_.percentile_thresholds
                                              : config_.level_thresholds;
    const double x = by_percentile ? percentile : current_level;

    VolatilityRegime regime = VolatilityRegime::High;
    if (x < t.normal_from) {
        regime = VolatilityRegime::Low;
    } else if (x < t.elevated_from) {
        regime = VolatilityRegime::Normal;
    } else if (x < t.high_from) {
        regime = VolatilityRegime::Elevated;
    }

    VOLSCAN_TRACE_REGIME_CLASSIFIED(current_level, percentile, static_cast<int>(regime));

    auto profile = regime_profile(regime);
    return RegimeClassification{
        .current_level = current_level,
        .percentile = percentile,
        .regime = regime,
        .risk_level = profile.risk_level,
        .description = profile.description,
        .trading_implication = profile.trading_implication,
        .implications = std::move(profile.implications),
        .history = history_statistics(current_level, history, config_.trend_window)
    };
}

}  // namespace volscan
