// SPDX-License-Identifier: MIT
/**
 * @file regime_classifier.hpp
 * @brief Volatility-regime classification from a volatility index and its history
 *
 * Maps the current index level (e.g. VIX) and a historical sample window to
 * one of four ordered regimes. Classification is a pure function of
 * (current level, history, config) and is monotonic in the current level:
 * a higher reading never maps to a calmer regime.
 */

#pragma once

#include "volscan/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace volscan {

/// Ordered volatility regimes (calmest first)
enum class VolatilityRegime {
    Low,
    Normal,
    Elevated,
    High
};

/// Risk level attached to each regime
enum class RiskLevel {
    Low,
    Moderate,
    High,
    VeryHigh
};

/// What the thresholds are compared against
enum class RegimeMode {
    Percentile,     ///< Percentile rank of the current level within the history
    AbsoluteLevel   ///< Raw index level
};

/// Lower edges of the Normal, Elevated and High regimes
///
/// Values below normal_from are Low. Must be strictly increasing.
struct RegimeThresholds {
    double normal_from;
    double elevated_from;
    double high_from;
};

/// Classifier configuration
struct RegimeConfig {
    RegimeMode mode = RegimeMode::Percentile;
    RegimeThresholds percentile_thresholds{.normal_from = 25.0, .elevated_from = 60.0, .high_from = 85.0};
    RegimeThresholds level_thresholds{.normal_from = 15.0, .elevated_from = 20.0, .high_from = 30.0};
    size_t trend_window = 5;  ///< Samples spanned by the recent change
};

/// Summary statistics of the historical window
struct HistoryStatistics {
    double mean;
    double stddev;        ///< Sample standard deviation (0 for one sample)
    double min;
    double max;
    size_t sample_count;
    double change;        ///< Current level minus the level trend_window samples back
    double change_pct;    ///< change relative to that level, in percent (0 if it was 0)
};

/// Result of a classification
struct RegimeClassification {
    double current_level;
    double percentile;                      ///< 0-100, share of samples ≤ current
    VolatilityRegime regime;
    RiskLevel risk_level;
    std::string description;
    std::string trading_implication;        ///< One-line summary
    std::vector<std::string> implications;  ///< Detailed bullets
    HistoryStatistics history;
};

/// "low", "normal", "elevated", "high"
std::string_view regime_name(VolatilityRegime regime);

/// "low", "moderate", "high", "very_high"
std::string_view risk_level_name(RiskLevel level);

/// Validate classifier configuration
std::expected<void, ConfigurationError> validate_regime_config(const RegimeConfig& config);

/// Percentile rank of `level` within `history` (share of samples ≤ level, 0-100)
double percentile_rank(double level, std::span<const double> history);

/// Volatility-regime classifier
///
/// Stateless after construction; classify() may be called concurrently.
class RegimeClassifier {
public:
    /// Factory with configuration validation
    static std::expected<RegimeClassifier, ConfigurationError>
    create(const RegimeConfig& config = {});

    /// Classify the current reading against a historical window
    ///
    /// @return RegimeClassification, or ValidationError for an empty history
    ///         (EmptyHistory) or a non-finite value (NonFiniteHistory, index
    ///         of the offending sample)
    std::expected<RegimeClassification, ValidationError>
    classify(double current_level, std::span<const double> history) const;

    const RegimeConfig& config() const { return config_; }

private:
    explicit RegimeClassifier(const RegimeConfig& config);

    RegimeConfig config_;
};

}  // namespace volscan
