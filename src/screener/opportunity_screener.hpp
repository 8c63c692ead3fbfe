// SPDX-License-Identifier: MIT
/**
 * @file opportunity_screener.hpp
 * @brief Regime-aware, multi-factor screening of long option opportunities
 *
 * Pipeline per contract:
 * 1. Regime adjustment of the criteria (once per screen)
 * 2. Structural filter: type, OTM, DTE band, volume, open interest
 * 3. Data quality: usable premium and some sign of liquidity
 * 4. Single-leg analysis as a long position, then the |delta| band
 * 5. Five weighted sub-scores (liquidity, probability, risk/reward,
 *    time value, macro) normalized to 0-100
 *
 * Symbols are screened independently (OpenMP fan-out) and the merged list
 * is sorted with a total order, so results do not depend on thread timing.
 */

#pragma once

#include "volscan/analysis/single_leg.hpp"
#include "volscan/option/contract.hpp"
#include "volscan/regime/regime_classifier.hpp"
#include "volscan/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace volscan {

/// Which side of the chain is screened
enum class ScreenType {
    OtmCalls,
    OtmPuts
};

/// Structural screening criteria
struct ScreeningCriteria {
    ScreenType screen_type = ScreenType::OtmCalls;
    double delta_min = 0.20;          ///< |delta| lower bound
    double delta_max = 0.45;          ///< |delta| upper bound
    int dte_min = 14;
    int dte_max = 60;
    int64_t min_volume = 100;
    int64_t min_open_interest = 100;
    bool regime_aware = true;         ///< Apply RegimeAdjustmentTable when a regime is supplied
    size_t top_n = 20;
    bool otm_only = true;
};

/// Maximum points of each sub-score
///
/// Policy constants: tune freely. Totals are normalized by their sum, so
/// the composite score stays on a 0-100 scale.
struct ScoreWeights {
    double liquidity = 20.0;
    double probability = 25.0;
    double risk_reward = 20.0;
    double time_value = 15.0;
    double macro = 20.0;

    double sum() const { return liquidity + probability + risk_reward + time_value + macro; }
};

/// Band shift applied in one regime
struct RegimeAdjustment {
    double delta_min_shift;
    double delta_max_shift;
    double dte_max_scale;  ///< Multiplies the DTE ceiling
};

/// Band shifts per regime
struct RegimeAdjustmentTable {
    RegimeAdjustment low{.delta_min_shift = -0.05, .delta_max_shift = 0.0, .dte_max_scale = 1.0};
    RegimeAdjustment normal{.delta_min_shift = 0.0, .delta_max_shift = 0.0, .dte_max_scale = 1.0};
    RegimeAdjustment elevated{.delta_min_shift = 0.05, .delta_max_shift = 0.05, .dte_max_scale = 0.85};
    RegimeAdjustment high{.delta_min_shift = 0.10, .delta_max_shift = 0.10, .dte_max_scale = 0.75};

    const RegimeAdjustment& for_regime(VolatilityRegime regime) const;
};

/// Screener configuration
struct ScreenerConfig {
    ScoreWeights weights;
    RegimeAdjustmentTable adjustments;
    AnalysisConfig analysis;  ///< Expiry policy is forced to TreatAsExpired
};

/// Contracts and market inputs for one underlying
struct SymbolUniverse {
    std::string symbol;
    MarketInputs market;
    std::vector<Contract> contracts;
};

/// Sub-scores, each on the scale of its weight
struct ScoreBreakdown {
    double liquidity = 0.0;
    double probability = 0.0;
    double risk_reward = 0.0;
    double time_value = 0.0;
    double macro = 0.0;

    double sum() const { return liquidity + probability + risk_reward + time_value + macro; }
};

/// A ranked candidate
struct ScoredOpportunity {
    Contract contract;
    SingleLegAnalysis analysis;
    double score;               ///< 0-100
    ScoreBreakdown components;
};

/// Contract dropped for data quality
struct RejectedContract {
    Contract contract;
    DataQualityError reason;
};

/// Aggregate statistics of the returned opportunities
struct ScreenSummary {
    size_t count = 0;
    double average_score = 0.0;
    double average_probability = 0.0;
    double average_delta = 0.0;
};

/// Screening output
struct ScreenResult {
    std::vector<ScoredOpportunity> opportunities;  ///< Ranked, at most top_n
    ScreeningCriteria effective_criteria;          ///< After regime adjustment
    size_t considered = 0;                         ///< Contracts examined
    size_t filtered = 0;                           ///< Dropped by structural filters
    std::vector<RejectedContract> rejected;        ///< Dropped for data quality
    ScreenSummary summary;
};

/// Validate screening criteria
std::expected<void, ConfigurationError> validate_screening_criteria(const ScreeningCriteria& criteria);

/// Validate score weights (finite, non-negative, positive sum)
std::expected<void, ConfigurationError> validate_score_weights(const ScoreWeights& weights);

/// Shift the delta band and shorten the DTE ceiling for a regime
///
/// The result is clamped to [0, 1] with delta_min ≤ delta_max and
/// dte_min ≤ dte_max.
ScreeningCriteria adjust_for_regime(const ScreeningCriteria& criteria,
                                    const RegimeClassification& regime,
                                    const RegimeAdjustmentTable& table);

/// Multi-factor opportunity screener
class OpportunityScreener {
public:
    /// Factory with configuration validation
    static std::expected<OpportunityScreener, ConfigurationError>
    create(const ScreenerConfig& config = {});

    /// Screen a universe
    ///
    /// @return ScreenResult, or an ErrorVariant holding a ConfigurationError
    ///         (bad criteria) or ValidationError (bad market inputs for a symbol)
    std::expected<ScreenResult, ErrorVariant>
    screen(const std::vector<SymbolUniverse>& universe, const ScreeningCriteria& criteria,
           const std::optional<RegimeClassification>& regime, const Timestamp& asof) const;

    /// Score one analyzed long position
    ScoreBreakdown score(const SingleLegAnalysis& analysis, ScreenType screen_type,
                         const std::optional<RegimeClassification>& regime) const;

    const ScreenerConfig& config() const { return config_; }

private:
    explicit OpportunityScreener(const ScreenerConfig& config);

    struct SymbolOutcome {
        std::vector<ScoredOpportunity> opportunities;
        std::vector<RejectedContract> rejected;
        size_t considered = 0;
        size_t filtered = 0;
    };

    SymbolOutcome screen_symbol(const SymbolUniverse& symbol, const ScreeningCriteria& criteria,
                                const std::optional<RegimeClassification>& regime,
                                const Timestamp& asof) const;

    ScreenerConfig config_;
};

}  // namespace volscan
