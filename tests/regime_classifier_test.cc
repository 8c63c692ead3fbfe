// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/regime/regime_classifier.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace volscan;

namespace {

/// 1, 2, ..., n
std::vector<double> ramp(size_t n) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = static_cast<double>(i + 1);
    }
    return v;
}

}  // namespace

TEST(RegimeClassifierTest, PercentileRank) {
    auto history = ramp(100);
    EXPECT_DOUBLE_EQ(percentile_rank(0.5, history), 0.0);
    EXPECT_DOUBLE_EQ(percentile_rank(50.0, history), 50.0);
    EXPECT_DOUBLE_EQ(percentile_rank(100.0, history), 100.0);
    EXPECT_DOUBLE_EQ(percentile_rank(1e6, history), 100.0);
}

TEST(RegimeClassifierTest, PercentileRankCountsTies) {
    std::vector<double> history{15.0, 15.0, 15.0, 20.0};
    EXPECT_DOUBLE_EQ(percentile_rank(15.0, history), 75.0);
}

TEST(RegimeClassifierTest, DefaultPercentileThresholds) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());
    auto history = ramp(100);

    auto low = classifier->classify(10.0, history);
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->regime, VolatilityRegime::Low);
    EXPECT_EQ(low->risk_level, RiskLevel::Low);

    // Percentile equal to a lower edge belongs to the higher regime
    auto normal = classifier->classify(25.0, history);
    ASSERT_TRUE(normal.has_value());
    EXPECT_EQ(normal->regime, VolatilityRegime::Normal);
    EXPECT_EQ(normal->risk_level, RiskLevel::Moderate);

    auto elevated = classifier->classify(70.0, history);
    ASSERT_TRUE(elevated.has_value());
    EXPECT_EQ(elevated->regime, VolatilityRegime::Elevated);

    auto high = classifier->classify(90.0, history);
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->regime, VolatilityRegime::High);
    EXPECT_EQ(high->risk_level, RiskLevel::VeryHigh);
    EXPECT_FALSE(high->implications.empty());
    EXPECT_FALSE(high->trading_implication.empty());
}

TEST(RegimeClassifierTest, MonotonicInCurrentLevel) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());
    std::vector<double> history{12.1, 13.4, 18.0, 14.2, 22.5, 16.8, 35.0, 19.9, 11.0, 15.5};

    int previous = -1;
    for (double level = 5.0; level <= 45.0; level += 0.25) {
        auto result = classifier->classify(level, history);
        ASSERT_TRUE(result.has_value());
        const int rank = static_cast<int>(result->regime);
        EXPECT_GE(rank, previous) << "level " << level;
        previous = rank;
    }
}

TEST(RegimeClassifierTest, AbsoluteLevelMode) {
    RegimeConfig config;
    config.mode = RegimeMode::AbsoluteLevel;
    auto classifier = RegimeClassifier::create(config);
    ASSERT_TRUE(classifier.has_value());

    // History is irrelevant to the regime in this mode
    std::vector<double> history{50.0, 60.0, 70.0};
    EXPECT_EQ(classifier->classify(12.0, history)->regime, VolatilityRegime::Low);
    EXPECT_EQ(classifier->classify(15.0, history)->regime, VolatilityRegime::Normal);
    EXPECT_EQ(classifier->classify(25.0, history)->regime, VolatilityRegime::Elevated);
    EXPECT_EQ(classifier->classify(30.0, history)->regime, VolatilityRegime::High);
    EXPECT_DOUBLE_EQ(classifier->classify(25.0, history)->percentile, 0.0);
}

TEST(RegimeClassifierTest, HistoryStatistics) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());
    std::vector<double> history{10.0, 12.0, 14.0, 16.0, 18.0, 20.0};

    auto result = classifier->classify(20.0, history);
    ASSERT_TRUE(result.has_value());
    const auto& h = result->history;
    EXPECT_DOUBLE_EQ(h.mean, 15.0);
    EXPECT_NEAR(h.stddev, std::sqrt(14.0), 1e-12);
    EXPECT_DOUBLE_EQ(h.min, 10.0);
    EXPECT_DOUBLE_EQ(h.max, 20.0);
    EXPECT_EQ(h.sample_count, 6);
    // trend_window = 5: compared against history[1]
    EXPECT_DOUBLE_EQ(h.change, 8.0);
    EXPECT_NEAR(h.change_pct, 8.0 / 12.0 * 100.0, 1e-12);
}

TEST(RegimeClassifierTest, SingleSampleHistory) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());
    std::vector<double> history{18.0};

    auto result = classifier->classify(18.0, history);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->percentile, 100.0);
    EXPECT_EQ(result->regime, VolatilityRegime::High);
    EXPECT_DOUBLE_EQ(result->history.stddev, 0.0);
    EXPECT_DOUBLE_EQ(result->history.change, 0.0);
}

TEST(RegimeClassifierTest, RejectsEmptyHistory) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());

    auto result = classifier->classify(20.0, std::span<const double>{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::EmptyHistory);
}

TEST(RegimeClassifierTest, RejectsNonFiniteSample) {
    auto classifier = RegimeClassifier::create();
    ASSERT_TRUE(classifier.has_value());
    std::vector<double> history{14.0, 15.0, std::numeric_limits<double>::quiet_NaN(), 16.0};

    auto result = classifier->classify(20.0, history);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::NonFiniteHistory);
    EXPECT_EQ(result.error().index, 2);

    auto inf_level = classifier->classify(std::numeric_limits<double>::infinity(), ramp(10));
    ASSERT_FALSE(inf_level.has_value());
    EXPECT_EQ(inf_level.error().code, ValidationErrorCode::NonFiniteHistory);
}

TEST(RegimeClassifierTest, RejectsBadThresholds) {
    RegimeConfig unordered;
    unordered.percentile_thresholds = {.normal_from = 60.0, .elevated_from = 25.0, .high_from = 85.0};
    auto r1 = RegimeClassifier::create(unordered);
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, ConfigurationErrorCode::InvalidRegimeThresholds);

    RegimeConfig out_of_range;
    out_of_range.percentile_thresholds = {.normal_from = 25.0, .elevated_from = 60.0, .high_from = 120.0};
    EXPECT_FALSE(RegimeClassifier::create(out_of_range).has_value());

    RegimeConfig zero_window;
    zero_window.trend_window = 0;
    EXPECT_FALSE(RegimeClassifier::create(zero_window).has_value());
}

TEST(RegimeClassifierTest, Names) {
    EXPECT_EQ(regime_name(VolatilityRegime::Elevated), "elevated");
    EXPECT_EQ(risk_level_name(RiskLevel::VeryHigh), "very_high");
}
