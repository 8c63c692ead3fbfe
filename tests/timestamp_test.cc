// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "volscan/option/timestamp.hpp"
#include <chrono>

using namespace volscan;

TEST(TimestampTest, ConstructFromISODate) {
    Timestamp ts{"2024-06-21"};
    auto tp = ts.to_timepoint();
    ASSERT_TRUE(tp.has_value());
    // Midnight UTC
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count(),
              1718928000);
}

TEST(TimestampTest, CompactMatchesISO) {
    Timestamp compact{"20240621", TimestampFormat::Compact};
    Timestamp iso{"2024-06-21"};
    ASSERT_TRUE(compact.to_timepoint().has_value());
    EXPECT_EQ(*compact.to_timepoint(), *iso.to_timepoint());
}

TEST(TimestampTest, NanosecondsMatchISO) {
    uint64_t nanos = 1718928000000000000ULL;
    Timestamp ts{nanos};
    EXPECT_EQ(*ts.to_timepoint(), *Timestamp{"2024-06-21"}.to_timepoint());
}

TEST(TimestampTest, ConstructFromISO8601WithTime) {
    Timestamp ts{"2024-06-21T10:30:00"};
    ASSERT_TRUE(ts.to_timepoint().has_value());
}

TEST(TimestampTest, MalformedStringsFail) {
    EXPECT_FALSE(Timestamp{"not a date"}.to_timepoint().has_value());
    EXPECT_FALSE((Timestamp{"2024062", TimestampFormat::Compact}.to_timepoint().has_value()));
}

TEST(TimestampTest, ComputeTauToExpiry) {
    Timestamp asof{"2024-06-21T10:30:00"};
    Timestamp expiry{"2024-06-21T16:00:00"};

    auto tau = compute_tau(asof, expiry);
    ASSERT_TRUE(tau.has_value());
    EXPECT_NEAR(*tau, 5.5 / (365.0 * 24.0), 1e-9);
}

TEST(TimestampTest, DaysBetweenIsSigned) {
    auto forward = days_between(Timestamp{"2024-01-01"}, Timestamp{"2024-03-01"});
    ASSERT_TRUE(forward.has_value());
    EXPECT_DOUBLE_EQ(*forward, 60.0);  // Leap year

    auto backward = days_between(Timestamp{"2024-03-01"}, Timestamp{"2024-01-01"});
    ASSERT_TRUE(backward.has_value());
    EXPECT_DOUBLE_EQ(*backward, -60.0);
}

TEST(TimestampTest, DaysBetweenPropagatesParseErrors) {
    EXPECT_FALSE(days_between(Timestamp{"garbage"}, Timestamp{"2024-01-01"}).has_value());
}

TEST(TimestampTest, ToStringIsISO) {
    EXPECT_EQ(Timestamp{uint64_t{1718928000000000000ULL}}.to_string(), "2024-06-21T00:00:00Z");
}
