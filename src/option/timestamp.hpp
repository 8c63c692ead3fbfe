// SPDX-License-Identifier: MIT
/**
 * @file timestamp.hpp
 * @brief Caller-supplied timestamps and expiry arithmetic
 *
 * The library never reads the wall clock. Every time-dependent quantity is
 * derived from an explicit `asof` timestamp provided by the caller.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <variant>

namespace volscan {

/// Timestamp storage format
enum class TimestampFormat {
    ISO,          // "2024-06-21" or "2024-06-21T10:30:00"
    Compact,      // "20240621"
    Nanoseconds   // uint64_t nanoseconds since epoch
};

/// Timestamp with multiple format support
///
/// Stores timestamps in original format, converts on demand. All string
/// formats are interpreted as UTC.
class Timestamp {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /// Construct from date string
    explicit Timestamp(std::string value, TimestampFormat format = TimestampFormat::ISO)
        : value_(StringValue{std::move(value), format}) {}

    /// Construct from nanoseconds since epoch
    explicit Timestamp(uint64_t nanos)
        : value_(nanos) {}

    /// Construct from time_point
    explicit Timestamp(TimePoint tp)
        : value_(tp) {}

    /// Convert to time_point
    [[nodiscard]] std::expected<TimePoint, std::string> to_timepoint() const;

    /// Convert to string for display
    [[nodiscard]] std::string to_string() const;

private:
    struct StringValue {
        std::string str;
        TimestampFormat format;
    };

    std::variant<StringValue, uint64_t, TimePoint> value_;

    // Parse helpers
    static std::expected<TimePoint, std::string> parse_iso(const std::string& s);
    static std::expected<TimePoint, std::string> parse_compact(const std::string& s);
};

/// Signed calendar days from `from` to `to` (fractional)
///
/// @return Negative when `to` precedes `from`; error if either timestamp is unparseable
std::expected<double, std::string> days_between(const Timestamp& from, const Timestamp& to);

/// Compute time to expiry in years (calendar time basis)
///
/// Uses calendar time (365 days) for consistency with market-quoted implied
/// volatilities. The result is signed; callers decide how to treat expiries
/// in the past.
///
/// @param valuation Valuation time (`asof`)
/// @param expiry Option expiry time
/// @return Time to expiry in years
std::expected<double, std::string> compute_tau(const Timestamp& valuation, const Timestamp& expiry);

}  // namespace volscan
