// SPDX-License-Identifier: MIT
/**
 * @file contract.hpp
 * @brief Listed option contract with its market quote
 */

#pragma once

#include "volscan/option/option_spec.hpp"
#include "volscan/option/timestamp.hpp"
#include "volscan/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace volscan {

/// Market quote attached to a contract
///
/// All fields are optional since data sources may not provide
/// complete information.
struct Quote {
    // Price data - at least one should be present for premium/IV
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;

    // Volume data - often missing for illiquid options
    std::optional<int64_t> volume;
    std::optional<int64_t> open_interest;

    /// Source-provided implied volatility (decimal)
    std::optional<double> implied_vol;

    /// Mid price if both bid and ask are present and positive
    [[nodiscard]] std::optional<double> mid() const {
        if (bid && ask && *bid > 0.0 && *ask > 0.0) {
            return 0.5 * (*bid + *ask);
        }
        return std::nullopt;
    }

    /// Best available premium per share
    /// Priority: mid > last (if positive)
    [[nodiscard]] std::optional<double> premium() const {
        if (auto m = mid()) {
            return m;
        }
        if (last && *last > 0.0) {
            return last;
        }
        return std::nullopt;
    }
};

/// How an expiration earlier than `asof` is treated
enum class ExpiryPolicy {
    Reject,          ///< ValidationError (ExpiredContract)
    TreatAsExpired   ///< Clamp time to expiry to zero
};

/// Time remaining until expiration, derived from `asof`
struct TimeToExpiry {
    double years = 0.0;      ///< days / 365, never negative
    double days = 0.0;       ///< Fractional calendar days, never negative
    int days_to_expiry = 0;  ///< Whole calendar days (DTE)
};

/// Immutable option contract plus the quote it was observed with
///
/// Built through create(), which validates the strike and expiration.
class Contract {
public:
    /// Factory with validation
    ///
    /// @return Contract, or ValidationError (InvalidStrike, InvalidTimestamp)
    static std::expected<Contract, ValidationError>
    create(std::string underlying, double strike, Timestamp expiration,
           OptionType type, Quote quote = {});

    const std::string& underlying() const { return underlying_; }
    double strike() const { return strike_; }
    const Timestamp& expiration() const { return expiration_; }
    Timestamp::TimePoint expiration_time() const { return expiration_tp_; }
    OptionType type() const { return type_; }
    const Quote& quote() const { return quote_; }

    /// Time to expiry relative to `asof`
    ///
    /// Expirations before `asof` are rejected under ExpiryPolicy::Reject and
    /// clamped to zero under ExpiryPolicy::TreatAsExpired.
    std::expected<TimeToExpiry, ValidationError>
    time_to_expiry(const Timestamp& asof, ExpiryPolicy policy = ExpiryPolicy::Reject) const;

    /// Same contract with a different quote
    Contract with_quote(Quote quote) const;

private:
    Contract(std::string underlying, double strike, Timestamp expiration,
             Timestamp::TimePoint expiration_tp, OptionType type, Quote quote);

    std::string underlying_;
    double strike_;
    Timestamp expiration_;
    Timestamp::TimePoint expiration_tp_;
    OptionType type_;
    Quote quote_;
};

}  // namespace volscan
