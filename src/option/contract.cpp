// SPDX-License-Identifier: MIT
#include "volscan/option/contract.hpp"
#include "volscan/support/volscan_trace.h"
#include <cmath>
#include <utility>

namespace volscan {

Contract::Contract(std::string underlying, double strike, Timestamp expiration,
                   Timestamp::TimePoint expiration_tp, OptionType type, Quote quote)
    : underlying_(std::move(underlying))
    , strike_(strike)
    , expiration_(std::move(expiration))
    , expiration_tp_(expiration_tp)
    , type_(type)
    , quote_(std::move(quote))
{}

std::expected<Contract, ValidationError>
Contract::create(std::string underlying, double strike, Timestamp expiration,
                 OptionType type, Quote quote) {
    if (strike <= 0.0 || !std::isfinite(strike)) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::InvalidStrike), strike, 0.0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrike, strike));
    }

    auto tp = expiration.to_timepoint();
    if (!tp) {
        VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
            static_cast<int>(ValidationErrorCode::InvalidTimestamp), strike, 0.0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTimestamp, strike));
    }

    return Contract(std::move(underlying), strike, std::move(expiration), *tp, type,
                    std::move(quote));
}

std::expected<TimeToExpiry, ValidationError>
Contract::time_to_expiry(const Timestamp& asof, ExpiryPolicy policy) const {
    auto asof_tp = asof.to_timepoint();
    if (!asof_tp) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTimestamp));
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        expiration_tp_ - *asof_tp).count();
    double days = static_cast<double>(seconds) / 86400.0;

    if (days < 0.0) {
        if (policy == ExpiryPolicy::Reject) {
            VOLSCAN_TRACE_VALIDATION_ERROR(MODULE_VALIDATION,
                static_cast<int>(ValidationErrorCode::ExpiredContract), days, strike_);
            return std::unexpected(ValidationError(ValidationErrorCode::ExpiredContract, days));
        }
        days = 0.0;
    }

    return TimeToExpiry{
        .years = days / 365.0,
        .days = days,
        .days_to_expiry = static_cast<int>(std::floor(days))
    };
}

Contract Contract::with_quote(Quote quote) const {
    return Contract(underlying_, strike_, expiration_, expiration_tp_, type_, std::move(quote));
}

}  // namespace volscan
