// SPDX-License-Identifier: MIT
/**
 * @file yfinance.hpp
 * @brief Converter for yfinance data format
 *
 * yfinance reports missing quotes as zeros and implied volatility as a
 * decimal; zero prices and counts become absent fields here.
 */

#pragma once

#include "volscan/simple/converter.hpp"
#include <cmath>
#include <cstdint>
#include <optional>

namespace volscan::simple {

template<>
struct Converter<YFinanceSource> {
    /// One row of a yfinance option chain
    struct RawOption {
        std::string expiry;
        std::string type;
        double strike;
        double bid;
        double ask;
        double lastPrice;
        int64_t volume;
        int64_t openInterest;
        double impliedVolatility;
    };

    static Timestamp to_timestamp(const std::string& s) {
        return Timestamp{s, TimestampFormat::ISO};
    }

    static volscan::OptionType to_option_type(const std::string& s) {
        if (s == "call" || s == "Call" || s == "CALL" || s == "C") {
            return volscan::OptionType::CALL;
        }
        if (s == "put" || s == "Put" || s == "PUT" || s == "P") {
            return volscan::OptionType::PUT;
        }
        throw ConversionError("Invalid option type: " + s);
    }

    static Quote to_quote(const RawOption& src) {
        auto price = [](double v) -> std::optional<double> {
            if (std::isfinite(v) && v > 0.0) {
                return v;
            }
            return std::nullopt;
        };
        auto count = [](int64_t v) -> std::optional<int64_t> {
            if (v > 0) {
                return v;
            }
            return std::nullopt;
        };
        return Quote{
            .bid = price(src.bid),
            .ask = price(src.ask),
            .last = price(src.lastPrice),
            .volume = count(src.volume),
            .open_interest = count(src.openInterest),
            .implied_vol = price(src.impliedVolatility)
        };
    }

    /// Convert one yfinance row to a Contract
    ///
    /// @throws ConversionError on an unknown type, bad strike or bad expiry
    static Contract to_contract(const std::string& underlying, const RawOption& src) {
        auto contract = Contract::create(underlying, src.strike, to_timestamp(src.expiry),
                                         to_option_type(src.type), to_quote(src));
        if (!contract) {
            throw ConversionError("Invalid yfinance option " + underlying + " " + src.expiry +
                                  " strike " + std::to_string(src.strike));
        }
        return std::move(*contract);
    }
};

static_assert(ValidConverter<Converter<YFinanceSource>>);

}  // namespace volscan::simple
