// SPDX-License-Identifier: MIT
/**
 * @file converter.hpp
 * @brief Type-safe converter traits for data sources
 */

#pragma once

#include "volscan/option/contract.hpp"
#include "volscan/option/option_spec.hpp"
#include "volscan/option/timestamp.hpp"
#include <concepts>
#include <stdexcept>
#include <string>

namespace volscan::simple {

// Source tag types
struct YFinanceSource {};

/// Conversion error exception
class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Converter trait - must be specialized for each source
template<typename Source>
struct Converter;

/// Concept for valid converter
template<typename T>
concept ValidConverter = requires {
    typename T::RawOption;
    { T::to_option_type(std::declval<const std::string&>()) } -> std::same_as<volscan::OptionType>;
    { T::to_timestamp(std::declval<const std::string&>()) } -> std::same_as<Timestamp>;
    { T::to_contract(std::declval<const std::string&>(),
                     std::declval<const typename T::RawOption&>()) } -> std::same_as<Contract>;
};

}  // namespace volscan::simple
