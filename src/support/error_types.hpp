// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string>
#include <variant>

namespace volscan {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidStrike,
    InvalidSpotPrice,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidDividend,
    InvalidMarketPrice,
    ArbitrageViolation,
    InvalidQuantity,
    InvalidPremium,
    ExpiredContract,
    InvalidTimestamp,
    EmptyStrategy,
    MismatchedUnderlying,
    MismatchedExpiration,
    InvalidLegStructure,
    InsufficientShares,
    EmptyHistory,
    NonFiniteHistory,
    MissingVolatility
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Leg or sample index where applicable (0 otherwise)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for invalid caller configuration (screening bands, weights, thresholds)
enum class ConfigurationErrorCode {
    InvertedDeltaBand,
    DeltaOutOfRange,
    InvertedExpiryBand,
    NegativeLiquidityThreshold,
    InvalidTopN,
    InvalidScoreWeights,
    InvalidRegimeThresholds,
    InvalidSolverBounds,
    InvalidTolerance,
    InvalidIterationCap,
    InvalidPayoffGrid,
    InvalidContractMultiplier
};

/// Detailed configuration error
struct ConfigurationError {
    ConfigurationErrorCode code;
    double value;  // Offending value (e.g. band minimum)
    double bound;  // Value it was checked against (e.g. band maximum)

    ConfigurationError(ConfigurationErrorCode code,
                       double value = 0.0,
                       double bound = 0.0)
        : code(code), value(value), bound(bound) {}
};

/// Per-contract data problems; the screener drops the contract and keeps going
enum class DataQualityErrorCode {
    MissingPremium,
    NoLiquidity,
    MissingVolatility,
    ImpliedVolNotConverged,
    InvalidQuote
};

/// Detailed data-quality error
struct DataQualityError {
    DataQualityErrorCode code;
    double value = 0.0;  // Offending quote field where applicable
};

/// Combined error type used at the facade boundary
using ErrorVariant = std::variant<
    ValidationError,
    ConfigurationError,
    DataQualityError,
    std::string  // Collaborator (provider) failure message
>;

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return -1;  // Generic string error
        } else {
            return static_cast<int>(e.code);
        }
    }, error);
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for ConfigurationError
inline std::ostream& operator<<(std::ostream& os, const ConfigurationError& err) {
    os << "ConfigurationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", bound=" << err.bound << "}";
    return os;
}

/// Output stream operator for DataQualityError
inline std::ostream& operator<<(std::ostream& os, const DataQualityError& err) {
    os << "DataQualityError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for ErrorVariant
inline std::ostream& operator<<(std::ostream& os, const ErrorVariant& err) {
    std::visit([&os](const auto& e) { os << e; }, err);
    return os;
}

} // namespace volscan
