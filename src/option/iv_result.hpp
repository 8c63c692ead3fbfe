// SPDX-License-Identifier: MIT
/**
 * @file iv_result.hpp
 * @brief IV solver result types for std::expected API
 */

#pragma once

#include <cstddef>
#include <vector>
#include <expected>
#include "volscan/support/error_types.hpp"

namespace volscan {

/// Which stage of the solver produced the estimate
enum class IVMethod {
    Newton,
    Bisection
};

/// Result from IV solver
///
/// Non-convergence is not an error: the best estimate is returned with
/// converged = false so callers can decide whether to trust it.
struct IVResult {
    double implied_vol;   ///< Solved (or best-estimate) implied volatility
    bool converged;       ///< |Price(σ) - Market_Price| < tolerance
    size_t iterations;    ///< Newton + bisection iterations taken
    double final_error;   ///< |Price(σ) - Market_Price|
    IVMethod method;      ///< Stage that produced implied_vol
};

/// Batch IV solver result
struct BatchIVResult {
    std::vector<std::expected<IVResult, ValidationError>> results;  ///< Individual results
    size_t failed_count;    ///< Validation failures
    size_t unconverged_count;  ///< Solved but not converged

    /// Check if every query solved and converged
    bool all_succeeded() const {
        return failed_count == 0 && unconverged_count == 0;
    }
};

}  // namespace volscan
