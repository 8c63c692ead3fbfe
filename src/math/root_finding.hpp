// SPDX-License-Identifier: MIT
#pragma once

#include "volscan/support/volscan_trace.h"
#include <cstddef>
#include <optional>
#include <string>
#include <concepts>
#include <cmath>
#include <limits>
#include <algorithm>

namespace volscan {

/// Configuration for all root-finding methods
///
/// Unified configuration allowing different methods to coexist.
/// Each method uses only its relevant parameters.
struct RootFindingConfig {
    /// Maximum iterations for any method
    size_t max_iter = 100;

    /// Absolute convergence tolerance on |f(x)|
    double tolerance = 1e-6;

    // Newton-specific parameters
    double max_step = 0.5;            ///< Largest |Δx| per Newton step (0 disables clamping)
    double min_derivative = 1e-8;     ///< |f'(x)| below this is treated as a flat region
    size_t max_divergent_steps = 3;   ///< Consecutive residual increases before giving up

    // Bisection-specific parameters
    double bracket_tolerance = 1e-12;  ///< Stop once the bracket is narrower than this
};

/// Result from any root-finding method
///
/// Provides consistent interface for convergence status,
/// iteration count, and diagnostic information.
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// Final error measure |f(root)|
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Best root estimate seen (set whenever at least one point was evaluated)
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
///
/// Works with any callable that takes a double and returns a double.
/// This includes lambdas, function objects, function pointers, and std::function.
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for derivative functions (scalar functions df: R -> R)
///
/// Same signature as ObjectiveFunction but semantically represents a derivative.
template<typename DF>
concept DerivativeFunction = requires(DF df, double x) {
    { df(x) } -> std::convertible_to<double>;
};

/// Find root using bisection
///
/// Halves [a, b] until |f(mid)| < tolerance or the bracket collapses.
/// Guaranteed to converge when f is continuous and f(a), f(b) differ in sign.
/// When the root is not bracketed, the endpoint with the smaller residual is
/// reported as the best estimate with converged = false.
///
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration (uses max_iter, tolerance, bracket_tolerance)
/// @return Result with best root estimate and convergence status
template<ObjectiveFunction F>
RootFindingResult bisect_find_root(F&& f, double a, double b,
                                   const RootFindingConfig& config) {
    VOLSCAN_TRACE_ALGO_START(MODULE_ROOT_FINDING, config.max_iter, config.tolerance, b - a);

    if (a >= b) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Invalid bounds: a must be < b",
            .root = std::nullopt
        };
    }

    double fa = f(a);
    double fb = f(b);

    // Check for NaN/Inf at endpoints (indicates invalid input or function failure)
    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Function returned non-finite value (NaN or Inf)",
            .root = std::nullopt
        };
    }

    // Check if endpoints are roots
    if (std::abs(fa) < config.tolerance || std::abs(fb) < config.tolerance) {
        const bool use_a = std::abs(fa) <= std::abs(fb);
        return RootFindingResult{
            .converged = true,
            .iterations = 0,
            .final_error = use_a ? std::abs(fa) : std::abs(fb),
            .failure_reason = std::nullopt,
            .root = use_a ? a : b
        };
    }

    // Check if root is bracketed
    if (fa * fb > 0.0) {
        const bool use_a = std::abs(fa) <= std::abs(fb);
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = use_a ? std::abs(fa) : std::abs(fb),
            .failure_reason = "Root not bracketed",
            .root = use_a ? a : b
        };
    }

    double best_x = std::abs(fa) <= std::abs(fb) ? a : b;
    double best_err = std::min(std::abs(fa), std::abs(fb));

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double mid = 0.5 * (a + b);
        const double fm = f(mid);

        if (!std::isfinite(fm)) {
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = best_err,
                .failure_reason = "Function returned non-finite value (NaN or Inf)",
                .root = best_x
            };
        }

        VOLSCAN_TRACE_CONVERGENCE_ITER(MODULE_ROOT_FINDING, iter, mid, fm);

        if (std::abs(fm) < best_err) {
            best_err = std::abs(fm);
            best_x = mid;
        }

        if (std::abs(fm) < config.tolerance) {
            VOLSCAN_TRACE_CONVERGENCE_SUCCESS(MODULE_ROOT_FINDING, iter + 1, std::abs(fm));
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(fm),
                .failure_reason = std::nullopt,
                .root = mid
            };
        }

        if (fa * fm < 0.0) {
            b = mid;
        } else {
            a = mid;
            fa = fm;
        }

        if (b - a < config.bracket_tolerance) {
            VOLSCAN_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, iter + 1, best_err);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = best_err,
                .failure_reason = "Bracket collapsed above tolerance",
                .root = best_x
            };
        }
    }

    VOLSCAN_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, config.max_iter, best_err);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = best_err,
        .failure_reason = "Max iterations reached",
        .root = best_x
    };
}

/// Find root using bounded Newton-Raphson method
///
/// Iteratively refines an initial guess using Newton's method with bounds enforcement.
/// Uses the update rule: x_{n+1} = x_n - f(x_n)/f'(x_n), with the step clamped to
/// config.max_step and the iterate clamped to [x_min, x_max].
///
/// **Properties:**
/// - Quadratic convergence when close to root (if derivative is accurate)
/// - Requires derivative information
/// - Bounds and step clamping prevent runaway iterates
///
/// **Stops without convergence when:**
/// - |f'(x)| < config.min_derivative (flat region)
/// - the residual grows for config.max_divergent_steps consecutive steps
/// - the iterate is pushed out of [x_min, x_max] on two consecutive steps
///
/// On failure the best point seen is returned in `root`, so a caller can fall
/// back to a bracketing method or accept the estimate.
///
/// @tparam F Objective function type satisfying ObjectiveFunction concept
/// @tparam DF Derivative function type satisfying DerivativeFunction concept
/// @param f Function to find root of (finds x where f(x) = 0)
/// @param df Derivative of f (df/dx)
/// @param x0 Initial guess
/// @param x_min Lower bound (x will stay >= x_min)
/// @param x_max Upper bound (x will stay <= x_max)
/// @param config Root-finding configuration
/// @return Result with best root estimate and convergence status
///
/// **Example:**
/// ```cpp
/// auto f = [](double x) { return x*x - 2.0; };  // Find sqrt(2)
/// auto df = [](double x) { return 2.0*x; };     // Derivative
/// auto result = newton_find_root(f, df, 1.0, 0.0, 10.0, config);
/// // result.root.value() ≈ 1.414213...
/// ```
template<ObjectiveFunction F, DerivativeFunction DF>
RootFindingResult newton_find_root(F&& f, DF&& df,
                                   double x0,
                                   double x_min, double x_max,
                                   const RootFindingConfig& config) {
    // Validate bounds
    if (x_min >= x_max) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Invalid bounds: x_min must be < x_max",
            .root = std::nullopt
        };
    }

    // Clamp initial guess to bounds
    double x = std::clamp(x0, x_min, x_max);

    double best_x = x;
    double best_err = std::numeric_limits<double>::infinity();
    double prev_err = std::numeric_limits<double>::infinity();
    size_t divergent_steps = 0;
    size_t bound_hits = 0;

    auto fail = [&](size_t iterations, const char* reason) {
        VOLSCAN_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, iterations, best_err);
        return RootFindingResult{
            .converged = false,
            .iterations = iterations,
            .final_error = best_err,
            .failure_reason = std::string(reason),
            .root = best_x
        };
    };

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        // Evaluate function and derivative at current point
        const double fx = f(x);
        const double dfx = df(x);

        // Check for non-finite values
        if (!std::isfinite(fx) || !std::isfinite(dfx)) {
            return fail(iter + 1, "Function or derivative returned non-finite value");
        }

        const double error_abs = std::abs(fx);
        VOLSCAN_TRACE_CONVERGENCE_ITER(MODULE_ROOT_FINDING, iter, x, fx);

        if (error_abs < best_err) {
            best_err = error_abs;
            best_x = x;
        }

        // Check convergence
        if (error_abs < config.tolerance) {
            VOLSCAN_TRACE_CONVERGENCE_SUCCESS(MODULE_ROOT_FINDING, iter + 1, error_abs);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = std::nullopt,
                .root = x
            };
        }

        // Residual growing: count consecutive divergent steps
        if (error_abs > prev_err) {
            if (++divergent_steps >= config.max_divergent_steps) {
                return fail(iter + 1, "Newton iteration diverging");
            }
        } else {
            divergent_steps = 0;
        }
        prev_err = error_abs;

        // Check for numerical issues (flat derivative)
        if (std::abs(dfx) < config.min_derivative) {
            return fail(iter + 1, "Derivative too small (flat region)");
        }

        // Newton step: x_{n+1} = x_n - f(x_n)/f'(x_n)
        double step = fx / dfx;
        if (config.max_step > 0.0) {
            step = std::clamp(step, -config.max_step, config.max_step);
        }
        const double x_new = x - step;

        // Enforce bounds
        if (x_new < x_min || x_new > x_max) {
            if (++bound_hits >= 2) {
                return fail(iter + 1, "Hit bounds without convergence");
            }
        } else {
            bound_hits = 0;
        }

        x = std::clamp(x_new, x_min, x_max);
    }

    return fail(config.max_iter, "Maximum iterations reached without convergence");
}

}  // namespace volscan
