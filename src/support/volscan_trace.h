// SPDX-License-Identifier: MIT
/**
 * @file volscan_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the volscan library
 *
 * Zero-overhead tracing points that can be enabled at runtime with bpftrace,
 * systemtap or perf. When tracing is disabled (default), probes compile to
 * single NOP instructions.
 *
 * The probes are module-agnostic: pricing, implied volatility, strategy
 * composition, regime classification and screening all report through the
 * same lifecycle, convergence and validation probes.
 *
 * Example usage with bpftrace:
 *   # Trace every IV solve that fell back to bisection
 *   sudo bpftrace -e 'usdt:./libvolscan.so:volscan:iv_fallback { ... }'
 *
 *   # Monitor contracts dropped by the screener
 *   sudo bpftrace -e 'usdt:./libvolscan.so:volscan:screen_rejected { ... }'
 */

#ifndef VOLSCAN_TRACE_H
#define VOLSCAN_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#define DTRACE_PROBE6(provider, probe, arg1, arg2, arg3, arg4, arg5, arg6) do {} while(0)
#endif

/**
 * Provider name for all volscan probes
 */
#define VOLSCAN_PROVIDER volscan

/**
 * Module identifiers for multi-module tracing
 * These are passed as the first parameter to many probes
 */
#define MODULE_PRICING          1
#define MODULE_IMPLIED_VOL      2
#define MODULE_ROOT_FINDING     3
#define MODULE_SINGLE_LEG       4
#define MODULE_STRATEGY         5
#define MODULE_REGIME           6
#define MODULE_SCREENER         7
#define MODULE_VALIDATION       8

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., max_iter, universe size)
 * @param param2: Module-specific parameter (e.g., tolerance)
 * @param param3: Module-specific parameter
 */
#define VOLSCAN_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(VOLSCAN_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Iterations or items processed
 * @param final_metric: Final metric value (e.g., residual, result count)
 */
#define VOLSCAN_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number
 * @param x: Current iterate
 * @param error: Current residual
 */
#define VOLSCAN_TRACE_CONVERGENCE_ITER(module_id, iter, x, error) \
    DTRACE_PROBE4(VOLSCAN_PROVIDER, convergence_iter, module_id, iter, x, error)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final residual
 */
#define VOLSCAN_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when convergence fails
 * @param module_id: Module identifier
 * @param max_iter: Iterations attempted
 * @param final_error: Residual at failure
 */
#define VOLSCAN_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode / ConfigurationErrorCode as int
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value or threshold
 */
#define VOLSCAN_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(VOLSCAN_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a runtime error occurs
 * @param module_id: Module identifier
 * @param error_code: Error code
 * @param context: Context value (e.g., item index)
 */
#define VOLSCAN_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Module-Specific Probes: Implied Volatility
 * ============================================================================
 */

/**
 * Fired when IV calculation begins
 */
#define VOLSCAN_TRACE_IV_START(spot, strike, time_to_maturity, market_price) \
    DTRACE_PROBE4(VOLSCAN_PROVIDER, iv_start, spot, strike, time_to_maturity, market_price)

/**
 * Fired when Newton-Raphson hands over to bisection
 * @param iter: Iteration at which Newton was abandoned
 * @param sigma: Last Newton iterate
 * @param vega: Vega at the last iterate
 */
#define VOLSCAN_TRACE_IV_FALLBACK(iter, sigma, vega) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, iv_fallback, iter, sigma, vega)

/**
 * Fired when IV calculation completes
 * @param implied_vol: Best volatility estimate
 * @param iterations: Number of iterations
 * @param converged: 1 if converged, 0 if failed
 */
#define VOLSCAN_TRACE_IV_COMPLETE(implied_vol, iterations, converged) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, iv_complete, implied_vol, iterations, converged)

/**
 * ============================================================================
 * Module-Specific Probes: Regime and Screening
 * ============================================================================
 */

/**
 * Fired when a regime is assigned
 * @param level: Current index level
 * @param percentile: Percentile rank (0-100)
 * @param regime: VolatilityRegime as int
 */
#define VOLSCAN_TRACE_REGIME_CLASSIFIED(level, percentile, regime) \
    DTRACE_PROBE3(VOLSCAN_PROVIDER, regime_classified, level, percentile, regime)

/**
 * Fired when the screener drops a contract for data quality
 * @param strike: Contract strike
 * @param error_code: DataQualityErrorCode as int
 * @param value: Offending value
 */
#define VOLSCAN_TRACE_SCREEN_REJECTED(strike, error_code, value) \
    DTRACE_PROBE4(VOLSCAN_PROVIDER, screen_rejected, MODULE_SCREENER, strike, error_code, value)

#endif // VOLSCAN_TRACE_H
