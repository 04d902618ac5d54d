// SPDX-License-Identifier: MIT
/**
 * @file covenant_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the covenant library
 *
 * Probes compile to single NOP instructions unless a tracing tool attaches to
 * them, so they are left in hot paths of the valuation engine.
 *
 * Example usage with bpftrace:
 *   # Watch every valuation pass
 *   sudo bpftrace -e 'usdt:./lib*.so:covenant:valuation_* { ... }'
 *
 *   # Report validation failures across modules
 *   sudo bpftrace -e 'usdt:./lib*.so:covenant:validation_error { ... }'
 */

#ifndef COVENANT_TRACE_H
#define COVENANT_TRACE_H

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
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all covenant probes
 */
#define COVENANT_PROVIDER covenant

/**
 * Module identifiers, passed as the first argument of shared probes
 */
#define COVENANT_MODULE_CONTRACT     1
#define COVENANT_MODULE_MARKET       2
#define COVENANT_MODULE_OBSERVABLE   3
#define COVENANT_MODULE_VALUATION    4
#define COVENANT_MODULE_GREEKS       5
#define COVENANT_MODULE_LEAF_PRICER  6

/**
 * Approximation kinds reported by COVENANT_TRACE_APPROXIMATION
 */
#define COVENANT_APPROX_WHEN      1
#define COVENANT_APPROX_ANYTIME   2
#define COVENANT_APPROX_TRUNCATE  3

/**
 * ============================================================================
 * Valuation Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired once per valuation pass after structural validation
 * @param node_count: Unique contract nodes in the tree
 * @param depth: Tree depth (observables included)
 * @param evaluation_day: Market evaluation day
 */
#define COVENANT_TRACE_VALUATION_START(node_count, depth, evaluation_day) \
    DTRACE_PROBE3(COVENANT_PROVIDER, valuation_start, node_count, depth, evaluation_day)

/**
 * Fired when a valuation pass returns a value
 * @param value: Value in the settlement currency
 */
#define COVENANT_TRACE_VALUATION_COMPLETE(value) \
    DTRACE_PROBE1(COVENANT_PROVIDER, valuation_complete, value)

/**
 * Fired when input validation fails
 * @param module_id: Module identifier (COVENANT_MODULE_* constant)
 * @param error_code: Error code enum value
 * @param param: Offending value (day, volatility, count)
 */
#define COVENANT_TRACE_VALIDATION_ERROR(module_id, error_code, param) \
    DTRACE_PROBE3(COVENANT_PROVIDER, validation_error, module_id, error_code, param)

/**
 * Fired when a runtime numeric error is detected during descent
 * @param module_id: Module identifier
 * @param error_code: Error code enum value
 * @param context: Day at which the failure occurred
 */
#define COVENANT_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(COVENANT_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Engine Probes
 * ============================================================================
 */

/**
 * Fired when the leaf pricer values a vanilla payoff
 * @param strike: Strike folded out of the payoff observable
 * @param maturity_days: Days from acquisition to maturity
 * @param price: Price returned by the pricer
 */
#define COVENANT_TRACE_LEAF_PRICED(strike, maturity_days, price) \
    DTRACE_PROBE4(COVENANT_PROVIDER, leaf_priced, COVENANT_MODULE_LEAF_PRICER, strike, maturity_days, price)

/**
 * Fired after a When/Anytime/Truncate search over candidate days
 * @param kind: COVENANT_APPROX_* constant
 * @param candidates: Number of candidate days inspected
 * @param chosen_day: Selected acquisition day (-1 if never triggered)
 */
#define COVENANT_TRACE_APPROXIMATION(kind, candidates, chosen_day) \
    DTRACE_PROBE4(COVENANT_PROVIDER, approximation, COVENANT_MODULE_VALUATION, kind, candidates, chosen_day)

/**
 * Fired when a bump-and-reprice batch is dispatched
 * @param scenarios: Number of perturbed snapshots
 * @param underlyings: Number of underlyings bumped
 */
#define COVENANT_TRACE_BUMP_BATCH(scenarios, underlyings) \
    DTRACE_PROBE3(COVENANT_PROVIDER, bump_batch, COVENANT_MODULE_GREEKS, scenarios, underlyings)

#endif  // COVENANT_TRACE_H
