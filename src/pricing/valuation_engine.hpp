// SPDX-License-Identifier: MIT
/**
 * @file valuation_engine.hpp
 * @brief Recursive valuation of contract trees against a market snapshot
 *
 * Valuation is a structural recursion over the contract tree. Each pass
 * first validates the tree against the snapshot (depth, node count,
 * referenced underlyings, settlement currency, strict mode) and only then
 * descends, so no partial result is ever produced.
 *
 * Usage:
 * @code
 *   auto market = MarketModel::create(data);
 *   auto call = european_call("AAPL", 100.0, 90, Currency::USD);
 *   auto v = value(*call, *market);
 *   if (v) std::cout << v->amount << '\n';
 * @endcode
 */

#pragma once

#include <cstddef>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include "covenant/contract/contract.hpp"
#include "covenant/market/market_model.hpp"
#include "covenant/pricing/black_scholes_pricer.hpp"
#include "covenant/pricing/european_pricer.hpp"
#include "covenant/pricing/greeks.hpp"
#include "covenant/pricing/valuation_config.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

/// Monetary amount in a settlement currency
struct Value {
    double amount = 0.0;
    Currency currency = Currency::USD;
};

struct PriceAndGreeks {
    Value value;
    Greeks greeks;
};

/// Result of valuing many contracts against one snapshot
struct BatchValuationResult {
    std::vector<std::expected<Value, ValuationError>> values;  ///< Same order as input
    size_t failed_count = 0;
};

/// Position of a node in the recursion
struct ValuationContext {
    int day = 0;                                      ///< "Now" for this sub-tree
    int horizon = std::numeric_limits<int>::max();    ///< Last day acquisition is allowed
    bool bounded = false;                             ///< An enclosing Truncate set horizon
    bool anchored = false;                            ///< day is a fixed date, not the evaluation day
};

/// Structural facts established by the validation pass
struct ValidatedContract {
    Currency currency;
    size_t node_count;
    std::vector<std::string> underlyings;
};

/// Vanilla payoff recognised by the leaf rule
struct VanillaPayoff {
    std::string underlying;
    double strike;
    OptionType type;
};

/// Recognise max(0, S-K), max(S-K, 0), max(0, K-S), max(K-S, 0)
/// with S an underlying and K a positive market-independent strike
std::optional<VanillaPayoff> match_vanilla_payoff(const Observable& payoff);

/// Skip Then nodes already due on `day`: acquiring Then(t, c) on day >= t acquires c
const Contract& skip_elapsed_then(const Contract& contract, int day);

/**
 * @brief Contract valuation engine
 *
 * Holds configuration and a leaf pricer; stateless otherwise. All methods
 * are const and may be called concurrently.
 */
class ValuationEngine {
public:
    /// Default configuration with the closed-form Black-Scholes leaf pricer
    ValuationEngine();

    /// Factory with configuration validation
    static std::expected<ValuationEngine, ValuationError>
    create(EngineConfig config, AnyEuropeanPricer pricer = BlackScholesPricer{});

    const EngineConfig& config() const { return config_; }
    const AnyEuropeanPricer& pricer() const { return pricer_; }

    /// Value as of the market's evaluation day
    std::expected<Value, ValuationError>
    value(const Contract& contract, const MarketModel& market) const;

    /// Value as of a later day (discounted to that day, forward-path observables)
    std::expected<Value, ValuationError>
    value(const Contract& contract, const MarketModel& market, int day) const;

    std::expected<Greeks, ValuationError>
    greeks(const Contract& contract, const MarketModel& market,
           const GreeksConfig& config = {}) const;

    std::expected<PriceAndGreeks, ValuationError>
    price_and_greeks(const Contract& contract, const MarketModel& market,
                     const GreeksConfig& config = {}) const;

    /// Value every contract against one snapshot (parallel over contracts)
    BatchValuationResult
    value_batch(std::span<const Contract> contracts, const MarketModel& market) const;

    /// Once-per-pass checks: depth, node count, search budget, data completeness, currency, strict mode
    std::expected<ValidatedContract, ValuationError>
    validate(const Contract& contract, const MarketModel& market) const;

    /// Value of a sub-tree at a position in the recursion, without validation
    ///
    /// `market` is always the root snapshot; ctx.day >= market.evaluation_day().
    std::expected<double, ValuationError>
    value_at(const Contract& contract, const MarketModel& market,
             const ValuationContext& ctx) const;

    /// Value of acquiring contract on `day` (>= ctx.day), seen from ctx.day
    std::expected<double, ValuationError>
    acquire_at(const Contract& contract, const MarketModel& market,
               const ValuationContext& ctx, int day) const;

private:
    ValuationEngine(EngineConfig config, AnyEuropeanPricer pricer);

    std::vector<int> candidate_days(const ValuationContext& ctx) const;

    EngineConfig config_;
    AnyEuropeanPricer pricer_;
};

/// Value with the default engine
std::expected<Value, ValuationError> value(const Contract& contract, const MarketModel& market);

/// Value and Greeks with the default engine and bump sizes
std::expected<PriceAndGreeks, ValuationError>
price_and_greeks(const Contract& contract, const MarketModel& market);

}  // namespace covenant
