// SPDX-License-Identifier: MIT
/**
 * @file greeks_aggregator.hpp
 * @brief Sensitivities that compose over the contract tree the way value does
 *
 * Linear combinators propagate Greeks analytically:
 * - Zero, One: all zero
 * - Give(c): negated
 * - And(a, b): component-wise sum
 * - Scale(k, c), k market-independent: multiplied by k
 * - Then(t, c): multiplied by the discount factor D, plus the sensitivities of
 *   D itself (rho and theta terms proportional to V(c))
 *
 * Everything else (Or, When, Truncate, Anytime, market-dependent Scale and
 * the closed-form leaf) is bump-and-reprice: the sub-tree is revalued at the
 * same position in the recursion against perturbed root snapshots.
 *
 * Step sizes are fixed per sensitivity (GreeksConfig): spot 1% relative with
 * centered delta and three-point gamma, volatility 0.01 absolute (forward
 * difference when σ-h would be non-positive), rate 1 bp parallel shift,
 * theta ±1 day on the evaluation day.
 */

#pragma once

#include <expected>
#include <string>
#include <vector>

#include "covenant/contract/contract.hpp"
#include "covenant/market/market_model.hpp"
#include "covenant/pricing/greeks.hpp"
#include "covenant/pricing/valuation_config.hpp"
#include "covenant/pricing/valuation_engine.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

class GreeksAggregator {
public:
    /// Factory with bump-size validation
    ///
    /// The engine must outlive the aggregator.
    static std::expected<GreeksAggregator, ValuationError>
    create(const ValuationEngine& engine, GreeksConfig config = {});

    /// Validate and compute Greeks at the market's evaluation day
    std::expected<Greeks, ValuationError>
    compute(const Contract& contract, const MarketModel& market) const;

    /// Greeks of a sub-tree at a position in the recursion
    ///
    /// `names` lists the underlyings whose delta/gamma/vega are summed.
    std::expected<Greeks, ValuationError>
    greeks_at(const Contract& contract, const MarketModel& market,
              const ValuationContext& ctx, const std::vector<std::string>& names) const;

    /// Finite-difference Greeks of a sub-tree (no analytic propagation)
    std::expected<Greeks, ValuationError>
    bump_and_reprice(const Contract& contract, const MarketModel& market,
                     const ValuationContext& ctx, const std::vector<std::string>& names) const;

    const GreeksConfig& config() const { return config_; }

private:
    GreeksAggregator(const ValuationEngine& engine, GreeksConfig config)
        : engine_(&engine), config_(std::move(config)) {}

    const ValuationEngine* engine_;
    GreeksConfig config_;
};

}  // namespace covenant
