// SPDX-License-Identifier: MIT
#include "covenant/pricing/valuation_engine.hpp"

#include "covenant/pricing/greeks_aggregator.hpp"
#include "covenant/pricing/observable_evaluator.hpp"
#include "covenant/support/covenant_trace.h"
#include "covenant/support/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <type_traits>
#include <utility>

namespace covenant {

namespace {

std::unexpected<ValuationError> validation_error(ValuationErrorCode code, std::string subject,
                                                 double value) {
    COVENANT_TRACE_VALIDATION_ERROR(COVENANT_MODULE_VALUATION, static_cast<int>(code), value);
    return std::unexpected(ValuationError(code, std::move(subject), value));
}

/// Underlying - K or K - Underlying
std::optional<VanillaPayoff> match_linear_leg(const Observable& leg) {
    const auto* diff = std::get_if<observable::BinaryOp>(&leg.node().form);
    if (diff == nullptr || diff->op != BinaryOperator::Subtract) {
        return std::nullopt;
    }
    const auto* lhs_name = std::get_if<observable::Underlying>(&diff->lhs.node().form);
    const auto* rhs_name = std::get_if<observable::Underlying>(&diff->rhs.node().form);
    if (lhs_name != nullptr) {
        auto k = fold_constant(diff->rhs);
        if (k.has_value() && *k > 0.0) {
            return VanillaPayoff{lhs_name->name, *k, OptionType::CALL};
        }
    } else if (rhs_name != nullptr) {
        auto k = fold_constant(diff->lhs);
        if (k.has_value() && *k > 0.0) {
            return VanillaPayoff{rhs_name->name, *k, OptionType::PUT};
        }
    }
    return std::nullopt;
}

bool is_zero(const Observable& obs) {
    auto v = fold_constant(obs);
    return v.has_value() && *v == 0.0;
}

/// Number of days candidate_days() yields for a search starting on `start`
double candidate_count(int start, int horizon, bool bounded, const EngineConfig& config) {
    long long limit = bounded
        ? static_cast<long long>(horizon)
        : static_cast<long long>(start) + config.unbounded_horizon_days;
    if (limit < start) {
        return 0.0;
    }
    long long span = limit - start;
    long long count = span / config.exercise_step_days + 1;
    if (span % config.exercise_step_days != 0) {
        ++count;
    }
    return static_cast<double>(count);
}

using CandidateMemo = std::map<std::pair<const ContractNode*, int>, double>;

/// Worst product of candidate counts along any path from `contract` to a leaf
///
/// Searches are counted from `start`, the earliest day any of them can begin,
/// which over-estimates searches that begin later.
double candidate_evaluations(const Contract& contract, int start, int horizon, bool bounded,
                             const EngineConfig& config, CandidateMemo& memo) {
    auto key = std::make_pair(contract.id(), bounded ? horizon : std::numeric_limits<int>::max());
    if (auto it = memo.find(key); it != memo.end()) {
        return it->second;
    }
    double result = std::visit([&](const auto& form) -> double {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, contract::Zero> || std::is_same_v<T, contract::One>) {
            return 1.0;
        } else if constexpr (std::is_same_v<T, contract::And> || std::is_same_v<T, contract::Or>) {
            return std::max(candidate_evaluations(form.lhs, start, horizon, bounded, config, memo),
                            candidate_evaluations(form.rhs, start, horizon, bounded, config, memo));
        } else if constexpr (std::is_same_v<T, contract::Truncate>) {
            int inner = bounded ? std::min(horizon, form.day) : form.day;
            return candidate_evaluations(form.inner, start, inner, true, config, memo);
        } else if constexpr (std::is_same_v<T, contract::When> ||
                             std::is_same_v<T, contract::Anytime>) {
            double n = std::max(candidate_count(start, horizon, bounded, config), 1.0);
            return n * candidate_evaluations(form.inner, start, horizon, bounded, config, memo);
        } else {
            return candidate_evaluations(form.inner, start, horizon, bounded, config, memo);
        }
    }, contract.node().form);
    memo.emplace(key, result);
    return result;
}

}  // namespace

std::optional<VanillaPayoff> match_vanilla_payoff(const Observable& payoff) {
    const auto* op = std::get_if<observable::BinaryOp>(&payoff.node().form);
    if (op == nullptr || op->op != BinaryOperator::Max) {
        return std::nullopt;
    }
    if (is_zero(op->lhs)) {
        return match_linear_leg(op->rhs);
    }
    if (is_zero(op->rhs)) {
        return match_linear_leg(op->lhs);
    }
    return std::nullopt;
}

const Contract& skip_elapsed_then(const Contract& contract, int day) {
    const Contract* c = &contract;
    while (const auto* t = std::get_if<contract::Then>(&c->node().form)) {
        if (t->day > day) {
            break;
        }
        c = &t->inner;
    }
    return *c;
}

// ===========================================================================
// Construction
// ===========================================================================

ValuationEngine::ValuationEngine()
    : ValuationEngine(EngineConfig{}, BlackScholesPricer{})
{}

ValuationEngine::ValuationEngine(EngineConfig config, AnyEuropeanPricer pricer)
    : config_(std::move(config))
    , pricer_(std::move(pricer))
{}

std::expected<ValuationEngine, ValuationError>
ValuationEngine::create(EngineConfig config, AnyEuropeanPricer pricer) {
    auto ok = validate_engine_config(config);
    if (!ok.has_value()) {
        return std::unexpected(ok.error());
    }
    return ValuationEngine(std::move(config), std::move(pricer));
}

// ===========================================================================
// Validation pass
// ===========================================================================

std::expected<ValidatedContract, ValuationError>
ValuationEngine::validate(const Contract& contract, const MarketModel& market) const {
    if (contract.depth() > config_.max_depth) {
        return validation_error(ValuationErrorCode::DepthLimitExceeded, "depth",
                                static_cast<double>(contract.depth()));
    }
    size_t nodes = unique_node_count(contract);
    if (nodes > config_.max_nodes) {
        return validation_error(ValuationErrorCode::DepthLimitExceeded, "nodes",
                                static_cast<double>(nodes));
    }

    CandidateMemo memo;
    double searches = candidate_evaluations(contract, market.evaluation_day(),
                                            std::numeric_limits<int>::max(), false, config_, memo);
    if (searches > static_cast<double>(config_.max_candidate_evaluations)) {
        return validation_error(ValuationErrorCode::DepthLimitExceeded, "candidates", searches);
    }

    auto names = referenced_underlyings(contract);
    for (const auto& name : names) {
        if (!market.has_underlying(name)) {
            return validation_error(ValuationErrorCode::MarketModelIncomplete, name, 0.0);
        }
    }

    auto currencies = settlement_currencies(contract);
    if (currencies.size() > 1) {
        return validation_error(ValuationErrorCode::MixedSettlementCurrency,
                                std::string(to_string(*currencies.begin())),
                                static_cast<double>(currencies.size()));
    }

    if (config_.strict && uses_path_approximation(contract)) {
        return validation_error(ValuationErrorCode::UnsupportedApproximation,
                                "When/Anytime/Truncate", 0.0);
    }

    ValidatedContract out{
        currencies.empty() ? market.base_currency() : *currencies.begin(),
        nodes,
        std::vector<std::string>(names.begin(), names.end())};
    return out;
}

// ===========================================================================
// Recursive descent
// ===========================================================================

std::vector<int> ValuationEngine::candidate_days(const ValuationContext& ctx) const {
    std::vector<int> days;
    long long limit = ctx.bounded
        ? static_cast<long long>(ctx.horizon)
        : static_cast<long long>(ctx.day) + config_.unbounded_horizon_days;
    if (limit < ctx.day) {
        return days;
    }
    for (long long d = ctx.day; d <= limit; d += config_.exercise_step_days) {
        days.push_back(static_cast<int>(d));
    }
    if (days.back() != limit) {
        days.push_back(static_cast<int>(limit));
    }
    return days;
}

std::expected<double, ValuationError>
ValuationEngine::acquire_at(const Contract& acquired, const MarketModel& market,
                            const ValuationContext& ctx, int day) const {
    if (day == ctx.day) {
        return value_at(acquired, market, ctx);
    }
    const Contract& contract = skip_elapsed_then(acquired, day);

    // Leaf rule: vanilla payoff paid on `day`, priced in closed form
    if (const auto* s = std::get_if<contract::Scale>(&contract.node().form)) {
        if (std::holds_alternative<contract::One>(s->inner.node().form)) {
            if (auto vanilla = match_vanilla_payoff(s->factor)) {
                auto rolled = market.rolled_to(std::max(ctx.day, market.evaluation_day()));
                if (!rolled.has_value()) {
                    return std::unexpected(rolled.error());
                }
                EuropeanQuery query{vanilla->underlying, vanilla->strike, day, vanilla->type};
                auto quote = pricer_.price_european(query, *rolled);
                if (!quote.has_value()) {
                    return std::unexpected(quote.error());
                }
                return quote->price;
            }
        }
    }

    double df = market.discount(ctx.day, day);
    if (!std::isfinite(df) || df <= 0.0) {
        COVENANT_TRACE_RUNTIME_ERROR(COVENANT_MODULE_VALUATION,
                                     static_cast<int>(ValuationErrorCode::NumericDomainError), day);
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              "discount", df));
    }

    ValuationContext inner = ctx;
    inner.day = day;
    inner.anchored = true;
    auto v = value_at(contract, market, inner);
    if (!v.has_value()) {
        return v;
    }
    return df * *v;
}

std::expected<double, ValuationError>
ValuationEngine::value_at(const Contract& contract, const MarketModel& market,
                          const ValuationContext& ctx) const {
    using Result = std::expected<double, ValuationError>;

    return std::visit([&](const auto& form) -> Result {
        using T = std::decay_t<decltype(form)>;

        if constexpr (std::is_same_v<T, contract::Zero>) {
            return 0.0;
        } else if constexpr (std::is_same_v<T, contract::One>) {
            return 1.0;
        } else if constexpr (std::is_same_v<T, contract::Give>) {
            auto v = value_at(form.inner, market, ctx);
            if (!v.has_value()) return v;
            return -*v;
        } else if constexpr (std::is_same_v<T, contract::And> || std::is_same_v<T, contract::Or>) {
            auto lhs = value_at(form.lhs, market, ctx);
            if (!lhs.has_value()) return lhs;
            auto rhs = value_at(form.rhs, market, ctx);
            if (!rhs.has_value()) return rhs;
            if constexpr (std::is_same_v<T, contract::And>) {
                return *lhs + *rhs;
            } else {
                return std::max(*lhs, *rhs);
            }
        } else if constexpr (std::is_same_v<T, contract::Then>) {
            int day = std::max(form.day, ctx.day);
            if (ctx.bounded && day > ctx.horizon) {
                return 0.0;
            }
            return acquire_at(form.inner, market, ctx, day);
        } else if constexpr (std::is_same_v<T, contract::Scale>) {
            auto k = evaluate_scalar(form.factor, market, ctx.day);
            if (!k.has_value()) return std::unexpected(k.error());
            auto v = value_at(form.inner, market, ctx);
            if (!v.has_value()) return v;
            return *k * *v;
        } else if constexpr (std::is_same_v<T, contract::Truncate>) {
            if (ctx.day > form.day) {
                COVENANT_TRACE_APPROXIMATION(COVENANT_APPROX_TRUNCATE, 0, -1);
                return 0.0;
            }
            ValuationContext inner = ctx;
            inner.horizon = ctx.bounded ? std::min(ctx.horizon, form.day) : form.day;
            inner.bounded = true;
            COVENANT_TRACE_APPROXIMATION(COVENANT_APPROX_TRUNCATE, 1, inner.horizon);
            return value_at(form.inner, market, inner);
        } else {
            // When / Anytime: search the forward path over candidate days
            constexpr bool first_only = std::is_same_v<T, contract::When>;
            auto days = candidate_days(ctx);
            std::optional<double> best;
            int chosen = -1;
            for (int d : days) {
                auto fired = evaluate_condition(form.trigger, market, d);
                if (!fired.has_value()) return std::unexpected(fired.error());
                if (!*fired) continue;
                auto v = acquire_at(form.inner, market, ctx, d);
                if (!v.has_value()) return v;
                if (!best.has_value() || *v > *best) {
                    best = *v;
                    chosen = d;
                }
                if constexpr (first_only) {
                    break;
                }
            }
            COVENANT_TRACE_APPROXIMATION(first_only ? COVENANT_APPROX_WHEN : COVENANT_APPROX_ANYTIME,
                                         days.size(), chosen);
            return best.value_or(0.0);
        }
    }, contract.node().form);
}

// ===========================================================================
// Public API
// ===========================================================================

std::expected<Value, ValuationError>
ValuationEngine::value(const Contract& contract, const MarketModel& market) const {
    return value(contract, market, market.evaluation_day());
}

std::expected<Value, ValuationError>
ValuationEngine::value(const Contract& contract, const MarketModel& market, int day) const {
    if (day < market.evaluation_day()) {
        return validation_error(ValuationErrorCode::NegativeTimeOffset, "day",
                                static_cast<double>(day));
    }
    auto checked = validate(contract, market);
    if (!checked.has_value()) {
        return std::unexpected(checked.error());
    }
    COVENANT_TRACE_VALUATION_START(checked->node_count, contract.depth(), market.evaluation_day());

    ValuationContext ctx;
    ctx.day = day;
    ctx.anchored = day != market.evaluation_day();
    auto amount = value_at(contract, market, ctx);
    if (!amount.has_value()) {
        return std::unexpected(amount.error());
    }
    if (!std::isfinite(*amount)) {
        return validation_error(ValuationErrorCode::NumericDomainError, "value", *amount);
    }

    COVENANT_TRACE_VALUATION_COMPLETE(*amount);
    return Value{*amount, checked->currency};
}

std::expected<Greeks, ValuationError>
ValuationEngine::greeks(const Contract& contract, const MarketModel& market,
                        const GreeksConfig& config) const {
    auto aggregator = GreeksAggregator::create(*this, config);
    if (!aggregator.has_value()) {
        return std::unexpected(aggregator.error());
    }
    return aggregator->compute(contract, market);
}

std::expected<PriceAndGreeks, ValuationError>
ValuationEngine::price_and_greeks(const Contract& contract, const MarketModel& market,
                                  const GreeksConfig& config) const {
    auto v = value(contract, market);
    if (!v.has_value()) {
        return std::unexpected(v.error());
    }
    auto g = greeks(contract, market, config);
    if (!g.has_value()) {
        return std::unexpected(g.error());
    }
    return PriceAndGreeks{*v, *g};
}

BatchValuationResult
ValuationEngine::value_batch(std::span<const Contract> contracts, const MarketModel& market) const {
    BatchValuationResult result;
    result.values.resize(contracts.size());

    COVENANT_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < contracts.size(); ++i) {
        result.values[i] = value(contracts[i], market);
    }

    for (const auto& v : result.values) {
        if (!v.has_value()) {
            ++result.failed_count;
        }
    }
    return result;
}

std::expected<Value, ValuationError> value(const Contract& contract, const MarketModel& market) {
    return ValuationEngine().value(contract, market);
}

std::expected<PriceAndGreeks, ValuationError>
price_and_greeks(const Contract& contract, const MarketModel& market) {
    return ValuationEngine().price_and_greeks(contract, market);
}

}  // namespace covenant
