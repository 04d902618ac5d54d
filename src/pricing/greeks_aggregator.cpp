// SPDX-License-Identifier: MIT
#include "covenant/pricing/greeks_aggregator.hpp"

#include "covenant/support/covenant_trace.h"
#include "covenant/support/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <type_traits>

namespace covenant {

namespace {

/// Perturbed root snapshot and the matching recursion position
struct Scenario {
    MarketModel market;
    ValuationContext ctx;
};

/// Indices of the two perturbed scenarios for one finite difference
///
/// Centered: [first] = x+h, [first+1] = x-h.
/// One-sided spot: [first] = x+h, [first+1] = x+2h.
/// One-sided vol: [first] = x+h only.
struct BumpSlot {
    double h;
    bool one_sided;
    size_t first;
};

bool is_leaf(const Contract& inner) {
    const auto* s = std::get_if<contract::Scale>(&inner.node().form);
    return s != nullptr &&
           std::holds_alternative<contract::One>(s->inner.node().form) &&
           match_vanilla_payoff(s->factor).has_value();
}

}  // namespace

std::expected<GreeksAggregator, ValuationError>
GreeksAggregator::create(const ValuationEngine& engine, GreeksConfig config) {
    auto ok = validate_greeks_config(config);
    if (!ok.has_value()) {
        return std::unexpected(ok.error());
    }
    return GreeksAggregator(engine, std::move(config));
}

std::expected<Greeks, ValuationError>
GreeksAggregator::compute(const Contract& contract, const MarketModel& market) const {
    auto checked = engine_->validate(contract, market);
    if (!checked.has_value()) {
        return std::unexpected(checked.error());
    }

    std::vector<std::string> names;
    if (config_.underlying.has_value()) {
        if (!market.has_underlying(*config_.underlying)) {
            return std::unexpected(ValuationError(ValuationErrorCode::UnknownUnderlying,
                                                  *config_.underlying));
        }
        names.push_back(*config_.underlying);
    } else {
        names = checked->underlyings;
    }

    ValuationContext ctx;
    ctx.day = market.evaluation_day();
    auto g = greeks_at(contract, market, ctx, names);
    if (!g.has_value()) {
        return g;
    }
    for (Greek k : kAllGreeks) {
        if (!std::isfinite((*g)[k])) {
            return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                                  "greeks", (*g)[k]));
        }
    }
    return g;
}

std::expected<Greeks, ValuationError>
GreeksAggregator::greeks_at(const Contract& contract, const MarketModel& market,
                            const ValuationContext& ctx,
                            const std::vector<std::string>& names) const {
    using Result = std::expected<Greeks, ValuationError>;

    return std::visit([&](const auto& form) -> Result {
        using T = std::decay_t<decltype(form)>;

        if constexpr (std::is_same_v<T, contract::Zero> || std::is_same_v<T, contract::One>) {
            return Greeks{};
        } else if constexpr (std::is_same_v<T, contract::Give>) {
            auto g = greeks_at(form.inner, market, ctx, names);
            if (!g.has_value()) return g;
            return -*g;
        } else if constexpr (std::is_same_v<T, contract::And>) {
            auto lhs = greeks_at(form.lhs, market, ctx, names);
            if (!lhs.has_value()) return lhs;
            auto rhs = greeks_at(form.rhs, market, ctx, names);
            if (!rhs.has_value()) return rhs;
            return *lhs + *rhs;
        } else if constexpr (std::is_same_v<T, contract::Scale>) {
            auto k = fold_constant(form.factor);
            if (!k.has_value()) {
                return bump_and_reprice(contract, market, ctx, names);
            }
            auto g = greeks_at(form.inner, market, ctx, names);
            if (!g.has_value()) return g;
            return *g * *k;
        } else if constexpr (std::is_same_v<T, contract::Then>) {
            int day = std::max(form.day, ctx.day);
            if (ctx.bounded && day > ctx.horizon) {
                return Greeks{};
            }
            if (day == ctx.day) {
                return greeks_at(form.inner, market, ctx, names);
            }
            if (is_leaf(skip_elapsed_then(form.inner, day))) {
                return bump_and_reprice(contract, market, ctx, names);
            }

            ValuationContext inner = ctx;
            inner.day = day;
            inner.anchored = true;
            auto child_value = engine_->value_at(form.inner, market, inner);
            if (!child_value.has_value()) return std::unexpected(child_value.error());
            auto child = greeks_at(form.inner, market, inner, names);
            if (!child.has_value()) return child;

            const double df = market.discount(ctx.day, day);
            const double pv = *child_value * df;
            Greeks g = *child * df;
            // d/dr of D(now, day) per 1% parallel shift
            g.rho += pv * (-MarketModel::year_fraction(ctx.day, day)) * 0.01;
            // d/d(evaluation day) of D(now, day): curve origin moves, `day` is fixed
            double drift = market.forward_rate(day);
            if (ctx.anchored) {
                drift -= market.forward_rate(ctx.day);
            }
            g.theta += pv * drift / kDaysPerYear;
            return g;
        } else {
            return bump_and_reprice(contract, market, ctx, names);
        }
    }, contract.node().form);
}

std::expected<Greeks, ValuationError>
GreeksAggregator::bump_and_reprice(const Contract& contract, const MarketModel& market,
                                   const ValuationContext& ctx,
                                   const std::vector<std::string>& names) const {
    std::vector<Scenario> scenarios;
    scenarios.push_back(Scenario{market, ctx});

    std::vector<BumpSlot> spot_slots;
    std::vector<BumpSlot> vol_slots;

    for (const auto& name : names) {
        auto spot = market.spot(name);
        if (!spot.has_value()) {
            return std::unexpected(to_valuation_error(spot.error()));
        }
        const double s = *spot;
        const double hs = s > 0.0 ? config_.spot_bump_rel * s : config_.spot_bump_rel;
        const bool spot_one_sided = s - hs < 0.0;

        auto up = market.with_spot(name, s + hs);
        auto second = spot_one_sided ? market.with_spot(name, s + 2.0 * hs)
                                     : market.with_spot(name, s - hs);
        if (!up.has_value()) return std::unexpected(to_valuation_error(up.error()));
        if (!second.has_value()) return std::unexpected(to_valuation_error(second.error()));
        spot_slots.push_back({hs, spot_one_sided, scenarios.size()});
        scenarios.push_back(Scenario{std::move(*up), ctx});
        scenarios.push_back(Scenario{std::move(*second), ctx});

        auto sigma = market.volatility(name);
        if (!sigma.has_value()) {
            return std::unexpected(to_valuation_error(sigma.error()));
        }
        const double hv = config_.vol_bump_abs;
        const bool vol_one_sided = *sigma - hv <= 0.0;
        auto vol_up = market.with_volatility(name, *sigma + hv);
        if (!vol_up.has_value()) return std::unexpected(to_valuation_error(vol_up.error()));
        vol_slots.push_back({hv, vol_one_sided, scenarios.size()});
        scenarios.push_back(Scenario{std::move(*vol_up), ctx});
        if (!vol_one_sided) {
            auto vol_down = market.with_volatility(name, *sigma - hv);
            if (!vol_down.has_value()) return std::unexpected(to_valuation_error(vol_down.error()));
            scenarios.push_back(Scenario{std::move(*vol_down), ctx});
        }
    }

    const double hr = config_.rate_bump_abs;
    auto rate_up = market.with_rate_shift(hr);
    auto rate_down = market.with_rate_shift(-hr);
    if (!rate_up.has_value()) return std::unexpected(to_valuation_error(rate_up.error()));
    if (!rate_down.has_value()) return std::unexpected(to_valuation_error(rate_down.error()));
    const size_t rate_slot = scenarios.size();
    scenarios.push_back(Scenario{std::move(*rate_up), ctx});
    scenarios.push_back(Scenario{std::move(*rate_down), ctx});

    const int ht = config_.theta_bump_days;
    const size_t theta_slot = scenarios.size();
    for (int sign : {1, -1}) {
        ValuationContext shifted = ctx;
        if (!ctx.anchored) {
            shifted.day += sign * ht;
        }
        scenarios.push_back(Scenario{market.with_evaluation_day(market.evaluation_day() + sign * ht),
                                     shifted});
    }

    COVENANT_TRACE_BUMP_BATCH(scenarios.size(), names.size());

    std::vector<std::expected<double, ValuationError>> values(scenarios.size());
    COVENANT_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < scenarios.size(); ++i) {
        values[i] = engine_->value_at(contract, scenarios[i].market, scenarios[i].ctx);
    }
    for (const auto& v : values) {
        if (!v.has_value()) {
            return std::unexpected(v.error());
        }
    }

    const double v0 = *values[0];
    Greeks g;
    for (const auto& slot : spot_slots) {
        const double v1 = *values[slot.first];
        const double v2 = *values[slot.first + 1];
        const double h = slot.h;
        if (slot.one_sided) {
            g.delta += (-3.0 * v0 + 4.0 * v1 - v2) / (2.0 * h);
            g.gamma += (v0 - 2.0 * v1 + v2) / (h * h);
        } else {
            g.delta += (v1 - v2) / (2.0 * h);
            g.gamma += (v1 - 2.0 * v0 + v2) / (h * h);
        }
    }
    for (const auto& slot : vol_slots) {
        const double up = *values[slot.first];
        if (slot.one_sided) {
            g.vega += (up - v0) / slot.h * 0.01;
        } else {
            g.vega += (up - *values[slot.first + 1]) / (2.0 * slot.h) * 0.01;
        }
    }
    g.rho = (*values[rate_slot] - *values[rate_slot + 1]) / (2.0 * hr) * 0.01;
    g.theta = (*values[theta_slot] - *values[theta_slot + 1]) / (2.0 * ht);
    return g;
}

}  // namespace covenant
