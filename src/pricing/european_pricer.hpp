// SPDX-License-Identifier: MIT
/**
 * @file european_pricer.hpp
 * @brief Leaf pricer seam for vanilla European payoffs
 *
 * The valuation engine recognises Then(T, Scale(max(0, S-K), One(cur))) and
 * its put counterpart and hands them to a leaf pricer. Any type satisfying
 * EuropeanPricer can be plugged in; AnyEuropeanPricer erases the type so the
 * engine is not a template.
 */

#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "covenant/market/market_model.hpp"
#include "covenant/math/black_scholes_analytics.hpp"
#include "covenant/pricing/greeks.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

/// Vanilla European option to be priced against a market snapshot
struct EuropeanQuery {
    std::string underlying;
    double strike = 0.0;
    int maturity_day = 0;  ///< Absolute day, after the market's evaluation day
    OptionType type = OptionType::CALL;
};

/// Price and Greeks in the library's units (see Greeks)
struct EuropeanQuote {
    double price = 0.0;
    Greeks greeks;
};

/**
 * @brief Concept for leaf pricers
 *
 * A pricer must provide a const price_european(query, market) returning
 * std::expected<EuropeanQuote, ValuationError>.
 */
template <typename P>
concept EuropeanPricer = requires(const P& p, const EuropeanQuery& q, const MarketModel& m) {
    { p.price_european(q, m) } -> std::same_as<std::expected<EuropeanQuote, ValuationError>>;
};

/// Type-erased EuropeanPricer
class AnyEuropeanPricer {
public:
    template <typename P>
        requires(EuropeanPricer<P> && !std::same_as<std::decay_t<P>, AnyEuropeanPricer>)
    AnyEuropeanPricer(P pricer)
        : fn_([p = std::move(pricer)](const EuropeanQuery& q, const MarketModel& m) {
              return p.price_european(q, m);
          }) {}

    std::expected<EuropeanQuote, ValuationError>
    price_european(const EuropeanQuery& query, const MarketModel& market) const {
        return fn_(query, market);
    }

private:
    std::function<std::expected<EuropeanQuote, ValuationError>(const EuropeanQuery&,
                                                                const MarketModel&)> fn_;
};

}  // namespace covenant
