// SPDX-License-Identifier: MIT
#include "covenant/pricing/black_scholes_pricer.hpp"

#include "covenant/support/covenant_trace.h"

#include <cmath>

namespace covenant {

std::expected<EuropeanQuote, ValuationError>
BlackScholesPricer::price_european(const EuropeanQuery& query, const MarketModel& market) const {
    auto spot = market.spot(query.underlying);
    if (!spot.has_value()) {
        return std::unexpected(to_valuation_error(spot.error()));
    }
    auto sigma = market.volatility(query.underlying);
    if (!sigma.has_value()) {
        return std::unexpected(to_valuation_error(sigma.error()));
    }
    if (*sigma <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::NonPositiveVolatility,
                                              query.underlying, *sigma));
    }
    if (!std::isfinite(query.strike) || query.strike <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              "strike", query.strike));
    }

    const int e = market.evaluation_day();
    const double tau = MarketModel::year_fraction(e, query.maturity_day);
    const double tv = market.variance_time(query.maturity_day);
    if (tau <= 0.0 || tv <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              "maturity", static_cast<double>(query.maturity_day)));
    }

    const double S = *spot;
    const double K = query.strike;
    const double vol = *sigma;
    const double D = market.discount(query.maturity_day);
    const double f = market.forward_rate(query.maturity_day);
    if (!std::isfinite(D) || D <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              "discount", D));
    }
    const bool is_call = query.type == OptionType::CALL;

    EuropeanQuote quote;
    if (S == 0.0) {
        // Absorbed at zero: call worthless, put pays the discounted strike
        if (!is_call) {
            quote.price = K * D;
            quote.greeks.delta = -1.0;
            quote.greeks.theta = K * D * f / kDaysPerYear;
            quote.greeks.rho = -K * tau * D * 0.01;
        }
        return quote;
    }

    const double sqrt_tv = std::sqrt(tv);
    const double w = vol * vol * tv;
    const double F = S / D;
    const double d1 = black76_d1(F, K, w);
    const double d2 = d1 - vol * sqrt_tv;
    const double pdf = norm_pdf(d1);
    const double decay = S * pdf * vol / (2.0 * sqrt_tv);

    quote.price = black76_price(F, K, w, D, query.type);
    quote.greeks.gamma = pdf / (S * vol * sqrt_tv);
    quote.greeks.vega = S * pdf * sqrt_tv * 0.01;
    if (is_call) {
        quote.greeks.delta = norm_cdf(d1);
        quote.greeks.theta = -(decay + K * D * f * norm_cdf(d2)) / kDaysPerYear;
        quote.greeks.rho = K * tau * D * norm_cdf(d2) * 0.01;
    } else {
        quote.greeks.delta = norm_cdf(d1) - 1.0;
        quote.greeks.theta = -(decay - K * D * f * norm_cdf(-d2)) / kDaysPerYear;
        quote.greeks.rho = -K * tau * D * norm_cdf(-d2) * 0.01;
    }

    if (!std::isfinite(quote.price)) {
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              query.underlying, quote.price));
    }

    COVENANT_TRACE_LEAF_PRICED(K, query.maturity_day - e, quote.price);
    return quote;
}

}  // namespace covenant
