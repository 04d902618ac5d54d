// SPDX-License-Identifier: MIT
#pragma once

#include "covenant/pricing/european_pricer.hpp"

namespace covenant {

/**
 * @brief Closed-form lognormal leaf pricer
 *
 * Prices on the forward F = S / D(T) with total variance σ²·Tv, where D comes
 * from the snapshot's curve and Tv is the snapshot's variance time to
 * maturity. For a snapshot that has not been rolled this is plain
 * Black-Scholes with a term-structured rate.
 *
 * Thread-safety: stateless, all methods const.
 */
class BlackScholesPricer {
public:
    std::expected<EuropeanQuote, ValuationError>
    price_european(const EuropeanQuery& query, const MarketModel& market) const;
};

static_assert(EuropeanPricer<BlackScholesPricer>);

}  // namespace covenant
