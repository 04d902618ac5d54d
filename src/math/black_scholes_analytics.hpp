// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cmath>

namespace covenant {

/// Option type for vanilla payoffs recognised by the leaf pricer
enum class OptionType {
    CALL,
    PUT
};

/// Intrinsic value max(S-K, 0) or max(K-S, 0)
inline double intrinsic_value(double spot, double strike, OptionType type) {
    return type == OptionType::CALL ? std::max(spot - strike, 0.0)
                                    : std::max(strike - spot, 0.0);
}

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF via erfc
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-76 d1 term on the forward
/// d1 = [ln(F/K) + w/2] / √w with total variance w = σ²T
inline double black76_d1(double forward, double strike, double total_variance) {
    return (std::log(forward / strike) + 0.5 * total_variance) / std::sqrt(total_variance);
}

/// Black-76 price of a European option
///
/// @param forward Forward price of the underlying at maturity
/// @param strike Strike price
/// @param total_variance σ² times variance time (years)
/// @param discount Discount factor from valuation to maturity
/// @param type CALL or PUT
/// @return Discounted option price
inline double black76_price(double forward, double strike, double total_variance,
                            double discount, OptionType type) {
    if (total_variance <= 0.0) {
        return discount * intrinsic_value(forward, strike, type);
    }
    double sqrt_w = std::sqrt(total_variance);
    double d1 = black76_d1(forward, strike, total_variance);
    double d2 = d1 - sqrt_w;

    if (type == OptionType::PUT) {
        return discount * (strike * norm_cdf(-d2) - forward * norm_cdf(-d1));
    }
    return discount * (forward * norm_cdf(d1) - strike * norm_cdf(d2));
}

/// Black-Scholes vega ∂V/∂σ = S·φ(d1)·√T (per unit volatility)
inline double black76_vega(double spot, double forward, double strike,
                           double sigma, double variance_time) {
    if (variance_time <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d1 = black76_d1(forward, strike, sigma * sigma * variance_time);
    return spot * std::sqrt(variance_time) * norm_pdf(d1);
}

}  // namespace covenant
