// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>

namespace covenant {

/// Sensitivity kinds reported by the Greeks aggregator
enum class Greek { Delta, Gamma, Vega, Theta, Rho };

/// First- and second-order sensitivities
///
/// Units: delta per unit of underlying, gamma per unit squared, vega per 1%
/// volatility, theta per calendar day, rho per 1% rate.
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double vega = 0.0;
    double theta = 0.0;
    double rho = 0.0;

    double operator[](Greek g) const {
        switch (g) {
            case Greek::Delta: return delta;
            case Greek::Gamma: return gamma;
            case Greek::Vega:  return vega;
            case Greek::Theta: return theta;
            case Greek::Rho:   return rho;
        }
        return 0.0;
    }

    double& operator[](Greek g) {
        switch (g) {
            case Greek::Delta: return delta;
            case Greek::Gamma: return gamma;
            case Greek::Vega:  return vega;
            case Greek::Theta: return theta;
            case Greek::Rho:   break;
        }
        return rho;
    }

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        vega += other.vega;
        theta += other.theta;
        rho += other.rho;
        return *this;
    }

    Greeks operator*(double k) const {
        return Greeks{delta * k, gamma * k, vega * k, theta * k, rho * k};
    }

    Greeks operator-() const { return *this * -1.0; }
};

inline constexpr Greek kAllGreeks[] = {Greek::Delta, Greek::Gamma, Greek::Vega,
                                       Greek::Theta, Greek::Rho};

inline Greeks operator+(Greeks lhs, const Greeks& rhs) {
    lhs += rhs;
    return lhs;
}

inline Greeks operator*(double k, const Greeks& g) { return g * k; }

inline std::ostream& operator<<(std::ostream& os, const Greeks& g) {
    os << "Greeks{delta=" << g.delta << ", gamma=" << g.gamma
       << ", vega=" << g.vega << ", theta=" << g.theta
       << ", rho=" << g.rho << "}";
    return os;
}

}  // namespace covenant
