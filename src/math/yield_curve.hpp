// SPDX-License-Identifier: MIT
/**
 * @file yield_curve.hpp
 * @brief Yield curve with log-linear discount interpolation
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <expected>
#include <string>
#include <vector>

namespace covenant {

/// Point on a yield curve: tenor and log-discount factor
struct TenorPoint {
    double tenor;        // Time in years from the curve origin
    double log_discount; // ln(D(t)) where D(t) = exp(-integral_0^t r(s)ds)
};

/// Yield curve with log-linear discount interpolation
///
/// Stores discrete tenor points and interpolates ln(D(t)) linearly, which
/// gives piecewise-constant forward rates between tenors. Beyond the last
/// tenor the final forward rate is extrapolated flat.
class YieldCurve {
    std::vector<TenorPoint> curve_;  // Sorted by tenor, curve_[0].tenor == 0

public:
    YieldCurve() = default;

    /// Construct flat curve (constant rate)
    static YieldCurve flat(double rate) {
        YieldCurve curve;
        curve.curve_.push_back({0.0, 0.0});
        curve.curve_.push_back({100.0, -rate * 100.0});
        return curve;
    }

    /// Construct from tenor points (must include t=0 with log_discount=0)
    static std::expected<YieldCurve, std::string>
    from_points(std::vector<TenorPoint> points) {
        if (points.size() < 2) {
            return std::unexpected(std::string("At least two tenor points required"));
        }

        std::sort(points.begin(), points.end(),
            [](const TenorPoint& a, const TenorPoint& b) {
                return a.tenor < b.tenor;
            });

        if (points[0].tenor != 0.0) {
            return std::unexpected(std::string("First point must have t=0"));
        }
        if (std::abs(points[0].log_discount) > 1e-10) {
            return std::unexpected(std::string("log_discount at t=0 must be 0"));
        }

        constexpr double kMinTenorGap = 1e-10;
        for (size_t i = 1; i < points.size(); ++i) {
            if (points[i].tenor <= points[i - 1].tenor + kMinTenorGap) {
                return std::unexpected(std::string("Tenors must be strictly increasing"));
            }
            if (!std::isfinite(points[i].log_discount)) {
                return std::unexpected(std::string("log_discount must be finite"));
            }
        }

        YieldCurve curve;
        curve.curve_ = std::move(points);
        return curve;
    }

    /// Parallel shift of the zero curve: ln D(t) -> ln D(t) - h*t
    YieldCurve shifted(double h) const {
        YieldCurve out;
        out.curve_.reserve(curve_.size());
        for (const auto& p : curve_) {
            out.curve_.push_back({p.tenor, p.log_discount - h * p.tenor});
        }
        if (out.curve_.size() < 2) {
            return flat(h);
        }
        return out;
    }

    /// Instantaneous forward rate at time t
    double rate(double t) const {
        if (curve_.size() < 2) return 0.0;
        if (t <= 0.0) return rate_between(0);

        auto it = std::upper_bound(curve_.begin(), curve_.end(), t,
            [](double t, const TenorPoint& p) { return t < p.tenor; });

        if (it == curve_.begin()) return rate_between(0);
        if (it == curve_.end()) return rate_between(curve_.size() - 2);

        size_t idx = static_cast<size_t>(std::distance(curve_.begin(), it)) - 1;
        return rate_between(idx);
    }

    /// Discount factor D(t) = exp(ln_D(t))
    double discount(double t) const {
        return std::exp(log_discount(t));
    }

    /// Zero rate: -ln(D(t))/t
    double zero_rate(double t) const {
        if (t <= 0.0) return rate(0.0);
        return -log_discount(t) / t;
    }

    /// Log discount factor ln(D(t)) via linear interpolation
    ///
    /// Negative t (a day before the curve origin) is extrapolated with the
    /// short rate so that D stays strictly monotone across the origin.
    double log_discount(double t) const {
        if (curve_.size() < 2) return 0.0;
        if (t == 0.0) return 0.0;
        if (t < 0.0) return -rate_between(0) * t;

        auto it = std::upper_bound(curve_.begin(), curve_.end(), t,
            [](double t, const TenorPoint& p) { return t < p.tenor; });

        if (it == curve_.begin()) return 0.0;
        if (it == curve_.end()) {
            const auto& last = curve_.back();
            return last.log_discount - rate_between(curve_.size() - 2) * (t - last.tenor);
        }

        const auto& right = *it;
        const auto& left = *std::prev(it);
        double alpha = (t - left.tenor) / (right.tenor - left.tenor);
        return left.log_discount + alpha * (right.log_discount - left.log_discount);
    }

    const std::vector<TenorPoint>& points() const { return curve_; }

private:
    /// Forward rate between curve_[idx] and curve_[idx+1]
    double rate_between(size_t idx) const {
        if (idx + 1 >= curve_.size()) return 0.0;
        const auto& left = curve_[idx];
        const auto& right = curve_[idx + 1];
        double dt = right.tenor - left.tenor;
        if (dt <= 0.0) return 0.0;
        return -(right.log_discount - left.log_discount) / dt;
    }
};

}  // namespace covenant
