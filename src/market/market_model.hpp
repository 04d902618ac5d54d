// SPDX-License-Identifier: MIT
/**
 * @file market_model.hpp
 * @brief Immutable market snapshot: spots, volatilities, discounting, evaluation day
 *
 * All days are absolute days on the same axis as contract dates. Year
 * fractions use ACT/365. Bumping never mutates a snapshot; it returns a new
 * validated one.
 */

#pragma once

#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "covenant/contract/currency.hpp"
#include "covenant/math/yield_curve.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

/// Days per year for the fixed ACT/365 day fraction
inline constexpr double kDaysPerYear = 365.0;

/// Spot and lognormal volatility of one underlying
struct UnderlyingQuote {
    double spot = 0.0;
    double volatility = 0.0;  ///< Annualized, must be > 0
};

/// Rate input: constant continuously-compounded rate or full curve
using RateSpec = std::variant<double, YieldCurve>;

/// Raw market input
struct MarketData {
    std::map<std::string, UnderlyingQuote, std::less<>> quotes;
    RateSpec rate = 0.0;
    int evaluation_day = 0;
    Currency base_currency = Currency::USD;
};

/// Validated, immutable market snapshot
///
/// Three day origins are tracked separately so that a snapshot can be
/// rolled forward along the risk-neutral path:
/// - evaluation day: "today" for the observable evaluator and the pricer
/// - curve origin: day at which the yield curve's t=0 sits
/// - variance origin: day from which accumulated variance is measured
class MarketModel {
public:
    /// Validate raw data and build a snapshot
    static std::expected<MarketModel, MarketError> create(MarketData data);

    int evaluation_day() const { return evaluation_day_; }
    int curve_origin_day() const { return curve_origin_day_; }
    int variance_origin_day() const { return variance_origin_day_; }
    Currency base_currency() const { return base_currency_; }
    const YieldCurve& curve() const { return curve_; }

    bool has_underlying(std::string_view name) const;
    std::vector<std::string> underlyings() const;

    std::expected<double, MarketError> spot(std::string_view name) const;
    std::expected<double, MarketError> volatility(std::string_view name) const;

    /// Risk-neutral forward of name for delivery on day: spot / discount(day)
    std::expected<double, MarketError> forward(std::string_view name, int day) const;

    /// Discount factor from the evaluation day to day
    double discount(int day) const { return discount(evaluation_day_, day); }

    /// Discount factor from day `from` to day `to`
    double discount(int from, int to) const;

    /// Instantaneous forward rate at day
    double forward_rate(int day) const;

    /// Years of accumulated variance up to day
    double variance_time(int day) const;

    /// Year fraction between two days (ACT/365)
    static double year_fraction(int from, int to) {
        return static_cast<double>(to - from) / kDaysPerYear;
    }

    // ---- Bumped copies --------------------------------------------------

    std::expected<MarketModel, MarketError> with_spot(std::string_view name, double spot) const;
    std::expected<MarketModel, MarketError> with_volatility(std::string_view name, double vol) const;

    /// Parallel shift of the continuously-compounded zero curve by h
    std::expected<MarketModel, MarketError> with_rate_shift(double h) const;

    /// Same spots and curve shape, seen from a different day (all origins move)
    MarketModel with_evaluation_day(int day) const;

    /// Snapshot as seen on a later day along the forward path
    ///
    /// Spots become forwards for that day; discounting and the variance clock
    /// keep their origins. NegativeTimeOffset if day precedes the evaluation day.
    std::expected<MarketModel, ValuationError> rolled_to(int day) const;

private:
    MarketModel() = default;

    std::map<std::string, UnderlyingQuote, std::less<>> quotes_;
    YieldCurve curve_;
    int evaluation_day_ = 0;
    int curve_origin_day_ = 0;
    int variance_origin_day_ = 0;
    Currency base_currency_ = Currency::USD;
};

}  // namespace covenant
