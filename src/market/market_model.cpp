// SPDX-License-Identifier: MIT
#include "covenant/market/market_model.hpp"

#include "covenant/support/covenant_trace.h"

#include <cmath>
#include <variant>

namespace covenant {

namespace {

std::unexpected<MarketError> market_error(MarketErrorCode code, std::string name, double value) {
    COVENANT_TRACE_VALIDATION_ERROR(COVENANT_MODULE_MARKET, static_cast<int>(code), value);
    return std::unexpected(MarketError(code, std::move(name), value));
}

std::expected<std::monostate, MarketError> validate_quote(const std::string& name, const UnderlyingQuote& quote) {
    if (name.empty()) {
        return market_error(MarketErrorCode::EmptyUnderlyingName, name, 0.0);
    }
    if (!std::isfinite(quote.spot) || quote.spot < 0.0) {
        return market_error(MarketErrorCode::InvalidSpot, name, quote.spot);
    }
    if (!std::isfinite(quote.volatility) || quote.volatility <= 0.0) {
        return market_error(MarketErrorCode::NonPositiveVolatility, name, quote.volatility);
    }
    return std::monostate{};
}

}  // namespace

std::expected<MarketModel, MarketError> MarketModel::create(MarketData data) {
    for (const auto& [name, quote] : data.quotes) {
        auto ok = validate_quote(name, quote);
        if (!ok.has_value()) {
            return std::unexpected(ok.error());
        }
    }

    MarketModel model;
    if (const auto* rate = std::get_if<double>(&data.rate)) {
        if (!std::isfinite(*rate)) {
            return market_error(MarketErrorCode::NonFiniteRate, {}, *rate);
        }
        model.curve_ = YieldCurve::flat(*rate);
    } else {
        const auto& curve = std::get<YieldCurve>(data.rate);
        if (curve.points().size() < 2) {
            return market_error(MarketErrorCode::InvalidYieldCurve, {},
                                static_cast<double>(curve.points().size()));
        }
        model.curve_ = curve;
    }

    model.quotes_ = std::move(data.quotes);
    model.evaluation_day_ = data.evaluation_day;
    model.curve_origin_day_ = data.evaluation_day;
    model.variance_origin_day_ = data.evaluation_day;
    model.base_currency_ = data.base_currency;
    return model;
}

bool MarketModel::has_underlying(std::string_view name) const {
    return quotes_.find(name) != quotes_.end();
}

std::vector<std::string> MarketModel::underlyings() const {
    std::vector<std::string> names;
    names.reserve(quotes_.size());
    for (const auto& [name, quote] : quotes_) {
        names.push_back(name);
    }
    return names;
}

std::expected<double, MarketError> MarketModel::spot(std::string_view name) const {
    auto it = quotes_.find(name);
    if (it == quotes_.end()) {
        return std::unexpected(MarketError(MarketErrorCode::UnknownUnderlying, std::string(name)));
    }
    return it->second.spot;
}

std::expected<double, MarketError> MarketModel::volatility(std::string_view name) const {
    auto it = quotes_.find(name);
    if (it == quotes_.end()) {
        return std::unexpected(MarketError(MarketErrorCode::UnknownUnderlying, std::string(name)));
    }
    return it->second.volatility;
}

std::expected<double, MarketError> MarketModel::forward(std::string_view name, int day) const {
    auto s = spot(name);
    if (!s.has_value()) {
        return s;
    }
    if (day == evaluation_day_) {
        return *s;
    }
    return *s / discount(day);
}

double MarketModel::discount(int from, int to) const {
    double log_from = curve_.log_discount(year_fraction(curve_origin_day_, from));
    double log_to = curve_.log_discount(year_fraction(curve_origin_day_, to));
    return std::exp(log_to - log_from);
}

double MarketModel::forward_rate(int day) const {
    return curve_.rate(year_fraction(curve_origin_day_, day));
}

double MarketModel::variance_time(int day) const {
    double t = year_fraction(variance_origin_day_, day);
    return t > 0.0 ? t : 0.0;
}

std::expected<MarketModel, MarketError>
MarketModel::with_spot(std::string_view name, double spot) const {
    auto it = quotes_.find(name);
    if (it == quotes_.end()) {
        return market_error(MarketErrorCode::UnknownUnderlying, std::string(name), spot);
    }
    UnderlyingQuote quote = it->second;
    quote.spot = spot;
    auto ok = validate_quote(it->first, quote);
    if (!ok.has_value()) {
        return std::unexpected(ok.error());
    }
    MarketModel out = *this;
    out.quotes_.find(name)->second = quote;
    return out;
}

std::expected<MarketModel, MarketError>
MarketModel::with_volatility(std::string_view name, double vol) const {
    auto it = quotes_.find(name);
    if (it == quotes_.end()) {
        return market_error(MarketErrorCode::UnknownUnderlying, std::string(name), vol);
    }
    UnderlyingQuote quote = it->second;
    quote.volatility = vol;
    auto ok = validate_quote(it->first, quote);
    if (!ok.has_value()) {
        return std::unexpected(ok.error());
    }
    MarketModel out = *this;
    out.quotes_.find(name)->second = quote;
    return out;
}

std::expected<MarketModel, MarketError> MarketModel::with_rate_shift(double h) const {
    if (!std::isfinite(h)) {
        return market_error(MarketErrorCode::NonFiniteRate, {}, h);
    }
    MarketModel out = *this;
    out.curve_ = curve_.shifted(h);
    return out;
}

MarketModel MarketModel::with_evaluation_day(int day) const {
    MarketModel out = *this;
    int shift = day - evaluation_day_;
    out.evaluation_day_ = day;
    out.curve_origin_day_ += shift;
    out.variance_origin_day_ += shift;
    return out;
}

std::expected<MarketModel, ValuationError> MarketModel::rolled_to(int day) const {
    if (day < evaluation_day_) {
        return std::unexpected(ValuationError(ValuationErrorCode::NegativeTimeOffset,
                                              "rolled_to", static_cast<double>(day)));
    }
    if (day == evaluation_day_) {
        return *this;
    }
    double df = discount(day);
    if (!std::isfinite(df) || df <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                              "discount", df));
    }
    MarketModel out = *this;
    for (auto& [name, quote] : out.quotes_) {
        quote.spot /= df;
        if (!std::isfinite(quote.spot)) {
            return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                                  name, quote.spot));
        }
    }
    out.evaluation_day_ = day;
    return out;
}

}  // namespace covenant
