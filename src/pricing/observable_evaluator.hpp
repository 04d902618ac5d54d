// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <variant>

#include "covenant/contract/observable.hpp"
#include "covenant/market/market_model.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

/// Result of evaluating an observable: a number or a truth value
using ObservableValue = std::variant<double, bool>;

/// Evaluate obs against market as seen from `day`
///
/// Underlying(name) resolves to the spot on the evaluation day and to the
/// risk-neutral forward on any other day. Division by zero and non-finite
/// results are reported as NumericDomainError; unknown names as
/// UnknownUnderlying.
std::expected<ObservableValue, ValuationError>
evaluate(const Observable& obs, const MarketModel& market, int day);

/// Evaluate as a number; booleans become indicators (1 or 0)
std::expected<double, ValuationError>
evaluate_scalar(const Observable& obs, const MarketModel& market, int day);

/// Evaluate as a truth value; numbers are true when non-zero
std::expected<bool, ValuationError>
evaluate_condition(const Observable& obs, const MarketModel& market, int day);

inline double as_scalar(const ObservableValue& v) {
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? 1.0 : 0.0;
    }
    return std::get<double>(v);
}

}  // namespace covenant
