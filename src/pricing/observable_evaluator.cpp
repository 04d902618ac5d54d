// SPDX-License-Identifier: MIT
#include "covenant/pricing/observable_evaluator.hpp"

#include "covenant/support/covenant_trace.h"

#include <cmath>
#include <type_traits>

namespace covenant {

namespace {

std::unexpected<ValuationError> domain_error(std::string subject, double value, int day) {
    COVENANT_TRACE_RUNTIME_ERROR(COVENANT_MODULE_OBSERVABLE,
                                 static_cast<int>(ValuationErrorCode::NumericDomainError), day);
    return std::unexpected(ValuationError(ValuationErrorCode::NumericDomainError,
                                          std::move(subject), value));
}

}  // namespace

std::expected<ObservableValue, ValuationError>
evaluate(const Observable& obs, const MarketModel& market, int day) {
    return std::visit([&](const auto& form) -> std::expected<ObservableValue, ValuationError> {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, observable::Constant>) {
            if (!std::isfinite(form.value)) {
                return domain_error("constant", form.value, day);
            }
            return ObservableValue(std::in_place_type<double>, form.value);
        } else if constexpr (std::is_same_v<T, observable::Underlying>) {
            auto fwd = market.forward(form.name, day);
            if (!fwd.has_value()) {
                return std::unexpected(ValuationError(ValuationErrorCode::UnknownUnderlying,
                                                      form.name, static_cast<double>(day)));
            }
            if (!std::isfinite(*fwd)) {
                return domain_error(form.name, *fwd, day);
            }
            return ObservableValue(std::in_place_type<double>, *fwd);
        } else {
            auto lhs = evaluate_scalar(form.lhs, market, day);
            if (!lhs.has_value()) {
                return std::unexpected(lhs.error());
            }
            auto rhs = evaluate_scalar(form.rhs, market, day);
            if (!rhs.has_value()) {
                return std::unexpected(rhs.error());
            }
            if constexpr (std::is_same_v<T, observable::BinaryOp>) {
                if (form.op == BinaryOperator::Divide && *rhs == 0.0) {
                    return domain_error("division by zero", *lhs, day);
                }
                double v = apply_binary(form.op, *lhs, *rhs);
                if (!std::isfinite(v)) {
                    return domain_error(to_string(form.op), v, day);
                }
                return ObservableValue(std::in_place_type<double>, v);
            } else {
                return ObservableValue(std::in_place_type<bool>, apply_comparison(form.op, *lhs, *rhs));
            }
        }
    }, obs.node().form);
}

std::expected<double, ValuationError>
evaluate_scalar(const Observable& obs, const MarketModel& market, int day) {
    auto v = evaluate(obs, market, day);
    if (!v.has_value()) {
        return std::unexpected(v.error());
    }
    return as_scalar(*v);
}

std::expected<bool, ValuationError>
evaluate_condition(const Observable& obs, const MarketModel& market, int day) {
    auto v = evaluate(obs, market, day);
    if (!v.has_value()) {
        return std::unexpected(v.error());
    }
    if (const auto* b = std::get_if<bool>(&*v)) {
        return *b;
    }
    return std::get<double>(*v) != 0.0;
}

}  // namespace covenant
