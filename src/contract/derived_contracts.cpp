// SPDX-License-Identifier: MIT
#include "covenant/contract/derived_contracts.hpp"

namespace covenant {

namespace {

/// Then(maturity, Scale(payoff, One(currency)))
ContractResult pay_on(int maturity, Observable payoff, Currency currency) {
    return then(maturity, scale(std::move(payoff), one(currency)));
}

Observable call_payoff(const std::string& name, double strike) {
    return max(0.0, underlying(name) - strike);
}

Observable put_payoff(const std::string& name, double strike) {
    return max(0.0, strike - underlying(name));
}

/// Exercise is allowed on every candidate day; the max(0, .) payoff floors each
/// exercise value, so Anytime picks the best of intrinsic now and the European
/// value of each later exercise day
ContractResult american(Observable payoff, int maturity, Currency currency) {
    Observable exercisable = greater_equal(payoff, 0.0);
    auto right = anytime(std::move(exercisable), scale(std::move(payoff), one(currency)));
    if (!right.has_value()) {
        return right;
    }
    return truncate(maturity, std::move(*right));
}

ContractResult basket_call(std::span<const std::string> names, BinaryOperator pick,
                           double strike, int maturity, Currency currency) {
    if (names.empty()) {
        return std::unexpected(ContractError(ContractErrorCode::EmptyBasket));
    }
    Observable level = underlying(names.front());
    for (size_t i = 1; i < names.size(); ++i) {
        level = binary(pick, level, underlying(names[i]));
    }
    return pay_on(maturity, max(0.0, level - strike), currency);
}

}  // namespace

ContractResult zcb(int maturity, double notional, Currency currency) {
    return pay_on(maturity, constant(notional), currency);
}

ContractResult coupon_bond(int maturity, double notional, double coupon,
                           std::span<const int> coupon_days, Currency currency) {
    auto bond = zcb(maturity, notional, currency);
    if (!bond.has_value()) {
        return bond;
    }
    Contract result = std::move(*bond);
    for (int day : coupon_days) {
        auto payment = pay_on(day, constant(coupon), currency);
        if (!payment.has_value()) {
            return payment;
        }
        result = and_(std::move(result), std::move(*payment));
    }
    return result;
}

ContractResult interest_rate_swap(double notional, double fixed_rate,
                                  std::span<const int> payment_days,
                                  const std::string& floating_index, Currency currency) {
    if (payment_days.empty()) {
        return std::unexpected(ContractError(ContractErrorCode::EmptySchedule));
    }
    Contract fixed_leg = zero();
    Contract floating_leg = zero();
    for (int day : payment_days) {
        auto fixed = pay_on(day, constant(notional * fixed_rate), currency);
        if (!fixed.has_value()) {
            return fixed;
        }
        auto floating = pay_on(day, notional * underlying(floating_index), currency);
        if (!floating.has_value()) {
            return floating;
        }
        fixed_leg = and_(std::move(fixed_leg), std::move(*fixed));
        floating_leg = and_(std::move(floating_leg), std::move(*floating));
    }
    return and_(std::move(fixed_leg), give(std::move(floating_leg)));
}

ContractResult forward_contract(const std::string& underlying_name, double strike,
                                int maturity, Currency currency) {
    return pay_on(maturity, underlying(underlying_name) - strike, currency);
}

ContractResult european_call(const std::string& underlying_name, double strike,
                             int maturity, Currency currency) {
    return pay_on(maturity, call_payoff(underlying_name, strike), currency);
}

ContractResult european_put(const std::string& underlying_name, double strike,
                            int maturity, Currency currency) {
    return pay_on(maturity, put_payoff(underlying_name, strike), currency);
}

ContractResult american_call(const std::string& underlying_name, double strike,
                             int maturity, Currency currency) {
    return american(call_payoff(underlying_name, strike), maturity, currency);
}

ContractResult american_put(const std::string& underlying_name, double strike,
                            int maturity, Currency currency) {
    return american(put_payoff(underlying_name, strike), maturity, currency);
}

ContractResult straddle(const std::string& underlying_name, double strike,
                        int maturity, Currency currency) {
    auto call = european_call(underlying_name, strike, maturity, currency);
    if (!call.has_value()) {
        return call;
    }
    auto put = european_put(underlying_name, strike, maturity, currency);
    if (!put.has_value()) {
        return put;
    }
    return *call + *put;
}

ContractResult bull_call_spread(const std::string& underlying_name, double low_strike,
                                double high_strike, int maturity, Currency currency) {
    auto long_call = european_call(underlying_name, low_strike, maturity, currency);
    if (!long_call.has_value()) {
        return long_call;
    }
    auto short_call = european_call(underlying_name, high_strike, maturity, currency);
    if (!short_call.has_value()) {
        return short_call;
    }
    return *long_call + -*short_call;
}

ContractResult digital_call(const std::string& underlying_name, double strike,
                            double payout, int maturity, Currency currency) {
    Observable in_the_money = greater(underlying(underlying_name), strike);
    return then(maturity, scale(payout, scale(in_the_money, one(currency))));
}

ContractResult spread_option(const std::string& first, const std::string& second,
                             double strike, int maturity, Currency currency) {
    Observable spread = underlying(first) - underlying(second);
    return pay_on(maturity, max(0.0, spread - strike), currency);
}

ContractResult best_of_call(std::span<const std::string> underlyings, double strike,
                            int maturity, Currency currency) {
    return basket_call(underlyings, BinaryOperator::Max, strike, maturity, currency);
}

ContractResult worst_of_call(std::span<const std::string> underlyings, double strike,
                             int maturity, Currency currency) {
    return basket_call(underlyings, BinaryOperator::Min, strike, maturity, currency);
}

ContractResult knock_in_call(const std::string& underlying_name, double strike,
                             double barrier, int maturity, Currency currency) {
    auto call = european_call(underlying_name, strike, maturity, currency);
    if (!call.has_value()) {
        return call;
    }
    auto knocked_in = when(greater(underlying(underlying_name), barrier), std::move(*call));
    if (!knocked_in.has_value()) {
        return knocked_in;
    }
    return truncate(maturity, std::move(*knocked_in));
}

ContractResult knock_out_call(const std::string& underlying_name, double strike,
                              double barrier, int maturity, Currency currency) {
    auto call = european_call(underlying_name, strike, maturity, currency);
    if (!call.has_value()) {
        return call;
    }
    auto knocked_in = knock_in_call(underlying_name, strike, barrier, maturity, currency);
    if (!knocked_in.has_value()) {
        return knocked_in;
    }
    // in-out parity: knock-out = vanilla - knock-in
    return and_(std::move(*call), give(std::move(*knocked_in)));
}

ContractResult quanto_call(const std::string& underlying_name, double strike,
                           double quanto_rate, int maturity, Currency currency) {
    auto call = european_call(underlying_name, strike, maturity, currency);
    if (!call.has_value()) {
        return call;
    }
    return scale(quanto_rate, std::move(*call));
}

ContractResult accumulator(const std::string& underlying_name, double strike, double knock_out,
                           std::span<const int> observation_days, double shares_per_day,
                           Currency currency) {
    if (observation_days.empty()) {
        return std::unexpected(ContractError(ContractErrorCode::EmptySchedule));
    }
    Observable purchase = shares_per_day * (underlying(underlying_name) - strike);
    Contract result = zero();
    for (int day : observation_days) {
        auto fixing = pay_on(day, purchase, currency);
        if (!fixing.has_value()) {
            return fixing;
        }
        // Purchases on or after the first knock-out day are cancelled
        auto cancelled = when(greater(underlying(underlying_name), knock_out), *fixing);
        if (!cancelled.has_value()) {
            return cancelled;
        }
        auto window = truncate(day, std::move(*cancelled));
        if (!window.has_value()) {
            return window;
        }
        result = and_(std::move(result), and_(std::move(*fixing), give(std::move(*window))));
    }
    return result;
}

ContractResult autocallable(const std::string& underlying_name, double barrier, double coupon,
                            std::span<const int> observation_days, Currency currency) {
    if (observation_days.empty()) {
        return std::unexpected(ContractError(ContractErrorCode::EmptySchedule));
    }
    std::optional<Contract> result;
    for (size_t i = 0; i < observation_days.size(); ++i) {
        double redemption = 100.0 + coupon * static_cast<double>(i + 1);
        auto paid = pay_on(observation_days[i], constant(redemption), currency);
        if (!paid.has_value()) {
            return paid;
        }
        auto early_call = when(greater_equal(underlying(underlying_name), barrier),
                               std::move(*paid));
        if (!early_call.has_value()) {
            return early_call;
        }
        result = result.has_value() ? or_(std::move(*result), std::move(*early_call))
                                    : std::move(*early_call);
    }
    return std::move(*result);
}

}  // namespace covenant
