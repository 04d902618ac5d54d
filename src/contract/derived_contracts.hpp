// SPDX-License-Identifier: MIT
/**
 * @file derived_contracts.hpp
 * @brief Standard instruments assembled from the primitive combinators
 *
 * Nothing here is special-cased by the engine: each builder returns an
 * ordinary tree, so these instruments obey the same algebraic laws and
 * Greeks composition as any hand-built contract. All days are absolute.
 */

#pragma once

#include <expected>
#include <span>
#include <string>

#include "covenant/contract/contract.hpp"

namespace covenant {

using ContractResult = std::expected<Contract, ContractError>;

// ---- Fixed income ----------------------------------------------------------

/// Receive notional on maturity
ContractResult zcb(int maturity, double notional, Currency currency);

/// Receive `coupon` on each coupon day and notional on maturity
ContractResult coupon_bond(int maturity, double notional, double coupon,
                           std::span<const int> coupon_days, Currency currency);

/// Receive fixed, pay notional * index on each payment day
ContractResult interest_rate_swap(double notional, double fixed_rate,
                                  std::span<const int> payment_days,
                                  const std::string& floating_index, Currency currency);

// ---- Vanilla ---------------------------------------------------------------

/// Obligation to buy the underlying at strike on maturity
ContractResult forward_contract(const std::string& underlying, double strike,
                                int maturity, Currency currency);

ContractResult european_call(const std::string& underlying, double strike,
                             int maturity, Currency currency);

ContractResult european_put(const std::string& underlying, double strike,
                            int maturity, Currency currency);

/// Exercisable on any day up to maturity while in the money
ContractResult american_call(const std::string& underlying, double strike,
                             int maturity, Currency currency);

ContractResult american_put(const std::string& underlying, double strike,
                            int maturity, Currency currency);

// ---- Combinations ----------------------------------------------------------

ContractResult straddle(const std::string& underlying, double strike,
                        int maturity, Currency currency);

/// Long call at low_strike, short call at high_strike
ContractResult bull_call_spread(const std::string& underlying, double low_strike,
                                double high_strike, int maturity, Currency currency);

// ---- Exotics ---------------------------------------------------------------

/// Pays `payout` on maturity if the underlying is above strike
ContractResult digital_call(const std::string& underlying, double strike,
                            double payout, int maturity, Currency currency);

/// Call on the spread between two underlyings: max(0, S1 - S2 - K)
ContractResult spread_option(const std::string& first, const std::string& second,
                             double strike, int maturity, Currency currency);

/// Call on the best performer of a basket
ContractResult best_of_call(std::span<const std::string> underlyings, double strike,
                            int maturity, Currency currency);

/// Call on the worst performer of a basket
ContractResult worst_of_call(std::span<const std::string> underlyings, double strike,
                             int maturity, Currency currency);

/// Up-and-in barrier call: the call is acquired once the underlying exceeds barrier
ContractResult knock_in_call(const std::string& underlying, double strike,
                             double barrier, int maturity, Currency currency);

/// Up-and-out barrier call: worthless once the underlying exceeds barrier
ContractResult knock_out_call(const std::string& underlying, double strike,
                              double barrier, int maturity, Currency currency);

/// Call on a foreign underlying paid in `currency` at a rate fixed at inception
ContractResult quanto_call(const std::string& underlying, double strike,
                           double quanto_rate, int maturity, Currency currency);

/// Buy shares_per_day at strike on each observation day until the underlying
/// first exceeds knock_out
ContractResult accumulator(const std::string& underlying, double strike, double knock_out,
                           std::span<const int> observation_days, double shares_per_day,
                           Currency currency);

/// Note redeemed early at 100 plus accrued coupons on the first observation
/// day the underlying is at or above barrier
ContractResult autocallable(const std::string& underlying, double barrier, double coupon,
                            std::span<const int> observation_days, Currency currency);

}  // namespace covenant
