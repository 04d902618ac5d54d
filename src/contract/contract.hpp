// SPDX-License-Identifier: MIT
/**
 * @file contract.hpp
 * @brief Contract algebra: ten primitive combinators over shared immutable trees
 *
 * Contracts are plain data. Every combinator allocates a new node that holds
 * handles to its children, so sub-trees are shared rather than copied and a
 * contract can be valued concurrently from several threads.
 *
 * Days passed to then() and truncate() are absolute days counted from a
 * shared epoch, the same axis as MarketData::evaluation_day.
 *
 * Example:
 * @code
 *   auto s = underlying("AAPL");
 *   auto call = then(90, scale(max(0.0, s - 100.0), one(Currency::USD)));
 *   if (!call) { std::cerr << call.error() << '\n'; }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <variant>

#include "covenant/contract/currency.hpp"
#include "covenant/contract/observable.hpp"
#include "covenant/support/error_types.hpp"

namespace covenant {

struct ContractNode;

/// Immutable handle to a shared contract tree
class Contract {
public:
    explicit Contract(std::shared_ptr<const ContractNode> node)
        : node_(std::move(node)) {}

    const ContractNode& node() const { return *node_; }

    /// Node identity, stable for the lifetime of the tree (used to detect sharing)
    const ContractNode* id() const { return node_.get(); }

    /// Depth of the tree, observable depth included
    size_t depth() const;

private:
    std::shared_ptr<const ContractNode> node_;
};

namespace contract {

/// No rights, no obligations
struct Zero {};

/// Immediately receive one unit of currency
struct One {
    Currency currency;
};

/// Swap rights and obligations with the counterparty
struct Give {
    Contract inner;
};

/// Acquire both
struct And {
    Contract lhs;
    Contract rhs;
};

/// Acquire the better of the two (holder's choice)
struct Or {
    Contract lhs;
    Contract rhs;
};

/// Acquire inner on absolute day `day` (or now, if already past)
struct Then {
    int day;
    Contract inner;
};

/// Multiply every payment of inner by the value of factor at acquisition
struct Scale {
    Observable factor;
    Contract inner;
};

/// Acquire inner as soon as trigger becomes true
struct When {
    Observable trigger;
    Contract inner;
};

/// Rights of inner expire after absolute day `day`
struct Truncate {
    int day;
    Contract inner;
};

/// Holder may acquire inner on any day trigger holds
struct Anytime {
    Observable trigger;
    Contract inner;
};

}  // namespace contract

struct ContractNode {
    using Form = std::variant<contract::Zero,
                              contract::One,
                              contract::Give,
                              contract::And,
                              contract::Or,
                              contract::Then,
                              contract::Scale,
                              contract::When,
                              contract::Truncate,
                              contract::Anytime>;

    Form form;
    size_t depth = 1;
};

inline size_t Contract::depth() const {
    return node_->depth;
}

// ===========================================================================
// Construction API
// ===========================================================================

Contract zero();
Contract one(Currency currency);
Contract give(Contract c);
Contract and_(Contract lhs, Contract rhs);
Contract or_(Contract lhs, Contract rhs);
Contract scale(Observable factor, Contract c);
Contract scale(double factor, Contract c);

/// Acquire c on day `day`; NegativeTimeOffset if day < 0
std::expected<Contract, ContractError> then(int day, Contract c);

/// Restrict c to acquisition on or before `day`; NegativeTimeBound if day < 0
std::expected<Contract, ContractError> truncate(int day, Contract c);

/// Acquire c when trigger holds; TriggerNotCondition for numeric triggers
std::expected<Contract, ContractError> when(Observable trigger, Contract c);

/// Holder may acquire c whenever trigger holds; TriggerNotCondition for numeric triggers
std::expected<Contract, ContractError> anytime(Observable trigger, Contract c);

inline Contract operator+(const Contract& lhs, const Contract& rhs) { return and_(lhs, rhs); }
inline Contract operator|(const Contract& lhs, const Contract& rhs) { return or_(lhs, rhs); }
inline Contract operator-(const Contract& c) { return give(c); }

// ===========================================================================
// Queries
// ===========================================================================

/// Number of distinct nodes (shared sub-trees counted once)
size_t unique_node_count(const Contract& c);

/// Every underlying name referenced by any observable in the tree
std::set<std::string, std::less<>> referenced_underlyings(const Contract& c);

/// Settlement currencies of all One() leaves
std::set<Currency> settlement_currencies(const Contract& c);

/// Contains When, Anytime or Truncate (valued by forward-path approximation)
bool uses_path_approximation(const Contract& c);

std::string to_string(const Contract& c);

std::ostream& operator<<(std::ostream& os, const Contract& c);

}  // namespace covenant
