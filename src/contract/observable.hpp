// SPDX-License-Identifier: MIT
/**
 * @file observable.hpp
 * @brief Expression language for market quantities referenced by contracts
 *
 * An Observable is an immutable handle to a shared expression node. Nodes are
 * never mutated after construction, so sub-expressions can be shared freely
 * between contracts and across threads.
 *
 * Example:
 * @code
 *   auto s = underlying("AAPL");
 *   auto payoff = max(0.0, s - 100.0);   // call payoff
 *   auto trigger = greater(s, 120.0);     // boolean observable
 * @endcode
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace covenant {

/// Arithmetic operators on scalar observables
enum class BinaryOperator {
    Add,
    Subtract,
    Multiply,
    Divide,
    Max,
    Min,
    Average
};

/// Comparison operators producing boolean observables
enum class Comparison {
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    Equal
};

struct ObservableNode;

/// Immutable handle to a shared observable expression
class Observable {
public:
    explicit Observable(std::shared_ptr<const ObservableNode> node)
        : node_(std::move(node)) {}

    const ObservableNode& node() const { return *node_; }

    /// Boolean-valued (a Condition at the root)
    bool is_condition() const;

    /// Depth of the expression tree (leaves have depth 1)
    size_t depth() const;

    /// True if any Underlying appears in the expression
    bool references_market() const;

private:
    std::shared_ptr<const ObservableNode> node_;
};

namespace observable {

struct Constant {
    double value;
};

/// Spot price of a named asset
struct Underlying {
    std::string name;
};

struct BinaryOp {
    BinaryOperator op;
    Observable lhs;
    Observable rhs;
};

/// Boolean comparison; used as 1/0 where a scalar is required
struct Condition {
    Comparison op;
    Observable lhs;
    Observable rhs;
};

}  // namespace observable

struct ObservableNode {
    using Form = std::variant<observable::Constant,
                              observable::Underlying,
                              observable::BinaryOp,
                              observable::Condition>;

    Form form;
    size_t depth = 1;
    bool references_market = false;
};

inline bool Observable::is_condition() const {
    return std::holds_alternative<observable::Condition>(node_->form);
}

inline size_t Observable::depth() const {
    return node_->depth;
}

inline bool Observable::references_market() const {
    return node_->references_market;
}

// ===========================================================================
// Builders
// ===========================================================================

Observable constant(double value);
Observable underlying(std::string name);

Observable binary(BinaryOperator op, Observable lhs, Observable rhs);
Observable compare(Comparison op, Observable lhs, Observable rhs);

Observable operator+(const Observable& lhs, const Observable& rhs);
Observable operator-(const Observable& lhs, const Observable& rhs);
Observable operator*(const Observable& lhs, const Observable& rhs);
Observable operator/(const Observable& lhs, const Observable& rhs);

Observable operator+(const Observable& lhs, double rhs);
Observable operator-(const Observable& lhs, double rhs);
Observable operator*(const Observable& lhs, double rhs);
Observable operator/(const Observable& lhs, double rhs);
Observable operator+(double lhs, const Observable& rhs);
Observable operator-(double lhs, const Observable& rhs);
Observable operator*(double lhs, const Observable& rhs);
Observable operator/(double lhs, const Observable& rhs);

Observable max(const Observable& lhs, const Observable& rhs);
Observable max(double lhs, const Observable& rhs);
Observable max(const Observable& lhs, double rhs);
Observable min(const Observable& lhs, const Observable& rhs);
Observable min(double lhs, const Observable& rhs);
Observable min(const Observable& lhs, double rhs);
Observable avg(const Observable& lhs, const Observable& rhs);

Observable greater(const Observable& lhs, const Observable& rhs);
Observable greater(const Observable& lhs, double rhs);
Observable less(const Observable& lhs, const Observable& rhs);
Observable less(const Observable& lhs, double rhs);
Observable greater_equal(const Observable& lhs, const Observable& rhs);
Observable greater_equal(const Observable& lhs, double rhs);
Observable less_equal(const Observable& lhs, const Observable& rhs);
Observable less_equal(const Observable& lhs, double rhs);
Observable equal(const Observable& lhs, const Observable& rhs);
Observable equal(const Observable& lhs, double rhs);

// ===========================================================================
// Queries
// ===========================================================================

/// Value of a market-independent expression
///
/// Returns nullopt if the expression references an underlying, or if folding
/// it hits a division by zero or a non-finite intermediate.
std::optional<double> fold_constant(const Observable& obs);

/// Apply an arithmetic operator (result may be non-finite; callers check)
double apply_binary(BinaryOperator op, double lhs, double rhs);

bool apply_comparison(Comparison op, double lhs, double rhs);

/// Add every underlying name referenced by obs to names
void collect_underlyings(const Observable& obs, std::set<std::string, std::less<>>& names);

std::string to_string(BinaryOperator op);
std::string to_string(Comparison op);
std::string to_string(const Observable& obs);

std::ostream& operator<<(std::ostream& os, const Observable& obs);

}  // namespace covenant
