// SPDX-License-Identifier: MIT
#include "covenant/contract/observable.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace covenant {

namespace {

Observable make_node(ObservableNode::Form form, size_t depth, bool references_market) {
    auto node = std::make_shared<ObservableNode>();
    node->form = std::move(form);
    node->depth = depth;
    node->references_market = references_market;
    return Observable(std::move(node));
}

void print(std::ostream& os, const Observable& obs) {
    std::visit([&](const auto& form) {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, observable::Constant>) {
            os << form.value;
        } else if constexpr (std::is_same_v<T, observable::Underlying>) {
            os << form.name;
        } else if constexpr (std::is_same_v<T, observable::BinaryOp>) {
            switch (form.op) {
                case BinaryOperator::Max:
                case BinaryOperator::Min:
                case BinaryOperator::Average:
                    os << to_string(form.op) << "(";
                    print(os, form.lhs);
                    os << ", ";
                    print(os, form.rhs);
                    os << ")";
                    break;
                default:
                    os << "(";
                    print(os, form.lhs);
                    os << " " << to_string(form.op) << " ";
                    print(os, form.rhs);
                    os << ")";
                    break;
            }
        } else {
            os << "(";
            print(os, form.lhs);
            os << " " << to_string(form.op) << " ";
            print(os, form.rhs);
            os << ")";
        }
    }, obs.node().form);
}

}  // namespace

Observable constant(double value) {
    return make_node(observable::Constant{value}, 1, false);
}

Observable underlying(std::string name) {
    return make_node(observable::Underlying{std::move(name)}, 1, true);
}

Observable binary(BinaryOperator op, Observable lhs, Observable rhs) {
    size_t depth = 1 + std::max(lhs.depth(), rhs.depth());
    bool market = lhs.references_market() || rhs.references_market();
    return make_node(observable::BinaryOp{op, std::move(lhs), std::move(rhs)}, depth, market);
}

Observable compare(Comparison op, Observable lhs, Observable rhs) {
    size_t depth = 1 + std::max(lhs.depth(), rhs.depth());
    bool market = lhs.references_market() || rhs.references_market();
    return make_node(observable::Condition{op, std::move(lhs), std::move(rhs)}, depth, market);
}

Observable operator+(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Add, lhs, rhs); }
Observable operator-(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Subtract, lhs, rhs); }
Observable operator*(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Multiply, lhs, rhs); }
Observable operator/(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Divide, lhs, rhs); }

Observable operator+(const Observable& lhs, double rhs) { return lhs + constant(rhs); }
Observable operator-(const Observable& lhs, double rhs) { return lhs - constant(rhs); }
Observable operator*(const Observable& lhs, double rhs) { return lhs * constant(rhs); }
Observable operator/(const Observable& lhs, double rhs) { return lhs / constant(rhs); }
Observable operator+(double lhs, const Observable& rhs) { return constant(lhs) + rhs; }
Observable operator-(double lhs, const Observable& rhs) { return constant(lhs) - rhs; }
Observable operator*(double lhs, const Observable& rhs) { return constant(lhs) * rhs; }
Observable operator/(double lhs, const Observable& rhs) { return constant(lhs) / rhs; }

Observable max(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Max, lhs, rhs); }
Observable max(double lhs, const Observable& rhs) { return max(constant(lhs), rhs); }
Observable max(const Observable& lhs, double rhs) { return max(lhs, constant(rhs)); }
Observable min(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Min, lhs, rhs); }
Observable min(double lhs, const Observable& rhs) { return min(constant(lhs), rhs); }
Observable min(const Observable& lhs, double rhs) { return min(lhs, constant(rhs)); }
Observable avg(const Observable& lhs, const Observable& rhs) { return binary(BinaryOperator::Average, lhs, rhs); }

Observable greater(const Observable& lhs, const Observable& rhs) { return compare(Comparison::Greater, lhs, rhs); }
Observable greater(const Observable& lhs, double rhs) { return greater(lhs, constant(rhs)); }
Observable less(const Observable& lhs, const Observable& rhs) { return compare(Comparison::Less, lhs, rhs); }
Observable less(const Observable& lhs, double rhs) { return less(lhs, constant(rhs)); }
Observable greater_equal(const Observable& lhs, const Observable& rhs) { return compare(Comparison::GreaterEqual, lhs, rhs); }
Observable greater_equal(const Observable& lhs, double rhs) { return greater_equal(lhs, constant(rhs)); }
Observable less_equal(const Observable& lhs, const Observable& rhs) { return compare(Comparison::LessEqual, lhs, rhs); }
Observable less_equal(const Observable& lhs, double rhs) { return less_equal(lhs, constant(rhs)); }
Observable equal(const Observable& lhs, const Observable& rhs) { return compare(Comparison::Equal, lhs, rhs); }
Observable equal(const Observable& lhs, double rhs) { return equal(lhs, constant(rhs)); }

double apply_binary(BinaryOperator op, double lhs, double rhs) {
    switch (op) {
        case BinaryOperator::Add:      return lhs + rhs;
        case BinaryOperator::Subtract: return lhs - rhs;
        case BinaryOperator::Multiply: return lhs * rhs;
        case BinaryOperator::Divide:   return lhs / rhs;
        case BinaryOperator::Max:      return std::max(lhs, rhs);
        case BinaryOperator::Min:      return std::min(lhs, rhs);
        case BinaryOperator::Average:  return 0.5 * (lhs + rhs);
    }
    return std::nan("");
}

bool apply_comparison(Comparison op, double lhs, double rhs) {
    switch (op) {
        case Comparison::Greater:      return lhs > rhs;
        case Comparison::Less:         return lhs < rhs;
        case Comparison::GreaterEqual: return lhs >= rhs;
        case Comparison::LessEqual:    return lhs <= rhs;
        case Comparison::Equal:        return lhs == rhs;
    }
    return false;
}

std::optional<double> fold_constant(const Observable& obs) {
    if (obs.references_market()) {
        return std::nullopt;
    }
    return std::visit([](const auto& form) -> std::optional<double> {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, observable::Constant>) {
            if (!std::isfinite(form.value)) return std::nullopt;
            return form.value;
        } else if constexpr (std::is_same_v<T, observable::Underlying>) {
            return std::nullopt;
        } else {
            auto lhs = fold_constant(form.lhs);
            auto rhs = fold_constant(form.rhs);
            if (!lhs || !rhs) return std::nullopt;
            if constexpr (std::is_same_v<T, observable::BinaryOp>) {
                if (form.op == BinaryOperator::Divide && *rhs == 0.0) return std::nullopt;
                double v = apply_binary(form.op, *lhs, *rhs);
                if (!std::isfinite(v)) return std::nullopt;
                return v;
            } else {
                return apply_comparison(form.op, *lhs, *rhs) ? 1.0 : 0.0;
            }
        }
    }, obs.node().form);
}

void collect_underlyings(const Observable& obs, std::set<std::string, std::less<>>& names) {
    if (!obs.references_market()) {
        return;
    }
    std::visit([&](const auto& form) {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, observable::Underlying>) {
            names.insert(form.name);
        } else if constexpr (std::is_same_v<T, observable::BinaryOp> ||
                             std::is_same_v<T, observable::Condition>) {
            collect_underlyings(form.lhs, names);
            collect_underlyings(form.rhs, names);
        }
    }, obs.node().form);
}

std::string to_string(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add:      return "+";
        case BinaryOperator::Subtract: return "-";
        case BinaryOperator::Multiply: return "*";
        case BinaryOperator::Divide:   return "/";
        case BinaryOperator::Max:      return "max";
        case BinaryOperator::Min:      return "min";
        case BinaryOperator::Average:  return "avg";
    }
    return "?";
}

std::string to_string(Comparison op) {
    switch (op) {
        case Comparison::Greater:      return ">";
        case Comparison::Less:         return "<";
        case Comparison::GreaterEqual: return ">=";
        case Comparison::LessEqual:    return "<=";
        case Comparison::Equal:        return "==";
    }
    return "?";
}

std::string to_string(const Observable& obs) {
    std::ostringstream os;
    print(os, obs);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Observable& obs) {
    print(os, obs);
    return os;
}

}  // namespace covenant
