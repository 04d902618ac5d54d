// SPDX-License-Identifier: MIT
#include "covenant/contract/contract.hpp"

#include "covenant/support/covenant_trace.h"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <unordered_set>

namespace covenant {

namespace {

Contract make_node(ContractNode::Form form, size_t depth) {
    auto node = std::make_shared<ContractNode>();
    node->form = std::move(form);
    node->depth = depth;
    return Contract(std::move(node));
}

/// Visit every distinct node once (pre-order)
template <typename Fn>
void for_each_node(const Contract& root, std::unordered_set<const ContractNode*>& seen, Fn&& fn) {
    if (!seen.insert(root.id()).second) {
        return;
    }
    fn(root.node());
    std::visit([&](const auto& form) {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, contract::And> || std::is_same_v<T, contract::Or>) {
            for_each_node(form.lhs, seen, fn);
            for_each_node(form.rhs, seen, fn);
        } else if constexpr (std::is_same_v<T, contract::Zero> || std::is_same_v<T, contract::One>) {
            // leaf
        } else {
            for_each_node(form.inner, seen, fn);
        }
    }, root.node().form);
}

void print(std::ostream& os, const Contract& c) {
    std::visit([&](const auto& form) {
        using T = std::decay_t<decltype(form)>;
        if constexpr (std::is_same_v<T, contract::Zero>) {
            os << "Zero";
        } else if constexpr (std::is_same_v<T, contract::One>) {
            os << "One(" << form.currency << ")";
        } else if constexpr (std::is_same_v<T, contract::Give>) {
            os << "Give(";
            print(os, form.inner);
            os << ")";
        } else if constexpr (std::is_same_v<T, contract::And> || std::is_same_v<T, contract::Or>) {
            os << (std::is_same_v<T, contract::And> ? "And(" : "Or(");
            print(os, form.lhs);
            os << ", ";
            print(os, form.rhs);
            os << ")";
        } else if constexpr (std::is_same_v<T, contract::Then>) {
            os << "Then(" << form.day << ", ";
            print(os, form.inner);
            os << ")";
        } else if constexpr (std::is_same_v<T, contract::Truncate>) {
            os << "Truncate(" << form.day << ", ";
            print(os, form.inner);
            os << ")";
        } else if constexpr (std::is_same_v<T, contract::Scale>) {
            os << "Scale(" << form.factor << ", ";
            print(os, form.inner);
            os << ")";
        } else if constexpr (std::is_same_v<T, contract::When>) {
            os << "When(" << form.trigger << ", ";
            print(os, form.inner);
            os << ")";
        } else {
            os << "Anytime(" << form.trigger << ", ";
            print(os, form.inner);
            os << ")";
        }
    }, c.node().form);
}

std::unexpected<ContractError> contract_error(ContractErrorCode code, double value) {
    COVENANT_TRACE_VALIDATION_ERROR(COVENANT_MODULE_CONTRACT, static_cast<int>(code), value);
    return std::unexpected(ContractError(code, value));
}

}  // namespace

Contract zero() {
    return make_node(contract::Zero{}, 1);
}

Contract one(Currency currency) {
    return make_node(contract::One{currency}, 1);
}

Contract give(Contract c) {
    size_t depth = c.depth() + 1;
    return make_node(contract::Give{std::move(c)}, depth);
}

Contract and_(Contract lhs, Contract rhs) {
    size_t depth = std::max(lhs.depth(), rhs.depth()) + 1;
    return make_node(contract::And{std::move(lhs), std::move(rhs)}, depth);
}

Contract or_(Contract lhs, Contract rhs) {
    size_t depth = std::max(lhs.depth(), rhs.depth()) + 1;
    return make_node(contract::Or{std::move(lhs), std::move(rhs)}, depth);
}

Contract scale(Observable factor, Contract c) {
    size_t depth = std::max(factor.depth(), c.depth()) + 1;
    return make_node(contract::Scale{std::move(factor), std::move(c)}, depth);
}

Contract scale(double factor, Contract c) {
    return scale(constant(factor), std::move(c));
}

std::expected<Contract, ContractError> then(int day, Contract c) {
    if (day < 0) {
        return contract_error(ContractErrorCode::NegativeTimeOffset, day);
    }
    size_t depth = c.depth() + 1;
    return make_node(contract::Then{day, std::move(c)}, depth);
}

std::expected<Contract, ContractError> truncate(int day, Contract c) {
    if (day < 0) {
        return contract_error(ContractErrorCode::NegativeTimeBound, day);
    }
    size_t depth = c.depth() + 1;
    return make_node(contract::Truncate{day, std::move(c)}, depth);
}

std::expected<Contract, ContractError> when(Observable trigger, Contract c) {
    if (!trigger.is_condition()) {
        return contract_error(ContractErrorCode::TriggerNotCondition, 0.0);
    }
    size_t depth = std::max(trigger.depth(), c.depth()) + 1;
    return make_node(contract::When{std::move(trigger), std::move(c)}, depth);
}

std::expected<Contract, ContractError> anytime(Observable trigger, Contract c) {
    if (!trigger.is_condition()) {
        return contract_error(ContractErrorCode::TriggerNotCondition, 0.0);
    }
    size_t depth = std::max(trigger.depth(), c.depth()) + 1;
    return make_node(contract::Anytime{std::move(trigger), std::move(c)}, depth);
}

size_t unique_node_count(const Contract& c) {
    std::unordered_set<const ContractNode*> seen;
    size_t count = 0;
    for_each_node(c, seen, [&](const ContractNode&) { ++count; });
    return count;
}

std::set<std::string, std::less<>> referenced_underlyings(const Contract& c) {
    std::set<std::string, std::less<>> names;
    std::unordered_set<const ContractNode*> seen;
    for_each_node(c, seen, [&](const ContractNode& node) {
        if (const auto* s = std::get_if<contract::Scale>(&node.form)) {
            collect_underlyings(s->factor, names);
        } else if (const auto* w = std::get_if<contract::When>(&node.form)) {
            collect_underlyings(w->trigger, names);
        } else if (const auto* a = std::get_if<contract::Anytime>(&node.form)) {
            collect_underlyings(a->trigger, names);
        }
    });
    return names;
}

std::set<Currency> settlement_currencies(const Contract& c) {
    std::set<Currency> currencies;
    std::unordered_set<const ContractNode*> seen;
    for_each_node(c, seen, [&](const ContractNode& node) {
        if (const auto* o = std::get_if<contract::One>(&node.form)) {
            currencies.insert(o->currency);
        }
    });
    return currencies;
}

bool uses_path_approximation(const Contract& c) {
    bool found = false;
    std::unordered_set<const ContractNode*> seen;
    for_each_node(c, seen, [&](const ContractNode& node) {
        found = found ||
                std::holds_alternative<contract::When>(node.form) ||
                std::holds_alternative<contract::Anytime>(node.form) ||
                std::holds_alternative<contract::Truncate>(node.form);
    });
    return found;
}

std::string to_string(const Contract& c) {
    std::ostringstream os;
    print(os, c);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Contract& c) {
    print(os, c);
    return os;
}

}  // namespace covenant
