// SPDX-License-Identifier: MIT
#include "covenant/contract/currency.hpp"

#include <array>
#include <utility>

namespace covenant {

namespace {

constexpr std::array<std::pair<Currency, std::string_view>, 5> kCurrencyCodes{{
    {Currency::USD, "USD"},
    {Currency::EUR, "EUR"},
    {Currency::GBP, "GBP"},
    {Currency::JPY, "JPY"},
    {Currency::CHF, "CHF"},
}};

}  // namespace

std::string_view to_string(Currency currency) {
    for (const auto& [cur, code] : kCurrencyCodes) {
        if (cur == currency) {
            return code;
        }
    }
    return "???";
}

std::optional<Currency> parse_currency(std::string_view code) {
    for (const auto& [cur, name] : kCurrencyCodes) {
        if (name == code) {
            return cur;
        }
    }
    return std::nullopt;
}

}  // namespace covenant
