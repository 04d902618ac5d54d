// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace covenant {

/// Settlement currency tag carried by One() leaves
///
/// Currencies are labels only: no FX conversion is performed, so a contract
/// must settle in a single currency to be valued.
enum class Currency {
    USD,
    EUR,
    GBP,
    JPY,
    CHF
};

std::string_view to_string(Currency currency);

/// Parse an ISO code ("USD", "EUR", ...). Returns nullopt for unknown codes.
std::optional<Currency> parse_currency(std::string_view code);

inline std::ostream& operator<<(std::ostream& os, Currency currency) {
    return os << to_string(currency);
}

}  // namespace covenant
