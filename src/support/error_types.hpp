// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace covenant {

/// Structural defects detected while composing a contract (MalformedContract)
enum class ContractErrorCode {
    NegativeTimeOffset,   ///< Then() with a day before the epoch
    NegativeTimeBound,    ///< Truncate() with a day before the epoch
    TriggerNotCondition,  ///< When()/Anytime() given a numeric observable
    EmptyBasket,          ///< Multi-asset payoff with no underlyings
    EmptySchedule         ///< Payment or observation schedule with no dates
};

/// Construction-time error for contract trees
struct ContractError {
    ContractErrorCode code;
    double value = 0.0;  ///< Offending day offset (0 if not applicable)

    ContractError(ContractErrorCode code, double value = 0.0)
        : code(code), value(value) {}
};

/// Error codes for market snapshot construction and bumping
enum class MarketErrorCode {
    EmptyUnderlyingName,
    InvalidSpot,
    NonPositiveVolatility,
    NonFiniteRate,
    InvalidYieldCurve,
    UnknownUnderlying
};

/// Market snapshot validation error
struct MarketError {
    MarketErrorCode code;
    std::string underlying;  ///< Underlying involved (empty for rate errors)
    double value = 0.0;      ///< The invalid value that was provided

    MarketError(MarketErrorCode code, std::string underlying = {}, double value = 0.0)
        : code(code), underlying(std::move(underlying)), value(value) {}
};

/// Error codes surfaced by valuation and Greeks passes
enum class ValuationErrorCode {
    MalformedContract,
    UnknownUnderlying,
    MarketModelIncomplete,
    NegativeTimeOffset,
    NonPositiveVolatility,
    NumericDomainError,
    UnsupportedApproximation,
    MixedSettlementCurrency,
    DepthLimitExceeded,
    InvalidConfiguration
};

/// Detailed valuation error passed through expected failure path
struct ValuationError {
    ValuationErrorCode code;
    std::string subject;  ///< Underlying name, combinator or parameter involved
    double value = 0.0;   ///< Offending numeric value, day or count

    ValuationError(ValuationErrorCode code, std::string subject = {}, double value = 0.0)
        : code(code), subject(std::move(subject)), value(value) {}
};

inline std::string_view to_string(ContractErrorCode code) {
    switch (code) {
        case ContractErrorCode::NegativeTimeOffset:  return "NegativeTimeOffset";
        case ContractErrorCode::NegativeTimeBound:   return "NegativeTimeBound";
        case ContractErrorCode::TriggerNotCondition: return "TriggerNotCondition";
        case ContractErrorCode::EmptyBasket:         return "EmptyBasket";
        case ContractErrorCode::EmptySchedule:       return "EmptySchedule";
    }
    return "Unknown";
}

inline std::string_view to_string(MarketErrorCode code) {
    switch (code) {
        case MarketErrorCode::EmptyUnderlyingName:   return "EmptyUnderlyingName";
        case MarketErrorCode::InvalidSpot:           return "InvalidSpot";
        case MarketErrorCode::NonPositiveVolatility: return "NonPositiveVolatility";
        case MarketErrorCode::NonFiniteRate:         return "NonFiniteRate";
        case MarketErrorCode::InvalidYieldCurve:     return "InvalidYieldCurve";
        case MarketErrorCode::UnknownUnderlying:     return "UnknownUnderlying";
    }
    return "Unknown";
}

inline std::string_view to_string(ValuationErrorCode code) {
    switch (code) {
        case ValuationErrorCode::MalformedContract:        return "MalformedContract";
        case ValuationErrorCode::UnknownUnderlying:        return "UnknownUnderlying";
        case ValuationErrorCode::MarketModelIncomplete:    return "MarketModelIncomplete";
        case ValuationErrorCode::NegativeTimeOffset:       return "NegativeTimeOffset";
        case ValuationErrorCode::NonPositiveVolatility:    return "NonPositiveVolatility";
        case ValuationErrorCode::NumericDomainError:       return "NumericDomainError";
        case ValuationErrorCode::UnsupportedApproximation: return "UnsupportedApproximation";
        case ValuationErrorCode::MixedSettlementCurrency:  return "MixedSettlementCurrency";
        case ValuationErrorCode::DepthLimitExceeded:       return "DepthLimitExceeded";
        case ValuationErrorCode::InvalidConfiguration:     return "InvalidConfiguration";
    }
    return "Unknown";
}

/// Market errors reach valuation callers as ValuationError
inline ValuationError to_valuation_error(const MarketError& err) {
    switch (err.code) {
        case MarketErrorCode::NonPositiveVolatility:
            return ValuationError(ValuationErrorCode::NonPositiveVolatility, err.underlying, err.value);
        case MarketErrorCode::UnknownUnderlying:
            return ValuationError(ValuationErrorCode::UnknownUnderlying, err.underlying, err.value);
        case MarketErrorCode::NonFiniteRate:
        case MarketErrorCode::InvalidYieldCurve:
        case MarketErrorCode::InvalidSpot:
            return ValuationError(ValuationErrorCode::NumericDomainError, err.underlying, err.value);
        case MarketErrorCode::EmptyUnderlyingName:
            break;
    }
    return ValuationError(ValuationErrorCode::MarketModelIncomplete, err.underlying, err.value);
}

/// Construction errors reach valuation callers as MalformedContract
inline ValuationError to_valuation_error(const ContractError& err) {
    return ValuationError(ValuationErrorCode::MalformedContract,
                          std::string(to_string(err.code)), err.value);
}

/// Output stream operator for ContractError
inline std::ostream& operator<<(std::ostream& os, const ContractError& err) {
    os << "ContractError{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for MarketError
inline std::ostream& operator<<(std::ostream& os, const MarketError& err) {
    os << "MarketError{code=" << to_string(err.code);
    if (!err.underlying.empty()) {
        os << ", underlying=" << err.underlying;
    }
    os << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for ValuationError
inline std::ostream& operator<<(std::ostream& os, const ValuationError& err) {
    os << "ValuationError{code=" << to_string(err.code);
    if (!err.subject.empty()) {
        os << ", subject=" << err.subject;
    }
    os << ", value=" << err.value << "}";
    return os;
}

}  // namespace covenant
