// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>

#include "covenant/support/error_types.hpp"

namespace covenant {

/// Valuation engine configuration
struct EngineConfig {
    /// Reject When/Anytime/Truncate instead of using the forward-path approximation
    bool strict = false;

    /// Spacing of candidate acquisition days for When/Anytime searches
    int exercise_step_days = 1;

    /// Search window for When/Anytime without an enclosing Truncate
    int unbounded_horizon_days = 3650;

    /// Maximum tree depth (observables included)
    size_t max_depth = 512;

    /// Maximum number of distinct contract nodes
    size_t max_nodes = size_t{1} << 20;

    /// Maximum product of When/Anytime candidate counts along any path of
    /// the tree; nested searches multiply, so this bounds their total work
    size_t max_candidate_evaluations = 2'000'000;
};

/// Bump sizes for bump-and-reprice Greeks
struct GreeksConfig {
    /// Relative spot bump (absolute bump of the same size when spot is zero)
    double spot_bump_rel = 0.01;

    /// Absolute volatility bump
    double vol_bump_abs = 0.01;

    /// Parallel rate shift (1 bp)
    double rate_bump_abs = 1e-4;

    /// Evaluation day shift for theta
    int theta_bump_days = 1;

    /// Restrict delta/gamma/vega to one underlying (default: sum over all)
    std::optional<std::string> underlying;
};

inline std::expected<std::monostate, ValuationError>
validate_engine_config(const EngineConfig& config) {
    if (config.exercise_step_days < 1) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "exercise_step_days", config.exercise_step_days));
    }
    if (config.unbounded_horizon_days < 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "unbounded_horizon_days", config.unbounded_horizon_days));
    }
    if (config.max_depth == 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "max_depth", 0.0));
    }
    if (config.max_nodes == 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "max_nodes", 0.0));
    }
    if (config.max_candidate_evaluations == 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "max_candidate_evaluations", 0.0));
    }
    return std::monostate{};
}

inline std::expected<std::monostate, ValuationError>
validate_greeks_config(const GreeksConfig& config) {
    auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };
    if (!positive(config.spot_bump_rel)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "spot_bump_rel", config.spot_bump_rel));
    }
    if (!positive(config.vol_bump_abs)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "vol_bump_abs", config.vol_bump_abs));
    }
    if (!positive(config.rate_bump_abs)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "rate_bump_abs", config.rate_bump_abs));
    }
    if (config.theta_bump_days < 1) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidConfiguration,
                                              "theta_bump_days", config.theta_bump_days));
    }
    return std::monostate{};
}

}  // namespace covenant
