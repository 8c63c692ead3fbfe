// SPDX-License-Identifier: MIT
/**
 * @file greeks.hpp
 * @brief Option sensitivities in trading-desk units
 */

#pragma once

namespace volscan {

/// Option Greeks in the units traders quote them
///
/// - delta: ∂V/∂S
/// - gamma: ∂²V/∂S²
/// - theta: value change per calendar day (∂V/∂t / 365)
/// - vega:  value change per 1 vol point (∂V/∂σ × 0.01)
/// - rho:   value change per 1 rate point (∂V/∂r × 0.01)
///
/// Derived from pricing inputs only; recomputing from the same inputs is
/// bit-identical.
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        theta += other.theta;
        vega += other.vega;
        rho += other.rho;
        return *this;
    }

    /// Scale every Greek, e.g. by direction sign × quantity
    Greeks scaled(double factor) const {
        return Greeks{
            .delta = delta * factor,
            .gamma = gamma * factor,
            .theta = theta * factor,
            .vega = vega * factor,
            .rho = rho * factor
        };
    }
};

inline Greeks operator+(Greeks lhs, const Greeks& rhs) {
    lhs += rhs;
    return lhs;
}

inline Greeks operator*(const Greeks& g, double factor) {
    return g.scaled(factor);
}

}  // namespace volscan
