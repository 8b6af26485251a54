#pragma once

#include <optional>

namespace fem2d {

/**
 * @brief In-plane cross-section properties of a frame member
 *
 * - A: Cross-sectional area [m²]
 * - I: Second moment of area about the out-of-plane axis [m⁴]
 * - h: Section depth [m] (optional, carried through for display)
 */
struct Section {
    double A = 0.0;              ///< Cross-sectional area [m²]
    double I = 0.0;              ///< Second moment of area [m⁴]
    std::optional<double> h;     ///< Section depth [m]

    Section() = default;

    Section(double A, double I, std::optional<double> h = std::nullopt)
        : A(A), I(I), h(h) {}
};

}  // namespace fem2d
