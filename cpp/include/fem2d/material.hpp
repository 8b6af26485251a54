#pragma once

#include <optional>

namespace fem2d {

/**
 * @brief Linear elastic material
 *
 * Units follow the caller's request; the reference tests use SI:
 * - E: Young's modulus [N/m²]
 * - nu: Poisson's ratio (optional, carried through, not used by the solve)
 */
struct Material {
    int id = 0;                   ///< Unique material identifier
    double E = 0.0;               ///< Young's modulus [N/m²]
    std::optional<double> nu;     ///< Poisson's ratio (dimensionless)

    Material() = default;

    Material(int id, double E, std::optional<double> nu = std::nullopt)
        : id(id), E(E), nu(nu) {}
};

}  // namespace fem2d
