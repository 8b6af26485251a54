#pragma once

#include "fem2d/geometry.hpp"

namespace fem2d {

/**
 * @brief Uniform distributed load on a member, in local axes
 *
 * The load acts on the sub-span [start_t * L, end_t * L]. Intensities are
 * per unit length along the member [N/m].
 */
struct LocalLoad {
    double qx = 0.0;        ///< Axial intensity (along local x)
    double qy = 0.0;        ///< Transverse intensity (along local y)
    double start_t = 0.0;   ///< Start of loaded span as a fraction of L
    double end_t = 1.0;     ///< End of loaded span as a fraction of L

    LocalLoad() = default;

    LocalLoad(double qx, double qy, double start_t = 0.0, double end_t = 1.0)
        : qx(qx), qy(qy), start_t(start_t), end_t(end_t) {}

    /**
     * @brief True when the load covers the whole member
     */
    bool is_full_span() const { return start_t <= 0.0 && end_t >= 1.0; }

    /**
     * @brief True when both intensities are zero
     */
    bool is_zero() const { return qx == 0.0 && qy == 0.0; }
};

/**
 * @brief Antiderivatives of the cubic Hermite shape functions
 *
 * H1..H4 integrate N1 (transverse, start), N2 (rotation, start),
 * N3 (transverse, end) and N4 (rotation, end) from 0 to x on a member of
 * length L.
 */
namespace hermite {

double H1(double x, double L);
double H2(double x, double L);
double H3(double x, double L);
double H4(double x, double L);

}  // namespace hermite

/**
 * @brief Equivalent nodal forces of a (possibly partial) uniform load
 *
 * Transverse terms integrate the Hermite shape functions over
 * [a, b] = [start_t L, end_t L]; axial terms use linear shape functions
 * over the same sub-span.
 *
 * @param length Member length L [m]
 * @param load Local load intensities and extent
 * @return Vector6 [Fx1, Fy1, M1, Fx2, Fy2, M2] in local axes
 */
Vector6 partial_equivalent_forces(double length, const LocalLoad& load);

/**
 * @brief Closed-form fixed-end forces of a full-span uniform load
 *
 * [qx L/2, qy L/2, qy L^2/12, qx L/2, qy L/2, -qy L^2/12]
 */
Vector6 full_span_equivalent_forces(double length, double qx, double qy);

/**
 * @brief Equivalent nodal forces rotated into global axes
 *
 * @param axes Member axes (length and orientation)
 * @param load Local load intensities and extent
 * @return Vector6 global [Fx1, Fy1, M1, Fx2, Fy2, M2]
 */
Vector6 global_equivalent_forces(const MemberAxes& axes, const LocalLoad& load);

}  // namespace fem2d
