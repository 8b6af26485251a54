#pragma once

#include <Eigen/Dense>

namespace fem2d {

/// Six-component end vector [Fx1, Fy1, M1, Fx2, Fy2, M2]
using Vector6 = Eigen::Matrix<double, 6, 1>;

/// 6x6 matrix acting on two-node frame DOF vectors
using Matrix6 = Eigen::Matrix<double, 6, 6>;

/**
 * @brief Local coordinate system of a 2D frame member
 *
 * The local x axis runs from the start point to the end point; the local
 * y axis is x rotated +90 degrees in the plane. Rotations (about the
 * out-of-plane z axis) are identical in local and global axes.
 *
 * Angles are measured counter-clockwise from global X [radians].
 */
class MemberAxes {
public:
    double length;   ///< Member length [m]
    double angle;    ///< Member angle atan2(dy, dx) [rad]
    double c;        ///< cos(angle)
    double s;        ///< sin(angle)

    /**
     * @brief Construct member axes from two endpoints
     *
     * @param x1 Start x [m]
     * @param y1 Start y [m]
     * @param x2 End x [m]
     * @param y2 End y [m]
     * @throws std::invalid_argument if the endpoints coincide (length < 1e-10)
     */
    MemberAxes(double x1, double y1, double x2, double y2);

    /**
     * @brief Rotation matrix for one node (global to local)
     *
     * [ c  s  0]
     * [-s  c  0]
     * [ 0  0  1]
     */
    Eigen::Matrix3d rotation_matrix() const;

    /**
     * @brief Block-diagonal transformation for a two-node vector
     *
     * u_local = T * u_global, f_global = T^T * f_local.
     */
    Matrix6 transformation_matrix() const;

    /**
     * @brief Rotate a local 6-component end vector into global axes
     *
     * Returns [c f0 - s f1, s f0 + c f1, f2, c f3 - s f4, s f3 + c f4, f5].
     */
    Vector6 to_global(const Vector6& local) const;

    /**
     * @brief Rotate a global 6-component end vector into local axes
     */
    Vector6 to_local(const Vector6& global) const;

    /**
     * @brief Convert a global load intensity pair to local axes
     *
     * qx_local = qx cos + qy sin, qy_local = -qx sin + qy cos.
     *
     * @return Eigen::Vector2d (qx_local, qy_local)
     */
    Eigen::Vector2d load_to_local(double qx_global, double qy_global) const;
};

}  // namespace fem2d
