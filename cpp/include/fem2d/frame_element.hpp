#pragma once

#include "fem2d/engine.hpp"
#include "fem2d/geometry.hpp"
#include "fem2d/node.hpp"
#include <Eigen/Dense>

namespace fem2d {

class DOFHandler;

/**
 * @brief Elastic 2D Euler-Bernoulli beam-column element
 *
 * Local DOF ordering: [u_i, v_i, θ_i, u_j, v_j, θ_j] with u along the
 * member and v perpendicular to it.
 *
 * With TransformationType::PDelta the element adds the geometric stiffness
 * of its axial force to the transverse translations:
 *   K_g = N/L * [v_i v_j] coupling [ 1 -1; -1 1 ]
 * with N positive in tension.
 *
 * Usage:
 *   FrameElement beam(1, n1, n2, A, E, I, TransformationType::Linear);
 *   Matrix6 K = beam.global_stiffness_matrix();
 */
class FrameElement {
public:
    int id;                              ///< Element tag
    Node* node_i;                        ///< Start node
    Node* node_j;                        ///< End node
    double A;                            ///< Area [m²]
    double E;                            ///< Young's modulus [N/m²]
    double I;                            ///< Second moment of area [m⁴]
    TransformationType transformation;   ///< Linear or P-Delta
    MemberAxes axes;                     ///< Length and orientation

    /**
     * @throws std::invalid_argument if the nodes coincide or a property is not positive
     */
    FrameElement(int id, Node* node_i, Node* node_j, double A, double E, double I,
                 TransformationType transformation = TransformationType::Linear);

    double length() const { return axes.length; }

    /// Elastic stiffness in local axes
    Matrix6 local_stiffness_matrix() const;

    /**
     * @brief Geometric stiffness in local axes for axial force N
     * @param N Axial force, tension positive [N]
     */
    Matrix6 local_geometric_stiffness(double N) const;

    /// Elastic stiffness in global axes (T^T K T)
    Matrix6 global_stiffness_matrix() const;

    /**
     * @brief Tangent stiffness in global axes at the given displacements
     *
     * Equals global_stiffness_matrix() for the Linear transformation.
     */
    Matrix6 global_tangent_stiffness(const Vector6& u_local, double wx) const;

    /**
     * @brief Fixed-end load vector of full-span uniform loads (local axes)
     * @param wx Axial intensity [N/m]
     * @param wy Transverse intensity [N/m]
     */
    Vector6 local_equivalent_loads(double wx, double wy) const;

    /**
     * @brief Element displacements in local axes
     */
    Vector6 local_displacements(const Eigen::VectorXd& global_displacements,
                                const DOFHandler& dof_handler) const;

    /**
     * @brief Axial force (tension positive) including the midspan effect of wx
     */
    double axial_force(const Vector6& u_local, double wx) const;

    /**
     * @brief Resisting forces K u (+ K_g u for P-Delta) in local axes
     */
    Vector6 local_resisting_forces(const Vector6& u_local, double wx) const;

    /**
     * @brief End actions exerted on the element by its nodes (local axes)
     *
     * f = K u (+ K_g u) - f_eq, where f_eq is the fixed-end load vector of
     * the element's own uniform loads.
     */
    Vector6 local_end_forces(const Vector6& u_local, double wx, double wy) const;
};

}  // namespace fem2d
