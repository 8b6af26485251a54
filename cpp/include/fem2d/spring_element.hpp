#pragma once

#include "fem2d/geometry.hpp"
#include "fem2d/node.hpp"
#include <array>

namespace fem2d {

/**
 * @brief Zero-length spring element connecting two nodes
 *
 * Independent stiffness per global DOF; for each DOF pair:
 *   K = [+k  -k]
 *       [-k  +k]
 *
 * Element DOF ordering: [UX_i, UY_i, RZ_i, UX_j, UY_j, RZ_j].
 */
class SpringElement {
public:
    int id;                          ///< Element tag
    Node* node_i;                    ///< First node
    Node* node_j;                    ///< Second node
    std::array<double, 3> stiffness; ///< [kx, ky, kr]

    /**
     * @throws std::invalid_argument if any stiffness is negative or non-finite
     */
    SpringElement(int id, Node* node_i, Node* node_j, const std::array<double, 3>& stiffness);

    /// 6x6 stiffness matrix (global axes)
    Matrix6 global_stiffness_matrix() const;

    /**
     * @brief Forces exerted on the spring by its nodes
     * @param u_element Element displacements [u_i, u_j] (global axes)
     */
    Vector6 forces(const Vector6& u_element) const;
};

}  // namespace fem2d
