#pragma once

#include <array>

namespace fem2d {

/**
 * @brief Engine node: a point in the XY plane with 3 DOFs
 *
 * DOF order: [UX, UY, RZ]. Coordinates are in meters [m].
 */
class Node {
public:
    int id;           ///< Engine node tag
    double x, y;      ///< Nodal coordinates [m]

    /// Global DOF numbers assigned by the DOFHandler (-1 = not assigned)
    std::array<int, 3> global_dof_numbers = {-1, -1, -1};

    Node(int id, double x, double y);
};

}  // namespace fem2d
