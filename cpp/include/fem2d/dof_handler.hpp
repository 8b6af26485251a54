#pragma once

#include "fem2d/node_registry.hpp"
#include <map>
#include <utility>
#include <vector>

namespace fem2d {

/**
 * @brief Handles global DOF numbering
 *
 * Every node carries three DOFs (UX, UY, RZ), numbered consecutively in
 * node creation order. Fixed DOFs keep their numbers; supports are
 * enforced on the assembled system by the BCHandler.
 */
class DOFHandler {
public:
    DOFHandler() = default;

    /**
     * @brief Assign global DOF numbers to all nodes
     *
     * Also writes the numbers into Node::global_dof_numbers.
     */
    void number_dofs(NodeRegistry& registry);

    /// Total number of global DOFs
    int total_dofs() const;

    /**
     * @brief Global DOF number of a node DOF
     * @return Global DOF number, or -1 if the node is not numbered
     */
    int get_global_dof(int node_id, int local_dof) const;

    /**
     * @brief Location array of a two-node element
     *
     * @return [UX_i, UY_i, RZ_i, UX_j, UY_j, RZ_j] global DOF numbers
     */
    std::vector<int> get_location_array(const Node& node_i, const Node& node_j) const;

    void clear();

private:
    int total_dofs_ = 0;
    std::map<std::pair<int, int>, int> dof_map_;   ///< (node id, local dof) -> global dof
};

}  // namespace fem2d
