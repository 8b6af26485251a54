#include "fem2d/load_pattern.hpp"
#include <stdexcept>
#include <string>

namespace fem2d {

void LoadPattern::add_nodal_load(int node_id, double fx, double fy, double moment) {
    nodal_loads_.emplace_back(node_id, fx, fy, moment);
}

void LoadPattern::add_element_load(int element_id, double wy, double wx) {
    ElementUniformLoad& load = element_loads_[element_id];
    load.wx += wx;
    load.wy += wy;
}

ElementUniformLoad LoadPattern::element_load(int element_id) const {
    auto it = element_loads_.find(element_id);
    if (it != element_loads_.end()) {
        return it->second;
    }
    return ElementUniformLoad{};
}

Eigen::VectorXd LoadPattern::assemble_load_vector(
    const DOFHandler& dof_handler,
    const std::map<int, std::unique_ptr<FrameElement>>& elements) const {

    Eigen::VectorXd F = Eigen::VectorXd::Zero(dof_handler.total_dofs());

    for (const auto& load : nodal_loads_) {
        const double values[3] = {load.fx, load.fy, load.moment};
        for (int d = 0; d < 3; ++d) {
            int global_dof = dof_handler.get_global_dof(load.node_id, d);
            if (global_dof < 0) {
                throw std::runtime_error("Nodal load on unnumbered node " +
                                         std::to_string(load.node_id));
            }
            F(global_dof) += values[d];
        }
    }

    for (const auto& [element_id, load] : element_loads_) {
        auto it = elements.find(element_id);
        if (it == elements.end()) {
            throw std::runtime_error("Element load on unknown element " +
                                     std::to_string(element_id));
        }
        const FrameElement& elem = *it->second;

        Vector6 f_global = elem.axes.to_global(elem.local_equivalent_loads(load.wx, load.wy));
        std::vector<int> loc = dof_handler.get_location_array(*elem.node_i, *elem.node_j);
        for (int i = 0; i < 6; ++i) {
            if (loc[i] >= 0) {
                F(loc[i]) += f_global(i);
            }
        }
    }

    return F;
}

void LoadPattern::clear() {
    nodal_loads_.clear();
    element_loads_.clear();
}

}  // namespace fem2d
