#include "fem2d/dof_handler.hpp"
#include "fem2d/engine.hpp"

namespace fem2d {

void DOFHandler::number_dofs(NodeRegistry& registry) {
    clear();

    int global_dof_counter = 0;

    for (const auto& node_ptr : registry.all_nodes()) {
        Node* node = node_ptr.get();
        for (int local_dof = 0; local_dof < kDofsPerNode; ++local_dof) {
            node->global_dof_numbers[local_dof] = global_dof_counter;
            dof_map_[{node->id, local_dof}] = global_dof_counter++;
        }
    }

    total_dofs_ = global_dof_counter;
}

int DOFHandler::total_dofs() const {
    return total_dofs_;
}

int DOFHandler::get_global_dof(int node_id, int local_dof) const {
    auto it = dof_map_.find({node_id, local_dof});
    if (it != dof_map_.end()) {
        return it->second;
    }
    return -1;
}

std::vector<int> DOFHandler::get_location_array(const Node& node_i, const Node& node_j) const {
    std::vector<int> loc;
    loc.reserve(2 * kDofsPerNode);
    for (int local_dof = 0; local_dof < kDofsPerNode; ++local_dof) {
        loc.push_back(get_global_dof(node_i.id, local_dof));
    }
    for (int local_dof = 0; local_dof < kDofsPerNode; ++local_dof) {
        loc.push_back(get_global_dof(node_j.id, local_dof));
    }
    return loc;
}

void DOFHandler::clear() {
    dof_map_.clear();
    total_dofs_ = 0;
}

}  // namespace fem2d
