#include "fem2d/assembler.hpp"

namespace fem2d {

Assembler::Assembler(const DOFHandler& dof_handler)
    : dof_handler_(dof_handler) {}

Eigen::SparseMatrix<double> Assembler::assemble_stiffness(
    const FrameElementMap& beams,
    const SpringElementMap& springs) const {

    int total_dofs = dof_handler_.total_dofs();
    Eigen::SparseMatrix<double> K_global(total_dofs, total_dofs);

    // Each element contributes 36 entries (6×6)
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve((beams.size() + springs.size()) * 36);

    for (const auto& [id, beam] : beams) {
        add_element_matrix(triplets, beam->global_stiffness_matrix(),
                           dof_handler_.get_location_array(*beam->node_i, *beam->node_j));
    }

    for (const auto& [id, spring] : springs) {
        add_element_matrix(triplets, spring->global_stiffness_matrix(),
                           dof_handler_.get_location_array(*spring->node_i, *spring->node_j));
    }

    K_global.setFromTriplets(triplets.begin(), triplets.end());
    return K_global;
}

Eigen::SparseMatrix<double> Assembler::assemble_tangent(
    const FrameElementMap& beams,
    const SpringElementMap& springs,
    const LoadPattern& pattern,
    const Eigen::VectorXd& u) const {

    int total_dofs = dof_handler_.total_dofs();
    Eigen::SparseMatrix<double> K_global(total_dofs, total_dofs);

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve((beams.size() + springs.size()) * 36);

    for (const auto& [id, beam] : beams) {
        std::vector<int> loc = dof_handler_.get_location_array(*beam->node_i, *beam->node_j);
        Vector6 u_local = beam->axes.transformation_matrix() * gather(u, loc);
        double wx = pattern.element_load(id).wx;
        add_element_matrix(triplets, beam->global_tangent_stiffness(u_local, wx), loc);
    }

    for (const auto& [id, spring] : springs) {
        add_element_matrix(triplets, spring->global_stiffness_matrix(),
                           dof_handler_.get_location_array(*spring->node_i, *spring->node_j));
    }

    K_global.setFromTriplets(triplets.begin(), triplets.end());
    return K_global;
}

Eigen::VectorXd Assembler::assemble_internal_forces(
    const FrameElementMap& beams,
    const SpringElementMap& springs,
    const LoadPattern& pattern,
    const Eigen::VectorXd& u) const {

    Eigen::VectorXd F_int = Eigen::VectorXd::Zero(dof_handler_.total_dofs());

    for (const auto& [id, beam] : beams) {
        std::vector<int> loc = dof_handler_.get_location_array(*beam->node_i, *beam->node_j);
        Vector6 u_local = beam->axes.transformation_matrix() * gather(u, loc);
        double wx = pattern.element_load(id).wx;
        Vector6 f_global = beam->axes.to_global(beam->local_resisting_forces(u_local, wx));
        add_element_vector(F_int, f_global, loc);
    }

    for (const auto& [id, spring] : springs) {
        std::vector<int> loc = dof_handler_.get_location_array(*spring->node_i, *spring->node_j);
        add_element_vector(F_int, spring->forces(gather(u, loc)), loc);
    }

    return F_int;
}

void Assembler::add_element_matrix(std::vector<Eigen::Triplet<double>>& triplets,
                                   const Matrix6& K_elem,
                                   const std::vector<int>& loc_array) {
    for (int i = 0; i < 6; ++i) {
        int global_i = loc_array[i];
        if (global_i < 0) continue;

        for (int j = 0; j < 6; ++j) {
            int global_j = loc_array[j];
            if (global_j < 0) continue;

            double value = K_elem(i, j);
            if (value != 0.0) {
                triplets.emplace_back(global_i, global_j, value);
            }
        }
    }
}

void Assembler::add_element_vector(Eigen::VectorXd& F,
                                   const Vector6& f_elem,
                                   const std::vector<int>& loc_array) {
    for (int i = 0; i < 6; ++i) {
        if (loc_array[i] >= 0) {
            F(loc_array[i]) += f_elem(i);
        }
    }
}

Vector6 Assembler::gather(const Eigen::VectorXd& u, const std::vector<int>& loc_array) const {
    Vector6 u_elem = Vector6::Zero();
    for (int i = 0; i < 6; ++i) {
        if (loc_array[i] >= 0 && loc_array[i] < u.size()) {
            u_elem(i) = u(loc_array[i]);
        }
    }
    return u_elem;
}

}  // namespace fem2d
