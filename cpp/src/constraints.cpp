#include "fem2d/constraints.hpp"
#include "fem2d/engine.hpp"
#include <stdexcept>
#include <string>

namespace fem2d {

void ConstraintHandler::add_equality_constraint(int slave_node, int slave_dof,
                                                int master_node, int master_dof) {
    if (slave_dof < 0 || slave_dof >= kDofsPerNode ||
        master_dof < 0 || master_dof >= kDofsPerNode) {
        throw std::invalid_argument("Local DOF must be in range [0, 2]");
    }

    if (slave_node == master_node && slave_dof == master_dof) {
        throw std::invalid_argument("Cannot constrain a DOF to itself");
    }

    equalities_.emplace_back(slave_node, slave_dof, master_node, master_dof);
}

std::map<int, int> ConstraintHandler::build_constraint_map(const DOFHandler& dof_handler) const {
    std::map<int, int> slave_to_master;

    for (const auto& eq : equalities_) {
        const int slave = dof_handler.get_global_dof(eq.slave_node_id, eq.slave_local_dof);
        const int master = dof_handler.get_global_dof(eq.master_node_id, eq.master_local_dof);

        if (slave < 0 || master < 0) {
            throw std::runtime_error(
                "Equality constraint references unnumbered node " +
                std::to_string(slave < 0 ? eq.slave_node_id : eq.master_node_id));
        }

        auto [it, inserted] = slave_to_master.emplace(slave, master);
        if (!inserted && it->second != master) {
            throw std::runtime_error("DOF " + std::to_string(slave) +
                                     " is constrained to two different masters");
        }
    }

    return slave_to_master;
}

Eigen::SparseMatrix<double> ConstraintHandler::build_transformation_matrix(
    const DOFHandler& dof_handler) const {

    const int rows = dof_handler.total_dofs();
    const std::map<int, int> slave_to_master = build_constraint_map(dof_handler);

    // Column of each independent DOF, -1 for slaves
    std::vector<int> column(rows, -1);
    int cols = 0;
    for (int dof = 0; dof < rows; ++dof) {
        if (slave_to_master.count(dof) == 0) {
            column[dof] = cols++;
        }
    }
    if (cols == 0) {
        throw std::runtime_error("Every DOF is a constraint slave; nothing left to solve for");
    }

    std::vector<Eigen::Triplet<double>> entries;
    entries.reserve(rows);
    for (int dof = 0; dof < rows; ++dof) {
        int target = dof;
        auto slave = slave_to_master.find(dof);
        if (slave != slave_to_master.end()) {
            target = slave->second;
            if (column[target] < 0) {
                throw std::runtime_error(
                    "Chained constraints not supported: DOF " +
                    std::to_string(target) + " is both master and slave");
            }
        }
        entries.emplace_back(dof, column[target], 1.0);
    }

    Eigen::SparseMatrix<double> T(rows, cols);
    T.setFromTriplets(entries.begin(), entries.end());
    return T;
}

Eigen::VectorXd ConstraintHandler::expand_displacements(
    const Eigen::VectorXd& u_reduced,
    const Eigen::SparseMatrix<double>& T) const {

    if (u_reduced.size() != T.cols()) {
        throw std::invalid_argument("Reduced displacement vector has " +
                                    std::to_string(u_reduced.size()) + " entries, T has " +
                                    std::to_string(T.cols()) + " columns");
    }
    return T * u_reduced;
}

Eigen::VectorXd ConstraintHandler::condense_forces(
    const Eigen::VectorXd& f_full,
    const DOFHandler& dof_handler) const {

    if (f_full.size() != dof_handler.total_dofs()) {
        throw std::invalid_argument("Force vector size doesn't match DOF count");
    }

    if (!has_constraints()) {
        return f_full;
    }

    // T has a single unit entry per row, so T^T f adds each slave entry to its master
    Eigen::VectorXd folded = f_full;
    for (const auto& [slave, master] : build_constraint_map(dof_handler)) {
        folded(master) += f_full(slave);
        folded(slave) = 0.0;
    }

    return folded;
}

}  // namespace fem2d
