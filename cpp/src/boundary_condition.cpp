#include "fem2d/boundary_condition.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fem2d {

namespace {

constexpr double kPenaltyFactor = 1.0e15;

}  // namespace

void BCHandler::add_fixed_dof(int node_id, int local_dof) {
    if (local_dof < 0 || local_dof >= kDofsPerNode) {
        throw std::invalid_argument("local_dof must be in range [0, 2]");
    }

    if (is_fixed(node_id, local_dof)) {
        return;
    }

    fixed_dofs_.emplace_back(node_id, local_dof);
}

void BCHandler::fix(int node_id, const std::array<bool, 3>& fixity) {
    for (int dof = 0; dof < kDofsPerNode; ++dof) {
        if (fixity[dof]) {
            add_fixed_dof(node_id, dof);
        }
    }
}

Eigen::VectorXd BCHandler::penalty_stiffness(const Eigen::SparseMatrix<double>& K,
                                             const DOFHandler& dof_handler) const {
    Eigen::VectorXd P = Eigen::VectorXd::Zero(K.rows());

    for (const auto& fixed : fixed_dofs_) {
        int global_dof = dof_handler.get_global_dof(fixed.node_id, fixed.local_dof);
        if (global_dof < 0) {
            throw std::runtime_error("Support on unknown node " + std::to_string(fixed.node_id));
        }

        double K_ii = K.coeff(global_dof, global_dof);
        P(global_dof) = kPenaltyFactor * std::max(std::abs(K_ii), 1.0);
    }

    return P;
}

Eigen::SparseMatrix<double> BCHandler::penalty_matrix(const Eigen::SparseMatrix<double>& K,
                                                       const DOFHandler& dof_handler) const {
    Eigen::VectorXd P = penalty_stiffness(K, dof_handler);

    std::vector<Eigen::Triplet<double>> diagonal;
    diagonal.reserve(fixed_dofs_.size());
    for (int i = 0; i < P.size(); ++i) {
        if (P(i) > 0.0) {
            diagonal.emplace_back(i, i, P(i));
        }
    }

    Eigen::SparseMatrix<double> P_matrix(K.rows(), K.cols());
    P_matrix.setFromTriplets(diagonal.begin(), diagonal.end());
    return P_matrix;
}

bool BCHandler::is_fixed(int node_id, int local_dof) const {
    return std::any_of(fixed_dofs_.begin(), fixed_dofs_.end(),
                       [&](const FixedDOF& f) {
                           return f.node_id == node_id && f.local_dof == local_dof;
                       });
}

}  // namespace fem2d
