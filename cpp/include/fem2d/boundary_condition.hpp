#ifndef FEM2D_BOUNDARY_CONDITION_HPP
#define FEM2D_BOUNDARY_CONDITION_HPP

#include "fem2d/dof_handler.hpp"
#include "fem2d/engine.hpp"
#include <Eigen/Sparse>
#include <array>
#include <vector>

namespace fem2d {

/**
 * @brief A node DOF restrained to zero displacement
 */
struct FixedDOF {
    int node_id;     ///< Node ID
    int local_dof;   ///< Local DOF index (0-2: UX, UY, RZ)

    FixedDOF(int node, int dof)
        : node_id(node), local_dof(dof) {}
};

/**
 * @brief Boundary condition handler
 *
 * Supports are enforced with the penalty method: a stiffness of
 * 1e15 * max(|K_ii|, 1) is added to the diagonal of every fixed DOF.
 * The penalty is sized from the elastic stiffness once and reused for
 * every iteration of a nonlinear solve.
 *
 * Usage:
 *   BCHandler bc;
 *   bc.fix(1, {true, true, false});   // pin node 1
 *   Eigen::SparseMatrix<double> K_bc = K + bc.penalty_matrix(K, dof_handler);
 */
class BCHandler {
public:
    BCHandler() = default;

    /**
     * @brief Restrain one DOF of a node (duplicates are ignored)
     * @throws std::invalid_argument if local_dof is outside [0, 2]
     */
    void add_fixed_dof(int node_id, int local_dof);

    /**
     * @brief Restrain the flagged DOFs of a node
     * @param fixity [UX, UY, RZ]
     */
    void fix(int node_id, const std::array<bool, 3>& fixity);

    /**
     * @brief Penalty stiffness per global DOF (0 for free DOFs)
     * @param K Elastic global stiffness used to scale the penalty
     */
    Eigen::VectorXd penalty_stiffness(const Eigen::SparseMatrix<double>& K,
                                      const DOFHandler& dof_handler) const;

    /// Penalty stiffness as a sparse diagonal matrix, to be added to K
    Eigen::SparseMatrix<double> penalty_matrix(const Eigen::SparseMatrix<double>& K,
                                               const DOFHandler& dof_handler) const;

    bool is_fixed(int node_id, int local_dof) const;

    size_t num_fixed_dofs() const { return fixed_dofs_.size(); }

    void clear() { fixed_dofs_.clear(); }

private:
    std::vector<FixedDOF> fixed_dofs_;
};

}  // namespace fem2d

#endif  // FEM2D_BOUNDARY_CONDITION_HPP
