#ifndef FEM2D_CONSTRAINTS_HPP
#define FEM2D_CONSTRAINTS_HPP

#include "fem2d/dof_handler.hpp"
#include <Eigen/Sparse>
#include <map>
#include <vector>

namespace fem2d {

/**
 * @brief Equality constraint between two DOFs: u_slave = u_master
 *
 * Used to tie the translations of a duplicate node to its original node
 * while leaving the rotations independent (moment release).
 */
struct EqualityConstraint {
    int slave_node_id;      ///< Node ID of the slave DOF
    int slave_local_dof;    ///< Local DOF index at slave node (0-2)
    int master_node_id;     ///< Node ID of the master DOF
    int master_local_dof;   ///< Local DOF index at master node (0-2)

    EqualityConstraint(int slave_node, int slave_dof, int master_node, int master_dof)
        : slave_node_id(slave_node), slave_local_dof(slave_dof),
          master_node_id(master_node), master_local_dof(master_dof) {}
};

/**
 * @brief Handles equality constraints by transformation
 *
 * Builds T (n_full × n_reduced) with u_full = T * u_reduced. Slave DOFs
 * are eliminated:
 *   K_reduced = T^T * K * T
 *   F_reduced = T^T * F
 *
 * Usage:
 *   ConstraintHandler ch;
 *   ch.add_equality_constraint(dup, UX, original, UX);
 *   ch.add_equality_constraint(dup, UY, original, UY);
 *   Eigen::SparseMatrix<double> T = ch.build_transformation_matrix(dof_handler);
 *   Eigen::VectorXd u = ch.expand_displacements(u_red, T);
 */
class ConstraintHandler {
public:
    ConstraintHandler() = default;

    /**
     * @brief Add an equality constraint u_slave = u_master
     *
     * @throws std::invalid_argument if a DOF index is outside [0, 2] or
     *         the constraint ties a DOF to itself
     */
    void add_equality_constraint(int slave_node, int slave_dof,
                                 int master_node, int master_dof);

    /**
     * @brief Build the transformation matrix T
     *
     * Without constraints T is the identity.
     *
     * @throws std::runtime_error for chained constraints (a master that is
     *         itself a slave) or a slave DOF constrained twice
     */
    Eigen::SparseMatrix<double> build_transformation_matrix(const DOFHandler& dof_handler) const;

    /**
     * @brief Recover full displacements u_full = T * u_reduced
     */
    Eigen::VectorXd expand_displacements(const Eigen::VectorXd& u_reduced,
                                         const Eigen::SparseMatrix<double>& T) const;

    /**
     * @brief Fold a full force vector onto the independent DOFs
     *
     * Equivalent to T^T * f scattered back to full size: slave entries
     * become zero and their forces are carried by their masters.
     */
    Eigen::VectorXd condense_forces(const Eigen::VectorXd& f_full,
                                    const DOFHandler& dof_handler) const;

    bool has_constraints() const { return !equalities_.empty(); }

    void clear() { equalities_.clear(); }

private:
    std::vector<EqualityConstraint> equalities_;

    /// Global slave DOF -> global master DOF
    std::map<int, int> build_constraint_map(const DOFHandler& dof_handler) const;
};

}  // namespace fem2d

#endif  // FEM2D_CONSTRAINTS_HPP
