#pragma once

#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>
#include <Eigen/SparseLU>
#include <string>

namespace fem2d {

/**
 * @brief Sparse direct solver for K * u = F
 *
 * - K: Reduced global stiffness (or tangent) matrix
 * - F: Reduced load (or residual) vector
 * - u: Displacement (or increment) vector [m, rad]
 *
 * Failures do not throw. solve() returns a zero vector and flags the
 * system as singular; the caller checks is_singular() and
 * get_error_message().
 *
 * Usage:
 *   LinearSolver solver(LinearSolver::Method::SimplicialLDLT);
 *   Eigen::VectorXd u = solver.solve(K, F);
 *   if (solver.is_singular()) {
 *       spdlog::error("{}", solver.get_error_message());
 *   }
 */
class LinearSolver {
public:
    enum class Method {
        SparseLU,           ///< Eigen::SparseLU - general sparse matrices
        SimplicialLDLT      ///< Eigen::SimplicialLDLT - symmetric matrices (default)
    };

    explicit LinearSolver(Method method = Method::SimplicialLDLT);

    /**
     * @brief Solve the linear system K * u = F
     * @param K Sparse square matrix (N×N)
     * @param F Right-hand side (N×1)
     * @return Solution u (N×1), or a zero vector if the system is singular
     */
    Eigen::VectorXd solve(const Eigen::SparseMatrix<double>& K,
                          const Eigen::VectorXd& F);

    /// True if the last solve detected a singular or ill-posed system
    bool is_singular() const { return singular_; }

    /// Error message from the last solve (empty if none)
    std::string get_error_message() const { return error_msg_; }

private:
    Method method_;
    bool singular_ = false;
    std::string error_msg_;

    Eigen::VectorXd solve_sparse_lu(const Eigen::SparseMatrix<double>& K,
                                    const Eigen::VectorXd& F);

    Eigen::VectorXd solve_simplicial_ldlt(const Eigen::SparseMatrix<double>& K,
                                          const Eigen::VectorXd& F);

    /**
     * @brief Detect a structurally singular system
     *
     * Flags any zero diagonal entry (a DOF with no stiffness at all).
     * The factorization catches the remaining mechanisms.
     */
    bool check_singularity(const Eigen::SparseMatrix<double>& K) const;

    /**
     * @brief Flag the system as singular and return a zero vector
     */
    Eigen::VectorXd fail(const std::string& message, Eigen::Index size);
};

/// Parse a solver method name ("SimplicialLDLT" or "SparseLU")
LinearSolver::Method solver_method_from_string(const std::string& name);

/// Name of a solver method
std::string to_string(LinearSolver::Method method);

}  // namespace fem2d
