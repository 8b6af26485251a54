#pragma once

#include "fem2d/solver.hpp"
#include <Eigen/Sparse>
#include <functional>
#include <string>

namespace fem2d {

/**
 * @brief Settings for the incremental-iterative solver
 */
struct NonlinearSolverSettings {
    /// Number of equal load increments (load factor 1/n per step)
    int load_steps = 10;

    /// Maximum Newton iterations per load step
    int max_iterations = 50;

    /// Convergence when the 2-norm of the displacement increment falls below this
    double displacement_tolerance = 1e-8;

    /// false: one linear solve per step without a convergence test
    bool newton = true;

    /// Linear solver method used for every iteration
    LinearSolver::Method linear_method = LinearSolver::Method::SimplicialLDLT;
};

/**
 * @brief Result of an incremental-iterative solve
 */
struct NonlinearSolverResult {
    /// Solution vector at the last converged load factor
    Eigen::VectorXd displacements;

    /// True if every load step converged
    bool converged = false;

    /// True if a linear solve hit a singular matrix
    bool singular = false;

    /// Total iterations over all load steps
    int iterations = 0;

    /// Descriptive message (convergence info or error)
    std::string message;
};

/**
 * @brief Load-controlled Newton-Raphson solver
 *
 * Solves F_int(u) = λ F_ref for λ = 1/n, 2/n, ..., 1. Each iteration:
 * 1. Evaluates the residual R = λ F_ref - F_int(u)
 * 2. Solves K_t(u) du = R
 * 3. Updates u += du
 * 4. Converges when ||du|| < displacement_tolerance
 *
 * For a linear problem with newton = false and one load step this is a
 * single linear solve.
 *
 * Usage:
 *   NonlinearSolver solver(settings);
 *   auto result = solver.solve(F_ref, tangent, internal_force);
 *   if (!result.converged) {
 *       spdlog::warn("{}", result.message);
 *   }
 */
class NonlinearSolver {
public:
    /// Tangent stiffness at u
    using TangentFunction = std::function<Eigen::SparseMatrix<double>(const Eigen::VectorXd&)>;

    /// Internal (resisting) force at u
    using InternalForceFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

    explicit NonlinearSolver(const NonlinearSolverSettings& settings = NonlinearSolverSettings());

    /**
     * @brief Solve from u = 0
     */
    NonlinearSolverResult solve(const Eigen::VectorXd& F_ref,
                                const TangentFunction& tangent,
                                const InternalForceFunction& internal_force) const;

    const NonlinearSolverSettings& settings() const { return settings_; }

private:
    NonlinearSolverSettings settings_;
};

}  // namespace fem2d
