#include "fem2d/nonlinear_solver.hpp"
#include <sstream>
#include <stdexcept>

namespace fem2d {

NonlinearSolver::NonlinearSolver(const NonlinearSolverSettings& settings)
    : settings_(settings) {
    if (settings_.load_steps < 1) {
        throw std::invalid_argument("load_steps must be at least 1");
    }
    if (settings_.max_iterations < 1) {
        throw std::invalid_argument("max_iterations must be at least 1");
    }
}

NonlinearSolverResult NonlinearSolver::solve(const Eigen::VectorXd& F_ref,
                                             const TangentFunction& tangent,
                                             const InternalForceFunction& internal_force) const {
    NonlinearSolverResult result;
    result.displacements = Eigen::VectorXd::Zero(F_ref.size());

    LinearSolver linear_solver(settings_.linear_method);
    Eigen::VectorXd& u = result.displacements;

    const int n_steps = settings_.load_steps;
    const int max_iter = settings_.newton ? settings_.max_iterations : 1;

    for (int step = 1; step <= n_steps; ++step) {
        double load_factor = static_cast<double>(step) / n_steps;
        const Eigen::VectorXd u_converged = u;
        bool step_converged = false;
        double du_norm = 0.0;

        for (int iter = 1; iter <= max_iter; ++iter) {
            Eigen::VectorXd R = load_factor * F_ref - internal_force(u);
            Eigen::VectorXd du = linear_solver.solve(tangent(u), R);

            if (linear_solver.is_singular()) {
                result.singular = true;
                u = u_converged;
                std::ostringstream oss;
                oss << "Load step " << step << ", iteration " << iter << ": "
                    << linear_solver.get_error_message();
                result.message = oss.str();
                return result;
            }

            u += du;
            ++result.iterations;
            du_norm = du.norm();

            if (!settings_.newton || du_norm < settings_.displacement_tolerance) {
                step_converged = true;
                break;
            }
        }

        if (!step_converged) {
            u = u_converged;
            std::ostringstream oss;
            oss << "Load step " << step << " of " << n_steps << " did not converge after "
                << max_iter << " iterations (||du|| = " << du_norm << ")";
            result.message = oss.str();
            return result;
        }
    }

    result.converged = true;
    std::ostringstream oss;
    oss << "Converged in " << result.iterations << " iterations over " << n_steps << " load steps";
    result.message = oss.str();
    return result;
}

}  // namespace fem2d
