#include "fem2d/solver.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace fem2d {

LinearSolver::LinearSolver(Method method)
    : method_(method), singular_(false), error_msg_("") {}

Eigen::VectorXd LinearSolver::solve(const Eigen::SparseMatrix<double>& K,
                                    const Eigen::VectorXd& F) {
    singular_ = false;
    error_msg_ = "";

    if (K.rows() != K.cols()) {
        return fail("Stiffness matrix is not square", F.size());
    }

    if (K.rows() != F.size()) {
        return fail("Stiffness matrix and force vector dimensions mismatch", F.size());
    }

    if (K.rows() == 0) {
        return Eigen::VectorXd::Zero(0);
    }

    if (check_singularity(K)) {
        return fail("Stiffness matrix is singular (a degree of freedom has no stiffness)",
                    F.size());
    }

    Eigen::VectorXd u;
    switch (method_) {
        case Method::SparseLU:
            u = solve_sparse_lu(K, F);
            break;
        case Method::SimplicialLDLT:
            u = solve_simplicial_ldlt(K, F);
            break;
        default:
            return fail("Unknown solver method", F.size());
    }

    if (!singular_ && !u.allFinite()) {
        return fail("Solution contains non-finite values (ill-conditioned system)", F.size());
    }

    return u;
}

Eigen::VectorXd LinearSolver::solve_sparse_lu(const Eigen::SparseMatrix<double>& K,
                                              const Eigen::VectorXd& F) {
    Eigen::SparseLU<Eigen::SparseMatrix<double>> solver;
    solver.analyzePattern(K);
    solver.factorize(K);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SparseLU decomposition failed (Eigen::ComputationInfo = " << solver.info()
            << "): " << solver.lastErrorMessage();
        return fail(oss.str(), F.size());
    }

    Eigen::VectorXd u = solver.solve(F);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SparseLU solve failed (Eigen::ComputationInfo = " << solver.info() << ")";
        return fail(oss.str(), F.size());
    }

    return u;
}

Eigen::VectorXd LinearSolver::solve_simplicial_ldlt(const Eigen::SparseMatrix<double>& K,
                                                    const Eigen::VectorXd& F) {
    Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
    solver.compute(K);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SimplicialLDLT decomposition failed (Eigen::ComputationInfo = " << solver.info() << ")";
        if (solver.info() == Eigen::NumericalIssue) {
            oss << " - zero pivot, the structure is a mechanism";
        }
        return fail(oss.str(), F.size());
    }

    // LDLT does not fail on a vanishing pivot in every case; compare each
    // pivot with the diagonal entry it was eliminated from.
    const Eigen::VectorXd D = solver.vectorD();
    const Eigen::VectorXd diag_permuted = solver.permutationP() * Eigen::VectorXd(K.diagonal());
    for (Eigen::Index i = 0; i < D.size(); ++i) {
        if (std::abs(D(i)) <= 1e-12 * std::abs(diag_permuted(i))) {
            std::ostringstream oss;
            oss << "SimplicialLDLT found a zero pivot at equation " << i
                << " - the structure is a mechanism";
            return fail(oss.str(), F.size());
        }
    }

    Eigen::VectorXd u = solver.solve(F);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SimplicialLDLT solve failed (Eigen::ComputationInfo = " << solver.info() << ")";
        return fail(oss.str(), F.size());
    }

    return u;
}

bool LinearSolver::check_singularity(const Eigen::SparseMatrix<double>& K) const {
    Eigen::VectorXd diag = K.diagonal();
    for (Eigen::Index i = 0; i < diag.size(); ++i) {
        if (diag(i) == 0.0 || !std::isfinite(diag(i))) {
            return true;
        }
    }
    return false;
}

Eigen::VectorXd LinearSolver::fail(const std::string& message, Eigen::Index size) {
    singular_ = true;
    error_msg_ = message;
    return Eigen::VectorXd::Zero(size);
}

LinearSolver::Method solver_method_from_string(const std::string& name) {
    if (name == "SimplicialLDLT") {
        return LinearSolver::Method::SimplicialLDLT;
    }
    if (name == "SparseLU") {
        return LinearSolver::Method::SparseLU;
    }
    throw std::invalid_argument("Unknown solver method '" + name +
                                "' (expected 'SimplicialLDLT' or 'SparseLU')");
}

std::string to_string(LinearSolver::Method method) {
    switch (method) {
        case LinearSolver::Method::SparseLU: return "SparseLU";
        case LinearSolver::Method::SimplicialLDLT: return "SimplicialLDLT";
    }
    return "SimplicialLDLT";
}

}  // namespace fem2d
