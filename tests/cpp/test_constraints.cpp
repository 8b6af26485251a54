/**
 * @file test_constraints.cpp
 * @brief C++ tests for ConstraintHandler equal-DOF constraints
 *
 * Tests include:
 * - Tied cantilever tips solved on the reduced system T^T K T
 * - Transformation matrix structure and displacement recovery
 * - Folding slave forces onto masters
 * - Rejection of chained and conflicting constraints
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "fem2d/node_registry.hpp"
#include "fem2d/frame_element.hpp"
#include "fem2d/dof_handler.hpp"
#include "fem2d/assembler.hpp"
#include "fem2d/boundary_condition.hpp"
#include "fem2d/constraints.hpp"
#include "fem2d/solver.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <memory>
#include <stdexcept>

using namespace fem2d;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Test Fixtures
// =============================================================================

/**
 * @brief Two parallel cantilevers of length L, fixed at x = 0
 *
 * Beam 1: node 1 (0, 0) -> node 2 (L, 0)
 * Beam 2: node 3 (0, 1) -> node 4 (L, 1)
 */
struct TwinCantileverFixture {
    static constexpr double L = 4.0;
    static constexpr double E = 210e9;
    static constexpr double A = 0.01;
    static constexpr double I = 1e-5;

    NodeRegistry registry;
    FrameElementMap beams;
    SpringElementMap springs;
    DOFHandler dof_handler;
    BCHandler bc;
    Eigen::SparseMatrix<double> K;

    TwinCantileverFixture() {
        Node* n1 = registry.create_node(1, 0.0, 0.0);
        Node* n2 = registry.create_node(2, L, 0.0);
        Node* n3 = registry.create_node(3, 0.0, 1.0);
        Node* n4 = registry.create_node(4, L, 1.0);

        beams[1] = std::make_unique<FrameElement>(1, n1, n2, A, E, I);
        beams[2] = std::make_unique<FrameElement>(2, n3, n4, A, E, I);

        dof_handler.number_dofs(registry);

        Assembler assembler(dof_handler);
        K = assembler.assemble_stiffness(beams, springs);

        bc.fix(1, {true, true, true});
        bc.fix(3, {true, true, true});
    }

    int dof(int node_id, int local_dof) const {
        return dof_handler.get_global_dof(node_id, local_dof);
    }

    /// Solve the supported, constrained system and return full displacements
    Eigen::VectorXd solve(const ConstraintHandler& constraints, const Eigen::VectorXd& F) const {
        Eigen::SparseMatrix<double> K_bc = K + bc.penalty_matrix(K, dof_handler);
        Eigen::SparseMatrix<double> T = constraints.build_transformation_matrix(dof_handler);
        Eigen::SparseMatrix<double> Tt = T.transpose();

        Eigen::SparseMatrix<double> K_reduced = Tt * K_bc * T;
        Eigen::VectorXd F_reduced = Tt * F;

        LinearSolver solver;
        Eigen::VectorXd u_reduced = solver.solve(K_reduced, F_reduced);
        REQUIRE_FALSE(solver.is_singular());

        return constraints.expand_displacements(u_reduced, T);
    }
};

// =============================================================================
// Equality constraints in analysis
// =============================================================================

TEST_CASE("Equality constraint: two cantilevers with tied tips", "[ConstraintHandler][equality]") {
    TwinCantileverFixture fixture;
    const double P = 12e3;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UY, 2, UY);

    Eigen::VectorXd F = Eigen::VectorXd::Zero(fixture.dof_handler.total_dofs());
    F[fixture.dof(2, UY)] = -P;

    Eigen::SparseMatrix<double> T = constraints.build_transformation_matrix(fixture.dof_handler);
    REQUIRE(T.rows() == 12);
    REQUIRE(T.cols() == 11);

    Eigen::VectorXd u = fixture.solve(constraints, F);
    REQUIRE(u.size() == 12);

    // Each cantilever carries half the load
    const double L = TwinCantileverFixture::L;
    const double EI = TwinCantileverFixture::E * TwinCantileverFixture::I;
    double expected = -(P / 2.0) * L * L * L / (3.0 * EI);

    REQUIRE_THAT(u[fixture.dof(2, UY)], WithinRel(expected, 1e-8));
    REQUIRE_THAT(u[fixture.dof(4, UY)], WithinRel(u[fixture.dof(2, UY)], 1e-12));

    // Untied DOFs stay independent: the tip rotations follow their own beams
    REQUIRE_THAT(u[fixture.dof(4, RZ)], WithinRel(u[fixture.dof(2, RZ)], 1e-8));
    REQUIRE_THAT(u[fixture.dof(4, UX)], WithinAbs(0.0, 1e-12));
}

TEST_CASE("Tied DOF reactions are folded onto the master", "[ConstraintHandler][equality]") {
    TwinCantileverFixture fixture;
    const double P = 12e3;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UY, 2, UY);

    Eigen::VectorXd F = Eigen::VectorXd::Zero(fixture.dof_handler.total_dofs());
    F[fixture.dof(2, UY)] = -P;

    Eigen::VectorXd u = fixture.solve(constraints, F);

    // Unfolded, the tied tips show equal and opposite constraint forces
    Eigen::VectorXd residual = fixture.K * u - F;
    REQUIRE_THAT(residual[fixture.dof(4, UY)], WithinRel(-P / 2.0, 1e-8));
    REQUIRE_THAT(residual[fixture.dof(2, UY)], WithinRel(P / 2.0, 1e-8));

    Eigen::VectorXd folded = constraints.condense_forces(residual, fixture.dof_handler);
    REQUIRE_THAT(folded[fixture.dof(2, UY)], WithinAbs(0.0, 1e-6));
    REQUIRE(folded[fixture.dof(4, UY)] == 0.0);

    // Support reactions are untouched
    REQUIRE_THAT(folded[fixture.dof(1, UY)], WithinRel(P / 2.0, 1e-8));
    REQUIRE_THAT(folded[fixture.dof(3, UY)], WithinRel(P / 2.0, 1e-8));
}

// =============================================================================
// Transformation matrix
// =============================================================================

TEST_CASE("Transformation matrix maps slaves onto their masters", "[ConstraintHandler][transformation]") {
    TwinCantileverFixture fixture;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UX, 2, UX);
    constraints.add_equality_constraint(4, UY, 2, UY);

    Eigen::MatrixXd T = Eigen::MatrixXd(constraints.build_transformation_matrix(fixture.dof_handler));

    REQUIRE(T.rows() == 12);
    REQUIRE(T.cols() == 10);

    // One unit entry per row
    for (int i = 0; i < T.rows(); ++i) {
        REQUIRE_THAT(T.row(i).sum(), WithinAbs(1.0, 1e-15));
    }
    REQUIRE(T.row(fixture.dof(4, UX)) == T.row(fixture.dof(2, UX)));
    REQUIRE(T.row(fixture.dof(4, UY)) == T.row(fixture.dof(2, UY)));
    REQUIRE(T.row(fixture.dof(4, RZ)) != T.row(fixture.dof(2, RZ)));
}

TEST_CASE("Expanded displacements equal T times the reduced vector", "[ConstraintHandler][recovery]") {
    TwinCantileverFixture fixture;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UY, 2, UY);

    Eigen::SparseMatrix<double> T = constraints.build_transformation_matrix(fixture.dof_handler);
    Eigen::VectorXd u_reduced = Eigen::VectorXd::LinSpaced(T.cols(), 1.0, 11.0);

    Eigen::VectorXd u = constraints.expand_displacements(u_reduced, T);
    Eigen::VectorXd expected = T * u_reduced;

    REQUIRE(u.size() == 12);
    for (int i = 0; i < u.size(); ++i) {
        REQUIRE(u[i] == expected[i]);
    }
    REQUIRE(u[fixture.dof(4, UY)] == u[fixture.dof(2, UY)]);

    Eigen::VectorXd wrong_size = Eigen::VectorXd::Zero(3);
    REQUIRE_THROWS_AS(constraints.expand_displacements(wrong_size, T), std::invalid_argument);
}

TEST_CASE("Without constraints T is the identity", "[ConstraintHandler][recovery]") {
    TwinCantileverFixture fixture;
    ConstraintHandler constraints;
    REQUIRE_FALSE(constraints.has_constraints());

    Eigen::MatrixXd T = Eigen::MatrixXd(constraints.build_transformation_matrix(fixture.dof_handler));
    REQUIRE(T.rows() == 12);
    REQUIRE(T.cols() == 12);
    REQUIRE(T.isIdentity());

    Eigen::VectorXd F = Eigen::VectorXd::Ones(12);
    REQUIRE(constraints.condense_forces(F, fixture.dof_handler) == F);
    REQUIRE_THROWS_AS(constraints.condense_forces(Eigen::VectorXd::Ones(5), fixture.dof_handler),
                      std::invalid_argument);
}

TEST_CASE("Untied cantilevers solve independently", "[ConstraintHandler][recovery]") {
    TwinCantileverFixture fixture;
    const double P = 12e3;

    Eigen::VectorXd F = Eigen::VectorXd::Zero(12);
    F[fixture.dof(2, UY)] = -P;

    Eigen::VectorXd u = fixture.solve(ConstraintHandler(), F);

    const double L = TwinCantileverFixture::L;
    const double EI = TwinCantileverFixture::E * TwinCantileverFixture::I;
    REQUIRE_THAT(u[fixture.dof(2, UY)], WithinRel(-P * L * L * L / (3.0 * EI), 1e-8));
    REQUIRE_THAT(u[fixture.dof(4, UY)], WithinAbs(0.0, 1e-15));
}

// =============================================================================
// Invalid constraints
// =============================================================================

TEST_CASE("Chained constraints are rejected", "[ConstraintHandler][errors]") {
    TwinCantileverFixture fixture;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UY, 2, UY);
    constraints.add_equality_constraint(2, UY, 1, UY);

    REQUIRE_THROWS_AS(constraints.build_transformation_matrix(fixture.dof_handler),
                      std::runtime_error);
}

TEST_CASE("A DOF tied to two masters is rejected", "[ConstraintHandler][errors]") {
    TwinCantileverFixture fixture;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(4, UY, 2, UY);
    constraints.add_equality_constraint(4, UY, 3, UY);

    REQUIRE_THROWS_AS(constraints.build_transformation_matrix(fixture.dof_handler),
                      std::runtime_error);
}

TEST_CASE("Constraint on an unnumbered node is rejected", "[ConstraintHandler][errors]") {
    TwinCantileverFixture fixture;

    ConstraintHandler constraints;
    constraints.add_equality_constraint(9, UY, 2, UY);

    REQUIRE_THROWS_AS(constraints.build_transformation_matrix(fixture.dof_handler),
                      std::runtime_error);
}

TEST_CASE("Invalid equality constraints are rejected on creation", "[ConstraintHandler][errors]") {
    ConstraintHandler constraints;

    REQUIRE_THROWS_AS(constraints.add_equality_constraint(2, 3, 1, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(constraints.add_equality_constraint(2, 0, 1, -1), std::invalid_argument);
    REQUIRE_THROWS_AS(constraints.add_equality_constraint(2, UX, 2, UX), std::invalid_argument);

    // Different DOFs of one node may be tied
    REQUIRE_NOTHROW(constraints.add_equality_constraint(2, UX, 2, UY));
}
