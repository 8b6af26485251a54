#pragma once

#include "fem2d/assembler.hpp"
#include "fem2d/boundary_condition.hpp"
#include "fem2d/constraints.hpp"
#include "fem2d/dof_handler.hpp"
#include "fem2d/engine.hpp"
#include "fem2d/load_pattern.hpp"
#include "fem2d/node_registry.hpp"
#include "fem2d/nonlinear_solver.hpp"
#include <Eigen/Dense>
#include <string>

namespace fem2d {

/**
 * @brief Status codes returned by FrameEngine::analyze()
 */
enum AnalysisStatus {
    ANALYSIS_OK = 0,
    ANALYSIS_EMPTY_MODEL = -1,      ///< No nodes or no elements
    ANALYSIS_NOT_CONVERGED = -2,    ///< A load step exceeded the iteration limit
    ANALYSIS_SINGULAR = -3,         ///< Singular stiffness (mechanism or orphan DOF)
    ANALYSIS_SETUP_FAILED = -4      ///< Constraints or loads could not be assembled
};

/**
 * @brief In-process 2D frame engine built on Eigen
 *
 * Workflow:
 * 1. wipe(), then add nodes, supports, constraints, elements and loads
 * 2. configure() the analysis
 * 3. analyze() numbers DOFs, applies supports with the penalty method,
 *    eliminates equal-DOF slaves by transformation and runs the
 *    load-controlled solve
 * 4. compute_reactions(), then query node and element results
 *
 * Reactions are r = F_int(u) - F folded onto the independent DOFs, so
 * forces carried through an equal-DOF slave show up at its master.
 */
class FrameEngine : public Engine {
public:
    FrameEngine() = default;

    void wipe() override;

    void add_node(int tag, double x, double y) override;

    void fix(int node_tag, const std::array<bool, 3>& fixity) override;

    void equal_dof(int master_tag, int slave_tag, const std::vector<int>& dofs) override;

    void set_transformation(TransformationType type) override;

    void add_elastic_beam(int tag, int node_i, int node_j,
                          double A, double E, double I) override;

    void add_zero_length(int tag, int node_i, int node_j,
                         const std::array<double, 3>& stiffness) override;

    void add_nodal_load(int node_tag, double fx, double fy, double moment) override;

    void add_beam_uniform_load(int element_tag, double wy, double wx) override;

    void configure(const SolverConfiguration& config) override;

    int analyze() override;

    void compute_reactions() override;

    std::array<double, 3> node_displacement(int node_tag) const override;

    std::array<double, 3> node_reaction(int node_tag) const override;

    std::array<double, 6> element_force(int element_tag) const override;

    // === Diagnostics ===

    size_t num_nodes() const { return registry_.size(); }

    size_t num_elements() const { return beams_.size() + springs_.size(); }

    int total_dofs() const { return dof_handler_.total_dofs(); }

    bool is_analyzed() const { return analyzed_; }

    /// Message of the last analyze() (convergence info or error)
    const std::string& last_message() const { return last_message_; }

private:
    NodeRegistry registry_;
    DOFHandler dof_handler_;
    BCHandler bc_handler_;
    ConstraintHandler constraint_handler_;
    FrameElementMap beams_;
    SpringElementMap springs_;
    LoadPattern load_pattern_;

    TransformationType transformation_ = TransformationType::Linear;
    SolverConfiguration config_;

    Eigen::VectorXd displacements_;
    Eigen::VectorXd load_vector_;
    Eigen::VectorXd reactions_;
    bool analyzed_ = false;
    bool reactions_computed_ = false;
    std::string last_message_;

    void require_unused_element_tag(int tag) const;

    void invalidate_results();

    void require_analyzed(const char* query) const;
};

}  // namespace fem2d
