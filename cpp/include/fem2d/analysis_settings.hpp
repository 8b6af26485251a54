#pragma once

#include "fem2d/solver.hpp"

namespace fem2d {

/**
 * @brief Tunables of the analysis pipeline
 *
 * Defaults reproduce the reference behaviour: rigid spring axes at 1e20,
 * 21 diagram stations, P-Delta in 10 load increments with a normed
 * displacement increment test of 1e-8 and at most 50 Newton iterations.
 */
struct AnalysisSettings {
    /// Stiffness used for spring axes given as 0 [N/m or N·m/rad]
    double rigid_spring_stiffness = 1e20;

    /// Number of diagram stations per beam (>= 2)
    int num_stations = 21;

    /// Lower bound for reported maxN, maxV, maxM
    double diagram_floor = 1e-10;

    /// Load-control increments for geometrically nonlinear analysis
    int nonlinear_load_steps = 10;

    /// Convergence tolerance on ||du|| for geometrically nonlinear analysis
    double nonlinear_tolerance = 1e-8;

    /// Newton iterations per load increment
    int nonlinear_max_iterations = 50;

    /// Sparse direct solver used by the engine
    LinearSolver::Method linear_method = LinearSolver::Method::SimplicialLDLT;

    /// Rigid spring / member stiffness ratio above which a warning is logged
    double stiffness_ratio_warning = 1e12;

    /**
     * @brief Check all values are in range
     * @throws AnalysisException (INVALID_SETTINGS) on the first bad value
     */
    void validate() const;
};

}  // namespace fem2d
