#pragma once

#include "fem2d/solver.hpp"
#include <array>
#include <vector>

namespace fem2d {

/**
 * @brief Local DOF indices of a 2D frame node
 */
enum DOFIndex {
    UX = 0,   ///< Translation along global X
    UY = 1,   ///< Translation along global Y
    RZ = 2    ///< Rotation about the out-of-plane axis
};

/// Number of DOFs per node
constexpr int kDofsPerNode = 3;

/**
 * @brief Coordinate transformation policy applied to every beam element
 */
enum class TransformationType {
    Linear,   ///< Small displacement
    PDelta    ///< Adds the geometric stiffness of the axial force
};

/**
 * @brief Solution algorithm of an analysis
 */
enum class AlgorithmType {
    Linear,   ///< One linear solve per load step, no convergence test
    Newton    ///< Newton-Raphson iterations with a displacement increment test
};

/**
 * @brief Analysis configuration handed to the engine before analyze()
 *
 * Load control applies the load pattern in `load_steps` equal increments
 * of 1 / load_steps.
 */
struct SolverConfiguration {
    AlgorithmType algorithm = AlgorithmType::Linear;
    int load_steps = 1;
    double tolerance = 1e-8;       ///< Norm of the displacement increment
    int max_iterations = 50;       ///< Per load step (Newton only)
    LinearSolver::Method linear_method = LinearSolver::Method::SimplicialLDLT;
};

/**
 * @brief Procedural interface of a 2D frame finite-element engine
 *
 * The engine holds one current model. Entities are added by integer tag;
 * element loads are given per unit length in the element's local axes.
 * Methods that add entities throw std::invalid_argument for duplicate
 * tags, unknown references or degenerate geometry.
 *
 * Result queries are valid after a successful analyze() (reactions
 * additionally after compute_reactions()).
 */
class Engine {
public:
    virtual ~Engine() = default;

    /// Discard the current model and all results
    virtual void wipe() = 0;

    virtual void add_node(int tag, double x, double y) = 0;

    /**
     * @brief Restrain DOFs of a node
     * @param fixity [UX, UY, RZ] (true = fixed)
     */
    virtual void fix(int node_tag, const std::array<bool, 3>& fixity) = 0;

    /**
     * @brief Tie DOFs of a slave node to the same DOFs of a master node
     * @param dofs Local DOF indices (DOFIndex values)
     */
    virtual void equal_dof(int master_tag, int slave_tag, const std::vector<int>& dofs) = 0;

    /// Transformation policy used by beams added afterwards
    virtual void set_transformation(TransformationType type) = 0;

    /**
     * @brief Add an elastic Euler-Bernoulli beam-column
     * @param A Area [m²]
     * @param E Young's modulus [N/m²]
     * @param I Second moment of area [m⁴]
     */
    virtual void add_elastic_beam(int tag, int node_i, int node_j,
                                  double A, double E, double I) = 0;

    /**
     * @brief Add a zero-length element with uncoupled springs
     * @param stiffness [kx, ky, kr] in global axes
     */
    virtual void add_zero_length(int tag, int node_i, int node_j,
                                 const std::array<double, 3>& stiffness) = 0;

    /// Add a nodal load (global axes) to the load pattern
    virtual void add_nodal_load(int node_tag, double fx, double fy, double moment) = 0;

    /**
     * @brief Add a full-span uniform load to a beam element
     * @param wy Transverse intensity (local y) [N/m]
     * @param wx Axial intensity (local x) [N/m]
     */
    virtual void add_beam_uniform_load(int element_tag, double wy, double wx) = 0;

    virtual void configure(const SolverConfiguration& config) = 0;

    /**
     * @brief Run the configured analysis
     * @return 0 on success, a negative code on failure
     */
    virtual int analyze() = 0;

    virtual void compute_reactions() = 0;

    /// [ux, uy, rz] of a node
    virtual std::array<double, 3> node_displacement(int node_tag) const = 0;

    /// [Rx, Ry, Rm] of a node
    virtual std::array<double, 3> node_reaction(int node_tag) const = 0;

    /**
     * @brief End actions of a beam element in local axes
     *
     * [N1, V1, M1, N2, V2, M2]: forces exerted on the element by its end
     * nodes, including the fixed-end effect of element loads.
     */
    virtual std::array<double, 6> element_force(int element_tag) const = 0;
};

}  // namespace fem2d
