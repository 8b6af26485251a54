#include "fem2d/frame_engine.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace fem2d {

void FrameEngine::wipe() {
    registry_.clear();
    dof_handler_.clear();
    bc_handler_.clear();
    constraint_handler_.clear();
    beams_.clear();
    springs_.clear();
    load_pattern_.clear();
    transformation_ = TransformationType::Linear;
    config_ = SolverConfiguration();
    invalidate_results();
    last_message_.clear();
}

void FrameEngine::add_node(int tag, double x, double y) {
    registry_.create_node(tag, x, y);
    invalidate_results();
}

void FrameEngine::fix(int node_tag, const std::array<bool, 3>& fixity) {
    registry_.require_node(node_tag);
    bc_handler_.fix(node_tag, fixity);
    invalidate_results();
}

void FrameEngine::equal_dof(int master_tag, int slave_tag, const std::vector<int>& dofs) {
    registry_.require_node(master_tag);
    registry_.require_node(slave_tag);
    if (master_tag == slave_tag) {
        throw std::invalid_argument("equal_dof: master and slave must be different nodes");
    }
    if (dofs.empty()) {
        throw std::invalid_argument("equal_dof: no DOFs given");
    }
    for (int dof : dofs) {
        constraint_handler_.add_equality_constraint(slave_tag, dof, master_tag, dof);
    }
    invalidate_results();
}

void FrameEngine::set_transformation(TransformationType type) {
    transformation_ = type;
}

void FrameEngine::add_elastic_beam(int tag, int node_i, int node_j,
                                   double A, double E, double I) {
    require_unused_element_tag(tag);
    Node* ni = &registry_.require_node(node_i);
    Node* nj = &registry_.require_node(node_j);
    if (ni == nj) {
        throw std::invalid_argument("Element " + std::to_string(tag) +
                                    " connects node " + std::to_string(node_i) + " to itself");
    }

    beams_[tag] = std::make_unique<FrameElement>(tag, ni, nj, A, E, I, transformation_);
    invalidate_results();
}

void FrameEngine::add_zero_length(int tag, int node_i, int node_j,
                                  const std::array<double, 3>& stiffness) {
    require_unused_element_tag(tag);
    Node* ni = &registry_.require_node(node_i);
    Node* nj = &registry_.require_node(node_j);
    if (ni == nj) {
        throw std::invalid_argument("Element " + std::to_string(tag) +
                                    " connects node " + std::to_string(node_i) + " to itself");
    }

    springs_[tag] = std::make_unique<SpringElement>(tag, ni, nj, stiffness);
    invalidate_results();
}

void FrameEngine::add_nodal_load(int node_tag, double fx, double fy, double moment) {
    registry_.require_node(node_tag);
    load_pattern_.add_nodal_load(node_tag, fx, fy, moment);
    invalidate_results();
}

void FrameEngine::add_beam_uniform_load(int element_tag, double wy, double wx) {
    if (beams_.find(element_tag) == beams_.end()) {
        throw std::invalid_argument("Uniform load on unknown beam element " +
                                    std::to_string(element_tag));
    }
    load_pattern_.add_element_load(element_tag, wy, wx);
    invalidate_results();
}

void FrameEngine::configure(const SolverConfiguration& config) {
    if (config.load_steps < 1 || config.max_iterations < 1 || !(config.tolerance > 0.0)) {
        throw std::invalid_argument("Invalid solver configuration");
    }
    config_ = config;
}

int FrameEngine::analyze() {
    invalidate_results();

    if (registry_.size() == 0 || num_elements() == 0) {
        last_message_ = "Model has no nodes or no elements";
        return ANALYSIS_EMPTY_MODEL;
    }

    dof_handler_.number_dofs(registry_);
    const int n = dof_handler_.total_dofs();
    Assembler assembler(dof_handler_);

    Eigen::SparseMatrix<double> K = assembler.assemble_stiffness(beams_, springs_);
    Eigen::VectorXd F;
    Eigen::VectorXd P;
    Eigen::SparseMatrix<double> P_matrix;
    Eigen::SparseMatrix<double> T;

    try {
        F = load_pattern_.assemble_load_vector(dof_handler_, beams_);
        P = bc_handler_.penalty_stiffness(K, dof_handler_);
        P_matrix = bc_handler_.penalty_matrix(K, dof_handler_);
        T = constraint_handler_.build_transformation_matrix(dof_handler_);
    } catch (const std::runtime_error& e) {
        last_message_ = e.what();
        spdlog::debug("Engine setup failed: {}", last_message_);
        return ANALYSIS_SETUP_FAILED;
    }

    const Eigen::SparseMatrix<double> Tt = T.transpose();

    auto tangent = [&](const Eigen::VectorXd& u_reduced) {
        Eigen::VectorXd u = constraint_handler_.expand_displacements(u_reduced, T);
        Eigen::SparseMatrix<double> K_t =
            assembler.assemble_tangent(beams_, springs_, load_pattern_, u) + P_matrix;
        return Eigen::SparseMatrix<double>(Tt * K_t * T);
    };

    auto internal_force = [&](const Eigen::VectorXd& u_reduced) {
        Eigen::VectorXd u = constraint_handler_.expand_displacements(u_reduced, T);
        Eigen::VectorXd f = assembler.assemble_internal_forces(beams_, springs_, load_pattern_, u)
                          + P.cwiseProduct(u);
        return Eigen::VectorXd(Tt * f);
    };

    NonlinearSolverSettings settings;
    settings.load_steps = config_.load_steps;
    settings.max_iterations = config_.max_iterations;
    settings.displacement_tolerance = config_.tolerance;
    settings.newton = config_.algorithm == AlgorithmType::Newton;
    settings.linear_method = config_.linear_method;

    spdlog::debug("Engine analyze: {} nodes, {} beams, {} springs, {} DOFs ({} independent), "
                  "{} fixed DOFs, {} load steps, {}",
                  registry_.size(), beams_.size(), springs_.size(), n, T.cols(),
                  bc_handler_.num_fixed_dofs(), config_.load_steps,
                  settings.newton ? "Newton" : "Linear");

    NonlinearSolver solver(settings);
    NonlinearSolverResult result = solver.solve(Tt * F, tangent, internal_force);

    last_message_ = result.message;

    if (result.singular) {
        spdlog::debug("Engine analyze failed: {}", result.message);
        return ANALYSIS_SINGULAR;
    }
    if (!result.converged) {
        spdlog::debug("Engine analyze failed: {}", result.message);
        return ANALYSIS_NOT_CONVERGED;
    }

    displacements_ = constraint_handler_.expand_displacements(result.displacements, T);
    load_vector_ = F;
    analyzed_ = true;
    spdlog::debug("Engine analyze: {}", result.message);
    return ANALYSIS_OK;
}

void FrameEngine::compute_reactions() {
    require_analyzed("compute_reactions");

    Assembler assembler(dof_handler_);
    Eigen::VectorXd f_int =
        assembler.assemble_internal_forces(beams_, springs_, load_pattern_, displacements_);

    reactions_ = constraint_handler_.condense_forces(f_int - load_vector_, dof_handler_);
    reactions_computed_ = true;
}

std::array<double, 3> FrameEngine::node_displacement(int node_tag) const {
    require_analyzed("node_displacement");
    const Node& node = registry_.require_node(node_tag);

    std::array<double, 3> result{};
    for (int d = 0; d < kDofsPerNode; ++d) {
        result[d] = displacements_(node.global_dof_numbers[d]);
    }
    return result;
}

std::array<double, 3> FrameEngine::node_reaction(int node_tag) const {
    require_analyzed("node_reaction");
    if (!reactions_computed_) {
        throw std::runtime_error("node_reaction: compute_reactions() has not been called");
    }
    const Node& node = registry_.require_node(node_tag);

    std::array<double, 3> result{};
    for (int d = 0; d < kDofsPerNode; ++d) {
        result[d] = reactions_(node.global_dof_numbers[d]);
    }
    return result;
}

std::array<double, 6> FrameEngine::element_force(int element_tag) const {
    require_analyzed("element_force");

    Vector6 f;
    auto beam_it = beams_.find(element_tag);
    if (beam_it != beams_.end()) {
        const FrameElement& beam = *beam_it->second;
        ElementUniformLoad load = load_pattern_.element_load(element_tag);
        Vector6 u_local = beam.local_displacements(displacements_, dof_handler_);
        f = beam.local_end_forces(u_local, load.wx, load.wy);
    } else {
        auto spring_it = springs_.find(element_tag);
        if (spring_it == springs_.end()) {
            throw std::invalid_argument("Element " + std::to_string(element_tag) + " does not exist");
        }
        const SpringElement& spring = *spring_it->second;
        std::vector<int> loc = dof_handler_.get_location_array(*spring.node_i, *spring.node_j);
        Vector6 u_elem;
        for (int i = 0; i < 6; ++i) {
            u_elem(i) = displacements_(loc[i]);
        }
        f = spring.forces(u_elem);
    }

    std::array<double, 6> result{};
    for (int i = 0; i < 6; ++i) {
        result[i] = f(i);
    }
    return result;
}

void FrameEngine::require_unused_element_tag(int tag) const {
    if (beams_.count(tag) > 0 || springs_.count(tag) > 0) {
        throw std::invalid_argument("Element " + std::to_string(tag) + " already exists");
    }
}

void FrameEngine::invalidate_results() {
    analyzed_ = false;
    reactions_computed_ = false;
    displacements_.resize(0);
    reactions_.resize(0);
}

void FrameEngine::require_analyzed(const char* query) const {
    if (!analyzed_) {
        throw std::runtime_error(std::string(query) + ": no converged analysis results");
    }
}

}  // namespace fem2d
