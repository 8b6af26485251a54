/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the fem2d C++ tests
 *
 * - RecordingEngine: Engine that records every call and returns canned results
 * - Request builders for the reference beams and frames
 */

#pragma once

#include "fem2d/engine.hpp"
#include "fem2d/model_input.hpp"

#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace fem2d {
namespace testing {

/**
 * @brief One recorded engine call
 *
 * tags holds the integer arguments in call order, values the floating
 * point ones.
 */
struct EngineCall {
    std::string op;
    std::vector<int> tags;
    std::vector<double> values;
};

/**
 * @brief Engine double that records calls and serves canned results
 */
class RecordingEngine : public Engine {
public:
    std::vector<EngineCall> calls;

    // Canned results
    int status = 0;
    bool throw_on_analyze = false;
    std::map<int, std::array<double, 3>> displacements;
    std::map<int, std::array<double, 3>> reactions;
    std::map<int, std::array<double, 6>> element_forces;

    SolverConfiguration last_config;
    int reactions_computed = 0;

    void wipe() override { calls.push_back({"wipe", {}, {}}); }

    void add_node(int tag, double x, double y) override {
        calls.push_back({"add_node", {tag}, {x, y}});
    }

    void fix(int node_tag, const std::array<bool, 3>& fixity) override {
        calls.push_back({"fix", {node_tag, fixity[0], fixity[1], fixity[2]}, {}});
    }

    void equal_dof(int master_tag, int slave_tag, const std::vector<int>& dofs) override {
        EngineCall call{"equal_dof", {master_tag, slave_tag}, {}};
        call.tags.insert(call.tags.end(), dofs.begin(), dofs.end());
        calls.push_back(call);
    }

    void set_transformation(TransformationType type) override {
        calls.push_back({"set_transformation", {type == TransformationType::PDelta ? 1 : 0}, {}});
    }

    void add_elastic_beam(int tag, int node_i, int node_j,
                          double A, double E, double I) override {
        calls.push_back({"add_elastic_beam", {tag, node_i, node_j}, {A, E, I}});
    }

    void add_zero_length(int tag, int node_i, int node_j,
                         const std::array<double, 3>& stiffness) override {
        calls.push_back({"add_zero_length", {tag, node_i, node_j},
                         {stiffness[0], stiffness[1], stiffness[2]}});
    }

    void add_nodal_load(int node_tag, double fx, double fy, double moment) override {
        calls.push_back({"add_nodal_load", {node_tag}, {fx, fy, moment}});
    }

    void add_beam_uniform_load(int element_tag, double wy, double wx) override {
        calls.push_back({"add_beam_uniform_load", {element_tag}, {wy, wx}});
    }

    void configure(const SolverConfiguration& config) override {
        last_config = config;
        calls.push_back({"configure", {config.load_steps}, {config.tolerance}});
    }

    int analyze() override {
        calls.push_back({"analyze", {}, {}});
        if (throw_on_analyze) {
            throw std::runtime_error("engine exploded");
        }
        return status;
    }

    void compute_reactions() override { ++reactions_computed; }

    std::array<double, 3> node_displacement(int node_tag) const override {
        auto it = displacements.find(node_tag);
        return it == displacements.end() ? std::array<double, 3>{} : it->second;
    }

    std::array<double, 3> node_reaction(int node_tag) const override {
        auto it = reactions.find(node_tag);
        return it == reactions.end() ? std::array<double, 3>{} : it->second;
    }

    std::array<double, 6> element_force(int element_tag) const override {
        auto it = element_forces.find(element_tag);
        return it == element_forces.end() ? std::array<double, 6>{} : it->second;
    }

    /// Calls with the given operation name, in order
    std::vector<EngineCall> calls_of(const std::string& op) const {
        std::vector<EngineCall> result;
        for (const auto& call : calls) {
            if (call.op == op) result.push_back(call);
        }
        return result;
    }

    /// Index of the first call with the given name (-1 if none)
    int first_index(const std::string& op) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].op == op) return static_cast<int>(i);
        }
        return -1;
    }
};

// =============================================================================
// Request builders
// =============================================================================

constexpr double kSteelE = 210e9;

inline NodeInput make_node(int id, double x, double y,
                           bool fix_x = false, bool fix_y = false, bool fix_rotation = false) {
    NodeInput node;
    node.id = id;
    node.x = x;
    node.y = y;
    node.constraints.x = fix_x;
    node.constraints.y = fix_y;
    node.constraints.rotation = fix_rotation;
    return node;
}

inline NodeInput with_load(NodeInput node, double fx, double fy, double moment = 0.0) {
    PointLoad load;
    load.fx = fx;
    load.fy = fy;
    load.moment = moment;
    node.loads = load;
    return node;
}

inline BeamInput make_beam(int id, int start, int end, double A, double I, int material_id = 1) {
    BeamInput beam;
    beam.id = id;
    beam.node_ids = {start, end};
    beam.material_id = material_id;
    beam.section = Section(A, I);
    return beam;
}

inline BeamInput with_uniform_load(BeamInput beam, double qx, double qy,
                                   double start_t = 0.0, double end_t = 1.0,
                                   CoordSystem system = CoordSystem::Local) {
    DistributedLoad load;
    load.qx = qx;
    load.qy = qy;
    load.start_t = start_t;
    load.end_t = end_t;
    load.coord_system = system;
    beam.distributed_load = load;
    return beam;
}

inline BeamInput with_releases(BeamInput beam, bool start, bool end) {
    EndReleases releases;
    releases.start_moment = start;
    releases.end_moment = end;
    beam.end_releases = releases;
    return beam;
}

/**
 * @brief Simply supported beam of length L split at midspan, point load at midspan
 *
 * Nodes 1 (pin), 2 (midspan, load fy), 3 (roller); beams 1: 1-2, 2: 2-3.
 * IPE200: A = 28.5 cm², I = 1940 cm⁴.
 */
inline SolveRequest simply_supported_point_load(double L, double F) {
    SolveRequest request;
    request.nodes = {
        make_node(1, 0.0, 0.0, true, true),
        with_load(make_node(2, L / 2.0, 0.0), 0.0, -F),
        make_node(3, L, 0.0, false, true),
    };
    request.beams = {
        make_beam(1, 1, 2, 28.5e-4, 1940e-8),
        make_beam(2, 2, 3, 28.5e-4, 1940e-8),
    };
    request.materials = {Material(1, kSteelE)};
    return request;
}

/**
 * @brief Simply supported single beam with a uniform load on [start_t, end_t]
 *
 * HEA200-like: A = 53.8 cm², I = 8360 cm⁴.
 */
inline SolveRequest simply_supported_uniform_load(double L, double q,
                                                  double start_t = 0.0, double end_t = 1.0) {
    SolveRequest request;
    request.nodes = {
        make_node(1, 0.0, 0.0, true, true),
        make_node(2, L, 0.0, false, true),
    };
    request.beams = {
        with_uniform_load(make_beam(1, 1, 2, 53.8e-4, 8360e-8), 0.0, q, start_t, end_t),
    };
    request.materials = {Material(1, kSteelE)};
    return request;
}

/**
 * @brief Cantilever of length L fixed at node 1, tip load fy = -F at node 2
 */
inline SolveRequest cantilever_tip_load(double L, double F) {
    SolveRequest request;
    request.nodes = {
        make_node(1, 0.0, 0.0, true, true, true),
        with_load(make_node(2, L, 0.0), 0.0, -F),
    };
    request.beams = {make_beam(1, 1, 2, 28.5e-4, 1940e-8)};
    request.materials = {Material(1, kSteelE)};
    return request;
}

/**
 * @brief Fixed-base portal frame, height h, span b, global uniform load q on the girder
 *
 * Nodes 1 (0,0) fixed, 2 (0,h), 3 (b,h), 4 (b,0) fixed.
 * Beams 1: 1-2, 2: 2-3 (loaded), 3: 4-3. HEA200: A = 53.8 cm², I = 3690 cm⁴.
 */
inline SolveRequest portal_frame(double h, double b, double q, double lateral = 0.0) {
    SolveRequest request;
    request.nodes = {
        make_node(1, 0.0, 0.0, true, true, true),
        with_load(make_node(2, 0.0, h), lateral, 0.0),
        make_node(3, b, h),
        make_node(4, b, 0.0, true, true, true),
    };
    request.beams = {
        make_beam(1, 1, 2, 53.8e-4, 3690e-8),
        with_uniform_load(make_beam(2, 2, 3, 53.8e-4, 3690e-8), 0.0, q, 0.0, 1.0,
                          CoordSystem::Global),
        make_beam(3, 4, 3, 53.8e-4, 3690e-8),
    };
    request.materials = {Material(1, kSteelE)};
    return request;
}

/// Sum of one reaction component over all nodes (0 = Rx, 1 = Ry, 2 = Rm)
inline double reaction_sum(const std::vector<double>& reactions, int component) {
    double sum = 0.0;
    for (size_t i = static_cast<size_t>(component); i < reactions.size(); i += 3) {
        sum += reactions[i];
    }
    return sum;
}

}  // namespace testing
}  // namespace fem2d
