#include "fem2d/model_assembler.hpp"
#include "fem2d/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

namespace fem2d {

namespace {

bool is_finite(double value) { return std::isfinite(value); }

Fem2dError node_error(ErrorCode code, int node_id, const std::string& message) {
    Fem2dError err(code, "Node " + std::to_string(node_id) + ": " + message);
    err.involved_nodes.push_back(node_id);
    return err;
}

}  // namespace

// =============================================================================
// AuxiliaryIdAllocator
// =============================================================================

AuxiliaryIdAllocator::AuxiliaryIdAllocator(int first_id)
    : first_id_(first_id), next_id_(first_id) {}

AuxiliaryIdAllocator AuxiliaryIdAllocator::for_request(const SolveRequest& request) {
    int max_id = 0;
    for (const auto& node : request.nodes) {
        max_id = std::max(max_id, node.id);
    }
    for (const auto& beam : request.beams) {
        max_id = std::max(max_id, beam.id);
    }
    if (max_id == std::numeric_limits<int>::max()) {
        throw AnalysisException(Fem2dError::invalid_request(
            "no engine tags left above id " + std::to_string(max_id)));
    }
    return AuxiliaryIdAllocator(max_id + 1);
}

int AuxiliaryIdAllocator::next() {
    if (next_id_ == std::numeric_limits<int>::max()) {
        throw AnalysisException(Fem2dError::invalid_request("auxiliary engine tags exhausted"));
    }
    return next_id_++;
}

// =============================================================================
// AssemblyMap
// =============================================================================

const BeamMapping& AssemblyMap::beam(int beam_id) const {
    for (const auto& mapping : beams) {
        if (mapping.beam_id == beam_id) {
            return mapping;
        }
    }
    throw std::out_of_range("Beam " + std::to_string(beam_id) + " is not in the assembly map");
}

std::vector<int> AssemblyMap::released_beams() const {
    std::vector<int> result;
    for (const auto& mapping : beams) {
        if (mapping.has_release()) {
            result.push_back(mapping.beam_id);
        }
    }
    return result;
}

// =============================================================================
// ModelAssembler
// =============================================================================

ModelAssembler::ModelAssembler(const AnalysisSettings& settings)
    : settings_(settings) {
    settings_.validate();
}

void ModelAssembler::validate(const SolveRequest& request) const {
    if (request.nodes.empty()) {
        throw AnalysisException(Fem2dError(ErrorCode::NO_NODES, "Request contains no nodes"));
    }
    if (request.beams.empty()) {
        throw AnalysisException(Fem2dError(ErrorCode::NO_BEAMS, "Request contains no beams"));
    }

    std::map<int, const NodeInput*> nodes_by_id;
    for (const auto& node : request.nodes) {
        if (!nodes_by_id.emplace(node.id, &node).second) {
            throw AnalysisException(Fem2dError::duplicate_id("node", node.id));
        }
        if (!is_finite(node.x) || !is_finite(node.y)) {
            throw AnalysisException(node_error(ErrorCode::INVALID_COORDINATE, node.id,
                                               "coordinates must be finite"));
        }
        if (node.springs) {
            const SpringSupport& k = *node.springs;
            for (double value : {k.kx, k.ky, k.kr}) {
                if (!is_finite(value) || value < 0.0) {
                    throw AnalysisException(node_error(ErrorCode::INVALID_SPRING, node.id,
                        "spring stiffness must be finite and >= 0"));
                }
            }
        }
        if (node.loads) {
            const PointLoad& p = *node.loads;
            if (!is_finite(p.fx) || !is_finite(p.fy) || !is_finite(p.moment)) {
                throw AnalysisException(node_error(ErrorCode::INVALID_LOAD_VALUE, node.id,
                                                   "point load must be finite"));
            }
        }
    }

    std::map<int, const Material*> materials_by_id;
    for (const auto& material : request.materials) {
        if (!materials_by_id.emplace(material.id, &material).second) {
            throw AnalysisException(Fem2dError::duplicate_id("material", material.id));
        }
        if (!is_finite(material.E) || material.E <= 0.0) {
            Fem2dError err(ErrorCode::INVALID_MATERIAL,
                "Material " + std::to_string(material.id) + " must have E > 0");
            err.details["E"] = std::to_string(material.E);
            throw AnalysisException(err);
        }
    }

    std::set<int> beam_ids;
    for (const auto& beam : request.beams) {
        if (!beam_ids.insert(beam.id).second) {
            throw AnalysisException(Fem2dError::duplicate_id("beam", beam.id));
        }

        const auto [start_id, end_id] = beam.node_ids;
        if (start_id == end_id) {
            throw AnalysisException(Fem2dError::invalid_element(
                beam.id, "start and end node are both " + std::to_string(start_id)));
        }
        auto start_it = nodes_by_id.find(start_id);
        if (start_it == nodes_by_id.end()) {
            throw AnalysisException(Fem2dError::invalid_node(beam.id, start_id));
        }
        auto end_it = nodes_by_id.find(end_id);
        if (end_it == nodes_by_id.end()) {
            throw AnalysisException(Fem2dError::invalid_node(beam.id, end_id));
        }
        if (materials_by_id.find(beam.material_id) == materials_by_id.end()) {
            throw AnalysisException(
                Fem2dError::invalid_material_reference(beam.id, beam.material_id));
        }

        if (!is_finite(beam.section.A) || beam.section.A <= 0.0) {
            throw AnalysisException(Fem2dError::invalid_section(beam.id, "A must be > 0"));
        }
        if (!is_finite(beam.section.I) || beam.section.I <= 0.0) {
            throw AnalysisException(Fem2dError::invalid_section(beam.id, "I must be > 0"));
        }

        const NodeInput& n1 = *start_it->second;
        const NodeInput& n2 = *end_it->second;
        if (std::hypot(n2.x - n1.x, n2.y - n1.y) < 1e-10) {
            Fem2dError err = Fem2dError::invalid_element(beam.id, "zero length");
            err.involved_nodes = {start_id, end_id};
            throw AnalysisException(err);
        }

        if (beam.distributed_load) {
            const DistributedLoad& q = *beam.distributed_load;
            if (!is_finite(q.qx) || !is_finite(q.qy)) {
                Fem2dError err(ErrorCode::INVALID_LOAD_VALUE,
                    "Distributed load on beam " + std::to_string(beam.id) + " must be finite");
                err.involved_beams.push_back(beam.id);
                throw AnalysisException(err);
            }
            if (!(q.start_t >= 0.0 && q.start_t <= q.end_t && q.end_t <= 1.0)) {
                throw AnalysisException(
                    Fem2dError::invalid_load_extent(beam.id, q.start_t, q.end_t));
            }
        }
    }
}

AssemblyMap ModelAssembler::assemble(const SolveRequest& request, Engine& engine) const {
    validate(request);

    AuxiliaryIdAllocator ids = AuxiliaryIdAllocator::for_request(request);

    // Reserve every auxiliary tag up front so emission cannot fail half-way
    long long needed = 0;
    for (const auto& node : request.nodes) {
        if (node.springs && node.springs->any()) needed += 2;
    }
    for (const auto& beam : request.beams) {
        if (beam.end_releases) {
            needed += (beam.end_releases->start_moment ? 1 : 0) +
                      (beam.end_releases->end_moment ? 1 : 0);
        }
    }
    if (static_cast<long long>(ids.first_id()) + needed >
        static_cast<long long>(std::numeric_limits<int>::max())) {
        throw AnalysisException(Fem2dError::invalid_request("auxiliary engine tags exhausted"));
    }

    std::map<int, const NodeInput*> nodes_by_id;
    for (const auto& node : request.nodes) {
        nodes_by_id[node.id] = &node;
    }
    std::map<int, const Material*> materials_by_id;
    for (const auto& material : request.materials) {
        materials_by_id[material.id] = &material;
    }

    AssemblyMap map;
    map.pinned_rotation_nodes = find_unrestrained_rotations(request);
    map.transformation = request.geometric_nonlinear ? TransformationType::PDelta
                                                     : TransformationType::Linear;
    warn_on_stiffness_ratio(request);

    const std::set<int> pinned(map.pinned_rotation_nodes.begin(),
                               map.pinned_rotation_nodes.end());

    engine.wipe();

    // 1. Caller nodes
    for (const auto& node : request.nodes) {
        engine.add_node(node.id, node.x, node.y);
        map.node_id_order.push_back(node.id);
    }

    // 2. Fixity on caller nodes
    for (const auto& node : request.nodes) {
        bool fix_rotation = node.constraints.rotation;
        if (pinned.count(node.id) > 0) {
            spdlog::warn("Node {}: every connected beam releases its moment here; "
                         "fixing the rotation", node.id);
            fix_rotation = true;
        }
        if (node.constraints.x || node.constraints.y || fix_rotation) {
            engine.fix(node.id, {node.constraints.x, node.constraints.y, fix_rotation});
        }
    }

    // 3. Spring supports
    for (const auto& node : request.nodes) {
        if (!node.springs || !node.springs->any()) continue;

        int ground = ids.next();
        engine.add_node(ground, node.x, node.y);
        engine.fix(ground, {true, true, true});

        int spring_tag = ids.next();
        engine.add_zero_length(spring_tag, ground, node.id, spring_stiffness(*node.springs));

        map.spring_ground_nodes[node.id] = ground;
        map.spring_elements[node.id] = spring_tag;
    }

    // 4. Transformation policy
    engine.set_transformation(map.transformation);

    // 5. Release nodes and beams
    for (const auto& beam : request.beams) {
        const NodeInput& n1 = *nodes_by_id.at(beam.node_ids.first);
        const NodeInput& n2 = *nodes_by_id.at(beam.node_ids.second);
        MemberAxes axes(n1.x, n1.y, n2.x, n2.y);

        BeamMapping mapping;
        mapping.beam_id = beam.id;
        mapping.element_tag = beam.id;
        mapping.start_node = n1.id;
        mapping.end_node = n2.id;
        mapping.engine_node_i = n1.id;
        mapping.engine_node_j = n2.id;
        mapping.length = axes.length;
        mapping.angle = axes.angle;

        if (beam.end_releases && beam.end_releases->start_moment) {
            int dup = ids.next();
            engine.add_node(dup, n1.x, n1.y);
            engine.equal_dof(n1.id, dup, {UX, UY});
            mapping.engine_node_i = dup;
            mapping.start_release_node = dup;
        }
        if (beam.end_releases && beam.end_releases->end_moment) {
            int dup = ids.next();
            engine.add_node(dup, n2.x, n2.y);
            engine.equal_dof(n2.id, dup, {UX, UY});
            mapping.engine_node_j = dup;
            mapping.end_release_node = dup;
        }

        const Material& material = *materials_by_id.at(beam.material_id);
        engine.add_elastic_beam(mapping.element_tag, mapping.engine_node_i, mapping.engine_node_j,
                                beam.section.A, material.E, beam.section.I);

        if (beam.distributed_load) {
            LocalLoad local = to_local_load(*beam.distributed_load, axes);
            if (!local.is_zero()) {
                mapping.local_load = local;
            }
        }

        map.beam_to_element[beam.id] = mapping.element_tag;
        map.beams.push_back(mapping);
    }

    // 6. Load pattern
    for (const auto& node : request.nodes) {
        if (node.loads && !node.loads->is_zero()) {
            engine.add_nodal_load(node.id, node.loads->fx, node.loads->fy, node.loads->moment);
        }
    }

    for (auto& mapping : map.beams) {
        if (!mapping.local_load) continue;
        const LocalLoad& load = *mapping.local_load;

        if (load.is_full_span()) {
            engine.add_beam_uniform_load(mapping.element_tag, load.qy, load.qx);
            continue;
        }

        mapping.equivalent_local = partial_equivalent_forces(mapping.length, load);
        mapping.load_as_nodal_equivalents = true;

        const NodeInput& n1 = *nodes_by_id.at(mapping.start_node);
        const NodeInput& n2 = *nodes_by_id.at(mapping.end_node);
        Vector6 f = MemberAxes(n1.x, n1.y, n2.x, n2.y).to_global(mapping.equivalent_local);
        engine.add_nodal_load(mapping.engine_node_i, f(0), f(1), f(2));
        engine.add_nodal_load(mapping.engine_node_j, f(3), f(4), f(5));
    }

    spdlog::debug("Assembled {} nodes, {} beams, {} spring supports, {} release nodes, "
                  "{} auxiliary tags from {}",
                  request.nodes.size(), request.beams.size(), map.spring_ground_nodes.size(),
                  map.released_beams().size(), ids.allocated(), ids.first_id());

    return map;
}

LocalLoad ModelAssembler::to_local_load(const DistributedLoad& load, const MemberAxes& axes) {
    if (load.coord_system == CoordSystem::Global) {
        Eigen::Vector2d q = axes.load_to_local(load.qx, load.qy);
        return LocalLoad(q(0), q(1), load.start_t, load.end_t);
    }
    return LocalLoad(load.qx, load.qy, load.start_t, load.end_t);
}

std::array<double, 3> ModelAssembler::spring_stiffness(const SpringSupport& springs) const {
    auto axis = [this](double k) { return k > 0.0 ? k : settings_.rigid_spring_stiffness; };
    return {axis(springs.kx), axis(springs.ky), axis(springs.kr)};
}

std::vector<int> ModelAssembler::find_unrestrained_rotations(const SolveRequest& request) const {
    std::map<int, int> connected;
    std::map<int, int> released;

    for (const auto& beam : request.beams) {
        bool start_released = beam.end_releases && beam.end_releases->start_moment;
        bool end_released = beam.end_releases && beam.end_releases->end_moment;

        ++connected[beam.node_ids.first];
        ++connected[beam.node_ids.second];
        if (start_released) ++released[beam.node_ids.first];
        if (end_released) ++released[beam.node_ids.second];
    }

    std::vector<int> result;
    for (const auto& node : request.nodes) {
        if (node.constraints.rotation) continue;
        if (node.springs && node.springs->any()) continue;

        auto it = connected.find(node.id);
        if (it == connected.end()) continue;
        if (released[node.id] == it->second) {
            result.push_back(node.id);
        }
    }
    return result;
}

void ModelAssembler::warn_on_stiffness_ratio(const SolveRequest& request) const {
    bool has_rigid_axis = false;
    for (const auto& node : request.nodes) {
        if (!node.springs || !node.springs->any()) continue;
        const SpringSupport& k = *node.springs;
        if (k.kx == 0.0 || k.ky == 0.0 || k.kr == 0.0) {
            has_rigid_axis = true;
            break;
        }
    }
    if (!has_rigid_axis) return;

    std::map<int, double> modulus;
    for (const auto& material : request.materials) {
        modulus[material.id] = material.E;
    }
    std::map<int, const NodeInput*> nodes_by_id;
    for (const auto& node : request.nodes) {
        nodes_by_id[node.id] = &node;
    }

    double max_member_stiffness = 0.0;
    for (const auto& beam : request.beams) {
        const NodeInput& n1 = *nodes_by_id.at(beam.node_ids.first);
        const NodeInput& n2 = *nodes_by_id.at(beam.node_ids.second);
        double L = std::hypot(n2.x - n1.x, n2.y - n1.y);
        double E = modulus.at(beam.material_id);
        double axial = E * beam.section.A / L;
        double bending = 12.0 * E * beam.section.I / (L * L * L);
        double rotational = 4.0 * E * beam.section.I / L;
        max_member_stiffness = std::max({max_member_stiffness, axial, bending, rotational});
    }

    double ratio = settings_.rigid_spring_stiffness / max_member_stiffness;
    if (ratio > settings_.stiffness_ratio_warning) {
        spdlog::warn("Rigid spring stiffness {:.3e} is {:.1e} times the stiffest member "
                     "({:.3e}); results may lose precision",
                     settings_.rigid_spring_stiffness, ratio, max_member_stiffness);
    }
}

}  // namespace fem2d
