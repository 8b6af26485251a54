#include "fem2d/result_extractor.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace fem2d {

namespace {

StationInterpolator make_interpolator(const AnalysisSettings& settings) {
    settings.validate();
    return StationInterpolator(settings.num_stations, settings.diagram_floor);
}

}  // namespace

ResultExtractor::ResultExtractor(const AnalysisSettings& settings)
    : interpolator_(make_interpolator(settings)) {}

std::array<double, 6> ResultExtractor::correct_signs(const std::array<double, 6>& raw) {
    return {raw[0], raw[1], -raw[2], -raw[3], -raw[4], raw[5]};
}

SolveResponse ResultExtractor::extract(Engine& engine, const AssemblyMap& map) const {
    engine.compute_reactions();

    SolveResponse response;
    response.success = true;
    response.node_id_order = map.node_id_order;
    response.displacements.reserve(map.node_id_order.size() * kDofsPerNode);
    response.reactions.reserve(map.node_id_order.size() * kDofsPerNode);

    for (int node_id : map.node_id_order) {
        std::array<double, 3> d = engine.node_displacement(node_id);
        std::array<double, 3> r = engine.node_reaction(node_id);

        auto ground = map.spring_ground_nodes.find(node_id);
        if (ground != map.spring_ground_nodes.end()) {
            std::array<double, 3> r_spring = engine.node_reaction(ground->second);
            for (int i = 0; i < kDofsPerNode; ++i) {
                r[i] += r_spring[i];
            }
        }

        response.displacements.insert(response.displacements.end(), d.begin(), d.end());
        response.reactions.insert(response.reactions.end(), r.begin(), r.end());
    }

    for (const auto& mapping : map.beams) {
        response.beam_forces[mapping.beam_id] =
            beam_record(mapping, engine.element_force(mapping.element_tag));
    }

    spdlog::debug("Extracted results for {} nodes and {} beams",
                  map.node_id_order.size(), response.beam_forces.size());
    return response;
}

BeamForceRecord ResultExtractor::beam_record(const BeamMapping& mapping,
                                             const std::array<double, 6>& raw) const {
    std::array<double, 6> member = raw;
    if (mapping.load_as_nodal_equivalents) {
        for (int i = 0; i < 6; ++i) {
            member[i] -= mapping.equivalent_local(i);
        }
    }
    const std::array<double, 6> f = correct_signs(member);

    BeamForceRecord record;
    record.element_id = mapping.beam_id;
    record.N1 = f[0];
    record.V1 = f[1];
    record.M1 = f[2];
    record.N2 = f[3];
    record.V2 = f[4];
    record.M2 = f[5];

    LocalLoad load = mapping.local_load.value_or(LocalLoad());
    StationDiagram diagram =
        interpolator_.interpolate(record.N1, record.V1, record.M1, mapping.length, load);

    record.stations = std::move(diagram.stations);
    record.normal_force = std::move(diagram.normal_force);
    record.shear_force = std::move(diagram.shear_force);
    record.bending_moment = std::move(diagram.bending_moment);
    record.max_n = diagram.max_n;
    record.max_v = diagram.max_v;
    record.max_m = diagram.max_m;
    return record;
}

}  // namespace fem2d
