#include "fem2d/json_io.hpp"
#include "fem2d/analysis_service.hpp"
#include "fem2d/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace fem2d {
namespace json_io {

using json = nlohmann::json;

namespace {

[[noreturn]] void fail(const std::string& where, const std::string& reason) {
    throw AnalysisException(Fem2dError::invalid_request(where + ": " + reason));
}

const json& require_field(const json& object, const std::string& key, const std::string& where) {
    if (!object.is_object()) {
        fail(where, "expected an object");
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        fail(where, "missing field '" + key + "'");
    }
    return *it;
}

double to_number(const json& value, const std::string& where) {
    if (!value.is_number()) {
        fail(where, "expected a number");
    }
    return value.get<double>();
}

int to_integer(const json& value, const std::string& where) {
    if (!value.is_number_integer()) {
        fail(where, "expected an integer");
    }
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            fail(where, "integer out of range");
        }
        return static_cast<int>(value.get<std::uint64_t>());
    }
    const std::int64_t number = value.get<std::int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        fail(where, "integer out of range");
    }
    return static_cast<int>(number);
}

bool to_bool(const json& value, const std::string& where) {
    if (!value.is_boolean()) {
        fail(where, "expected a boolean");
    }
    return value.get<bool>();
}

// Optional fields: absent or null keeps the default
double number_or(const json& object, const std::string& key, double fallback,
                 const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    return to_number(*it, where + "." + key);
}

int int_or(const json& object, const std::string& key, int fallback,
           const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    return to_integer(*it, where + "." + key);
}

bool bool_or(const json& object, const std::string& key, bool fallback,
             const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    return to_bool(*it, where + "." + key);
}

const json* optional_object(const json& object, const std::string& key,
                            const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        fail(where + "." + key, "expected an object");
    }
    return &*it;
}

const json& require_array(const json& object, const std::string& key) {
    const json& value = require_field(object, key, "request");
    if (!value.is_array()) {
        fail(key, "expected an array");
    }
    return value;
}

NodeInput node_from_json(const json& j, size_t index) {
    const std::string where = "nodes[" + std::to_string(index) + "]";
    NodeInput node;
    node.id = to_integer(require_field(j, "id", where), where + ".id");
    node.x = to_number(require_field(j, "x", where), where + ".x");
    node.y = to_number(require_field(j, "y", where), where + ".y");

    if (const json* c = optional_object(j, "constraints", where)) {
        node.constraints.x = bool_or(*c, "x", false, where + ".constraints");
        node.constraints.y = bool_or(*c, "y", false, where + ".constraints");
        node.constraints.rotation = bool_or(*c, "rotation", false, where + ".constraints");
    }
    if (const json* s = optional_object(j, "springs", where)) {
        SpringSupport springs;
        springs.kx = number_or(*s, "kx", 0.0, where + ".springs");
        springs.ky = number_or(*s, "ky", 0.0, where + ".springs");
        springs.kr = number_or(*s, "kr", 0.0, where + ".springs");
        node.springs = springs;
    }
    if (const json* l = optional_object(j, "loads", where)) {
        PointLoad load;
        load.fx = number_or(*l, "fx", 0.0, where + ".loads");
        load.fy = number_or(*l, "fy", 0.0, where + ".loads");
        load.moment = number_or(*l, "moment", 0.0, where + ".loads");
        node.loads = load;
    }
    return node;
}

BeamInput beam_from_json(const json& j, size_t index) {
    const std::string where = "beams[" + std::to_string(index) + "]";
    BeamInput beam;
    beam.id = to_integer(require_field(j, "id", where), where + ".id");

    const json& node_ids = require_field(j, "nodeIds", where);
    if (!node_ids.is_array() || node_ids.size() != 2) {
        fail(where + ".nodeIds", "expected two node ids");
    }
    beam.node_ids = {to_integer(node_ids[0], where + ".nodeIds[0]"),
                     to_integer(node_ids[1], where + ".nodeIds[1]")};
    beam.material_id = to_integer(require_field(j, "materialId", where), where + ".materialId");

    const json& section = require_field(j, "section", where);
    beam.section.A = to_number(require_field(section, "A", where + ".section"), where + ".section.A");
    beam.section.I = to_number(require_field(section, "I", where + ".section"), where + ".section.I");
    if (section.contains("h") && !section["h"].is_null()) {
        beam.section.h = to_number(section["h"], where + ".section.h");
    }

    if (const json* r = optional_object(j, "endReleases", where)) {
        EndReleases releases;
        releases.start_moment = bool_or(*r, "startMoment", false, where + ".endReleases");
        releases.end_moment = bool_or(*r, "endMoment", false, where + ".endReleases");
        beam.end_releases = releases;
    }

    if (const json* q = optional_object(j, "distributedLoad", where)) {
        const std::string load_where = where + ".distributedLoad";
        DistributedLoad load;
        load.qx = number_or(*q, "qx", 0.0, load_where);
        load.qy = number_or(*q, "qy", 0.0, load_where);
        load.start_t = number_or(*q, "startT", 0.0, load_where);
        load.end_t = number_or(*q, "endT", 1.0, load_where);

        auto cs = q->find("coordSystem");
        if (cs != q->end() && !cs->is_null()) {
            if (!cs->is_string()) {
                fail(load_where + ".coordSystem", "expected a string");
            }
            try {
                load.coord_system = coord_system_from_string(cs->get<std::string>());
            } catch (const std::invalid_argument& e) {
                fail(load_where + ".coordSystem", e.what());
            }
        }
        beam.distributed_load = load;
    }
    return beam;
}

Material material_from_json(const json& j, size_t index) {
    const std::string where = "materials[" + std::to_string(index) + "]";
    Material material;
    material.id = to_integer(require_field(j, "id", where), where + ".id");
    material.E = to_number(require_field(j, "E", where), where + ".E");
    if (j.contains("nu") && !j["nu"].is_null()) {
        material.nu = to_number(j["nu"], where + ".nu");
    }
    return material;
}

}  // namespace

SolveRequest request_from_json(const json& document) {
    if (!document.is_object()) {
        fail("request", "expected a JSON object");
    }

    SolveRequest request;
    const json& nodes = require_array(document, "nodes");
    for (size_t i = 0; i < nodes.size(); ++i) {
        request.nodes.push_back(node_from_json(nodes[i], i));
    }
    const json& beams = require_array(document, "beams");
    for (size_t i = 0; i < beams.size(); ++i) {
        request.beams.push_back(beam_from_json(beams[i], i));
    }
    const json& materials = require_array(document, "materials");
    for (size_t i = 0; i < materials.size(); ++i) {
        request.materials.push_back(material_from_json(materials[i], i));
    }

    auto type = document.find("analysisType");
    if (type != document.end() && !type->is_null()) {
        if (!type->is_string()) {
            fail("analysisType", "expected a string");
        }
        request.analysis_type = type->get<std::string>();
    }
    request.geometric_nonlinear = bool_or(document, "geometricNonlinear", false, "request");
    return request;
}

AnalysisSettings settings_from_json(const json& document, const AnalysisSettings& base) {
    AnalysisSettings settings = base;
    if (!document.is_object()) return settings;
    const json* s = optional_object(document, "settings", "request");
    if (s == nullptr) return settings;

    const std::string where = "settings";
    settings.rigid_spring_stiffness =
        number_or(*s, "rigidSpringStiffness", settings.rigid_spring_stiffness, where);
    settings.diagram_floor = number_or(*s, "diagramFloor", settings.diagram_floor, where);
    settings.nonlinear_tolerance =
        number_or(*s, "nonlinearTolerance", settings.nonlinear_tolerance, where);
    settings.stiffness_ratio_warning =
        number_or(*s, "stiffnessRatioWarning", settings.stiffness_ratio_warning, where);

    settings.num_stations = int_or(*s, "numStations", settings.num_stations, where);
    settings.nonlinear_load_steps =
        int_or(*s, "nonlinearLoadSteps", settings.nonlinear_load_steps, where);
    settings.nonlinear_max_iterations =
        int_or(*s, "nonlinearMaxIterations", settings.nonlinear_max_iterations, where);

    auto method_it = s->find("linearMethod");
    if (method_it != s->end() && !method_it->is_null()) {
        const json& method = *method_it;
        if (!method.is_string()) {
            fail(where + ".linearMethod", "expected a string");
        }
        try {
            settings.linear_method = solver_method_from_string(method.get<std::string>());
        } catch (const std::invalid_argument& e) {
            fail(where + ".linearMethod", e.what());
        }
    }
    return settings;
}

json beam_record_to_json(const BeamForceRecord& record) {
    json j;
    j["elementId"] = record.element_id;
    j["N1"] = record.N1;
    j["V1"] = record.V1;
    j["M1"] = record.M1;
    j["N2"] = record.N2;
    j["V2"] = record.V2;
    j["M2"] = record.M2;
    j["stations"] = record.stations;
    j["normalForce"] = record.normal_force;
    j["shearForce"] = record.shear_force;
    j["bendingMoment"] = record.bending_moment;
    j["maxN"] = record.max_n;
    j["maxV"] = record.max_v;
    j["maxM"] = record.max_m;
    return j;
}

json response_to_json(const SolveResponse& response) {
    json j;
    j["success"] = response.success;

    if (!response.success) {
        j["displacements"] = nullptr;
        j["reactions"] = nullptr;
        j["beamForces"] = nullptr;
        j["nodeIdOrder"] = nullptr;
        j["error"] = response.error;
        return j;
    }

    j["displacements"] = response.displacements;
    j["reactions"] = response.reactions;
    json beam_forces = json::object();
    for (const auto& [id, record] : response.beam_forces) {
        beam_forces[std::to_string(id)] = beam_record_to_json(record);
    }
    j["beamForces"] = beam_forces;
    j["nodeIdOrder"] = response.node_id_order;
    j["error"] = nullptr;
    return j;
}

json solve_document(const std::string& text, const AnalysisSettings& base) {
    SolveRequest request;
    AnalysisSettings settings;
    try {
        const json document = json::parse(text);
        request = request_from_json(document);
        settings = settings_from_json(document, base);
    } catch (const json::exception& e) {
        spdlog::error("Malformed request document: {}", e.what());
        return response_to_json(SolveResponse::failure(
            Fem2dError::invalid_request(e.what()).message));
    } catch (const AnalysisException& e) {
        spdlog::error("Rejected request document: {}", e.error().to_string());
        return response_to_json(SolveResponse::failure(e.what()));
    }

    return response_to_json(solve(request, settings));
}

}  // namespace json_io
}  // namespace fem2d
