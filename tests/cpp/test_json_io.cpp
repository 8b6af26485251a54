/**
 * @file test_json_io.cpp
 * @brief Tests for the JSON request and response documents
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "fem2d/errors.hpp"
#include "fem2d/json_io.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <string>

using namespace fem2d;
using namespace fem2d::testing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using nlohmann::json;

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Simply supported beam L = 6 with a 10 kN point load at midspan
json point_load_document() {
    return json::parse(R"({
        "nodes": [
            {"id": 1, "x": 0.0, "y": 0.0, "constraints": {"x": true, "y": true, "rotation": false}},
            {"id": 2, "x": 3.0, "y": 0.0, "loads": {"fy": -10000.0}},
            {"id": 3, "x": 6.0, "y": 0.0, "constraints": {"y": true}}
        ],
        "beams": [
            {"id": 1, "nodeIds": [1, 2], "materialId": 1, "section": {"A": 28.5e-4, "I": 1940e-8}},
            {"id": 2, "nodeIds": [2, 3], "materialId": 1, "section": {"A": 28.5e-4, "I": 1940e-8}}
        ],
        "materials": [
            {"id": 1, "E": 210e9}
        ]
    })");
}

std::string error_of(const json& document) {
    try {
        json_io::request_from_json(document);
    } catch (const AnalysisException& e) {
        REQUIRE(e.error().code == ErrorCode::INVALID_REQUEST);
        return e.what();
    }
    FAIL("request was accepted");
    return {};
}

}  // namespace

// =============================================================================
// Request parsing
// =============================================================================

TEST_CASE("Request document is read into the model input", "[JsonIO][request]") {
    json document = point_load_document();
    document["beams"][1]["endReleases"] = {{"startMoment", true}};
    document["beams"][1]["distributedLoad"] = {
        {"qy", -2000.0}, {"startT", 0.25}, {"coordSystem", "global"}};
    document["nodes"][2]["springs"] = {{"ky", 1e6}};
    document["geometricNonlinear"] = true;
    document["analysisType"] = "frame";

    SolveRequest request = json_io::request_from_json(document);

    REQUIRE(request.nodes.size() == 3);
    REQUIRE(request.beams.size() == 2);
    REQUIRE(request.materials.size() == 1);
    REQUIRE(request.geometric_nonlinear);
    REQUIRE(request.analysis_type == "frame");

    const NodeInput& n1 = request.nodes[0];
    REQUIRE(n1.constraints.x);
    REQUIRE(n1.constraints.y);
    REQUIRE_FALSE(n1.constraints.rotation);
    REQUIRE_FALSE(n1.loads.has_value());

    const NodeInput& n2 = request.nodes[1];
    REQUIRE(n2.loads.has_value());
    REQUIRE(n2.loads->fx == 0.0);
    REQUIRE(n2.loads->fy == -10000.0);
    REQUIRE(n2.loads->moment == 0.0);

    const NodeInput& n3 = request.nodes[2];
    REQUIRE_FALSE(n3.constraints.x);
    REQUIRE(n3.constraints.y);
    REQUIRE(n3.springs.has_value());
    REQUIRE(n3.springs->ky == 1e6);
    REQUIRE(n3.springs->kx == 0.0);

    const BeamInput& b1 = request.beams[0];
    REQUIRE(b1.node_ids.first == 1);
    REQUIRE(b1.node_ids.second == 2);
    REQUIRE(b1.material_id == 1);
    REQUIRE(b1.section.A == 28.5e-4);
    REQUIRE(b1.section.I == 1940e-8);
    REQUIRE_FALSE(b1.end_releases.has_value());
    REQUIRE_FALSE(b1.distributed_load.has_value());

    const BeamInput& b2 = request.beams[1];
    REQUIRE(b2.end_releases.has_value());
    REQUIRE(b2.end_releases->start_moment);
    REQUIRE_FALSE(b2.end_releases->end_moment);
    REQUIRE(b2.distributed_load.has_value());
    REQUIRE(b2.distributed_load->qx == 0.0);
    REQUIRE(b2.distributed_load->qy == -2000.0);
    REQUIRE(b2.distributed_load->start_t == 0.25);
    REQUIRE(b2.distributed_load->end_t == 1.0);
    REQUIRE(b2.distributed_load->coord_system == CoordSystem::Global);

    REQUIRE(request.materials[0].E == 210e9);
}

TEST_CASE("Optional request fields take their defaults", "[JsonIO][request]") {
    json document = point_load_document();
    document["beams"][0]["distributedLoad"] = {{"qy", -1000.0}};

    SolveRequest request = json_io::request_from_json(document);

    REQUIRE_FALSE(request.geometric_nonlinear);
    REQUIRE(request.analysis_type == "frame");
    REQUIRE(request.beams[0].distributed_load->start_t == 0.0);
    REQUIRE(request.beams[0].distributed_load->end_t == 1.0);
    REQUIRE(request.beams[0].distributed_load->coord_system == CoordSystem::Local);
}

TEST_CASE("Malformed request fields are rejected with their location", "[JsonIO][request][errors]") {
    SECTION("Missing node list") {
        json document = point_load_document();
        document.erase("nodes");
        REQUIRE_THAT(error_of(document), ContainsSubstring("missing field 'nodes'"));
    }

    SECTION("Node coordinate of the wrong type") {
        json document = point_load_document();
        document["nodes"][1]["x"] = "three";
        REQUIRE_THAT(error_of(document), ContainsSubstring("nodes[1].x"));
    }

    SECTION("Beam with a single node id") {
        json document = point_load_document();
        document["beams"][0]["nodeIds"] = json::array({1});
        REQUIRE_THAT(error_of(document), ContainsSubstring("beams[0].nodeIds"));
    }

    SECTION("Non-integer id") {
        json document = point_load_document();
        document["materials"][0]["id"] = 1.5;
        REQUIRE_THAT(error_of(document), ContainsSubstring("materials[0].id"));
    }

    SECTION("Id beyond the int range") {
        json document = point_load_document();
        document["nodes"][0]["id"] = 4294967297LL;
        std::string message = error_of(document);
        REQUIRE_THAT(message, ContainsSubstring("nodes[0].id"));
        REQUIRE_THAT(message, ContainsSubstring("integer out of range"));
    }

    SECTION("Negative id beyond the int range") {
        json document = point_load_document();
        document["beams"][1]["materialId"] = -4294967297LL;
        REQUIRE_THAT(error_of(document), ContainsSubstring("beams[1].materialId"));
    }

    SECTION("Unknown coordinate system") {
        json document = point_load_document();
        document["beams"][0]["distributedLoad"] = {{"qy", -1.0}, {"coordSystem", "polar"}};
        REQUIRE_THAT(error_of(document), ContainsSubstring("coordSystem"));
    }

    SECTION("Document that is not an object") {
        REQUIRE_THAT(error_of(json::array()), StartsWith("Invalid request"));
    }
}

// =============================================================================
// Settings
// =============================================================================

TEST_CASE("Settings block overrides the base settings", "[JsonIO][settings]") {
    json document = point_load_document();
    document["settings"] = {
        {"numStations", 11},
        {"rigidSpringStiffness", 1e16},
        {"linearMethod", "SparseLU"}};

    AnalysisSettings base;
    base.nonlinear_load_steps = 4;

    AnalysisSettings settings = json_io::settings_from_json(document, base);

    REQUIRE(settings.num_stations == 11);
    REQUIRE(settings.rigid_spring_stiffness == 1e16);
    REQUIRE(settings.linear_method == LinearSolver::Method::SparseLU);
    REQUIRE(settings.nonlinear_load_steps == 4);
    REQUIRE(settings.nonlinear_max_iterations == 50);
}

TEST_CASE("Absent settings block keeps the base settings", "[JsonIO][settings]") {
    AnalysisSettings base;
    base.num_stations = 41;

    AnalysisSettings settings = json_io::settings_from_json(point_load_document(), base);
    REQUIRE(settings.num_stations == 41);
}

TEST_CASE("Null settings keep the base settings", "[JsonIO][settings]") {
    json document = point_load_document();
    document["settings"] = {
        {"numStations", nullptr},
        {"nonlinearLoadSteps", nullptr},
        {"nonlinearMaxIterations", nullptr},
        {"nonlinearTolerance", nullptr},
        {"linearMethod", nullptr}};

    AnalysisSettings base;
    base.num_stations = 7;
    base.nonlinear_load_steps = 3;
    base.nonlinear_max_iterations = 12;
    base.linear_method = LinearSolver::Method::SparseLU;

    AnalysisSettings settings = json_io::settings_from_json(document, base);

    REQUIRE(settings.num_stations == 7);
    REQUIRE(settings.nonlinear_load_steps == 3);
    REQUIRE(settings.nonlinear_max_iterations == 12);
    REQUIRE(settings.nonlinear_tolerance == base.nonlinear_tolerance);
    REQUIRE(settings.linear_method == LinearSolver::Method::SparseLU);
}

TEST_CASE("Out-of-range station count is rejected", "[JsonIO][settings][errors]") {
    json document = point_load_document();
    document["settings"] = {{"numStations", 4294967297LL}};

    REQUIRE_THROWS_WITH(json_io::settings_from_json(document),
                        ContainsSubstring("settings.numStations"));
}

TEST_CASE("Unknown linear method is rejected", "[JsonIO][settings][errors]") {
    json document = point_load_document();
    document["settings"] = {{"linearMethod", "Cholmod"}};

    REQUIRE_THROWS_AS(json_io::settings_from_json(document), AnalysisException);
}

// =============================================================================
// Response documents
// =============================================================================

TEST_CASE("Solved document reports results keyed by beam id", "[JsonIO][response]") {
    json response = json_io::solve_document(point_load_document().dump());

    REQUIRE(response["success"].get<bool>());
    REQUIRE(response["error"].is_null());
    REQUIRE(response["nodeIdOrder"] == json({1, 2, 3}));
    REQUIRE(response["displacements"].size() == 9);
    REQUIRE(response["reactions"].size() == 9);

    REQUIRE(response["beamForces"].is_object());
    REQUIRE(response["beamForces"].contains("1"));
    REQUIRE(response["beamForces"].contains("2"));

    const json& beam = response["beamForces"]["1"];
    REQUIRE(beam["elementId"] == 1);
    REQUIRE(beam["stations"].size() == 21);
    REQUIRE(beam["bendingMoment"].size() == 21);
    REQUIRE_THAT(beam["M2"].get<double>(), WithinRel(15000.0, 1e-6));
    REQUIRE_THAT(beam["maxM"].get<double>(), WithinRel(15000.0, 1e-6));

    // Ry at both supports
    REQUIRE_THAT(response["reactions"][1].get<double>(), WithinRel(5000.0, 1e-6));
    REQUIRE_THAT(response["reactions"][7].get<double>(), WithinRel(5000.0, 1e-6));
}

TEST_CASE("Settings in the document reach the analysis", "[JsonIO][response]") {
    json document = point_load_document();
    document["settings"] = {{"numStations", 5}};

    json response = json_io::solve_document(document.dump());

    REQUIRE(response["success"].get<bool>());
    REQUIRE(response["beamForces"]["2"]["stations"].size() == 5);
    REQUIRE_THAT(response["beamForces"]["2"]["stations"][4].get<double>(), WithinAbs(3.0, 1e-12));
}

TEST_CASE("Unparseable text gives a failure document", "[JsonIO][response][errors]") {
    json response = json_io::solve_document("{\"nodes\": [");

    REQUIRE_FALSE(response["success"].get<bool>());
    REQUIRE(response["displacements"].is_null());
    REQUIRE(response["reactions"].is_null());
    REQUIRE(response["beamForces"].is_null());
    REQUIRE(response["nodeIdOrder"].is_null());
    REQUIRE_THAT(response["error"].get<std::string>(), StartsWith("Invalid request"));
}

TEST_CASE("Invalid model gives a failure document", "[JsonIO][response][errors]") {
    json document = point_load_document();
    document["beams"][0]["materialId"] = 3;

    json response = json_io::solve_document(document.dump());

    REQUIRE_FALSE(response["success"].get<bool>());
    REQUIRE_THAT(response["error"].get<std::string>(), ContainsSubstring("unknown material 3"));
}

TEST_CASE("Beam record fields use the document names", "[JsonIO][response]") {
    BeamForceRecord record;
    record.element_id = 4;
    record.N1 = 1.0;
    record.V1 = 2.0;
    record.M1 = 3.0;
    record.N2 = 4.0;
    record.V2 = 5.0;
    record.M2 = 6.0;
    record.stations = {0.0, 1.0};
    record.normal_force = {1.0, 1.0};
    record.shear_force = {2.0, 2.0};
    record.bending_moment = {3.0, 4.0};
    record.max_n = 1.0;
    record.max_v = 2.0;
    record.max_m = 4.0;

    json j = json_io::beam_record_to_json(record);

    REQUIRE(j["elementId"] == 4);
    REQUIRE(j["N1"] == 1.0);
    REQUIRE(j["M2"] == 6.0);
    REQUIRE(j["normalForce"] == json({1.0, 1.0}));
    REQUIRE(j["shearForce"] == json({2.0, 2.0}));
    REQUIRE(j["bendingMoment"] == json({3.0, 4.0}));
    REQUIRE(j["maxN"] == 1.0);
    REQUIRE(j["maxV"] == 2.0);
    REQUIRE(j["maxM"] == 4.0);
}
