#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "fem2d/analysis_result.hpp"
#include "fem2d/analysis_service.hpp"
#include "fem2d/analysis_settings.hpp"
#include "fem2d/equivalent_loads.hpp"
#include "fem2d/errors.hpp"
#include "fem2d/geometry.hpp"
#include "fem2d/material.hpp"
#include "fem2d/model_input.hpp"
#include "fem2d/result_extractor.hpp"
#include "fem2d/section.hpp"
#include "fem2d/solver.hpp"
#include "fem2d/station_interpolator.hpp"

namespace py = pybind11;

/**
 * fem2d C++ Python bindings module.
 * Exposes the request/response model and the solve entry point.
 */
PYBIND11_MODULE(_fem2d_cpp, m) {
    m.doc() = "fem2d C++ core module - 2D frame analysis";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Request model
    // ========================================================================

    py::class_<fem2d::Material>(m, "Material",
        "Linear elastic material")
        .def(py::init<>())
        .def(py::init<int, double, std::optional<double>>(),
             py::arg("id"), py::arg("E"), py::arg("nu") = std::nullopt)
        .def_readwrite("id", &fem2d::Material::id, "Material ID")
        .def_readwrite("E", &fem2d::Material::E, "Young's modulus [N/m²]")
        .def_readwrite("nu", &fem2d::Material::nu, "Poisson's ratio (optional)")
        .def("__repr__", [](const fem2d::Material &mat) {
            return "<Material id=" + std::to_string(mat.id) +
                   " E=" + std::to_string(mat.E) + ">";
        });

    py::class_<fem2d::Section>(m, "Section",
        "In-plane cross-section properties")
        .def(py::init<>())
        .def(py::init<double, double, std::optional<double>>(),
             py::arg("A"), py::arg("I"), py::arg("h") = std::nullopt)
        .def_readwrite("A", &fem2d::Section::A, "Cross-sectional area [m²]")
        .def_readwrite("I", &fem2d::Section::I, "Second moment of area [m⁴]")
        .def_readwrite("h", &fem2d::Section::h, "Section depth [m] (optional)");

    py::class_<fem2d::Constraints>(m, "Constraints",
        "Fixity flags of a node")
        .def(py::init<>())
        .def_readwrite("x", &fem2d::Constraints::x)
        .def_readwrite("y", &fem2d::Constraints::y)
        .def_readwrite("rotation", &fem2d::Constraints::rotation);

    py::class_<fem2d::SpringSupport>(m, "SpringSupport",
        "Elastic support stiffness per axis (0 = rigid on that axis)")
        .def(py::init<>())
        .def_readwrite("kx", &fem2d::SpringSupport::kx, "[N/m]")
        .def_readwrite("ky", &fem2d::SpringSupport::ky, "[N/m]")
        .def_readwrite("kr", &fem2d::SpringSupport::kr, "[N·m/rad]");

    py::class_<fem2d::PointLoad>(m, "PointLoad",
        "Concentrated nodal load in global axes")
        .def(py::init<>())
        .def_readwrite("fx", &fem2d::PointLoad::fx, "[N]")
        .def_readwrite("fy", &fem2d::PointLoad::fy, "[N]")
        .def_readwrite("moment", &fem2d::PointLoad::moment, "[N·m]");

    py::class_<fem2d::NodeInput>(m, "NodeInput",
        "Caller-defined node")
        .def(py::init<>())
        .def_readwrite("id", &fem2d::NodeInput::id)
        .def_readwrite("x", &fem2d::NodeInput::x)
        .def_readwrite("y", &fem2d::NodeInput::y)
        .def_readwrite("constraints", &fem2d::NodeInput::constraints)
        .def_readwrite("springs", &fem2d::NodeInput::springs)
        .def_readwrite("loads", &fem2d::NodeInput::loads);

    py::class_<fem2d::EndReleases>(m, "EndReleases",
        "Moment releases at the beam ends")
        .def(py::init<>())
        .def_readwrite("start_moment", &fem2d::EndReleases::start_moment)
        .def_readwrite("end_moment", &fem2d::EndReleases::end_moment);

    py::enum_<fem2d::CoordSystem>(m, "CoordSystem",
        "Axes of distributed load intensities")
        .value("Local", fem2d::CoordSystem::Local)
        .value("Global", fem2d::CoordSystem::Global)
        .export_values();

    py::class_<fem2d::DistributedLoad>(m, "DistributedLoad",
        "Uniform distributed load on [start_t, end_t] of a beam")
        .def(py::init<>())
        .def_readwrite("qx", &fem2d::DistributedLoad::qx, "[N/m]")
        .def_readwrite("qy", &fem2d::DistributedLoad::qy, "[N/m]")
        .def_readwrite("start_t", &fem2d::DistributedLoad::start_t)
        .def_readwrite("end_t", &fem2d::DistributedLoad::end_t)
        .def_readwrite("coord_system", &fem2d::DistributedLoad::coord_system);

    py::class_<fem2d::BeamInput>(m, "BeamInput",
        "Caller-defined beam")
        .def(py::init<>())
        .def_readwrite("id", &fem2d::BeamInput::id)
        .def_readwrite("node_ids", &fem2d::BeamInput::node_ids, "(start, end) node ids")
        .def_readwrite("material_id", &fem2d::BeamInput::material_id)
        .def_readwrite("section", &fem2d::BeamInput::section)
        .def_readwrite("end_releases", &fem2d::BeamInput::end_releases)
        .def_readwrite("distributed_load", &fem2d::BeamInput::distributed_load);

    py::class_<fem2d::SolveRequest>(m, "SolveRequest",
        "Complete analysis request")
        .def(py::init<>())
        .def_readwrite("nodes", &fem2d::SolveRequest::nodes)
        .def_readwrite("beams", &fem2d::SolveRequest::beams)
        .def_readwrite("materials", &fem2d::SolveRequest::materials)
        .def_readwrite("analysis_type", &fem2d::SolveRequest::analysis_type)
        .def_readwrite("geometric_nonlinear", &fem2d::SolveRequest::geometric_nonlinear);

    // ========================================================================
    // Settings
    // ========================================================================

    py::enum_<fem2d::LinearSolver::Method>(m, "SolverMethod",
        "Sparse direct solver used by the engine")
        .value("SparseLU", fem2d::LinearSolver::Method::SparseLU,
               "General sparse LU decomposition")
        .value("SimplicialLDLT", fem2d::LinearSolver::Method::SimplicialLDLT,
               "Symmetric LDLT decomposition (default)")
        .export_values();

    py::class_<fem2d::AnalysisSettings>(m, "AnalysisSettings",
        "Tunables of the analysis pipeline")
        .def(py::init<>())
        .def_readwrite("rigid_spring_stiffness", &fem2d::AnalysisSettings::rigid_spring_stiffness,
                       "Stiffness used for spring axes given as 0")
        .def_readwrite("num_stations", &fem2d::AnalysisSettings::num_stations,
                       "Diagram stations per beam")
        .def_readwrite("diagram_floor", &fem2d::AnalysisSettings::diagram_floor,
                       "Floor for maxN, maxV, maxM")
        .def_readwrite("nonlinear_load_steps", &fem2d::AnalysisSettings::nonlinear_load_steps)
        .def_readwrite("nonlinear_tolerance", &fem2d::AnalysisSettings::nonlinear_tolerance)
        .def_readwrite("nonlinear_max_iterations", &fem2d::AnalysisSettings::nonlinear_max_iterations)
        .def_readwrite("linear_method", &fem2d::AnalysisSettings::linear_method)
        .def_readwrite("stiffness_ratio_warning", &fem2d::AnalysisSettings::stiffness_ratio_warning)
        .def("validate", &fem2d::AnalysisSettings::validate,
             "Raise if a value is out of range");

    // ========================================================================
    // Response model
    // ========================================================================

    py::class_<fem2d::BeamForceRecord>(m, "BeamForceRecord",
        "End forces and sampled N, V, M diagrams of one beam")
        .def(py::init<>())
        .def_readonly("element_id", &fem2d::BeamForceRecord::element_id)
        .def_readonly("N1", &fem2d::BeamForceRecord::N1)
        .def_readonly("V1", &fem2d::BeamForceRecord::V1)
        .def_readonly("M1", &fem2d::BeamForceRecord::M1)
        .def_readonly("N2", &fem2d::BeamForceRecord::N2)
        .def_readonly("V2", &fem2d::BeamForceRecord::V2)
        .def_readonly("M2", &fem2d::BeamForceRecord::M2)
        .def_readonly("stations", &fem2d::BeamForceRecord::stations)
        .def_readonly("normal_force", &fem2d::BeamForceRecord::normal_force)
        .def_readonly("shear_force", &fem2d::BeamForceRecord::shear_force)
        .def_readonly("bending_moment", &fem2d::BeamForceRecord::bending_moment)
        .def_readonly("max_n", &fem2d::BeamForceRecord::max_n)
        .def_readonly("max_v", &fem2d::BeamForceRecord::max_v)
        .def_readonly("max_m", &fem2d::BeamForceRecord::max_m);

    py::class_<fem2d::SolveResponse>(m, "SolveResponse",
        "Response of one analysis request")
        .def(py::init<>())
        .def_readonly("success", &fem2d::SolveResponse::success)
        .def_readonly("displacements", &fem2d::SolveResponse::displacements,
                      "Flat [ux, uy, rz] per node in node_id_order")
        .def_readonly("reactions", &fem2d::SolveResponse::reactions,
                      "Flat [Rx, Ry, Rm] per node in node_id_order")
        .def_readonly("beam_forces", &fem2d::SolveResponse::beam_forces)
        .def_readonly("node_id_order", &fem2d::SolveResponse::node_id_order)
        .def_readonly("error", &fem2d::SolveResponse::error)
        .def("__repr__", [](const fem2d::SolveResponse &r) {
            if (!r.success) return "<SolveResponse error='" + r.error + "'>";
            return "<SolveResponse nodes=" + std::to_string(r.node_id_order.size()) +
                   " beams=" + std::to_string(r.beam_forces.size()) + ">";
        });

    // ========================================================================
    // Errors
    // ========================================================================

    py::enum_<fem2d::ErrorCode>(m, "ErrorCode",
        "Error codes for fem2d analysis failures")
        .value("OK", fem2d::ErrorCode::OK)
        .value("INVALID_REQUEST", fem2d::ErrorCode::INVALID_REQUEST)
        .value("NO_NODES", fem2d::ErrorCode::NO_NODES)
        .value("NO_BEAMS", fem2d::ErrorCode::NO_BEAMS)
        .value("DUPLICATE_ID", fem2d::ErrorCode::DUPLICATE_ID)
        .value("INVALID_NODE_REFERENCE", fem2d::ErrorCode::INVALID_NODE_REFERENCE)
        .value("INVALID_MATERIAL_REFERENCE", fem2d::ErrorCode::INVALID_MATERIAL_REFERENCE)
        .value("INVALID_ELEMENT", fem2d::ErrorCode::INVALID_ELEMENT)
        .value("INVALID_MATERIAL", fem2d::ErrorCode::INVALID_MATERIAL)
        .value("INVALID_SECTION", fem2d::ErrorCode::INVALID_SECTION)
        .value("INVALID_SPRING", fem2d::ErrorCode::INVALID_SPRING)
        .value("INVALID_COORDINATE", fem2d::ErrorCode::INVALID_COORDINATE)
        .value("INVALID_LOAD_EXTENT", fem2d::ErrorCode::INVALID_LOAD_EXTENT)
        .value("INVALID_LOAD_VALUE", fem2d::ErrorCode::INVALID_LOAD_VALUE)
        .value("SOLVER_CONVERGENCE_FAILED", fem2d::ErrorCode::SOLVER_CONVERGENCE_FAILED)
        .value("ENGINE_FAILURE", fem2d::ErrorCode::ENGINE_FAILURE)
        .value("INVALID_SETTINGS", fem2d::ErrorCode::INVALID_SETTINGS)
        .value("UNKNOWN_ERROR", fem2d::ErrorCode::UNKNOWN_ERROR)
        .export_values();

    py::register_exception<fem2d::AnalysisException>(m, "AnalysisError");

    // ========================================================================
    // Entry points
    // ========================================================================

    m.def("solve",
          [](const fem2d::SolveRequest &request, const fem2d::AnalysisSettings &settings) {
              return fem2d::solve(request, settings);
          },
          py::arg("request"), py::arg("settings") = fem2d::AnalysisSettings{},
          py::call_guard<py::gil_scoped_release>(),
          "Solve a request on the process-wide engine (blocks while another solve runs)");

    m.def("partial_equivalent_forces",
          [](double length, double qx, double qy, double start_t, double end_t) {
              return fem2d::partial_equivalent_forces(
                  length, fem2d::LocalLoad(qx, qy, start_t, end_t));
          },
          py::arg("length"), py::arg("qx"), py::arg("qy"),
          py::arg("start_t") = 0.0, py::arg("end_t") = 1.0,
          "Local equivalent nodal forces [Fx1, Fy1, M1, Fx2, Fy2, M2]");

    m.def("interpolate_stations",
          [](double N1, double V1, double M1, double length, double qx, double qy,
             double start_t, double end_t, int num_stations) {
              fem2d::StationInterpolator interpolator(num_stations);
              fem2d::StationDiagram d = interpolator.interpolate(
                  N1, V1, M1, length, fem2d::LocalLoad(qx, qy, start_t, end_t));
              return py::make_tuple(d.stations, d.normal_force, d.shear_force, d.bending_moment);
          },
          py::arg("N1"), py::arg("V1"), py::arg("M1"), py::arg("length"),
          py::arg("qx") = 0.0, py::arg("qy") = 0.0,
          py::arg("start_t") = 0.0, py::arg("end_t") = 1.0, py::arg("num_stations") = 21,
          "Sample N, V, M along a member; returns (stations, N, V, M)");

    m.def("correct_signs", &fem2d::ResultExtractor::correct_signs,
          py::arg("raw"),
          "Apply the end force sign contract to raw engine end actions");
}
