#pragma once

#include "fem2d/material.hpp"
#include "fem2d/section.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fem2d {

/**
 * @brief Fixity flags of a node (true = restrained)
 */
struct Constraints {
    bool x = false;
    bool y = false;
    bool rotation = false;

    bool any() const { return x || y || rotation; }
};

/**
 * @brief Elastic support stiffness per axis (0 = free on that axis)
 *
 * kx, ky [N/m], kr [N·m/rad]. A spring is created only when at least
 * one value is positive.
 */
struct SpringSupport {
    double kx = 0.0;
    double ky = 0.0;
    double kr = 0.0;

    bool any() const { return kx > 0.0 || ky > 0.0 || kr > 0.0; }
};

/**
 * @brief Concentrated nodal load in global axes
 */
struct PointLoad {
    double fx = 0.0;       ///< Force along global X [N]
    double fy = 0.0;       ///< Force along global Y [N]
    double moment = 0.0;   ///< Moment about Z, counter-clockwise positive [N·m]

    bool is_zero() const { return fx == 0.0 && fy == 0.0 && moment == 0.0; }
};

/**
 * @brief Caller-defined node
 */
struct NodeInput {
    int id = 0;
    double x = 0.0;
    double y = 0.0;
    Constraints constraints;
    std::optional<SpringSupport> springs;   ///< Absent = no spring
    std::optional<PointLoad> loads;         ///< Absent = no load
};

/**
 * @brief Moment releases at the beam ends
 */
struct EndReleases {
    bool start_moment = false;
    bool end_moment = false;
};

/// Axes in which distributed load intensities are given
enum class CoordSystem {
    Local,    ///< qx along the member, qy perpendicular to it
    Global    ///< qx along global X, qy along global Y
};

/**
 * @brief Uniform distributed load on [startT, endT] of a beam
 */
struct DistributedLoad {
    double qx = 0.0;         ///< Intensity along x of coord_system [N/m]
    double qy = 0.0;         ///< Intensity along y of coord_system [N/m]
    double start_t = 0.0;    ///< Start as a fraction of the beam length
    double end_t = 1.0;      ///< End as a fraction of the beam length
    CoordSystem coord_system = CoordSystem::Local;
};

/**
 * @brief Caller-defined beam (one frame element)
 */
struct BeamInput {
    int id = 0;
    std::pair<int, int> node_ids{0, 0};   ///< (start node id, end node id)
    int material_id = 0;
    Section section;
    std::optional<EndReleases> end_releases;
    std::optional<DistributedLoad> distributed_load;
};

/**
 * @brief Complete analysis request
 */
struct SolveRequest {
    std::vector<NodeInput> nodes;
    std::vector<BeamInput> beams;
    std::vector<Material> materials;
    std::string analysis_type = "frame";   ///< Informational label
    bool geometric_nonlinear = false;      ///< true selects P-Delta analysis
};

/**
 * @brief Parse a coordinate system label ("local" or "global")
 * @throws std::invalid_argument for any other label
 */
CoordSystem coord_system_from_string(const std::string& label);

/**
 * @brief Label of a coordinate system ("local" or "global")
 */
std::string to_string(CoordSystem system);

}  // namespace fem2d
