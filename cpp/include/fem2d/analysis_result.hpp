#pragma once

#include <map>
#include <string>
#include <vector>

namespace fem2d {

/**
 * @brief Per-beam force record
 *
 * End forces follow the reporting sign contract: N1, V1, M1 at the start
 * and N2, V2, M2 at the end of the beam. The diagrams are sampled at
 * `stations` (positions along the beam from its start node [m]).
 */
struct BeamForceRecord {
    int element_id = 0;   ///< Caller beam id

    double N1 = 0.0;
    double V1 = 0.0;
    double M1 = 0.0;
    double N2 = 0.0;
    double V2 = 0.0;
    double M2 = 0.0;

    std::vector<double> stations;
    std::vector<double> normal_force;
    std::vector<double> shear_force;
    std::vector<double> bending_moment;

    double max_n = 0.0;   ///< max |N| over stations, floored
    double max_v = 0.0;   ///< max |V| over stations, floored
    double max_m = 0.0;   ///< max |M| over stations, floored
};

/**
 * @brief Response of one analysis request
 *
 * On success the numeric payload is filled and `error` is empty; on
 * failure only `success = false` and `error` are meaningful.
 */
struct SolveResponse {
    bool success = false;

    /// Flat [ux, uy, rz] triples in node_id_order
    std::vector<double> displacements;

    /// Flat [Rx, Ry, Rm] triples in node_id_order
    std::vector<double> reactions;

    /// Beam id -> force record
    std::map<int, BeamForceRecord> beam_forces;

    /// Caller node ids in request order
    std::vector<int> node_id_order;

    std::string error;

    static SolveResponse failure(const std::string& message) {
        SolveResponse response;
        response.success = false;
        response.error = message;
        return response;
    }
};

}  // namespace fem2d
