#pragma once

#include "fem2d/analysis_result.hpp"
#include "fem2d/analysis_settings.hpp"
#include "fem2d/model_input.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace fem2d {

/**
 * @brief JSON codec for analysis requests and responses
 *
 * Request keys (camelCase):
 *   nodes[]     {id, x, y, constraints{x, y, rotation}, springs{kx, ky, kr},
 *                loads{fx, fy, moment}}
 *   beams[]     {id, nodeIds[2], materialId, section{A, I, h},
 *                endReleases{startMoment, endMoment},
 *                distributedLoad{qx, qy, startT, endT, coordSystem}}
 *   materials[] {id, E, nu}
 *   analysisType, geometricNonlinear, settings{...}
 *
 * Response keys: success, displacements, reactions, beamForces (keyed by
 * beam id), nodeIdOrder, error. On failure the numeric fields are null.
 */
namespace json_io {

/**
 * @brief Decode a request document
 * @throws AnalysisException (INVALID_REQUEST) for missing or mistyped fields
 */
SolveRequest request_from_json(const nlohmann::json& document);

/**
 * @brief Apply an optional "settings" object over base settings
 *
 * Keys: rigidSpringStiffness, numStations, diagramFloor,
 * nonlinearLoadSteps, nonlinearTolerance, nonlinearMaxIterations,
 * linearMethod, stiffnessRatioWarning.
 * @throws AnalysisException (INVALID_REQUEST) for mistyped values
 */
AnalysisSettings settings_from_json(const nlohmann::json& document,
                                    const AnalysisSettings& base = AnalysisSettings());

nlohmann::json beam_record_to_json(const BeamForceRecord& record);

nlohmann::json response_to_json(const SolveResponse& response);

/**
 * @brief Parse, solve on the process-wide engine and encode
 *
 * Never throws: malformed JSON becomes a failure response.
 *
 * @param text Request document
 * @param base Settings the request's "settings" object is applied over
 */
nlohmann::json solve_document(const std::string& text,
                              const AnalysisSettings& base = AnalysisSettings());

}  // namespace json_io

}  // namespace fem2d
