#pragma once

#include "fem2d/analysis_result.hpp"
#include "fem2d/analysis_settings.hpp"
#include "fem2d/engine.hpp"
#include "fem2d/model_assembler.hpp"
#include "fem2d/station_interpolator.hpp"
#include <array>

namespace fem2d {

/**
 * @brief Reads a solved engine back into the caller's id space
 *
 * Displacements and reactions are reported per caller node in request
 * order. The reaction of a sprung node includes the force in its spring.
 *
 * Beam end forces use a fixed sign contract. The engine reports
 * [N1, V1, M1, N2, V2, M2] in local axes as forces exerted on the element
 * by its nodes; the reported record is
 *
 *   N1 = raw0, V1 = raw1, M1 = -raw2, N2 = -raw3, V2 = -raw4, M2 = raw5
 *
 * For loads emitted as nodal equivalents the local equivalent vector is
 * subtracted from the raw vector first, so every beam reports its true
 * member end actions.
 */
class ResultExtractor {
public:
    /**
     * @throws AnalysisException (INVALID_SETTINGS) if settings are invalid
     */
    explicit ResultExtractor(const AnalysisSettings& settings = AnalysisSettings());

    /**
     * @brief Apply the sign contract to raw engine end actions
     */
    static std::array<double, 6> correct_signs(const std::array<double, 6>& raw);

    /**
     * @brief Compute reactions and build the success response
     *
     * @param engine Engine after a successful analyze()
     * @param map Mapping returned by ModelAssembler::assemble()
     */
    SolveResponse extract(Engine& engine, const AssemblyMap& map) const;

    /**
     * @brief Force record of one beam from its raw engine end actions
     */
    BeamForceRecord beam_record(const BeamMapping& mapping,
                                const std::array<double, 6>& raw) const;

private:
    StationInterpolator interpolator_;
};

}  // namespace fem2d
