#pragma once

#include "fem2d/analysis_result.hpp"
#include "fem2d/analysis_settings.hpp"
#include "fem2d/engine.hpp"
#include "fem2d/model_input.hpp"

namespace fem2d {

/**
 * @brief Runs one request through assemble -> analyze -> extract
 *
 * solve() never throws: reference errors, convergence failures and engine
 * errors all come back as a response with success = false and a message.
 * Every failure is logged with its context.
 *
 * Linear requests run one Linear load step. Geometrically nonlinear
 * requests run P-Delta with load control in nonlinear_load_steps
 * increments and Newton iterations on the displacement increment norm.
 *
 * Usage:
 *   AnalysisService service;
 *   SolveResponse response = service.solve(request);
 *   if (!response.success) {
 *       std::cerr << response.error << std::endl;
 *   }
 */
class AnalysisService {
public:
    explicit AnalysisService(const AnalysisSettings& settings = AnalysisSettings());

    /**
     * @brief Solve on the process-wide engine
     *
     * Holds an EngineSession for the whole sequence; concurrent calls
     * block until the engine is free.
     */
    SolveResponse solve(const SolveRequest& request) const;

    /**
     * @brief Solve on a given engine
     *
     * The caller must have exclusive use of the engine for the call.
     */
    SolveResponse solve(const SolveRequest& request, Engine& engine) const;

    /**
     * @brief Engine configuration for a linear or P-Delta request
     */
    SolverConfiguration solver_configuration(bool geometric_nonlinear) const;

    const AnalysisSettings& settings() const { return settings_; }

private:
    AnalysisSettings settings_;
};

/**
 * @brief Solve a request on the process-wide engine
 */
SolveResponse solve(const SolveRequest& request,
                    const AnalysisSettings& settings = AnalysisSettings());

}  // namespace fem2d
