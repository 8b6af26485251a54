#include "fem2d/analysis_service.hpp"
#include "fem2d/engine_session.hpp"
#include "fem2d/errors.hpp"
#include "fem2d/model_assembler.hpp"
#include "fem2d/result_extractor.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace fem2d {

AnalysisService::AnalysisService(const AnalysisSettings& settings)
    : settings_(settings) {}

SolveResponse AnalysisService::solve(const SolveRequest& request) const {
    EngineSession session;
    return solve(request, session.engine());
}

SolveResponse AnalysisService::solve(const SolveRequest& request, Engine& engine) const {
    spdlog::info("Solving '{}' request: {} nodes, {} beams, {} materials, {} analysis",
                 request.analysis_type, request.nodes.size(), request.beams.size(),
                 request.materials.size(),
                 request.geometric_nonlinear ? "P-Delta" : "linear");

    try {
        ModelAssembler assembler(settings_);
        ResultExtractor extractor(settings_);

        AssemblyMap map = assembler.assemble(request, engine);

        engine.configure(solver_configuration(request.geometric_nonlinear));
        int status = engine.analyze();
        if (status != 0) {
            throw AnalysisException(Fem2dError::not_converged(status));
        }

        SolveResponse response = extractor.extract(engine, map);
        spdlog::info("Solved: {} displacement values, {} beam force records",
                     response.displacements.size(), response.beam_forces.size());
        return response;

    } catch (const AnalysisException& e) {
        spdlog::error("Analysis failed: {}", e.error().to_string());
        return SolveResponse::failure(e.what());

    } catch (const std::exception& e) {
        Fem2dError err = Fem2dError::engine_failure(e.what());
        spdlog::error("Engine failure on '{}' request ({} nodes, {} beams, geometricNonlinear={}): {}",
                      request.analysis_type, request.nodes.size(), request.beams.size(),
                      request.geometric_nonlinear, err.to_string());
        return SolveResponse::failure(err.message);
    }
}

SolverConfiguration AnalysisService::solver_configuration(bool geometric_nonlinear) const {
    SolverConfiguration config;
    config.linear_method = settings_.linear_method;

    if (geometric_nonlinear) {
        config.algorithm = AlgorithmType::Newton;
        config.load_steps = settings_.nonlinear_load_steps;
        config.tolerance = settings_.nonlinear_tolerance;
        config.max_iterations = settings_.nonlinear_max_iterations;
    } else {
        config.algorithm = AlgorithmType::Linear;
        config.load_steps = 1;
    }
    return config;
}

SolveResponse solve(const SolveRequest& request, const AnalysisSettings& settings) {
    return AnalysisService(settings).solve(request);
}

}  // namespace fem2d
