#include "fem2d/analysis_settings.hpp"
#include "fem2d/errors.hpp"
#include <cmath>
#include <string>

namespace fem2d {

namespace {

void require(bool condition, const std::string& field, const std::string& rule) {
    if (!condition) {
        Fem2dError err(ErrorCode::INVALID_SETTINGS,
            "Invalid analysis setting '" + field + "': " + rule);
        throw AnalysisException(err);
    }
}

}  // namespace

void AnalysisSettings::validate() const {
    require(std::isfinite(rigid_spring_stiffness) && rigid_spring_stiffness > 0.0,
            "rigid_spring_stiffness", "must be positive and finite");
    require(num_stations >= 2, "num_stations", "must be at least 2");
    require(std::isfinite(diagram_floor) && diagram_floor >= 0.0,
            "diagram_floor", "must be non-negative");
    require(nonlinear_load_steps >= 1, "nonlinear_load_steps", "must be at least 1");
    require(std::isfinite(nonlinear_tolerance) && nonlinear_tolerance > 0.0,
            "nonlinear_tolerance", "must be positive");
    require(nonlinear_max_iterations >= 1, "nonlinear_max_iterations", "must be at least 1");
    require(stiffness_ratio_warning > 0.0, "stiffness_ratio_warning", "must be positive");
}

}  // namespace fem2d
