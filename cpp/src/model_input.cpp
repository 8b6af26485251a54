#include "fem2d/model_input.hpp"
#include <stdexcept>

namespace fem2d {

CoordSystem coord_system_from_string(const std::string& label) {
    if (label == "local") {
        return CoordSystem::Local;
    }
    if (label == "global") {
        return CoordSystem::Global;
    }
    throw std::invalid_argument("Unknown coordinate system '" + label +
                                "' (expected 'local' or 'global')");
}

std::string to_string(CoordSystem system) {
    switch (system) {
        case CoordSystem::Local: return "local";
        case CoordSystem::Global: return "global";
    }
    return "local";
}

}  // namespace fem2d
