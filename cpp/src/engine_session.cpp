#include "fem2d/engine_session.hpp"
#include "fem2d/frame_engine.hpp"

namespace fem2d {

Engine& global_engine() {
    static FrameEngine engine;
    return engine;
}

std::mutex& engine_mutex() {
    static std::mutex mutex;
    return mutex;
}

EngineSession::EngineSession()
    : EngineSession(global_engine(), engine_mutex()) {}

EngineSession::EngineSession(Engine& engine, std::mutex& mutex)
    : engine_(engine), lock_(mutex) {}

}  // namespace fem2d
