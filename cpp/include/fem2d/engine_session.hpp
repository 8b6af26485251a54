#pragma once

#include "fem2d/engine.hpp"
#include <mutex>

namespace fem2d {

/**
 * @brief The process-wide engine instance
 *
 * The engine holds one current model, so every use must go through an
 * EngineSession.
 */
Engine& global_engine();

/**
 * @brief Mutex guarding global_engine()
 */
std::mutex& engine_mutex();

/**
 * @brief Exclusive session on the process-wide engine
 *
 * The constructor blocks (no timeout) until no other session is open; the
 * destructor releases the engine on every exit path.
 *
 * Usage:
 *   {
 *       EngineSession session;
 *       Engine& engine = session.engine();
 *       // assemble, analyze, extract
 *   }   // engine released here
 */
class EngineSession {
public:
    EngineSession();

    /**
     * @brief Session on a specific engine, guarded by the given mutex
     */
    EngineSession(Engine& engine, std::mutex& mutex);

    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;
    EngineSession(EngineSession&&) = delete;
    EngineSession& operator=(EngineSession&&) = delete;

    Engine& engine() { return engine_; }

private:
    Engine& engine_;
    std::lock_guard<std::mutex> lock_;
};

}  // namespace fem2d
