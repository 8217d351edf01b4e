#pragma once

#include <memory>
#include <string>

#include "spymon/core/config.hpp"
#include "spymon/core/errors.hpp"
#include "spymon/core/session.hpp"

namespace spymon {
    /**
     * @brief Start profiling @p pid. Returns once sampling has begun.
     */
    std::unique_ptr<Session> start(int pid, const Config& config = {}, SessionFactories factories = {});

    /**
     * @brief Stop @p session and return its serialized profile.
     * A second call on the same session throws Error(NoActiveSession).
     */
    std::string stop(Session& session);
} // namespace spymon
