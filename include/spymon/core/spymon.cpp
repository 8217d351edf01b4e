#include "spymon/spymon.hpp"

namespace spymon {
    std::unique_ptr<Session> start(const int pid, const Config& config, SessionFactories factories) {
        return std::make_unique<Session>(pid, config, std::move(factories));
    }

    std::string stop(Session& session) {
        return session.stop();
    }
}
