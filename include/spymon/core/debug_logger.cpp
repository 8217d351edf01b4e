#include "spymon/core/debug_logger.hpp"

#include <mutex>

namespace spymon {
    static std::atomic<bool> g_debugEnabled{false};
    static std::mutex g_sinkMu;
    static DebugLogger::Sink g_sink;

    void DebugLogger::setEnabled(bool enabled) {
        g_debugEnabled.store(enabled);
    }

    bool DebugLogger::isEnabled() {
        return g_debugEnabled.load();
    }

    void DebugLogger::setSink(Sink sink) {
        std::lock_guard lk(g_sinkMu);
        g_sink = std::move(sink);
    }

    void DebugLogger::emit(LogLevel level, const std::string& line) {
        std::lock_guard lk(g_sinkMu);
        if (g_sink) {
            g_sink(level, line);
            return;
        }
        if (level == LogLevel::Debug) {
            std::cout << line << std::endl;
        } else {
            std::cerr << line << std::endl;
        }
    }
}
