#pragma once
#include <iostream>
#include <atomic>
#include <functional>
#include <string>
#include <sstream>

namespace spymon {

    enum class LogLevel { Debug, Warn, Error };

    class DebugLogger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        static void setEnabled(bool enabled);
        static bool isEnabled();

        /**
         * @brief Redirect every emitted line to @p sink instead of stdout/stderr.
         * Passing an empty function restores the console.
         */
        static void setSink(Sink sink);

        template<typename... Args>
        static void log(const char* prefix, Args&&... args) {
            if (isEnabled()) {
                emit(LogLevel::Debug, format(prefix, std::forward<Args>(args)...));
            }
        }

        // Warnings are user-facing and ignore the debug switch.
        template<typename... Args>
        static void warn(const char* prefix, Args&&... args) {
            emit(LogLevel::Warn, format(prefix, std::forward<Args>(args)...));
        }

        template<typename... Args>
        static void error(const char* prefix, Args&&... args) {
            if (isEnabled()) {
                emit(LogLevel::Error, format(prefix, std::forward<Args>(args)...));
            }
        }

    private:
        template<typename... Args>
        static std::string format(const char* prefix, Args&&... args) {
            std::stringstream ss;
            ss << prefix;
            (ss << ... << std::forward<Args>(args));
            return ss.str();
        }

        static void emit(LogLevel level, const std::string& line);
    };

    #define SPYMON_LOG_DEBUG(...) ::spymon::DebugLogger::log("[SPYMON] ", __VA_ARGS__)
    #define SPYMON_LOG_WARN(...) ::spymon::DebugLogger::warn("[SPYMON-WARN] ", __VA_ARGS__)
    #define SPYMON_LOG_ERROR(...) ::spymon::DebugLogger::error("[SPYMON-ERROR] ", __VA_ARGS__)

} // namespace spymon
