#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <memory>

#include "spymon/core/events.hpp"

namespace spymon {

    /**
     * @brief JSON-lines event log for profiling sessions.
     *
     * Lines go to "<basePath>.session.<index>.log"; a new index is opened
     * once the current file would exceed rotateBytes.
     */
    class Logger {
    public:
        struct Options {
            std::string basePath;
            std::size_t rotateBytes = 16 * 1024 * 1024; // 16 MiB default
            bool flushAlways = false;
        };

        Logger();
        ~Logger();

        bool open(const Options& opt);
        void close();
        bool isOpen() const;

        void logSessionStart(const SessionStartEvent& e) const;
        void logSessionStop(const SessionStopEvent& e) const;
        void logLag(const LagEvent& e) const;
        void logSamplingError(const SamplingErrorEvent& e) const;

        // Path of the file currently written (for diagnostics and tests).
        std::string currentPath() const;

    private:
        class LogChannel {
        public:
            LogChannel(std::string name, Options opt);
            ~LogChannel();

            void write(const std::string& line);
            void close();
            bool isOpen() const;
            std::string path() const;

        private:
            void ensureOpenLocked();
            void rotateLocked();
            [[nodiscard]] std::string makePathLocked() const;
            void closeLocked();

            std::string name_;
            Options opt_;

            std::ofstream stream_;
            int index_ = 0;
            size_t currentBytes_ = 0;

            mutable std::mutex mu_;
            bool opened_ = false;
        };

        Options opt_;
        std::unique_ptr<LogChannel> chanSession_;
    };
}
