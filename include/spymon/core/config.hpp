#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace spymon {

    enum class FileFormat { Speedscope, Flamegraph, Raw, ChromeTrace };

    const char* toString(FileFormat format);

    // Accepts the lowercase names ("speedscope", "flamegraph", "raw",
    // "chrometrace"). Throws Error(InvalidConfig) on anything else.
    FileFormat parseFileFormat(const std::string& name);

    struct RecordDuration {
        // 0 means unlimited
        uint64_t seconds = 0;

        bool unlimited() const { return seconds == 0; }

        static RecordDuration Unlimited() { return {}; }
        static RecordDuration Seconds(uint64_t s) { return RecordDuration{s}; }
    };

    struct Config {
        int sampleRate = 100;                                  // samples per second
        std::optional<FileFormat> format = FileFormat::Speedscope;
        RecordDuration duration = RecordDuration::Unlimited();

        bool includeIdle = false;
        bool gilOnly = false;
        bool includeThreadIds = false;
        bool subprocesses = false;
        bool showLineNumbers = true;

        std::string logPath = "";     // empty disables the session event log
        bool enableDebugOutput = false;

        std::chrono::nanoseconds sampleInterval() const;

        // Throws Error(InvalidConfig) when the sample rate is not positive.
        void validate() const;
    };
}
