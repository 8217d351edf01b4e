#include "spymon/core/config.hpp"
#include "spymon/core/errors.hpp"

namespace spymon {
    const char* toString(const FileFormat format) {
        switch (format) {
            case FileFormat::Speedscope: return "speedscope";
            case FileFormat::Flamegraph: return "flamegraph";
            case FileFormat::Raw: return "raw";
            case FileFormat::ChromeTrace: return "chrometrace";
        }
        return "unknown";
    }

    FileFormat parseFileFormat(const std::string& name) {
        if (name == "speedscope") return FileFormat::Speedscope;
        if (name == "flamegraph") return FileFormat::Flamegraph;
        if (name == "raw") return FileFormat::Raw;
        if (name == "chrometrace") return FileFormat::ChromeTrace;
        throw Error(ErrorCode::InvalidConfig, "Unknown file format '" + name + "'");
    }

    std::chrono::nanoseconds Config::sampleInterval() const {
        if (sampleRate <= 0) return std::chrono::nanoseconds(0);
        return std::chrono::nanoseconds(1'000'000'000LL / sampleRate);
    }

    void Config::validate() const {
        if (sampleRate <= 0) {
            throw Error(ErrorCode::InvalidConfig,
                        "Sample rate must be positive, got " + std::to_string(sampleRate));
        }
    }
}
