#include "spymon/core/stack_trace.hpp"

#include <functional>
#include <sstream>

namespace spymon {
    namespace {
        Frame makeShimFrame(std::string name) {
            Frame f;
            f.name = std::move(name);
            f.isEntry = true;
            f.isShimEntry = true;
            return f;
        }

        void hashCombine(std::size_t& seed, std::size_t h) {
            seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
    }

    bool Frame::operator==(const Frame& other) const {
        return name == other.name
            && filename == other.filename
            && module == other.module
            && shortFilename == other.shortFilename
            && line == other.line
            && isEntry == other.isEntry
            && isShimEntry == other.isShimEntry;
    }

    std::size_t FrameHash::operator()(const Frame& f) const noexcept {
        std::size_t seed = std::hash<std::string>{}(f.name);
        hashCombine(seed, std::hash<std::string>{}(f.filename));
        hashCombine(seed, std::hash<int>{}(f.line));
        if (f.module) hashCombine(seed, std::hash<std::string>{}(*f.module));
        if (f.shortFilename) hashCombine(seed, std::hash<std::string>{}(*f.shortFilename));
        hashCombine(seed, (f.isEntry ? 1u : 0u) | (f.isShimEntry ? 2u : 0u));
        return seed;
    }

    Frame ProcessInfo::toFrame() const {
        std::ostringstream oss;
        oss << "process " << pid << ":\"" << commandLine << "\"";
        return makeShimFrame(oss.str());
    }

    std::string StackTrace::formatThreadId() const {
        std::ostringstream oss;
        if (osThreadId) {
            oss << *osThreadId;
        } else {
            oss << "0x" << std::uppercase << std::hex << threadId;
        }
        return oss.str();
    }

    Frame StackTrace::threadIdentityFrame() const {
        std::string label = "thread (" + formatThreadId() + ")";
        if (threadName) {
            label += ": " + *threadName;
        }
        return makeShimFrame(std::move(label));
    }
}
