#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spymon {

    struct Frame {
        std::string name;
        std::string filename;
        std::optional<std::string> module;
        std::optional<std::string> shortFilename;
        int line = 0;

        // Set on frames manufactured by the sampler (thread and process
        // markers) so renderers can tell them apart from code frames.
        bool isEntry = false;
        bool isShimEntry = false;

        bool operator==(const Frame& other) const;
        bool operator!=(const Frame& other) const { return !(*this == other); }
    };

    struct FrameHash {
        std::size_t operator()(const Frame& f) const noexcept;
    };

    struct ProcessInfo {
        int pid = 0;
        std::string commandLine;
        std::shared_ptr<const ProcessInfo> parent;

        Frame toFrame() const;
    };

    struct StackTrace {
        int pid = 0;
        uint64_t threadId = 0;
        std::optional<uint64_t> osThreadId;
        std::optional<std::string> threadName;

        bool active = true;
        bool ownsGil = false;

        std::vector<Frame> frames;   // innermost first
        std::shared_ptr<const ProcessInfo> processInfo;

        std::string formatThreadId() const;

        // "thread (<tid>)" or "thread (<tid>): <name>"
        Frame threadIdentityFrame() const;
    };

} // namespace spymon
