#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spymon/core/stack_trace.hpp"

namespace spymon {
    // One emission of a sample source: every thread captured at one tick.
    struct Sample {
        std::vector<StackTrace> traces;
        std::optional<std::chrono::nanoseconds> late;
        std::optional<std::vector<std::pair<int, std::string>>> samplingErrors;
    };

    struct SessionStartEvent {
        int pid = 0;          // profiler process
        int targetPid = 0;
        std::string format;
        int sampleRate = 0;
        int64_t tsNs = 0;
        std::string wallTime;
    };

    struct SessionStopEvent {
        int pid = 0;
        int targetPid = 0;
        uint64_t samples = 0;
        uint64_t errors = 0;
        uint64_t lagWarnings = 0;
        std::size_t bytes = 0;
        std::string error;    // empty on success
        int64_t tsNs = 0;
        std::string wallTime;
    };

    struct LagEvent {
        int targetPid = 0;
        int64_t delayNs = 0;
        int64_t tsNs = 0;
    };

    struct SamplingErrorEvent {
        int targetPid = 0;
        int sourcePid = 0;
        std::string message;
        int64_t tsNs = 0;
    };
}
