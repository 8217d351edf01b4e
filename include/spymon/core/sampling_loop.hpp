#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "spymon/core/aggregator.hpp"
#include "spymon/core/config.hpp"
#include "spymon/core/events.hpp"
#include "spymon/core/lag_reporter.hpp"
#include "spymon/core/sample_source.hpp"

namespace spymon {
    class Logger;

    struct LoopStats {
        uint64_t samples = 0;        // traces handed to the aggregator
        uint64_t errors = 0;         // per-process sampling errors
        uint64_t lagWarnings = 0;
        uint64_t filteredIdle = 0;
        uint64_t filteredGil = 0;
    };

    struct LoopResult {
        std::string bytes;
        LoopStats stats;
    };

    /**
     * @brief Turns a stream of samples into a serialized profile.
     *
     * run() pulls from the source until it is exhausted or @p running is
     * observed false (checked once per sample), filters and annotates each
     * trace, feeds the aggregator and finally serializes it. An aggregator
     * failure propagates out of run(); nothing is serialized in that case.
     */
    class SamplingLoop {
    public:
        SamplingLoop(int targetPid,
                     Config config,
                     std::unique_ptr<ITraceAggregator> aggregator,
                     std::shared_ptr<Logger> logger = nullptr,
                     LagReporter lagReporter = LagReporter());

        LoopResult run(ISampleSource& source, const std::atomic<bool>& running);

        const LoopStats& stats() const { return stats_; }

        // "Collected N samples (E errors)"
        std::string progressMessage() const;

    private:
        void reportLag_(std::chrono::nanoseconds delay);
        bool keep_(const StackTrace& trace);
        void annotate_(StackTrace& trace) const;
        void recordErrors_(const std::vector<std::pair<int, std::string>>& errors);

        int targetPid_;
        Config config_;
        std::unique_ptr<ITraceAggregator> aggregator_;
        std::shared_ptr<Logger> logger_;
        LagReporter lagReporter_;
        LoopStats stats_;
    };
}
