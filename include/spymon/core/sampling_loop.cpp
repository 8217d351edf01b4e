#include "spymon/core/sampling_loop.hpp"
#include "spymon/core/common.hpp"
#include "spymon/core/debug_logger.hpp"
#include "spymon/core/errors.hpp"
#include "spymon/core/logger.hpp"

#include <sstream>

namespace spymon {
    SamplingLoop::SamplingLoop(const int targetPid,
                               Config config,
                               std::unique_ptr<ITraceAggregator> aggregator,
                               std::shared_ptr<Logger> logger,
                               LagReporter lagReporter)
        : targetPid_(targetPid),
          config_(std::move(config)),
          aggregator_(std::move(aggregator)),
          logger_(std::move(logger)),
          lagReporter_(std::move(lagReporter)) {
        if (!aggregator_) {
            throw Error(ErrorCode::UnsupportedFormat, "No aggregator for the requested format");
        }
    }

    LoopResult SamplingLoop::run(ISampleSource& source, const std::atomic<bool>& running) {
        while (auto sample = source.next()) {
            if (sample->late) {
                reportLag_(*sample->late);
            }

            if (!running.load(std::memory_order_seq_cst)) {
                break;
            }

            for (auto& trace : sample->traces) {
                if (!keep_(trace)) continue;

                annotate_(trace);
                aggregator_->increment(trace);
                stats_.samples += 1;
            }

            if (sample->samplingErrors) {
                recordErrors_(*sample->samplingErrors);
            }
        }

        SPYMON_LOG_DEBUG(progressMessage());

        LoopResult result;
        result.bytes = aggregator_->serialize();
        result.stats = stats_;
        return result;
    }

    void SamplingLoop::reportLag_(const std::chrono::nanoseconds delay) {
        if (!lagReporter_.shouldReport(delay)) return;

        stats_.lagWarnings += 1;
        SPYMON_LOG_WARN(formatDelay(delay),
                        " behind in sampling, results may be inaccurate. Try reducing the sampling rate");

        if (logger_) {
            LagEvent e;
            e.targetPid = targetPid_;
            e.delayNs = delay.count();
            e.tsNs = detail::getTimestampNs();
            logger_->logLag(e);
        }
    }

    bool SamplingLoop::keep_(const StackTrace& trace) {
        if (!(config_.includeIdle || trace.active)) {
            stats_.filteredIdle += 1;
            return false;
        }
        if (config_.gilOnly && !trace.ownsGil) {
            stats_.filteredGil += 1;
            return false;
        }
        return true;
    }

    void SamplingLoop::annotate_(StackTrace& trace) const {
        if (config_.includeThreadIds) {
            trace.frames.push_back(trace.threadIdentityFrame());
        }

        // The trace's own process first, then each ancestor outward.
        for (const ProcessInfo* p = trace.processInfo.get(); p; p = p->parent.get()) {
            trace.frames.push_back(p->toFrame());
        }
    }

    void SamplingLoop::recordErrors_(const std::vector<std::pair<int, std::string>>& errors) {
        for (const auto& [pid, message] : errors) {
            SPYMON_LOG_WARN("Failed to get stack trace from ", pid, ": ", message);
            stats_.errors += 1;

            if (logger_) {
                SamplingErrorEvent e;
                e.targetPid = targetPid_;
                e.sourcePid = pid;
                e.message = message;
                e.tsNs = detail::getTimestampNs();
                logger_->logSamplingError(e);
            }
        }
    }

    std::string SamplingLoop::progressMessage() const {
        std::ostringstream oss;
        oss << "Collected " << stats_.samples << " samples";
        if (stats_.errors > 0) {
            oss << " (" << stats_.errors << " errors)";
        }
        if (!config_.duration.unlimited()) {
            oss << " of " << config_.duration.seconds << "s requested";
        }
        return oss.str();
    }
}
