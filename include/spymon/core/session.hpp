#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "spymon/core/aggregator.hpp"
#include "spymon/core/config.hpp"
#include "spymon/core/sample_source.hpp"
#include "spymon/core/sampling_loop.hpp"

namespace spymon {
    class Logger;

    struct SessionFactories {
        SampleSourceFactory makeSource = &createSampleSource;
        AggregatorFactory makeAggregator = &createAggregator;
    };

    /**
     * @brief One profiling attempt against one target process.
     *
     * The constructor spawns the sampling thread and returns only once that
     * thread has attached to the target and is about to pull its first
     * sample. stop() ends the session and returns the serialized profile;
     * it succeeds at most once. A session destroyed while still running is
     * stopped and its result discarded.
     */
    class Session {
    public:
        /**
         * @throws Error(InvalidConfig)     bad pid or sample rate
         * @throws Error(UnsupportedFormat) before any thread is created
         * @throws Error(AttachFailure)     the sample source could not be built
         */
        Session(int pid, Config config, SessionFactories factories = {});
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @throws Error(NoActiveSession)  the thread was already consumed
         * @throws Error(JoinFailure)      the thread ended abnormally, or stop()
         *                                 ran on the sampling thread itself (the
         *                                 session then stays active)
         * @throws Error(RecordingFailure) the loop failed; cause() says why
         */
        std::string stop();

        bool active() const;
        bool ready() const { return ready_.load(); }
        int pid() const { return pid_; }
        const Config& config() const { return config_; }

        // Set by a successful stop().
        const std::optional<LoopStats>& stats() const { return stats_; }

    private:
        struct Worker {
            std::thread thread;
            std::future<LoopResult> result;
        };

        LoopResult recordSamples_(const SampleSourceFactory& makeSource,
                                  std::unique_ptr<ITraceAggregator> aggregator);
        void waitUntilReady_(Worker& worker);
        void logStop_(const LoopStats& stats, std::size_t bytes, const std::string& error) const;

        int pid_;
        Config config_;

        std::atomic<bool> ready_{false};
        std::atomic<bool> running_{true};

        mutable std::mutex mu_;
        std::unique_ptr<Worker> worker_;

        std::shared_ptr<Logger> logger_;
        std::optional<LoopStats> stats_;
    };
}
