#include "spymon/core/session.hpp"
#include "spymon/core/common.hpp"
#include "spymon/core/debug_logger.hpp"
#include "spymon/core/errors.hpp"
#include "spymon/core/logger.hpp"
#include "spymon/core/timer.hpp"

#include <system_error>

namespace spymon {
    Session::Session(const int pid, Config config, SessionFactories factories)
        : pid_(pid), config_(std::move(config)) {
        if (config_.enableDebugOutput) {
            DebugLogger::setEnabled(true);
        }

        config_.validate();
        if (pid_ <= 0) {
            throw Error(ErrorCode::InvalidConfig, "Invalid process id " + std::to_string(pid_));
        }
        if (!factories.makeSource || !factories.makeAggregator) {
            throw Error(ErrorCode::InvalidConfig, "Session factories must be set");
        }

        // Reject the output format on the caller's thread, before anything
        // touches the target.
        auto aggregator = factories.makeAggregator(config_);
        if (!aggregator) {
            throw Error(ErrorCode::UnsupportedFormat, "No aggregator for the requested format");
        }

        if (!config_.logPath.empty()) {
            logger_ = std::make_shared<Logger>();
            Logger::Options logOpts;
            logOpts.basePath = config_.logPath;
            if (!logger_->open(logOpts)) {
                SPYMON_LOG_ERROR("Session log disabled, cannot open ", config_.logPath);
                logger_.reset();
            }
        }

        auto worker = std::make_unique<Worker>();
        std::promise<LoopResult> promise;
        worker->result = promise.get_future();
        worker->thread = std::thread(
            [this, promise = std::move(promise), aggregator = std::move(aggregator),
             makeSource = std::move(factories.makeSource)]() mutable {
                try {
                    promise.set_value(recordSamples_(makeSource, std::move(aggregator)));
                } catch (...) {
                    promise.set_exception(std::current_exception());
                }
            });

        waitUntilReady_(*worker);

        // The thread is live: anything that throws from here on has to
        // stop and join it before the exception leaves the constructor.
        try {
            SPYMON_LOG_DEBUG("Sampling pid ", pid_, " at ", config_.sampleRate, " Hz");
            if (logger_) {
                SessionStartEvent e;
                e.pid = detail::getPid();
                e.targetPid = pid_;
                e.format = config_.format ? toString(*config_.format) : "";
                e.sampleRate = config_.sampleRate;
                e.tsNs = detail::getTimestampNs();
                e.wallTime = detail::toIso8601Utc();
                logger_->logSessionStart(e);
            }
        } catch (...) {
            running_.store(false, std::memory_order_seq_cst);
            worker->thread.join();
            throw;
        }

        std::lock_guard lk(mu_);
        worker_ = std::move(worker);
    }

    Session::~Session() {
        if (!active()) return;
        try {
            stop();
        } catch (const Error& e) {
            SPYMON_LOG_DEBUG("Discarding error from implicit stop: ", e.what());
        }
    }

    bool Session::active() const {
        std::lock_guard lk(mu_);
        return worker_ != nullptr;
    }

    void Session::waitUntilReady_(Worker& worker) {
        Timer poll = Timer::fixed(config_.sampleInterval());
        while (!ready_.load(std::memory_order_seq_cst)) {
            if (worker.result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                // The thread finished: either it raised readiness just now
                // (finite source) or it failed before sampling began.
                if (ready_.load(std::memory_order_seq_cst)) break;

                worker.thread.join();
                try {
                    worker.result.get();
                } catch (const Error&) {
                    throw;
                } catch (const std::exception& e) {
                    throw Error(ErrorCode::AttachFailure, std::string("Failed to start sampling: ") + e.what());
                } catch (...) {
                    throw Error(ErrorCode::AttachFailure, "Failed to start sampling");
                }
                throw Error(ErrorCode::AttachFailure, "Sampling thread exited before sampling began");
            }
            poll.wait();
        }
    }

    LoopResult Session::recordSamples_(const SampleSourceFactory& makeSource,
                                       std::unique_ptr<ITraceAggregator> aggregator) {
        SamplingLoop loop(pid_, config_, std::move(aggregator), logger_);

        std::unique_ptr<ISampleSource> source = makeSource(pid_, config_);
        if (!source) {
            throw Error(ErrorCode::AttachFailure, "No sample source for pid " + std::to_string(pid_));
        }

        ready_.store(true, std::memory_order_seq_cst);
        return loop.run(*source, running_);
    }

    std::string Session::stop() {
        std::unique_ptr<Worker> worker;
        {
            std::lock_guard lk(mu_);
            if (!worker_) {
                throw Error(ErrorCode::NoActiveSession, "No running profiler thread");
            }
            // Joining ourselves would deadlock. The handle stays so the
            // owner can still stop the session.
            if (worker_->thread.get_id() == std::this_thread::get_id()) {
                throw Error(ErrorCode::JoinFailure, "stop() called from the sampling thread");
            }
            running_.store(false, std::memory_order_seq_cst);
            worker = std::move(worker_);
        }

        try {
            worker->thread.join();
        } catch (const std::system_error& e) {
            throw Error(ErrorCode::JoinFailure, std::string("Failed to join profiling thread: ") + e.what());
        }

        try {
            LoopResult r = worker->result.get();
            logStop_(r.stats, r.bytes.size(), "");
            SPYMON_LOG_DEBUG("Session for pid ", pid_, " produced ", r.bytes.size(), " bytes");
            stats_ = r.stats;
            return std::move(r.bytes);
        } catch (const Error& e) {
            logStop_({}, 0, e.what());
            throw Error(ErrorCode::RecordingFailure, e.code(), std::string("Recording failed: ") + e.what());
        } catch (const std::exception& e) {
            logStop_({}, 0, e.what());
            throw Error(ErrorCode::JoinFailure, std::string("Profiling thread terminated abnormally: ") + e.what());
        } catch (...) {
            logStop_({}, 0, "unknown exception");
            throw Error(ErrorCode::JoinFailure, "Profiling thread terminated abnormally");
        }
    }

    void Session::logStop_(const LoopStats& stats, const std::size_t bytes, const std::string& error) const {
        if (!logger_) return;
        SessionStopEvent e;
        e.pid = detail::getPid();
        e.targetPid = pid_;
        e.samples = stats.samples;
        e.errors = stats.errors;
        e.lagWarnings = stats.lagWarnings;
        e.bytes = bytes;
        e.error = error;
        e.tsNs = detail::getTimestampNs();
        e.wallTime = detail::toIso8601Utc();
        logger_->logSessionStop(e);
    }
}
