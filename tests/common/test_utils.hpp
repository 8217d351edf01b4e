#pragma once
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "spymon/core/aggregator.hpp"
#include "spymon/core/debug_logger.hpp"
#include "spymon/core/errors.hpp"
#include "spymon/core/sample_source.hpp"

namespace spymon::testing {

    inline Frame codeFrame(const std::string& name, const std::string& file = "app.py", int line = 1) {
        Frame f;
        f.name = name;
        f.filename = file;
        f.line = line;
        return f;
    }

    inline StackTrace makeTrace(uint64_t tid, bool active, bool ownsGil = true,
                                std::vector<Frame> frames = {codeFrame("work")}) {
        StackTrace t;
        t.pid = 4242;
        t.threadId = tid;
        t.active = active;
        t.ownsGil = ownsGil;
        t.frames = std::move(frames);
        return t;
    }

    // Scripted samples. Once the script runs out the source either ends
    // (finite) or keeps yielding empty samples every millisecond.
    class FakeSampleSource : public ISampleSource {
    public:
        struct State {
            std::atomic<int> nextCalls{0};
            std::atomic<bool> drained{false};
        };

        FakeSampleSource(std::deque<Sample> script, bool finite,
                         std::shared_ptr<State> state = std::make_shared<State>())
            : script_(std::move(script)), finite_(finite), state_(std::move(state)) {}

        std::optional<Sample> next() override {
            state_->nextCalls.fetch_add(1);
            if (!script_.empty()) {
                Sample s = std::move(script_.front());
                script_.pop_front();
                return s;
            }
            state_->drained.store(true);
            if (finite_) return std::nullopt;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return Sample{};
        }

    private:
        std::deque<Sample> script_;
        bool finite_;
        std::shared_ptr<State> state_;
    };

    // Records what the loop fed it; the record outlives the aggregator.
    class CountingAggregator : public ITraceAggregator {
    public:
        struct Record {
            std::mutex mu;
            std::vector<StackTrace> traces;
            int serializeCalls = 0;

            std::size_t count() {
                std::lock_guard lk(mu);
                return traces.size();
            }
        };

        explicit CountingAggregator(std::shared_ptr<Record> record) : record_(std::move(record)) {}

        void increment(const StackTrace& trace) override {
            std::lock_guard lk(record_->mu);
            record_->traces.push_back(trace);
        }

        std::string serialize() override {
            std::lock_guard lk(record_->mu);
            record_->serializeCalls += 1;
            return "traces=" + std::to_string(record_->traces.size());
        }

    private:
        std::shared_ptr<Record> record_;
    };

    class FailingAggregator : public ITraceAggregator {
    public:
        explicit FailingAggregator(std::shared_ptr<std::atomic<int>> attempts = std::make_shared<std::atomic<int>>(0))
            : attempts_(std::move(attempts)) {}

        void increment(const StackTrace&) override {
            attempts_->fetch_add(1);
            throw Error(ErrorCode::AggregationFailure, "trace cannot be represented");
        }
        std::string serialize() override { return "unreachable"; }

    private:
        std::shared_ptr<std::atomic<int>> attempts_;
    };

    // Captures DebugLogger output for the lifetime of the object.
    class LogCapture {
    public:
        LogCapture() {
            DebugLogger::setSink([this](LogLevel level, const std::string& line) {
                std::lock_guard lk(mu_);
                lines_.emplace_back(level, line);
            });
        }
        ~LogCapture() { DebugLogger::setSink({}); }

        std::size_t count(LogLevel level, const std::string& needle) const {
            std::lock_guard lk(mu_);
            std::size_t n = 0;
            for (const auto& [lvl, line] : lines_) {
                if (lvl == level && line.find(needle) != std::string::npos) ++n;
            }
            return n;
        }

    private:
        mutable std::mutex mu_;
        std::vector<std::pair<LogLevel, std::string>> lines_;
    };

    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
}

// Run a statement expected to throw spymon::Error and check its code.
#define EXPECT_SPYMON_ERROR(stmt, expectedCode)                                   \
    do {                                                                          \
        bool _spymon_thrown = false;                                              \
        try {                                                                     \
            stmt;                                                                 \
        } catch (const ::spymon::Error& _spymon_e) {                              \
            _spymon_thrown = true;                                                \
            EXPECT_EQ(_spymon_e.code(), expectedCode)                             \
                << ::spymon::toString(_spymon_e.code()) << ": " << _spymon_e.what(); \
        }                                                                         \
        EXPECT_TRUE(_spymon_thrown) << "expected " << ::spymon::toString(expectedCode); \
    } while (0)
