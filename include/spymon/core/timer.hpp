#pragma once
#include <chrono>
#include <random>

namespace spymon {

    /**
     * @brief Paces a sampling loop at a target rate.
     *
     * Tick spacing is drawn from an exponential distribution with mean
     * 1/rate so that sampling does not alias with periodic work in the
     * target. wait() sleeps until the next tick and returns how far behind
     * schedule the caller already was (zero when on time).
     */
    class Timer {
    public:
        using Clock = std::chrono::steady_clock;

        explicit Timer(double rate, bool jitter = true);

        static Timer fixed(double rate) { return Timer(rate, false); }
        static Timer fixed(std::chrono::nanoseconds interval);

        std::chrono::nanoseconds wait();

    private:
        std::chrono::nanoseconds nextInterval_();

        Clock::time_point start_;
        std::chrono::nanoseconds desired_{0};
        double rate_;
        bool jitter_;
        std::mt19937_64 rng_;
        std::exponential_distribution<double> dist_;
    };
}
