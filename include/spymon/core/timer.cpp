#include "spymon/core/timer.hpp"

#include <cstdint>
#include <thread>

namespace spymon {
    Timer::Timer(const double rate, const bool jitter)
        : start_(Clock::now()),
          rate_(rate > 0.0 ? rate : 1.0),
          jitter_(jitter),
          rng_(std::random_device{}()),
          dist_(rate_) {}

    Timer Timer::fixed(const std::chrono::nanoseconds interval) {
        if (interval.count() <= 0) return Timer(1.0, false);
        return Timer(1e9 / static_cast<double>(interval.count()), false);
    }

    std::chrono::nanoseconds Timer::nextInterval_() {
        const double seconds = jitter_ ? dist_(rng_) : 1.0 / rate_;
        return std::chrono::nanoseconds(static_cast<int64_t>(seconds * 1e9));
    }

    std::chrono::nanoseconds Timer::wait() {
        desired_ += nextInterval_();
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_);
        if (desired_ > elapsed) {
            std::this_thread::sleep_for(desired_ - elapsed);
            return std::chrono::nanoseconds(0);
        }
        return elapsed - desired_;
    }
}
