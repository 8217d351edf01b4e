#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace spymon {

    // Decides when a "sampling is falling behind" warning may be shown:
    // only for lag above the threshold, and at most once per window.
    class LagReporter {
    public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit LagReporter(std::chrono::nanoseconds threshold = std::chrono::seconds(1),
                             std::chrono::nanoseconds window = std::chrono::seconds(1),
                             NowFn now = &Clock::now);

        bool shouldReport(std::chrono::nanoseconds lag);

    private:
        std::chrono::nanoseconds threshold_;
        std::chrono::nanoseconds window_;
        NowFn now_;
        std::optional<Clock::time_point> lastReport_;
    };

    // "1.25s", "340.00ms"
    std::string formatDelay(std::chrono::nanoseconds delay);
}
