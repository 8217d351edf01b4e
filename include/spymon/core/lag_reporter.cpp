#include "spymon/core/lag_reporter.hpp"

#include <iomanip>
#include <sstream>

namespace spymon {
    LagReporter::LagReporter(std::chrono::nanoseconds threshold,
                             std::chrono::nanoseconds window,
                             NowFn now)
        : threshold_(threshold), window_(window), now_(std::move(now)) {}

    bool LagReporter::shouldReport(const std::chrono::nanoseconds lag) {
        if (lag <= threshold_) return false;

        const auto now = now_();
        if (lastReport_ && now - *lastReport_ < window_) {
            return false;
        }
        lastReport_ = now;
        return true;
    }

    std::string formatDelay(const std::chrono::nanoseconds delay) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        const double secs = std::chrono::duration<double>(delay).count();
        if (secs >= 1.0) {
            oss << secs << "s";
        } else {
            oss << secs * 1000.0 << "ms";
        }
        return oss.str();
    }
}
