#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "spymon/core/config.hpp"
#include "spymon/core/events.hpp"

namespace spymon {

    /**
     * @brief Blocking stream of samples taken from one target process.
     *
     * Constructing a source attaches to the target; implementations throw
     * Error(AttachFailure) from their constructor when that is impossible.
     */
    class ISampleSource {
    public:
        virtual ~ISampleSource() = default;

        /**
         * @brief Block until the next sample is due and return it.
         * @return std::nullopt once the source is exhausted (target exited).
         */
        virtual std::optional<Sample> next() = 0;
    };

    using SampleSourceFactory = std::function<std::unique_ptr<ISampleSource>(int pid, const Config&)>;

    /**
     * @brief Build the platform sample source for @p pid.
     * @throws Error(AttachFailure) if the process cannot be attached to.
     */
    std::unique_ptr<ISampleSource> createSampleSource(int pid, const Config& config);

} // namespace spymon
