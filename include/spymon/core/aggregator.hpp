#pragma once

#include <functional>
#include <memory>
#include <string>

#include "spymon/core/config.hpp"
#include "spymon/core/stack_trace.hpp"

namespace spymon {

    /**
     * @brief Interface for output encodings fed by the sampling loop.
     *
     * The loop calls increment() once per trace that passed filtering and
     * serialize() exactly once, after the last increment.
     */
    class ITraceAggregator {
    public:
        virtual ~ITraceAggregator() = default;

        /**
         * @brief Fold one trace into the running profile.
         * @throws Error(AggregationFailure) if the trace cannot be represented.
         */
        virtual void increment(const StackTrace& trace) = 0;

        /**
         * @brief Produce the final artifact for this encoding.
         */
        virtual std::string serialize() = 0;
    };

    using AggregatorFactory = std::function<std::unique_ptr<ITraceAggregator>(const Config&)>;

    /**
     * @brief Build the aggregator for config.format.
     * @throws Error(UnsupportedFormat) for every encoding except speedscope.
     */
    std::unique_ptr<ITraceAggregator> createAggregator(const Config& config);

} // namespace spymon
