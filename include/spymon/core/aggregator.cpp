#include "spymon/core/aggregator.hpp"
#include "spymon/core/errors.hpp"
#include "spymon/backends/speedscope/speedscope_aggregator.hpp"

namespace spymon {
    std::unique_ptr<ITraceAggregator> createAggregator(const Config& config) {
        if (!config.format) {
            throw Error(ErrorCode::UnsupportedFormat, "A file format is required to record samples");
        }

        switch (*config.format) {
            case FileFormat::Speedscope:
                return std::make_unique<speedscope::SpeedscopeAggregator>(config);
            case FileFormat::Flamegraph:
                throw Error(ErrorCode::UnsupportedFormat, "Flamegraph not supported");
            case FileFormat::Raw:
                throw Error(ErrorCode::UnsupportedFormat, "Raw not supported");
            case FileFormat::ChromeTrace:
                throw Error(ErrorCode::UnsupportedFormat, "Chrometrace not supported");
        }
        throw Error(ErrorCode::UnsupportedFormat, "Unknown file format");
    }
}
