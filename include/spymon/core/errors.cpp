#include "spymon/core/errors.hpp"

namespace spymon {
    const char* toString(ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidConfig: return "InvalidConfig";
            case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
            case ErrorCode::AttachFailure: return "AttachFailure";
            case ErrorCode::AggregationFailure: return "AggregationFailure";
            case ErrorCode::SamplingError: return "SamplingError";
            case ErrorCode::JoinFailure: return "JoinFailure";
            case ErrorCode::NoActiveSession: return "NoActiveSession";
            case ErrorCode::RecordingFailure: return "RecordingFailure";
        }
        return "Unknown";
    }

    Error::Error(ErrorCode code, const std::string& message)
        : Error(code, code, message) {}

    Error::Error(ErrorCode code, ErrorCode cause, const std::string& message)
        : std::runtime_error(message), code_(code), cause_(cause) {}
}
