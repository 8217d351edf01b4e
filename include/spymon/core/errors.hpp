#pragma once
#include <stdexcept>
#include <string>

namespace spymon {

    enum class ErrorCode {
        InvalidConfig,
        UnsupportedFormat,
        AttachFailure,
        AggregationFailure,
        SamplingError,
        JoinFailure,
        NoActiveSession,
        RecordingFailure
    };

    const char* toString(ErrorCode code);

    /**
     * @brief Every failure the library reports to its caller.
     *
     * For RecordingFailure, cause() names the error that aborted the
     * sampling loop. For all other codes cause() == code().
     */
    class Error : public std::runtime_error {
    public:
        Error(ErrorCode code, const std::string& message);
        Error(ErrorCode code, ErrorCode cause, const std::string& message);

        ErrorCode code() const noexcept { return code_; }
        ErrorCode cause() const noexcept { return cause_; }

    private:
        ErrorCode code_;
        ErrorCode cause_;
    };

} // namespace spymon
