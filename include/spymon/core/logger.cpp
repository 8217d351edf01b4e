#include "spymon/core/logger.hpp"
#include "spymon/core/common.hpp"
#include "spymon/core/debug_logger.hpp"

#include <sstream>
#include <memory>
#include <filesystem>

namespace spymon {
    namespace fs = std::filesystem;
    using detail::jsonEscape;

    // --- LogChannel Implementation ---

    Logger::LogChannel::LogChannel(std::string name, Options opt)
        : name_(std::move(name)), opt_(std::move(opt)) {
        if (!opt_.basePath.empty()) {
            std::lock_guard<std::mutex> lk(mu_);
            opened_ = true;
            ensureOpenLocked();
        }
    }

    Logger::LogChannel::~LogChannel() {
        close();
    }

    void Logger::LogChannel::close() {
        std::lock_guard<std::mutex> lk(mu_);
        closeLocked();
    }

    void Logger::LogChannel::closeLocked() {
        if (stream_.is_open()) {
            stream_.flush();
            stream_.close();
        }
        opened_ = false;
    }

    bool Logger::LogChannel::isOpen() const {
        std::lock_guard<std::mutex> lk(mu_);
        return opened_ && stream_.is_open();
    }

    std::string Logger::LogChannel::path() const {
        std::lock_guard<std::mutex> lk(mu_);
        return makePathLocked();
    }

    std::string Logger::LogChannel::makePathLocked() const {
        std::ostringstream oss;
        // Naming format: basePath.category.index.log
        oss << "." << name_ << "." << index_ << ".log";
        return opt_.basePath + oss.str();
    }

    void Logger::LogChannel::ensureOpenLocked() {
        if (!opened_) return;
        if (stream_.is_open()) return;

        const fs::path p(makePathLocked());

        if (p.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(p.parent_path(), ec);
        }

        stream_.open(p, std::ios::out | std::ios::app);

        if (!stream_.good()) {
            SPYMON_LOG_ERROR("Failed to open log file: ", p.string());
        } else {
            currentBytes_ = 0;
        }
    }

    void Logger::LogChannel::rotateLocked() {
        if (!opened_) return;
        if (stream_.is_open()) {
            stream_.flush();
            stream_.close();
        }
        index_ += 1;
        currentBytes_ = 0;
        ensureOpenLocked();
    }

    void Logger::LogChannel::write(const std::string& line) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!opened_) return;

        ensureOpenLocked();
        if (!stream_.good()) return;

        const size_t bytesToWrite = line.size() + 1; // + '\n'
        if (opt_.rotateBytes > 0 && currentBytes_ > 0 &&
            (currentBytes_ + bytesToWrite) > opt_.rotateBytes) {
            rotateLocked();
            if (!stream_.good()) return;
        }

        stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
        stream_.put('\n');
        currentBytes_ += bytesToWrite;

        if (opt_.flushAlways) {
            stream_.flush();
        }
    }

    // --- Logger Implementation ---

    Logger::Logger() = default;
    Logger::~Logger() { close(); }

    bool Logger::open(const Options& opt) {
        close();
        opt_ = opt;

        if (opt_.basePath.empty()) return false;

        chanSession_ = std::make_unique<LogChannel>("session", opt_);
        return chanSession_->isOpen();
    }

    void Logger::close() {
        if (chanSession_) chanSession_->close();
        chanSession_.reset();
    }

    bool Logger::isOpen() const {
        return chanSession_ && chanSession_->isOpen();
    }

    std::string Logger::currentPath() const {
        return chanSession_ ? chanSession_->path() : std::string();
    }

    void Logger::logSessionStart(const SessionStartEvent& e) const {
        if (!chanSession_) return;
        std::ostringstream oss;
        oss << "{"
            << "\"type\":\"session_start\""
            << ",\"pid\":" << e.pid
            << ",\"target_pid\":" << e.targetPid
            << ",\"format\":\"" << jsonEscape(e.format) << "\""
            << ",\"sample_rate\":" << e.sampleRate
            << ",\"ts_ns\":" << e.tsNs
            << ",\"wall_time\":\"" << jsonEscape(e.wallTime) << "\""
            << "}";
        chanSession_->write(oss.str());
    }

    void Logger::logSessionStop(const SessionStopEvent& e) const {
        if (!chanSession_) return;
        std::ostringstream oss;
        oss << "{"
            << "\"type\":\"session_stop\""
            << ",\"pid\":" << e.pid
            << ",\"target_pid\":" << e.targetPid
            << ",\"samples\":" << e.samples
            << ",\"errors\":" << e.errors
            << ",\"lag_warnings\":" << e.lagWarnings
            << ",\"bytes\":" << e.bytes
            << ",\"error\":\"" << jsonEscape(e.error) << "\""
            << ",\"ts_ns\":" << e.tsNs
            << ",\"wall_time\":\"" << jsonEscape(e.wallTime) << "\""
            << "}";
        chanSession_->write(oss.str());
    }

    void Logger::logLag(const LagEvent& e) const {
        if (!chanSession_) return;
        std::ostringstream oss;
        oss << "{"
            << "\"type\":\"lag\""
            << ",\"target_pid\":" << e.targetPid
            << ",\"delay_ns\":" << e.delayNs
            << ",\"ts_ns\":" << e.tsNs
            << "}";
        chanSession_->write(oss.str());
    }

    void Logger::logSamplingError(const SamplingErrorEvent& e) const {
        if (!chanSession_) return;
        std::ostringstream oss;
        oss << "{"
            << "\"type\":\"sampling_error\""
            << ",\"target_pid\":" << e.targetPid
            << ",\"source_pid\":" << e.sourcePid
            << ",\"message\":\"" << jsonEscape(e.message) << "\""
            << ",\"ts_ns\":" << e.tsNs
            << "}";
        chanSession_->write(oss.str());
    }
}
