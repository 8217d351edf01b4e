#include "spymon/backends/speedscope/speedscope_aggregator.hpp"
#include "spymon/core/common.hpp"
#include "spymon/core/errors.hpp"

#include <sstream>
#include <unordered_set>

namespace spymon::speedscope {
    using detail::jsonEscape;

    SpeedscopeAggregator::SpeedscopeAggregator(const Config& config, const std::size_t maxFrames)
        : sampleRate_(config.sampleRate > 0 ? config.sampleRate : 1),
          showLineNumbers_(config.showLineNumbers),
          maxFrames_(maxFrames) {}

    Frame SpeedscopeAggregator::normalise_(const Frame& frame) const {
        if (showLineNumbers_) return frame;
        Frame f = frame;
        f.line = 0;
        return f;
    }

    void SpeedscopeAggregator::increment(const StackTrace& trace) {
        if (serialized_) {
            throw Error(ErrorCode::AggregationFailure, "Profile already serialized");
        }

        std::vector<Frame> normalised;
        normalised.reserve(trace.frames.size());
        for (const auto& frame : trace.frames) {
            normalised.push_back(normalise_(frame));
        }

        // Check the table limit before touching any state so a rejected
        // trace leaves the profile unchanged.
        std::unordered_set<Frame, FrameHash> unseen;
        for (const auto& frame : normalised) {
            if (frameIndex_.find(frame) == frameIndex_.end()) {
                unseen.insert(frame);
            }
        }
        if (frames_.size() + unseen.size() > maxFrames_) {
            std::ostringstream oss;
            oss << "speedscope frame table is limited to " << maxFrames_
                << " frames; trace from thread " << trace.formatThreadId()
                << " would add " << unseen.size() << " more";
            throw Error(ErrorCode::AggregationFailure, oss.str());
        }

        std::vector<std::size_t> indices;
        indices.reserve(normalised.size());
        for (auto it = normalised.rbegin(); it != normalised.rend(); ++it) {
            auto found = frameIndex_.find(*it);
            if (found != frameIndex_.end()) {
                indices.push_back(found->second);
            } else {
                const std::size_t idx = frames_.size();
                frames_.push_back(*it);
                frameIndex_.emplace(*it, idx);
                indices.push_back(idx);
            }
        }

        const ThreadKey key{trace.pid, trace.threadId};
        samples_[key].push_back(std::move(indices));
        if (trace.threadName && !trace.threadName->empty()) {
            threadNames_[key] = *trace.threadName;
        }
        ++totalSamples_;
    }

    std::string SpeedscopeAggregator::profileName_(const ThreadKey& key) const {
        std::ostringstream oss;
        oss << "Process " << key.first << " Thread " << key.second;
        if (auto it = threadNames_.find(key); it != threadNames_.end()) {
            oss << " \"" << it->second << "\"";
        }
        return oss.str();
    }

    std::string SpeedscopeAggregator::serialize() {
        serialized_ = true;

        const double weight = 1.0 / static_cast<double>(sampleRate_);

        std::ostringstream oss;
        oss.precision(15);
        oss << "{"
            << "\"$schema\":\"" << kSchemaUrl << "\""
            << ",\"profiles\":[";

        bool firstProfile = true;
        for (const auto& [key, stacks] : samples_) {
            if (!firstProfile) oss << ",";
            firstProfile = false;

            oss << "{"
                << "\"type\":\"sampled\""
                << ",\"name\":\"" << jsonEscape(profileName_(key)) << "\""
                << ",\"unit\":\"seconds\""
                << ",\"startValue\":0"
                << ",\"endValue\":" << weight * static_cast<double>(stacks.size())
                << ",\"samples\":[";
            for (std::size_t i = 0; i < stacks.size(); ++i) {
                if (i) oss << ",";
                oss << "[";
                for (std::size_t j = 0; j < stacks[i].size(); ++j) {
                    if (j) oss << ",";
                    oss << stacks[i][j];
                }
                oss << "]";
            }
            oss << "],\"weights\":[";
            for (std::size_t i = 0; i < stacks.size(); ++i) {
                if (i) oss << ",";
                oss << weight;
            }
            oss << "]}";
        }

        oss << "],\"shared\":{\"frames\":[";
        for (std::size_t i = 0; i < frames_.size(); ++i) {
            const Frame& f = frames_[i];
            if (i) oss << ",";
            oss << "{"
                << "\"name\":\"" << jsonEscape(f.name) << "\""
                << ",\"file\":\"" << jsonEscape(f.filename) << "\"";
            if (showLineNumbers_) {
                oss << ",\"line\":" << f.line;
            }
            oss << "}";
        }
        oss << "]}"
            << ",\"activeProfileIndex\":null"
            << ",\"exporter\":\"spymon@" << kVersion << "\""
            << ",\"name\":\"spymon profile\""
            << "}";
        return oss.str();
    }
}
