#pragma once
#include "spymon/core/aggregator.hpp"
#include "spymon/core/config.hpp"
#include "spymon/core/stack_trace.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spymon::speedscope {

    /**
     * @brief Aggregates traces into a speedscope "sampled" profile.
     *
     * Frames are interned in one table shared by every profile. Each
     * (pid, thread id) pair becomes its own profile whose samples are
     * root-first lists of frame indices, all weighted 1/sampleRate seconds.
     */
    class SpeedscopeAggregator : public ITraceAggregator {
    public:
        static constexpr std::size_t kDefaultMaxFrames = std::size_t{1} << 20;
        static constexpr const char* kSchemaUrl = "https://www.speedscope.app/file-format-schema.json";

        explicit SpeedscopeAggregator(const Config& config, std::size_t maxFrames = kDefaultMaxFrames);
        ~SpeedscopeAggregator() override = default;

        void increment(const StackTrace& trace) override;
        std::string serialize() override;

        std::size_t frameCount() const { return frames_.size(); }
        std::size_t sampleCount() const { return totalSamples_; }

    private:
        using ThreadKey = std::pair<int, uint64_t>;

        Frame normalise_(const Frame& frame) const;
        std::string profileName_(const ThreadKey& key) const;

        std::map<ThreadKey, std::vector<std::vector<std::size_t>>> samples_;
        std::map<ThreadKey, std::string> threadNames_;
        std::vector<Frame> frames_;
        std::unordered_map<Frame, std::size_t, FrameHash> frameIndex_;

        int sampleRate_;
        bool showLineNumbers_;
        std::size_t maxFrames_;
        std::size_t totalSamples_ = 0;
        bool serialized_ = false;
    };
}
