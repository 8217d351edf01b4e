#pragma once
#include "spymon/core/sample_source.hpp"
#include "spymon/core/stack_trace.hpp"
#include "spymon/core/timer.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spymon::procfs {

    /**
     * @brief Samples thread state of a live process through procfs.
     *
     * Each thread yields a two-frame trace: the kernel wait channel (or
     * "[running]") innermost, the process executable outermost. Thread
     * liveness comes from the task state; GIL ownership cannot be seen from
     * procfs and is always reported false.
     *
     * With Config::subprocesses every descendant of the target is sampled
     * too and its traces carry the ProcessInfo chain back to the target.
     */
    class ProcSampleSource : public ISampleSource {
    public:
        ProcSampleSource(int pid, const Config& config, std::string procRoot = "/proc");
        ~ProcSampleSource() override = default;

        std::optional<Sample> next() override;

        static bool isAvailable(int pid, std::string* reason = nullptr, const std::string& procRoot = "/proc");

    private:
        struct TaskStat {
            std::string comm;
            char state = '?';
            int ppid = 0;
        };

        std::vector<StackTrace> sampleProcess_(int pid, const std::shared_ptr<const ProcessInfo>& info) const;
        std::map<int, std::vector<int>> childrenByParent_() const;
        std::shared_ptr<const ProcessInfo> processInfo_(int pid, std::shared_ptr<const ProcessInfo> parent) const;
        std::string processPath_(int pid) const;

        static std::optional<std::string> readFile_(const std::string& path);
        static std::optional<TaskStat> parseStat_(const std::string& content);

        int pid_;
        Config config_;
        std::string root_;
        Timer timer_;
    };
}
