#include "spymon/backends/procfs/proc_sample_source.hpp"
#include "spymon/core/debug_logger.hpp"
#include "spymon/core/errors.hpp"

#include <cctype>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace spymon::procfs {
    namespace fs = std::filesystem;

    namespace {
        bool isNumeric(const std::string& s) {
            if (s.empty()) return false;
            for (char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        std::string trim(std::string s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
            return s;
        }

        std::string baseName(const std::string& path) {
            const auto pos = path.find_last_of('/');
            return pos == std::string::npos ? path : path.substr(pos + 1);
        }

        const char* stateName(char state) {
            switch (state) {
                case 'S': return "[sleeping]";
                case 'D': return "[disk sleep]";
                case 'T': return "[stopped]";
                case 't': return "[tracing stop]";
                case 'Z': return "[zombie]";
                case 'I': return "[idle]";
                default: return "[unknown]";
            }
        }
    }

    ProcSampleSource::ProcSampleSource(const int pid, const Config& config, std::string procRoot)
        : pid_(pid),
          config_(config),
          root_(std::move(procRoot)),
          timer_(static_cast<double>(config.sampleRate)) {
        std::string reason;
        if (!isAvailable(pid_, &reason, root_)) {
            throw Error(ErrorCode::AttachFailure,
                        "Failed to attach to process " + std::to_string(pid_) + ": " + reason);
        }
        SPYMON_LOG_DEBUG("Attached to ", pid_, " (", processPath_(pid_), ")");
    }

    bool ProcSampleSource::isAvailable(const int pid, std::string* reason, const std::string& procRoot) {
        const fs::path dir = fs::path(procRoot) / std::to_string(pid);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            if (reason) *reason = "no such process";
            return false;
        }
        if (!readFile_((dir / "stat").string())) {
            if (reason) *reason = "cannot read " + (dir / "stat").string();
            return false;
        }
        if (!fs::is_directory(dir / "task", ec)) {
            if (reason) *reason = "cannot list threads";
            return false;
        }
        return true;
    }

    std::optional<std::string> ProcSampleSource::readFile_(const std::string& path) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) return std::nullopt;
        std::ostringstream oss;
        oss << in.rdbuf();
        if (in.bad()) return std::nullopt;
        return oss.str();
    }

    std::optional<ProcSampleSource::TaskStat> ProcSampleSource::parseStat_(const std::string& content) {
        // "<tid> (<comm>) <state> <ppid> ..." where comm may hold spaces and parens
        const auto open = content.find('(');
        const auto close = content.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            return std::nullopt;
        }
        TaskStat st;
        st.comm = content.substr(open + 1, close - open - 1);

        std::istringstream rest(content.substr(close + 1));
        if (!(rest >> st.state >> st.ppid)) return std::nullopt;
        return st;
    }

    std::string ProcSampleSource::processPath_(const int pid) const {
        std::error_code ec;
        const auto exe = fs::read_symlink(fs::path(root_) / std::to_string(pid) / "exe", ec);
        if (!ec) return exe.string();
        if (auto stat = readFile_(root_ + "/" + std::to_string(pid) + "/stat")) {
            if (auto parsed = parseStat_(*stat)) return parsed->comm;
        }
        return "[unknown]";
    }

    std::shared_ptr<const ProcessInfo> ProcSampleSource::processInfo_(
        const int pid, std::shared_ptr<const ProcessInfo> parent) const {
        auto info = std::make_shared<ProcessInfo>();
        info->pid = pid;
        if (auto cmdline = readFile_(root_ + "/" + std::to_string(pid) + "/cmdline")) {
            for (char& c : *cmdline) {
                if (c == '\0') c = ' ';
            }
            info->commandLine = trim(*cmdline);
        }
        if (info->commandLine.empty()) {
            info->commandLine = processPath_(pid);
        }
        info->parent = std::move(parent);
        return info;
    }

    std::vector<StackTrace> ProcSampleSource::sampleProcess_(
        const int pid, const std::shared_ptr<const ProcessInfo>& info) const {
        const fs::path procDir = fs::path(root_) / std::to_string(pid);
        const std::string exe = processPath_(pid);

        std::error_code ec;
        fs::directory_iterator it(procDir / "task", ec);
        if (ec) {
            throw Error(ErrorCode::SamplingError, "cannot list threads: " + ec.message());
        }

        std::vector<StackTrace> traces;
        for (const auto& entry : it) {
            const std::string tidStr = entry.path().filename().string();
            if (!isNumeric(tidStr)) continue;

            // Threads may exit between listing and reading; skip them.
            auto statContent = readFile_((entry.path() / "stat").string());
            if (!statContent) continue;
            auto stat = parseStat_(*statContent);
            if (!stat) continue;

            StackTrace trace;
            trace.pid = pid;
            trace.threadId = std::stoull(tidStr);
            trace.osThreadId = trace.threadId;
            trace.threadName = stat->comm;
            trace.active = stat->state == 'R';
            trace.ownsGil = false;
            trace.processInfo = info;

            Frame kernel;
            if (trace.active) {
                kernel.name = "[running]";
            } else {
                auto wchan = readFile_((entry.path() / "wchan").string());
                const std::string channel = wchan ? trim(*wchan) : std::string();
                kernel.name = (channel.empty() || channel == "0") ? stateName(stat->state) : channel;
            }
            kernel.filename = "[kernel]";
            kernel.module = "kernel";
            kernel.shortFilename = "[kernel]";
            trace.frames.push_back(std::move(kernel));

            Frame program;
            program.name = stat->comm;
            program.filename = exe;
            program.module = baseName(exe);
            program.shortFilename = baseName(exe);
            trace.frames.push_back(std::move(program));

            traces.push_back(std::move(trace));
        }
        return traces;
    }

    std::map<int, std::vector<int>> ProcSampleSource::childrenByParent_() const {
        std::map<int, std::vector<int>> children;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(root_, ec)) {
            const std::string name = entry.path().filename().string();
            if (!isNumeric(name)) continue;
            auto content = readFile_((entry.path() / "stat").string());
            if (!content) continue;
            if (auto stat = parseStat_(*content)) {
                children[stat->ppid].push_back(std::stoi(name));
            }
        }
        return children;
    }

    std::optional<Sample> ProcSampleSource::next() {
        const auto late = timer_.wait();

        std::error_code ec;
        if (!fs::is_directory(fs::path(root_) / std::to_string(pid_), ec)) {
            SPYMON_LOG_DEBUG("Process ", pid_, " has exited");
            return std::nullopt;
        }

        Sample sample;
        if (late.count() > 0) {
            sample.late = late;
        }

        std::shared_ptr<const ProcessInfo> rootInfo;
        if (config_.subprocesses) {
            rootInfo = processInfo_(pid_, nullptr);
        }

        try {
            sample.traces = sampleProcess_(pid_, rootInfo);
        } catch (const std::exception& e) {
            // The target vanished between the liveness check and the read.
            SPYMON_LOG_DEBUG("Process ", pid_, " went away: ", e.what());
            return std::nullopt;
        }

        if (!config_.subprocesses) {
            return sample;
        }

        // Breadth-first over descendants so each child's parent info exists.
        const auto children = childrenByParent_();
        std::deque<std::shared_ptr<const ProcessInfo>> pending{rootInfo};
        std::vector<std::pair<int, std::string>> errors;
        while (!pending.empty()) {
            auto parent = pending.front();
            pending.pop_front();

            auto found = children.find(parent->pid);
            if (found == children.end()) continue;

            for (const int child : found->second) {
                auto info = processInfo_(child, parent);
                try {
                    auto traces = sampleProcess_(child, info);
                    for (auto& t : traces) sample.traces.push_back(std::move(t));
                } catch (const std::exception& e) {
                    errors.emplace_back(child, e.what());
                    continue;
                }
                pending.push_back(std::move(info));
            }
        }
        if (!errors.empty()) {
            sample.samplingErrors = std::move(errors);
        }
        return sample;
    }
}
