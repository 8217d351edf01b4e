#include <gtest/gtest.h>
#include "common/test_utils.hpp"
#include "spymon/backends/procfs/proc_sample_source.hpp"
#include "spymon/core/common.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace spymon;
using spymon::procfs::ProcSampleSource;

// Builds a miniature /proc tree so parsing can be checked without
// depending on what the host happens to be running.
class FakeProcTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("spymon_proc_") + info->name());
        fs::remove_all(root);
        fs::create_directories(root);
        config.sampleRate = 1000;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static void write(const fs::path& p, const std::string& content) {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
    }

    void addProcess(int pid, int ppid, const std::string& cmdline) {
        const fs::path dir = root / std::to_string(pid);
        write(dir / "stat", std::to_string(pid) + " (python3) S " + std::to_string(ppid) + " 1 1 0");
        write(dir / "cmdline", cmdline);
    }

    void addThread(int pid, int tid, const std::string& comm, char state, const std::string& wchan) {
        const fs::path dir = root / std::to_string(pid) / "task" / std::to_string(tid);
        write(dir / "stat", std::to_string(tid) + " (" + comm + ") " + state + " 1 1 1 0");
        write(dir / "wchan", wchan);
    }

    fs::path root;
    Config config;
};

TEST_F(FakeProcTest, MissingProcessIsAttachFailure) {
    EXPECT_SPYMON_ERROR(ProcSampleSource(31337, config, root.string()), ErrorCode::AttachFailure);
}

TEST_F(FakeProcTest, ThreadsBecomeTraces) {
    addProcess(100, 1, std::string("python3\0app.py\0", 15));
    addThread(100, 100, "python3", 'R', "0");
    addThread(100, 101, "worker (io)", 'S', "do_epoll_wait");

    ProcSampleSource source(100, config, root.string());
    auto sample = source.next();

    ASSERT_TRUE(sample.has_value());
    ASSERT_EQ(sample->traces.size(), 2u);
    EXPECT_FALSE(sample->samplingErrors.has_value());

    const StackTrace* running = nullptr;
    const StackTrace* sleeping = nullptr;
    for (const auto& t : sample->traces) {
        if (t.threadId == 100) running = &t;
        if (t.threadId == 101) sleeping = &t;
    }
    ASSERT_NE(running, nullptr);
    ASSERT_NE(sleeping, nullptr);

    EXPECT_TRUE(running->active);
    EXPECT_FALSE(running->ownsGil);
    EXPECT_EQ(running->pid, 100);
    ASSERT_EQ(running->frames.size(), 2u);
    EXPECT_EQ(running->frames[0].name, "[running]");
    EXPECT_EQ(running->frames[0].filename, "[kernel]");
    EXPECT_EQ(running->frames[1].name, "python3");
    EXPECT_EQ(running->processInfo, nullptr);

    EXPECT_FALSE(sleeping->active);
    EXPECT_EQ(sleeping->threadName, std::optional<std::string>("worker (io)"));
    EXPECT_EQ(sleeping->osThreadId, std::optional<uint64_t>(101));
    EXPECT_EQ(sleeping->frames[0].name, "do_epoll_wait");
}

TEST_F(FakeProcTest, SubprocessesCarryAncestry) {
    config.subprocesses = true;
    addProcess(100, 1, std::string("python3\0app.py\0", 15));
    addThread(100, 100, "python3", 'S', "");
    addProcess(200, 100, std::string("python3\0child.py\0", 17));
    addThread(200, 200, "python3", 'R', "0");
    addProcess(300, 200, std::string("sh\0", 3));
    addThread(300, 300, "sh", 'S', "pipe_read");

    ProcSampleSource source(100, config, root.string());
    auto sample = source.next();
    ASSERT_TRUE(sample.has_value());
    ASSERT_EQ(sample->traces.size(), 3u);

    for (const auto& t : sample->traces) {
        ASSERT_NE(t.processInfo, nullptr);
        EXPECT_EQ(t.processInfo->pid, t.pid);
    }

    const auto& grandchild = *std::find_if(sample->traces.begin(), sample->traces.end(),
                                           [](const StackTrace& t) { return t.pid == 300; });
    ASSERT_NE(grandchild.processInfo->parent, nullptr);
    EXPECT_EQ(grandchild.processInfo->commandLine, "sh");
    EXPECT_EQ(grandchild.processInfo->parent->pid, 200);
    EXPECT_EQ(grandchild.processInfo->parent->commandLine, "python3 child.py");
    ASSERT_NE(grandchild.processInfo->parent->parent, nullptr);
    EXPECT_EQ(grandchild.processInfo->parent->parent->pid, 100);
    EXPECT_EQ(grandchild.processInfo->parent->parent->parent, nullptr);
}

TEST_F(FakeProcTest, UnreadableChildIsSamplingError) {
    config.subprocesses = true;
    addProcess(100, 1, "python3");
    addThread(100, 100, "python3", 'R', "0");
    addProcess(200, 100, "broken");  // no task directory

    ProcSampleSource source(100, config, root.string());
    auto sample = source.next();

    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->traces.size(), 1u);
    ASSERT_TRUE(sample->samplingErrors.has_value());
    ASSERT_EQ(sample->samplingErrors->size(), 1u);
    EXPECT_EQ(sample->samplingErrors->front().first, 200);
}

TEST_F(FakeProcTest, ExitedTargetEndsTheStream) {
    addProcess(100, 1, "python3");
    addThread(100, 100, "python3", 'R', "0");

    ProcSampleSource source(100, config, root.string());
    ASSERT_TRUE(source.next().has_value());

    fs::remove_all(root / "100");
    EXPECT_FALSE(source.next().has_value());
}

TEST(ProcSampleSourceTest, SamplesOwnProcess) {
    Config config;
    config.sampleRate = 1000;
    const int self = detail::getPid();

    ProcSampleSource source(self, config);
    auto sample = source.next();

    ASSERT_TRUE(sample.has_value());
    ASSERT_FALSE(sample->traces.empty());
    bool sawSelf = false;
    for (const auto& t : sample->traces) {
        EXPECT_EQ(t.pid, self);
        EXPECT_EQ(t.frames.size(), 2u);
        EXPECT_TRUE(t.threadName.has_value());
        // The reading thread is on-CPU while it reads its own stat.
        if (t.threadId == static_cast<uint64_t>(self)) {
            sawSelf = true;
            EXPECT_TRUE(t.active);
        }
    }
    EXPECT_TRUE(sawSelf);
}

TEST(ProcSampleSourceTest, FactoryRejectsMissingProcess) {
    Config config;
    EXPECT_SPYMON_ERROR(createSampleSource(0x3ffffff0, config), ErrorCode::AttachFailure);
}
