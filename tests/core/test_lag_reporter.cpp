#include <gtest/gtest.h>
#include "spymon/core/lag_reporter.hpp"

using namespace spymon;
using namespace std::chrono_literals;

class LagReporterTest : public ::testing::Test {
protected:
    LagReporter make() {
        return LagReporter(1s, 1s, [this] { return now; });
    }

    LagReporter::Clock::time_point now{};
};

TEST_F(LagReporterTest, FirstLateSampleIsReported) {
    auto r = make();
    EXPECT_TRUE(r.shouldReport(1500ms));
}

TEST_F(LagReporterTest, ThresholdIsExclusive) {
    auto r = make();
    EXPECT_FALSE(r.shouldReport(1s));
    EXPECT_FALSE(r.shouldReport(0ms));
    EXPECT_TRUE(r.shouldReport(1001ms));
}

TEST_F(LagReporterTest, AtMostOncePerWindow) {
    auto r = make();
    EXPECT_TRUE(r.shouldReport(2s));
    now += 200ms;
    EXPECT_FALSE(r.shouldReport(2s));
    now += 700ms;
    EXPECT_FALSE(r.shouldReport(2s));
    now += 100ms;
    EXPECT_TRUE(r.shouldReport(2s));
}

TEST_F(LagReporterTest, SuppressedLagDoesNotMoveWindow) {
    auto r = make();
    EXPECT_TRUE(r.shouldReport(3s));
    now += 999ms;
    EXPECT_FALSE(r.shouldReport(3s));
    now += 1ms;
    EXPECT_TRUE(r.shouldReport(3s));
}

TEST(FormatDelayTest, Units) {
    EXPECT_EQ(formatDelay(1250ms), "1.25s");
    EXPECT_EQ(formatDelay(340ms), "340.00ms");
}
