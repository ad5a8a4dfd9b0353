#include <gtest/gtest.h>
#include "coffer/transfer/throughput_monitor.hpp"

using namespace coffer::transfer;
using namespace std::chrono_literals;

class ThroughputMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        start_ = ThroughputMonitor::Clock::now();
        monitor_.start(start_);
    }

    ThroughputMonitor monitor_{2500ms};
    ThroughputMonitor::Clock::time_point start_;
};

TEST_F(ThroughputMonitorTest, NoTrafficIsZero) {
    EXPECT_EQ(monitor_.current_speed_bps(start_ + 1s), 0u);
    EXPECT_EQ(monitor_.total_bytes(), 0u);
}

TEST_F(ThroughputMonitorTest, SpeedOverShortTransfer) {
    monitor_.on_bytes_transferred(1'000'000, start_ + 500ms);
    monitor_.on_bytes_transferred(1'000'000, start_ + 1000ms);

    // Two megabytes in the first second
    EXPECT_EQ(monitor_.current_speed_bps(start_ + 1000ms), 2'000'000u);
    EXPECT_EQ(monitor_.average_speed_bps(start_ + 1000ms), 2'000'000u);
    EXPECT_EQ(monitor_.total_bytes(), 2'000'000u);
}

TEST_F(ThroughputMonitorTest, OldSamplesLeaveTheWindow) {
    monitor_.on_bytes_transferred(10'000'000, start_ + 100ms);
    monitor_.on_bytes_transferred(500'000, start_ + 4000ms);

    // Only the recent sample counts, spread over the whole window
    EXPECT_EQ(monitor_.current_speed_bps(start_ + 4000ms), 200'000u);
    EXPECT_EQ(monitor_.total_bytes(), 10'500'000u);
    EXPECT_EQ(monitor_.current_speed_bps(start_ + 10s), 0u);
}

TEST_F(ThroughputMonitorTest, RestartClearsHistory) {
    monitor_.on_bytes_transferred(1'000'000, start_ + 100ms);
    monitor_.start(start_ + 200ms);
    EXPECT_EQ(monitor_.total_bytes(), 0u);
    EXPECT_EQ(monitor_.current_speed_bps(start_ + 300ms), 0u);
}
