#include "ferry/transfer/progress.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using ferry::core::TimePoint;
using ferry::transfer::ProgressTracker;

namespace {

struct ManualClock {
    std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(std::chrono::system_clock::now());

    ferry::core::Clock clock() const {
        auto shared = now;
        return [shared] { return *shared; };
    }

    void advance(std::chrono::milliseconds by) const { *now += by; }
};

} // namespace

TEST(ProgressTracker, SpeedAndEta) {
    ManualClock clock;
    ProgressTracker tracker(1000000, 2, clock.clock());

    for (int i = 0; i < 5; ++i) {
        clock.advance(std::chrono::milliseconds{100});
        tracker.add_bytes(10000);
    }

    const auto progress = tracker.snapshot();
    EXPECT_EQ(progress.bytes_transferred, 50000u);
    EXPECT_DOUBLE_EQ(progress.current_speed, 100000.0);
    EXPECT_DOUBLE_EQ(progress.average_speed, 100000.0);
    ASSERT_TRUE(progress.eta_seconds.has_value());
    EXPECT_EQ(*progress.eta_seconds, 10u);
    EXPECT_DOUBLE_EQ(progress.percentage(), 5.0);
}

TEST(ProgressTracker, CurrentSpeedUsesRecentWindow) {
    ManualClock clock;
    ProgressTracker tracker(10000000, 1, clock.clock());

    // Slow start, then ten fast samples push the slow ones out of the window.
    for (int i = 0; i < 5; ++i) {
        clock.advance(std::chrono::milliseconds{1000});
        tracker.add_bytes(1000);
    }
    for (std::size_t i = 0; i < ProgressTracker::kSpeedSamples; ++i) {
        clock.advance(std::chrono::milliseconds{100});
        tracker.add_bytes(100000);
    }

    const auto progress = tracker.snapshot();
    EXPECT_NEAR(progress.current_speed, 1000000.0, 1.0);
    EXPECT_LT(progress.average_speed, progress.current_speed);
}

TEST(ProgressTracker, ClampsToTotals) {
    ManualClock clock;
    ProgressTracker tracker(100, 1, clock.clock());
    clock.advance(std::chrono::milliseconds{10});
    tracker.add_bytes(500);
    tracker.file_completed();
    tracker.file_completed();

    const auto progress = tracker.snapshot();
    EXPECT_EQ(progress.bytes_transferred, 100u);
    EXPECT_EQ(progress.files_completed, 1u);
    ASSERT_TRUE(progress.eta_seconds.has_value());
    EXPECT_EQ(*progress.eta_seconds, 0u);
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}

TEST(ProgressTracker, ResumedBytesDoNotCountAsSpeed) {
    ManualClock clock;
    ProgressTracker tracker(1000, 1, clock.clock());
    tracker.set_bytes(600);

    clock.advance(std::chrono::milliseconds{1000});
    tracker.add_bytes(100);

    const auto progress = tracker.snapshot();
    EXPECT_EQ(progress.bytes_transferred, 700u);
    EXPECT_DOUBLE_EQ(progress.average_speed, 100.0);
}

TEST(TransferProgress, EmptyTransferPercentage) {
    ferry::transfer::TransferProgress progress;
    progress.total_files = 1;
    EXPECT_DOUBLE_EQ(progress.percentage(), 0.0);
    progress.files_completed = 1;
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}
