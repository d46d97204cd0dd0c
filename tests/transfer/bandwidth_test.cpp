#include "ferry/transfer/bandwidth.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using ferry::transfer::BandwidthController;
using Clock = std::chrono::steady_clock;

TEST(BandwidthController, UnlimitedNeverWaits) {
    BandwidthController bucket;
    const auto start = Clock::now();
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(bucket.acquire(64 * 1024).is_ok());
    }
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds{200});
    EXPECT_EQ(bucket.bytes_granted(), 100u * 64 * 1024);
    EXPECT_FALSE(bucket.limit().has_value());
}

TEST(BandwidthController, SustainedRateStaysUnderLimit) {
    constexpr std::uint64_t kLimit = 1024 * 1024;
    constexpr std::uint64_t kChunk = 64 * 1024;
    constexpr int kChunks = 24;
    BandwidthController bucket(kLimit, std::chrono::milliseconds{100});

    const auto start = Clock::now();
    for (int i = 0; i < kChunks; ++i) {
        ASSERT_TRUE(bucket.acquire(kChunk).is_ok());
    }
    const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();

    // Only the initial bucket (limit * 100ms) may go out without waiting.
    const double total = static_cast<double>(kChunk * kChunks);
    const double burst = static_cast<double>(kLimit) * 0.1;
    const double minimum = (total - burst) / static_cast<double>(kLimit);
    EXPECT_GE(elapsed, minimum * 0.95);
    EXPECT_LT(elapsed, minimum * 3.0);
}

TEST(BandwidthController, SharedAcrossThreads) {
    constexpr std::uint64_t kLimit = 512 * 1024;
    BandwidthController bucket(kLimit, std::chrono::milliseconds{100});

    const auto start = Clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bucket]() {
            for (int i = 0; i < 4; ++i) {
                EXPECT_TRUE(bucket.acquire(32 * 1024).is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();

    const double total = 16.0 * 32 * 1024;
    const double minimum = (total - static_cast<double>(kLimit) * 0.1) / static_cast<double>(kLimit);
    EXPECT_GE(elapsed, minimum * 0.95);
    EXPECT_EQ(bucket.bytes_granted(), 16u * 32 * 1024);
}

TEST(BandwidthController, InterruptWakesWaiter) {
    BandwidthController bucket(1000, std::chrono::milliseconds{100});
    // Leaves the bucket deep in debt.
    ASSERT_TRUE(bucket.acquire(100000).is_ok());

    std::thread interrupter([&bucket]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        bucket.interrupt();
    });
    auto result = bucket.acquire(100);
    interrupter.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ferry::ErrorKind::Cancelled);

    bucket.clear_interrupt();
    bucket.set_limit(std::nullopt);
    EXPECT_TRUE(bucket.acquire(10).is_ok());
}

TEST(BandwidthController, RaisingLimitReleasesWaiter) {
    BandwidthController bucket(100, std::chrono::milliseconds{100});
    ASSERT_TRUE(bucket.acquire(5000).is_ok());

    std::atomic<bool> done{false};
    std::thread waiter([&]() {
        EXPECT_TRUE(bucket.acquire(10).is_ok());
        done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    EXPECT_FALSE(done.load());

    bucket.set_limit(std::nullopt);
    waiter.join();
    EXPECT_TRUE(done.load());
}
