#include <gtest/gtest.h>
#include "threat_guard/throttle/lockout_tracker.hpp"
#include "threat_guard/throttle/rate_limiter.hpp"
#include "threat_guard/throttle/sweeper.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace threat_guard;
using namespace std::chrono_literals;
using throttle::Sweeper;

TEST(SweeperTest, RunAllSumsTaskResults) {
    Sweeper sweeper;
    EXPECT_TRUE(sweeper.addTask("a", 1000ms, [] { return size_t{2}; }));
    EXPECT_TRUE(sweeper.addTask("b", 1000ms, [] { return size_t{3}; }));

    EXPECT_EQ(sweeper.runAll(), 5u);
}

TEST(SweeperTest, RejectsInvalidTasks) {
    Sweeper sweeper;
    EXPECT_FALSE(sweeper.addTask("null", 1000ms, nullptr));
    EXPECT_FALSE(sweeper.addTask("zero", 0ms, [] { return size_t{0}; }));
    EXPECT_EQ(sweeper.runAll(), 0u);
}

TEST(SweeperTest, FailingTaskDoesNotStopOthers) {
    Sweeper sweeper;
    sweeper.addTask("boom", 1000ms, []() -> size_t { throw std::runtime_error("store unavailable"); });
    sweeper.addTask("ok", 1000ms, [] { return size_t{1}; });

    EXPECT_EQ(sweeper.runAll(), 1u);
}

TEST(SweeperTest, RunsTasksPeriodicallyInBackground) {
    Sweeper sweeper;
    std::atomic<int> runs{0};
    sweeper.addTask("tick", 10ms, [&runs] {
        runs++;
        return size_t{0};
    });

    ASSERT_TRUE(sweeper.start());
    EXPECT_TRUE(sweeper.isRunning());
    EXPECT_FALSE(sweeper.addTask("late", 10ms, [] { return size_t{0}; }));

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    sweeper.stop();

    EXPECT_GE(runs.load(), 3);
    EXPECT_FALSE(sweeper.isRunning());
}

TEST(SweeperTest, StopWakesLongWait) {
    Sweeper sweeper;
    sweeper.addTask("hourly", std::chrono::milliseconds(60 * 60 * 1000), [] { return size_t{0}; });
    ASSERT_TRUE(sweeper.start());

    auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 2s);
    sweeper.stop();
}

TEST(SweeperTest, SweepsLimiterAndLockoutState) {
    test_util::ManualClock clock;
    throttle::SlidingWindowRateLimiter limiter(nullptr, clock.source());
    throttle::AccountLockoutTracker tracker(common::LockoutConfig{}, nullptr, clock.source());

    limiter.check("anon:1.1.1.1:/api/items", 10, 1000);
    tracker.recordFailure("user@example.com");

    Sweeper sweeper;
    sweeper.addTask("rate_limit", 1000ms, [&limiter] { return limiter.cleanupExpired(); });
    sweeper.addTask("lockout", 1000ms, [&tracker] { return tracker.cleanupExpired(); });

    EXPECT_EQ(sweeper.runAll(), 0u);

    clock.advanceMinutes(120);
    EXPECT_EQ(sweeper.runAll(), 2u);
    EXPECT_EQ(limiter.stats().total_keys, 0u);
    EXPECT_EQ(tracker.stats().total_with_attempts, 0u);
}
