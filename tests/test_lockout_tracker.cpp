#include <gtest/gtest.h>
#include "threat_guard/throttle/lockout_tracker.hpp"
#include "test_support.hpp"

using namespace threat_guard;
using throttle::AccountLockoutTracker;

namespace {

common::LockoutConfig quickConfig() {
    common::LockoutConfig config;
    config.max_attempts = 3;
    config.base_lockout_minutes = 1;
    config.progressive_multiplier = 2;
    config.max_lockout_minutes = 24 * 60;
    config.attempt_window_minutes = 60;
    return config;
}

}

class LockoutTrackerTest : public ::testing::Test {
protected:
    test_util::ManualClock clock;
    std::shared_ptr<throttle::ShardedKeyedStore<throttle::LockoutRecord>> store =
        std::make_shared<throttle::ShardedKeyedStore<throttle::LockoutRecord>>(4);
    AccountLockoutTracker tracker{quickConfig(), store, clock.source()};

    void failTimes(const std::string& id, int times) {
        for (int i = 0; i < times; ++i) tracker.recordFailure(id);
    }
};

TEST_F(LockoutTrackerTest, LocksAtThreshold) {
    auto first = tracker.recordFailure("alice");
    EXPECT_FALSE(first.should_lock);
    EXPECT_EQ(first.attempts, 1);
    EXPECT_FALSE(first.lockout_duration_minutes.has_value());

    EXPECT_FALSE(tracker.recordFailure("alice").should_lock);

    auto third = tracker.recordFailure("alice");
    EXPECT_TRUE(third.should_lock);
    EXPECT_EQ(third.attempts, 3);
    ASSERT_TRUE(third.lockout_duration_minutes.has_value());
    EXPECT_EQ(*third.lockout_duration_minutes, 1);

    auto status = tracker.isLockedOut("alice");
    EXPECT_TRUE(status.locked);
    ASSERT_TRUE(status.remaining_minutes.has_value());
    EXPECT_EQ(*status.remaining_minutes, 1);
    EXPECT_EQ(status.attempts, 3);
}

TEST_F(LockoutTrackerTest, FailuresWhileLockedDoNotCount) {
    failTimes("alice", 3);
    clock.advance(30 * 1000);

    auto outcome = tracker.recordFailure("alice");
    EXPECT_TRUE(outcome.should_lock);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(outcome.lockout_duration_minutes, 1);
    EXPECT_EQ(store->get("alice")->lockout_level, 1);
}

TEST_F(LockoutTrackerTest, LockIncludesItsEndInstant) {
    failTimes("alice", 3);

    clock.advanceMinutes(1);
    EXPECT_TRUE(tracker.isLockedOut("alice").locked);

    clock.advance(1);
    EXPECT_FALSE(tracker.isLockedOut("alice").locked);
}

TEST_F(LockoutTrackerTest, SecondLockoutDoubles) {
    failTimes("alice", 3);
    clock.advance(61 * 1000);

    auto status = tracker.isLockedOut("alice");
    EXPECT_FALSE(status.locked);
    EXPECT_EQ(status.attempts, 3);

    auto restarted = tracker.recordFailure("alice");
    EXPECT_FALSE(restarted.should_lock);
    EXPECT_EQ(restarted.attempts, 1);

    tracker.recordFailure("alice");
    auto relocked = tracker.recordFailure("alice");
    EXPECT_TRUE(relocked.should_lock);
    EXPECT_EQ(relocked.lockout_duration_minutes, 2);
}

TEST_F(LockoutTrackerTest, ExpiredLockRestartsCountWithoutStatusCheck) {
    failTimes("bob", 3);
    clock.advanceMinutes(2);

    auto outcome = tracker.recordFailure("bob");
    EXPECT_FALSE(outcome.should_lock);
    EXPECT_EQ(outcome.attempts, 1);
}

TEST_F(LockoutTrackerTest, LevelSurvivesStaleAttemptWindow) {
    failTimes("carol", 3);
    clock.advanceMinutes(2);
    failTimes("carol", 2);
    auto second = tracker.recordFailure("carol");
    EXPECT_EQ(second.lockout_duration_minutes, 2);

    clock.advanceMinutes(180);
    failTimes("carol", 2);
    auto third = tracker.recordFailure("carol");
    EXPECT_EQ(third.lockout_duration_minutes, 4);
}

TEST_F(LockoutTrackerTest, StaleAttemptsAreForgotten) {
    failTimes("dave", 2);
    clock.advanceMinutes(61);

    auto outcome = tracker.recordFailure("dave");
    EXPECT_FALSE(outcome.should_lock);
    EXPECT_EQ(outcome.attempts, 1);
}

TEST_F(LockoutTrackerTest, DurationIsCapped) {
    auto config = quickConfig();
    config.max_attempts = 1;
    config.max_lockout_minutes = 5;

    std::vector<int64_t> durations;
    for (int round = 0; round < 5; ++round) {
        auto outcome = tracker.recordFailure("erin", config);
        ASSERT_TRUE(outcome.lockout_duration_minutes.has_value());
        durations.push_back(*outcome.lockout_duration_minutes);
        clock.advanceMinutes(*outcome.lockout_duration_minutes + 1);
    }
    EXPECT_EQ(durations, (std::vector<int64_t>{1, 2, 4, 5, 5}));
}

TEST_F(LockoutTrackerTest, SuccessClearsRecord) {
    failTimes("frank", 3);
    tracker.recordSuccess("frank");

    auto status = tracker.isLockedOut("frank");
    EXPECT_FALSE(status.locked);
    EXPECT_FALSE(status.attempts.has_value());

    auto outcome = tracker.recordFailure("frank");
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(store->get("frank")->lockout_level, 0);
}

TEST_F(LockoutTrackerTest, StatusCheckDoesNotCreateRecords) {
    auto status = tracker.isLockedOut("nobody");
    EXPECT_FALSE(status.locked);
    EXPECT_FALSE(status.remaining_minutes.has_value());
    EXPECT_FALSE(status.attempts.has_value());
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(LockoutTrackerTest, IdentifiersAreIndependent) {
    failTimes("x", 3);
    EXPECT_TRUE(tracker.isLockedOut("x").locked);
    EXPECT_FALSE(tracker.isLockedOut("y").locked);
}

TEST_F(LockoutTrackerTest, CleanupAndStats) {
    failTimes("locked", 3);
    failTimes("active", 1);
    clock.advanceMinutes(30);
    failTimes("recent", 2);

    auto stats = tracker.stats();
    EXPECT_EQ(stats.total_locked, 0u);
    EXPECT_EQ(stats.total_with_attempts, 3u);
    EXPECT_NEAR(stats.average_attempts, 2.0, 1e-9);

    clock.advanceMinutes(31);
    EXPECT_EQ(tracker.cleanupExpired(), 2u);
    EXPECT_FALSE(store->get("locked").has_value());
    EXPECT_FALSE(store->get("active").has_value());
    EXPECT_TRUE(store->get("recent").has_value());

    tracker.clear();
    EXPECT_EQ(store->size(), 0u);
}

TEST(ProgressiveDelayTest, FollowsDelayTable) {
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(-1), 0);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(0), 0);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(1), 0);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(2), 1000);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(3), 5000);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(4), 15000);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(5), 60000);
    EXPECT_EQ(AccountLockoutTracker::progressiveDelay(50), 60000);
}
