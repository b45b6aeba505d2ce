// tests/test_remotehealthtracker.cpp
#include <chrono>

#include "gtest/gtest.h"

#include "../src/cache/RemoteHealthTracker.hpp"

using std::chrono::milliseconds;

TEST(RemoteHealthTrackerTest, StartsHealthy) {
    RemoteHealthTracker tracker(3, 2);
    EXPECT_EQ(tracker.state(), RemoteHealthState::Healthy);
    EXPECT_FALSE(tracker.recordSuccess().has_value());
}

TEST(RemoteHealthTrackerTest, SingleTransientFailureDoesNotFlap) {
    RemoteHealthTracker tracker(3, 2);
    EXPECT_FALSE(tracker.recordFailure().has_value());
    EXPECT_EQ(tracker.state(), RemoteHealthState::Healthy);
    EXPECT_EQ(tracker.consecutiveFailures(), 1);
    EXPECT_FALSE(tracker.recordSuccess().has_value());
    EXPECT_FALSE(tracker.recordFailure().has_value());
    EXPECT_EQ(tracker.state(), RemoteHealthState::Healthy);
}

TEST(RemoteHealthTrackerTest, DegradesAfterDegradeThreshold) {
    RemoteHealthTracker tracker(3, 2);
    tracker.recordFailure();
    auto transition = tracker.recordFailure();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->from, RemoteHealthState::Healthy);
    EXPECT_EQ(transition->to, RemoteHealthState::Degraded);
    EXPECT_EQ(tracker.consecutiveFailures(), 2);
}

TEST(RemoteHealthTrackerTest, DegradeThresholdOfOneDegradesImmediately) {
    RemoteHealthTracker tracker(3, 2, 1);
    auto transition = tracker.recordFailure();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->to, RemoteHealthState::Degraded);
}

TEST(RemoteHealthTrackerTest, ConsecutiveFailuresReachUnreachable) {
    RemoteHealthTracker tracker(3, 2);
    EXPECT_FALSE(tracker.recordFailure().has_value());
    EXPECT_TRUE(tracker.recordFailure().has_value());
    auto transition = tracker.recordFailure();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->to, RemoteHealthState::Unreachable);
}

TEST(RemoteHealthTrackerTest, SuccessResetsFailureStreak) {
    RemoteHealthTracker tracker(3, 2);
    tracker.recordFailure();
    tracker.recordFailure();
    tracker.recordSuccess();
    tracker.recordFailure();
    EXPECT_EQ(tracker.state(), RemoteHealthState::Degraded);
    EXPECT_EQ(tracker.consecutiveFailures(), 1);
}

TEST(RemoteHealthTrackerTest, DegradedRecoversAfterSuccessThreshold) {
    RemoteHealthTracker tracker(3, 2);
    tracker.recordFailure();
    tracker.recordFailure();
    EXPECT_FALSE(tracker.recordSuccess().has_value());
    auto transition = tracker.recordSuccess();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->from, RemoteHealthState::Degraded);
    EXPECT_EQ(transition->to, RemoteHealthState::Healthy);
}

TEST(RemoteHealthTrackerTest, UnreachableOnlyLeftByReconnect) {
    RemoteHealthTracker tracker(1, 1);
    tracker.recordFailure();
    EXPECT_EQ(tracker.state(), RemoteHealthState::Unreachable);

    EXPECT_FALSE(tracker.recordSuccess().has_value());
    EXPECT_EQ(tracker.state(), RemoteHealthState::Unreachable);

    auto transition = tracker.markReconnected();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->to, RemoteHealthState::Degraded);
    tracker.recordSuccess();
    EXPECT_EQ(tracker.state(), RemoteHealthState::Healthy);
}

TEST(RemoteHealthTrackerTest, MarkUnreachableFromHealthy) {
    RemoteHealthTracker tracker(3, 2);
    auto transition = tracker.markUnreachable();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->from, RemoteHealthState::Healthy);
    EXPECT_EQ(tracker.consecutiveFailures(), 3);
    EXPECT_FALSE(tracker.markUnreachable().has_value());
}

TEST(RemoteHealthTrackerTest, RejectsNonPositiveThresholds) {
    EXPECT_THROW(RemoteHealthTracker(0, 1), std::invalid_argument);
    EXPECT_THROW(RemoteHealthTracker(1, 0), std::invalid_argument);
    EXPECT_THROW(RemoteHealthTracker(1, 1, 0), std::invalid_argument);
}

TEST(ReconnectBackoffTest, DelayGrowsGeometricallyUpToTheCap) {
    ReconnectBackoff backoff(milliseconds(100), 2.0, milliseconds(1000), 10);
    EXPECT_EQ(backoff.delayFor(1), milliseconds(100));
    EXPECT_EQ(backoff.delayFor(2), milliseconds(200));
    EXPECT_EQ(backoff.delayFor(3), milliseconds(400));
    EXPECT_EQ(backoff.delayFor(4), milliseconds(800));
    EXPECT_EQ(backoff.delayFor(5), milliseconds(1000));
    EXPECT_EQ(backoff.delayFor(50), milliseconds(1000));
}

TEST(ReconnectBackoffTest, ExhaustionReportedOnceThenRetriesAtCap) {
    ReconnectBackoff backoff(milliseconds(10), 3.0, milliseconds(50), 2);
    EXPECT_EQ(backoff.nextDelay(), milliseconds(10));
    EXPECT_FALSE(backoff.consumeExhausted());
    EXPECT_EQ(backoff.nextDelay(), milliseconds(30));
    EXPECT_FALSE(backoff.consumeExhausted());

    EXPECT_EQ(backoff.nextDelay(), milliseconds(50));
    EXPECT_TRUE(backoff.exhausted());
    EXPECT_TRUE(backoff.consumeExhausted());
    EXPECT_EQ(backoff.nextDelay(), milliseconds(50));
    EXPECT_FALSE(backoff.consumeExhausted());

    backoff.reset();
    EXPECT_EQ(backoff.attempts(), 0);
    EXPECT_FALSE(backoff.exhausted());
    EXPECT_EQ(backoff.nextDelay(), milliseconds(10));
}

TEST(ReconnectBackoffTest, RejectsInvalidSettings) {
    EXPECT_THROW(ReconnectBackoff(milliseconds(0), 2.0, milliseconds(10), 1), std::invalid_argument);
    EXPECT_THROW(ReconnectBackoff(milliseconds(100), 2.0, milliseconds(10), 1), std::invalid_argument);
    EXPECT_THROW(ReconnectBackoff(milliseconds(10), 0.5, milliseconds(100), 1), std::invalid_argument);
    EXPECT_THROW(ReconnectBackoff(milliseconds(10), 2.0, milliseconds(100), 0), std::invalid_argument);
}
