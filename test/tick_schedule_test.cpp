#include "poller/TickSchedule.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using jpoll::TickSchedule;

namespace {
    const TickSchedule::clock::time_point t0{std::chrono::seconds(1000)};
}

TEST(TickScheduleTest, FirstTickIsImmediate) {
    TickSchedule s(500ms);
    EXPECT_EQ(s.start(t0), t0);
    EXPECT_EQ(s.skipped(), 0u);
}

TEST(TickScheduleTest, OnTimeCyclesFollowTheGrid) {
    TickSchedule s(500ms);
    s.start(t0);

    // Cycle finished well within the period.
    EXPECT_EQ(s.next(t0 + 120ms), t0 + 500ms);
    EXPECT_EQ(s.next(t0 + 610ms), t0 + 1000ms);
    EXPECT_EQ(s.skipped(), 0u);
}

TEST(TickScheduleTest, OverrunSkipsMissedTicksInsteadOfBursting) {
    TickSchedule s(50ms);
    s.start(t0);

    // Cycle took 200ms: grid points 50, 100, 150 and 200 are gone.
    EXPECT_EQ(s.next(t0 + 205ms), t0 + 250ms);
    EXPECT_EQ(s.skipped(), 4u);

    // Back on the grid afterwards.
    EXPECT_EQ(s.next(t0 + 260ms), t0 + 300ms);
    EXPECT_EQ(s.skipped(), 4u);
}

TEST(TickScheduleTest, SlightOverrunSkipsOneTick) {
    TickSchedule s(100ms);
    s.start(t0);
    EXPECT_EQ(s.next(t0 + 130ms), t0 + 200ms);
    EXPECT_EQ(s.skipped(), 1u);
}

TEST(TickScheduleTest, NextDeadlineIsNeverInThePast) {
    TickSchedule s(30ms);
    s.start(t0);
    auto now = t0;
    for (int i = 0; i < 50; ++i) {
        now += std::chrono::milliseconds(7 * i);
        const auto d = s.next(now);
        EXPECT_GE(d, now);
        EXPECT_EQ((d - t0) % 30ms, TickSchedule::clock::duration::zero());
    }
}

TEST(TickScheduleTest, ZeroPeriodTicksBackToBack) {
    TickSchedule s(0ms);
    s.start(t0);
    EXPECT_EQ(s.next(t0 + 3ms), t0 + 3ms);
    EXPECT_EQ(s.next(t0 + 9ms), t0 + 9ms);
    EXPECT_EQ(s.skipped(), 0u);
}

TEST(TickScheduleTest, RestartReanchorsTheGrid) {
    TickSchedule s(100ms);
    s.start(t0);
    s.next(t0 + 450ms);
    ASSERT_GT(s.skipped(), 0u);

    EXPECT_EQ(s.start(t0 + 1s), t0 + 1s);
    EXPECT_EQ(s.skipped(), 0u);
    EXPECT_EQ(s.next(t0 + 1s + 10ms), t0 + 1s + 100ms);
}
