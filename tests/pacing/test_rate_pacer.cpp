#include <gtest/gtest.h>
#include "pacing/rate_pacer.h"
#include "clock/manual_clock.h"
#include "clock/system_clock.h"
#include "core/errors.h"

#include <atomic>
#include <cmath>
#include <limits>
#include <vector>

namespace flowbench {
namespace test {

TEST(RatePacer, RejectsNonPositiveRate) {
    ManualClock clock;
    EXPECT_THROW(RatePacer(clock, 0.0), ConfigError);
    EXPECT_THROW(RatePacer(clock, -5.0), ConfigError);
    EXPECT_THROW(RatePacer(clock, std::numeric_limits<double>::infinity()), ConfigError);
}

TEST(RatePacer, IntervalMatchesChunkBitsOverRate) {
    ManualClock clock;
    RatePacer pacer(clock, 10e6);   // 10 Mbps
    // 1200 B = 9600 bits -> 960 us
    EXPECT_EQ(pacer.intervalNs(1200), 960000u);
}

TEST(RatePacer, FirstDeadlineIsStartThenEvenlySpaced) {
    ManualClock clock(1000000000ULL);
    RatePacer pacer(clock, 0.1e6);  // 0.1 Mbps, 1200 B -> 96 ms
    pacer.start(clock.nowNs());

    const uint64_t t0 = pacer.nextDeadline(1200);
    EXPECT_EQ(t0, 1000000000ULL);
    uint64_t prev = t0;
    for (int i = 1; i < 50; ++i) {
        const uint64_t d = pacer.nextDeadline(1200);
        EXPECT_EQ(d - prev, 96000000u) << "chunk " << i;
        prev = d;
    }
}

TEST(RatePacer, DeadlinesStrictlyIncreaseForTinyChunksAtHugeRate) {
    ManualClock clock;
    RatePacer pacer(clock, 1e12);   // 1 byte = 0.008 ns
    pacer.start(0);
    uint64_t prev = pacer.nextDeadline(1);
    for (int i = 0; i < 1000; ++i) {
        const uint64_t d = pacer.nextDeadline(1);
        EXPECT_GT(d, prev);
        prev = d;
    }
}

TEST(RatePacer, CumulativeScheduleDoesNotDrift) {
    ManualClock clock;
    RatePacer pacer(clock, 3e6);    // intervals that do not divide evenly
    pacer.start(0);

    uint64_t last = 0;
    for (int i = 0; i < 10001; ++i)
        last = pacer.nextDeadline(1000);
    // 10000 chunks of 8000 bits at 3 Mbps before the last one.
    const double expect = 10000.0 * 8000.0 / 3e6 * 1e9;
    EXPECT_LE(std::fabs(static_cast<double>(last) - expect), 1.0);
}

TEST(RatePacer, LateSendDoesNotShiftLaterDeadlines) {
    ManualClock clock;
    RatePacer pacer(clock, 8e6);    // 1000 B -> 1 ms
    pacer.start(0);

    PacedSlot s0 = pacer.waitForSlot(1000);
    EXPECT_EQ(s0.scheduled_ns, 0u);
    clock.advance(5000000);         // a send that took 5 ms

    PacedSlot s1 = pacer.waitForSlot(1000);
    EXPECT_EQ(s1.scheduled_ns, 1000000u);   // still on the original grid
    EXPECT_EQ(clock.nowNs(), 5000000u);     // no wait when already late

    PacedSlot s2 = pacer.waitForSlot(1000);
    EXPECT_EQ(s2.scheduled_ns, 2000000u);
}

TEST(RatePacer, WaitForSlotSleepsUntilDeadline) {
    ManualClock clock;
    RatePacer pacer(clock, 0.1e6);
    pacer.start(0);
    pacer.waitForSlot(1200);
    const PacedSlot s = pacer.waitForSlot(1200);
    EXPECT_FALSE(s.stopped);
    EXPECT_EQ(s.scheduled_ns, 96000000u);
    EXPECT_EQ(clock.nowNs(), 96000000u);
}

TEST(RatePacer, RealClockHoldsTheGrid) {
    SystemClock clock;
    RatePacer pacer(clock, 8e6);    // 1000 B -> 1 ms
    constexpr int kChunks = 200;

    std::vector<uint64_t> actual;
    actual.reserve(kChunks);
    pacer.start(clock.nowNs());
    for (int i = 0; i < kChunks; ++i) {
        const PacedSlot slot = pacer.waitForSlot(1000);
        ASSERT_FALSE(slot.stopped);
        actual.push_back(clock.nowNs());
        EXPECT_GE(actual.back(), slot.scheduled_ns) << "chunk " << i;
    }

    const double mean_gap =
        static_cast<double>(actual.back() - actual.front()) / (kChunks - 1);
    EXPECT_NEAR(mean_gap, 1e6, 0.1e6);
}

TEST(RatePacer, RaisedStopFlagEndsWait) {
    ManualClock clock;
    RatePacer pacer(clock, 0.1e6);
    pacer.start(0);
    pacer.waitForSlot(1200);

    std::atomic<bool> stop{true};
    const PacedSlot s = pacer.waitForSlot(1200, &stop);
    EXPECT_TRUE(s.stopped);
    EXPECT_LT(clock.nowNs(), s.scheduled_ns);
}

TEST(RatePacer, NextDeadlineBeforeStartThrows) {
    ManualClock clock;
    RatePacer pacer(clock, 1e6);
    EXPECT_THROW(pacer.nextDeadline(100), std::logic_error);
}

TEST(RatePacer, PolicyFollowsMode) {
    EXPECT_EQ(policyFor(TransportMode::DATAGRAM), PacingPolicy::UNBLOCKABLE);
    EXPECT_EQ(policyFor(TransportMode::STREAM), PacingPolicy::BACKPRESSURE_AWARE);
}

}  // namespace test
}  // namespace flowbench
