#include <gtest/gtest.h>

#include "MotionExtrapolator.hpp"
#include "SnapshotStore.hpp"

namespace
{
    VehicleState moving(double progress, double speed, double length)
    {
        VehicleState v;
        v.id = "T1";
        v.edge = EdgeRef{"A", "B"};
        v.progress = progress;
        v.speedMetersPerSecond = speed;
        v.edgeLengthMeters = length;
        v.status = VehicleStatus::Running;
        return v;
    }
}

TEST(MotionExtrapolatorTest, AdvancesBySpeedOverLength)
{
    EXPECT_NEAR(MotionExtrapolator::extrapolateProgress(moving(0.2, 10.0, 100.0), 2.0), 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(MotionExtrapolator::extrapolateProgress(moving(0.9, 10.0, 100.0), 60.0), 1.0);
}

TEST(MotionExtrapolatorTest, UnknownLengthCountsAsOneMetre)
{
    EXPECT_NEAR(MotionExtrapolator::extrapolateProgress(moving(0.0, 0.25, 0.0), 2.0), 0.5, 1e-12);
    EXPECT_NEAR(MotionExtrapolator::extrapolateProgress(moving(0.0, 0.25, -5.0), 2.0), 0.5, 1e-12);
}

TEST(MotionExtrapolatorTest, NeverMovesBackwards)
{
    EXPECT_DOUBLE_EQ(MotionExtrapolator::extrapolateProgress(moving(0.5, -20.0, 100.0), 3.0), 0.5);
    EXPECT_DOUBLE_EQ(MotionExtrapolator::extrapolateProgress(moving(0.5, 20.0, 100.0), -3.0), 0.5);
}

TEST(MotionExtrapolatorTest, EmptyStoreGivesEmptyDisplay)
{
    SnapshotStore store;
    MotionExtrapolator motion(store);
    EXPECT_TRUE(motion.tick(std::chrono::steady_clock::now()).empty());
    EXPECT_EQ(motion.displayedSequence(), 0u);
}

TEST(MotionExtrapolatorTest, PlayingProgressIsMonotonicAndClamped)
{
    SnapshotStore store;
    auto t0 = std::chrono::steady_clock::now();
    store.replace({moving(0.1, 30.0, 300.0)}, t0);

    MotionExtrapolator motion(store);
    double last = 0.0;
    for (int ms = 0; ms <= 12000; ms += 500)
    {
        auto const& display = motion.tick(t0 + std::chrono::milliseconds(ms));
        ASSERT_EQ(display.size(), 1u);
        EXPECT_GE(display[0].progress, last);
        EXPECT_LE(display[0].progress, 1.0);
        last = display[0].progress;
    }
    EXPECT_DOUBLE_EQ(last, 1.0);

    // The stored snapshot is untouched.
    EXPECT_DOUBLE_EQ(store.current().vehicles[0].progress, 0.1);
}

TEST(MotionExtrapolatorTest, PausedShowsSnapshotUnchanged)
{
    SnapshotStore store;
    auto t0 = std::chrono::steady_clock::now();
    store.replace({moving(0.1, 30.0, 300.0)}, t0);

    MotionExtrapolator motion(store);
    motion.tick(t0 + std::chrono::seconds(2));
    motion.setPlaying(false);

    auto const& first = motion.tick(t0 + std::chrono::seconds(5));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_DOUBLE_EQ(first[0].progress, 0.1);

    auto const& second = motion.tick(t0 + std::chrono::seconds(9));
    EXPECT_EQ(&first, &second);
    EXPECT_DOUBLE_EQ(second[0].progress, 0.1);
    EXPECT_EQ(motion.displayedSequence(), 1u);

    // A new snapshot while paused is shown as received.
    store.replace({moving(0.6, 30.0, 300.0)}, t0 + std::chrono::seconds(10));
    EXPECT_DOUBLE_EQ(motion.tick(t0 + std::chrono::seconds(11))[0].progress, 0.6);
    EXPECT_EQ(motion.displayedSequence(), 2u);
}
