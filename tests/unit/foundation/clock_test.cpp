#include <gtest/gtest.h>

#include <limits>

#include "arc/foundation/clock.hpp"

using namespace arc::foundation;

TEST(ManualClockTest, StartsAtGivenTime) {
    ManualClock clock(fromMillis(1000));
    EXPECT_EQ(toMillis(clock.Now()), 1000);
}

TEST(ManualClockTest, AdvanceAndSet) {
    ManualClock clock;
    clock.Advance(Milliseconds(250));
    clock.Advance(Milliseconds(250));
    EXPECT_EQ(toMillis(clock.Now()), 500);

    clock.Set(fromMillis(42));
    EXPECT_EQ(toMillis(clock.Now()), 42);
}

TEST(ManualClockTest, UsableThroughInterface) {
    ManualClock manual(fromMillis(5));
    const IClock& clock = manual;
    manual.Advance(Milliseconds(5));
    EXPECT_EQ(toMillis(clock.Now()), 10);
}

TEST(SystemClockTest, IsMonotonic) {
    SystemClock clock;
    auto a = clock.Now();
    auto b = clock.Now();
    EXPECT_LE(a, b);
}

TEST(FrameDeltaTest, PassesThroughNormalFrames) {
    FrameDelta dt(0.016f);
    EXPECT_FLOAT_EQ(dt.Seconds(), 0.016f);
}

TEST(FrameDeltaTest, ClampsStalledFrame) {
    FrameDelta dt(2.5f);
    EXPECT_FLOAT_EQ(dt.Seconds(), FrameDelta::kDefaultMax);

    FrameDelta custom(2.5f, 0.05f);
    EXPECT_FLOAT_EQ(custom.Seconds(), 0.05f);
}

TEST(FrameDeltaTest, NegativeAndNonFiniteBecomeZero) {
    EXPECT_FLOAT_EQ(FrameDelta(-1.0f).Seconds(), 0.0f);
    EXPECT_FLOAT_EQ(FrameDelta(std::numeric_limits<float>::quiet_NaN()).Seconds(), 0.0f);
    EXPECT_FLOAT_EQ(FrameDelta(std::numeric_limits<float>::infinity()).Seconds(), 0.0f);
}

TEST(FrameDeltaTest, DefaultIsZero) {
    FrameDelta dt;
    EXPECT_FLOAT_EQ(dt.Seconds(), 0.0f);
}
