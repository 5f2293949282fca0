/// @file game_loop_test.cpp
/// @brief Unit tests for FrameClock and GameLoop.

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "tds/service/game_loop.hpp"

using namespace tds::service;
using namespace std::chrono_literals;
using tds::foundation::ErrorCode;

// ============================================================================
// FrameClock Tests
// ============================================================================

TEST(FrameClockTest, FirstAdvanceIsZero) {
    FrameClock clock(0.05f);
    EXPECT_FLOAT_EQ(clock.advance(FrameClock::Clock::now()), 0.0f);
}

TEST(FrameClockTest, ReportsElapsedSeconds) {
    FrameClock clock(0.05f);
    const auto start = FrameClock::Clock::time_point{} + 10s;
    (void)clock.advance(start);
    EXPECT_NEAR(clock.advance(start + 16ms), 0.016f, 1e-5f);
    EXPECT_NEAR(clock.advance(start + 36ms), 0.020f, 1e-5f);
}

TEST(FrameClockTest, ClampsLongStalls) {
    FrameClock clock(0.05f);
    const auto start = FrameClock::Clock::time_point{} + 10s;
    (void)clock.advance(start);
    EXPECT_FLOAT_EQ(clock.advance(start + 3s), 0.05f);
}

TEST(FrameClockTest, BackwardsTimeIsZero) {
    FrameClock clock(0.05f);
    const auto start = FrameClock::Clock::time_point{} + 10s;
    (void)clock.advance(start);
    EXPECT_FLOAT_EQ(clock.advance(start - 5ms), 0.0f);
}

TEST(FrameClockTest, ResetRestartsAtZero) {
    FrameClock clock(0.05f);
    const auto start = FrameClock::Clock::time_point{} + 10s;
    (void)clock.advance(start);
    clock.reset();
    EXPECT_FLOAT_EQ(clock.advance(start + 20ms), 0.0f);
}

// ============================================================================
// GameLoop Tests
// ============================================================================

class GameLoopTest : public ::testing::Test {
protected:
    GameLoop loop_{60, 0.05f};
};

TEST_F(GameLoopTest, DefaultFrameRate) {
    EXPECT_EQ(loop_.frameRate(), 60u);
    // 1'000'000 / 60 = 16666 us
    EXPECT_EQ(loop_.targetFrameTime().count(), 16666);
}

TEST_F(GameLoopTest, ZeroFrameRateDefaultsToSixty) {
    GameLoop zeroRate(0);
    EXPECT_EQ(zeroRate.frameRate(), 60u);
}

TEST_F(GameLoopTest, InitialState) {
    EXPECT_EQ(loop_.frameCount(), 0u);
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_FALSE(loop_.finished());
}

TEST_F(GameLoopTest, ManualFramesPassClampedDelta) {
    std::vector<float> deltas;
    loop_.setFrameCallback([&](float dt) {
        deltas.push_back(dt);
        return true;
    });

    const auto start = FrameClock::Clock::time_point{} + 10s;
    (void)loop_.frame(start);
    (void)loop_.frame(start + 10ms);
    auto metrics = loop_.frame(start + 1s);

    ASSERT_EQ(deltas.size(), 3u);
    EXPECT_FLOAT_EQ(deltas[0], 0.0f);
    EXPECT_NEAR(deltas[1], 0.01f, 1e-5f);
    EXPECT_FLOAT_EQ(deltas[2], 0.05f);

    EXPECT_EQ(metrics.frameNumber, 2u);
    EXPECT_FLOAT_EQ(metrics.deltaTime, 0.05f);
    EXPECT_GE(metrics.updateTime.count(), 0);
    EXPECT_GE(metrics.budgetUtilization, 0.0f);
    EXPECT_EQ(loop_.frameCount(), 3u);
    EXPECT_EQ(loop_.lastMetrics().frameNumber, 2u);
}

TEST_F(GameLoopTest, CallbackReturningFalseFinishes) {
    loop_.setFrameCallback([](float) { return false; });
    (void)loop_.frame(FrameClock::Clock::now());
    EXPECT_TRUE(loop_.finished());
}

TEST_F(GameLoopTest, FrameWithoutCallbackIsSafe) {
    auto metrics = loop_.frame(FrameClock::Clock::now());
    EXPECT_EQ(metrics.frameNumber, 0u);
    EXPECT_FALSE(loop_.finished());
}

TEST(GameLoopRunTest, RunStopsAtMaxFrames) {
    GameLoop loop(1000, 0.05f);
    int calls = 0;
    int metricsCount = 0;
    loop.setFrameCallback([&](float) {
        ++calls;
        return true;
    });
    loop.setMetricsCallback([&](const TickMetrics&) { ++metricsCount; });

    auto result = loop.run(5);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(metricsCount, 5);
    EXPECT_EQ(loop.frameCount(), 5u);
    EXPECT_FALSE(loop.isRunning());
    EXPECT_FALSE(loop.finished());
}

TEST(GameLoopRunTest, RunEndsWhenCallbackReturnsFalse) {
    GameLoop loop(1000, 0.05f);
    int calls = 0;
    loop.setFrameCallback([&](float) { return ++calls < 3; });

    ASSERT_TRUE(loop.run().hasValue());
    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(loop.finished());
}

TEST(GameLoopRunTest, StopFromCallback) {
    GameLoop loop(1000, 0.05f);
    int calls = 0;
    loop.setFrameCallback([&](float) {
        if (++calls == 2) {
            loop.stop();
        }
        return true;
    });

    ASSERT_TRUE(loop.run().hasValue());
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(loop.finished());
}

TEST(GameLoopRunTest, ReentrantRunRejected) {
    GameLoop loop(1000, 0.05f);
    ErrorCode nested = ErrorCode::Success;
    loop.setFrameCallback([&](float) {
        auto inner = loop.run(1);
        if (inner.hasError()) {
            nested = inner.error().code();
        }
        return false;
    });

    ASSERT_TRUE(loop.run().hasValue());
    EXPECT_EQ(nested, ErrorCode::GameLoopAlreadyRunning);
}

TEST(GameLoopRunTest, RunCanBeRepeated) {
    GameLoop loop(1000, 0.05f);
    loop.setFrameCallback([](float) { return false; });

    ASSERT_TRUE(loop.run().hasValue());
    EXPECT_TRUE(loop.finished());
    ASSERT_TRUE(loop.run().hasValue());
    EXPECT_EQ(loop.frameCount(), 2u);
}
