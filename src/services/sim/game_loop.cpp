/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "tds/service/game_loop.hpp"

#include <algorithm>
#include <thread>

namespace tds::service {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameResult;

// -- FrameClock --------------------------------------------------------------

float FrameClock::advance(Clock::time_point now) {
    if (!last_) {
        last_ = now;
        return 0.0f;
    }

    const auto elapsed = std::chrono::duration<float>(now - *last_).count();
    last_ = now;
    return std::clamp(elapsed, 0.0f, maxDelta_);
}

// -- GameLoop ----------------------------------------------------------------

GameLoop::GameLoop(uint32_t frameRate, float maxFrameDelta)
    : frameRate_(frameRate > 0 ? frameRate : 60),
      targetFrameTime_(std::chrono::microseconds(
          1'000'000 / (frameRate > 0 ? frameRate : 60))),
      clock_(maxFrameDelta) {}

void GameLoop::setFrameCallback(FrameCallback callback) {
    frameCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    metricsCallback_ = std::move(callback);
}

GameResult<void> GameLoop::run(uint64_t maxFrames) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return GameResult<void>::err(
            GameError(ErrorCode::GameLoopAlreadyRunning, "game loop is already running"));
    }

    stopRequested_.store(false);
    finished_ = false;
    clock_.reset();

    auto nextFrame = FrameClock::Clock::now();
    uint64_t framesRun = 0;

    while (!stopRequested_.load() && !finished_) {
        if (maxFrames > 0 && framesRun >= maxFrames) {
            break;
        }
        nextFrame += targetFrameTime_;

        const auto frameStart = FrameClock::Clock::now();
        auto metrics = frame(frameStart);
        ++framesRun;

        // Sleep until next frame, but skip if we already overran.
        auto now = FrameClock::Clock::now();
        if (now < nextFrame) {
            std::this_thread::sleep_until(nextFrame);
        } else {
            // Overrun: reset the target to avoid cascading catch-up.
            nextFrame = now;
        }

        metrics.frameTime = std::chrono::duration_cast<std::chrono::microseconds>(
            FrameClock::Clock::now() - frameStart);
        lastMetrics_ = metrics;
        if (metricsCallback_) {
            metricsCallback_(metrics);
        }
    }

    running_.store(false);
    return GameResult<void>::ok();
}

void GameLoop::stop() noexcept {
    stopRequested_.store(true);
}

TickMetrics GameLoop::frame(FrameClock::Clock::time_point now) {
    const float deltaTime = clock_.advance(now);
    const auto updateStart = FrameClock::Clock::now();

    if (frameCallback_ && !frameCallback_(deltaTime)) {
        finished_ = true;
    }

    const auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        FrameClock::Clock::now() - updateStart);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.frameTime = updateDuration;  // For manual frame(), frame = update.
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateDuration.count()) /
                  static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.deltaTime = deltaTime;
    metrics.frameNumber = frameCount_++;
    metrics.overrun = updateDuration > targetFrameTime_;

    lastMetrics_ = metrics;
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t GameLoop::frameRate() const noexcept {
    return frameRate_;
}

std::chrono::microseconds GameLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

uint64_t GameLoop::frameCount() const noexcept {
    return frameCount_;
}

}  // namespace tds::service
