#pragma once

/// @file game_loop.hpp
/// @brief Frame-driven game loop with clamped frame time and metrics.
///
/// GameLoop drives a frame callback at a target frame rate on the calling
/// thread.  Frame deltas come from a FrameClock: the first frame sees a
/// delta of zero and later frames see the wall-clock difference clamped
/// to a maximum, so a stalled process does not fast-forward the game.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "tds/foundation/game_result.hpp"

namespace tds::service {

/// Per-frame performance metrics.
struct TickMetrics {
    /// Actual time spent in the frame callback.
    std::chrono::microseconds updateTime{0};

    /// Total frame time including sleep.
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Clamped simulated seconds handed to the callback.
    float deltaTime = 0.0f;

    /// Monotonically increasing frame counter (starts at 0).
    uint64_t frameNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;
};

/// Converts wall-clock timestamps into clamped frame deltas.
class FrameClock {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameClock(float maxDelta = 0.05f) : maxDelta_(maxDelta) {}

    /// Delta in seconds since the previous call, clamped to [0, maxDelta].
    /// The first call after construction or reset() returns 0.
    float advance(Clock::time_point now);

    /// Forget the previous timestamp.
    void reset() noexcept { last_.reset(); }

    [[nodiscard]] float maxDelta() const noexcept { return maxDelta_; }

private:
    std::optional<Clock::time_point> last_;
    float maxDelta_;
};

/// Single-threaded frame loop.
///
/// Usage:
/// @code
///   GameLoop loop(60, 0.05f);
///   loop.setFrameCallback([&](float dt) {
///       sim.frame(dt);
///       return !sim.isGameOver();
///   });
///   auto r = loop.run();   // blocks until the callback returns false
/// @endcode
class GameLoop {
public:
    /// Frame callback.  Returning false ends the loop.
    using FrameCallback = std::function<bool(float deltaTime)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// Construct a loop with the given frame rate and delta clamp.
    ///
    /// @param frameRate      Frames per second (default: 60).
    /// @param maxFrameDelta  Upper bound for one frame's delta, in seconds.
    explicit GameLoop(uint32_t frameRate = 60, float maxFrameDelta = 0.05f);

    // Non-copyable, non-movable (holds an atomic stop flag).
    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    /// Set the callback invoked each frame with the clamped delta.
    void setFrameCallback(FrameCallback callback);

    /// Set an optional callback invoked after each frame with metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Run frames on the calling thread until the frame callback returns
    /// false, stop() is called, or @p maxFrames frames have run
    /// (0 = unlimited).
    ///
    /// @return GameLoopAlreadyRunning if called re-entrantly.
    [[nodiscard]] foundation::GameResult<void> run(uint64_t maxFrames = 0);

    /// Request the loop to stop after the current frame.
    ///
    /// Lock-free; callable from a signal-driven watcher or the callback.
    void stop() noexcept;

    /// Execute a single frame at timestamp @p now (for testing).
    ///
    /// @return The metrics for the executed frame.
    TickMetrics frame(FrameClock::Clock::time_point now);

    /// Check whether run() is currently executing.
    [[nodiscard]] bool isRunning() const noexcept;

    /// True once the frame callback has returned false.
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /// Get the configured frame rate.
    [[nodiscard]] uint32_t frameRate() const noexcept;

    /// Get the target frame duration.
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;

    /// Get the total number of frames executed.
    [[nodiscard]] uint64_t frameCount() const noexcept;

    /// Get the metrics from the last completed frame.
    [[nodiscard]] const TickMetrics& lastMetrics() const noexcept { return lastMetrics_; }

private:
    uint32_t frameRate_;
    std::chrono::microseconds targetFrameTime_;

    FrameClock clock_;
    FrameCallback frameCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    bool finished_ = false;
    uint64_t frameCount_ = 0;
    TickMetrics lastMetrics_;
};

}  // namespace tds::service
