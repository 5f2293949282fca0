/// @file wave_system.cpp
/// @brief Spawning, wave completion, and auto-wave countdown.

#include "tds/game/wave_system.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include "tds/foundation/game_logger.hpp"

namespace tds::game {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameLogger;
using tds::foundation::GameResult;
using tds::foundation::LogCategory;
using tds::foundation::LogContext;
using tds::foundation::LogLevel;

// ── SpawnSystem ─────────────────────────────────────────────────────────

void SpawnSystem::Execute(float deltaTime) {
    if (state_.gameOver || state_.phase != WavePhase::WaveActive) {
        return;
    }

    auto& wave = state_.wave;
    wave.elapsed += deltaTime;

    while (!wave.queue.empty() && wave.elapsed >= wave.interval) {
        wave.elapsed -= wave.interval;
        const auto record = wave.queue.front();
        wave.queue.pop_front();
        state_.SpawnEnemy(record);
    }
}

// ── WaveSystem ──────────────────────────────────────────────────────────

void WaveSystem::Execute(float deltaTime) {
    if (state_.gameOver) {
        return;
    }

    if (state_.phase == WavePhase::WaveActive) {
        if (state_.wave.queue.empty() && !state_.AnyEnemyAlive()) {
            completeWave();
        }
        return;
    }

    auto& countdown = state_.wave.autoCountdown;
    if (!countdown) {
        return;
    }

    *countdown -= deltaTime;
    if (*countdown <= 0.0f) {
        countdown.reset();
        auto started = StartWave(state_);
        if (!started) {
            TDS_LOG_WARN(LogCategory::Wave,
                         "Auto-wave start rejected: " + std::string(started.error().message()));
        }
    }
}

void WaveSystem::completeWave() {
    const auto payout = state_.economy.ComputeWaveReward(state_.rules.economy);
    state_.economy.Earn(payout.reward + payout.bonus);

    WaveOverlay overlay;
    overlay.waveNumber = state_.wave.index + 1;
    overlay.reward = payout.reward;
    overlay.bonus = payout.bonus;
    state_.overlay = overlay;

    ++state_.wave.index;
    state_.phase = WavePhase::WaveComplete;

    if (state_.wave.autoWave) {
        state_.wave.autoCountdown = state_.rules.waves.autoWaveDelay;
    }

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Wave)) {
        LogContext ctx;
        ctx.waveNumber = overlay.waveNumber;
        ctx.extra["reward"] = std::to_string(payout.reward);
        ctx.extra["bonus"] = std::to_string(payout.bonus);
        ctx.extra["money"] = std::to_string(state_.economy.Money());
        logger.logWithContext(LogLevel::Info, LogCategory::Wave, "Wave complete", ctx);
    }
}

GameResult<void> WaveSystem::StartWave(SimulationState& state) {
    if (state.gameOver) {
        return GameResult<void>::err(GameError(ErrorCode::GameIsOver, "game is over"));
    }
    if (state.phase == WavePhase::WaveActive) {
        return GameResult<void>::err(
            GameError(ErrorCode::WaveAlreadyActive, "a wave is already in progress"));
    }

    auto& wave = state.wave;
    const auto params = state.director.Parameters(wave.index);
    wave.queue = state.director.BuildSpawnQueue(wave.index);
    wave.interval = params.gap;
    wave.elapsed = 0.0f;
    wave.spawned = 0;
    wave.autoCountdown.reset();

    state.phase = WavePhase::WaveActive;
    state.overlay.reset();

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Wave)) {
        LogContext ctx;
        ctx.waveNumber = wave.index + 1;
        ctx.extra["enemies"] = std::to_string(wave.queue.size());
        std::ostringstream hp;
        hp << std::fixed << std::setprecision(0) << params.hp;
        ctx.extra["hp"] = hp.str();
        logger.logWithContext(LogLevel::Info, LogCategory::Wave, "Wave started", ctx);
    }
    return GameResult<void>::ok();
}

}  // namespace tds::game
