/// @file movement_system.cpp
/// @brief Enemy movement, leak detection, and pruning.

#include "tds/game/movement_system.hpp"

#include <string>

#include "tds/foundation/game_logger.hpp"

namespace tds::game {

using tds::foundation::GameLogger;
using tds::foundation::LogCategory;
using tds::foundation::LogContext;
using tds::foundation::LogLevel;

// ── MovementSystem ──────────────────────────────────────────────────────

void MovementSystem::Execute(float deltaTime) {
    if (state_.gameOver) {
        return;
    }

    const float exitAt = state_.path.Length();

    for (std::size_t i = 0; i < state_.followers.Size(); ++i) {
        const auto enemy = state_.followers.EntityAt(i);
        auto& follower = state_.followers.At(i);
        auto* vitality = state_.vitals.Find(enemy);
        if (vitality == nullptr) {
            continue;
        }

        if (vitality->alive) {
            follower.s += follower.speed * deltaTime;
            if (follower.s >= exitAt) {
                onLeak(enemy);
            }
        } else if (vitality->leaked) {
            follower.s += follower.speed * deltaTime;
        } else {
            vitality->deadTime += deltaTime;
        }
    }
}

void MovementSystem::onLeak(ecs::Entity enemy) {
    auto& vitality = state_.vitals.Get(enemy);
    vitality.alive = false;
    vitality.leaked = true;

    const bool noLivesLeft = state_.economy.LoseLife();

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::World)) {
        LogContext ctx;
        ctx.entityId = enemy.raw;
        ctx.waveNumber = state_.wave.index + 1;
        ctx.extra["lives"] = std::to_string(state_.economy.Lives());
        logger.logWithContext(LogLevel::Debug, LogCategory::World, "Enemy leaked", ctx);
    }

    if (noLivesLeft && !state_.gameOver) {
        state_.gameOver = true;
        state_.wave.autoCountdown.reset();
        TDS_LOG_INFO(LogCategory::Core,
                     "Game over on wave " + std::to_string(state_.wave.index + 1));
    }
}

// ── PruneSystem ─────────────────────────────────────────────────────────

void PruneSystem::Execute(float /*deltaTime*/) {
    const float removeAt = state_.path.Length() + state_.rules.enemies.exitMargin;
    const float corpseGrace = state_.rules.enemies.corpseGrace;

    for (std::size_t i = 0; i < state_.vitals.Size(); ++i) {
        const auto& vitality = state_.vitals.At(i);
        if (vitality.alive) {
            continue;
        }

        const auto enemy = state_.vitals.EntityAt(i);
        if (vitality.leaked) {
            const auto* follower = state_.followers.Find(enemy);
            if (follower == nullptr || follower->s >= removeAt) {
                state_.entities.DestroyDeferred(enemy);
            }
        } else if (vitality.deadTime >= corpseGrace) {
            state_.entities.DestroyDeferred(enemy);
        }
    }

    state_.entities.FlushDeferred();
}

}  // namespace tds::game
