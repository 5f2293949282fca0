/// @file combat_resolver.cpp
/// @brief Damage, rewards, and targeting.

#include "tds/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "tds/foundation/game_logger.hpp"
#include "tds/game/economy.hpp"
#include "tds/game/simulation_state.hpp"

namespace tds::game {

using tds::foundation::GameLogger;
using tds::foundation::LogCategory;
using tds::foundation::LogContext;
using tds::foundation::LogLevel;

float CombatResolver::CalculateDamage(const GameRules& rules,
                                      float baseDamage,
                                      TowerKind source,
                                      EnemyKind target) {
    return baseDamage * rules.damageMultiplier(source, target);
}

int64_t CombatResolver::KillReward(const GameRules& rules, EnemyKind kind, double maxHp) {
    if (kind == EnemyKind::Boss) {
        return rules.waves.bossReward;
    }
    const int64_t scaled = RoundToMoney(maxHp * static_cast<double>(rules.economy.killRewardRatio));
    return std::max<int64_t>(rules.economy.minKillReward, scaled);
}

bool CombatResolver::ApplyDamage(SimulationState& state, ecs::Entity enemy,
                                 float baseDamage, TowerKind source) {
    auto* vitality = state.vitals.Find(enemy);
    const auto* enemyTraits = state.traits.Find(enemy);
    if (vitality == nullptr || enemyTraits == nullptr || !vitality->alive) {
        return false;
    }

    vitality->hp -= CalculateDamage(state.rules, baseDamage, source, enemyTraits->kind);
    if (vitality->hp > 0.0f) {
        return false;
    }

    vitality->alive = false;
    vitality->deadTime = 0.0f;
    state.economy.Earn(enemyTraits->reward);

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.entityId = enemy.raw;
        ctx.waveNumber = state.wave.index + 1;
        ctx.extra["kind"] = std::string(enemyKindName(enemyTraits->kind));
        ctx.extra["reward"] = std::to_string(enemyTraits->reward);
        logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "Enemy killed", ctx);
    }
    return true;
}

std::optional<ecs::Entity> CombatResolver::FurthestInRange(
    const SimulationState& state, const Vector2& origin, float range) {
    std::optional<ecs::Entity> best;
    float bestS = -1.0f;
    uint64_t bestOrder = 0;

    for (std::size_t i = 0; i < state.followers.Size(); ++i) {
        const auto enemy = state.followers.EntityAt(i);
        const auto& follower = state.followers.At(i);
        const auto* vitality = state.vitals.Find(enemy);
        if (vitality == nullptr || !vitality->alive) {
            continue;
        }
        if (Distance(origin, state.path.PositionAt(follower.s)) > range) {
            continue;
        }
        // Dense order is not spawn order; break ties by spawn order.
        if (follower.s > bestS || (best && follower.s == bestS && follower.spawnOrder < bestOrder)) {
            best = enemy;
            bestS = follower.s;
            bestOrder = follower.spawnOrder;
        }
    }
    return best;
}

std::optional<ecs::Entity> CombatResolver::OldestInRange(
    const SimulationState& state, const Vector2& origin, float range) {
    std::optional<ecs::Entity> best;
    uint64_t bestOrder = 0;

    for (std::size_t i = 0; i < state.followers.Size(); ++i) {
        const auto enemy = state.followers.EntityAt(i);
        const auto& follower = state.followers.At(i);
        const auto* vitality = state.vitals.Find(enemy);
        if (vitality == nullptr || !vitality->alive) {
            continue;
        }
        if (Distance(origin, state.path.PositionAt(follower.s)) > range) {
            continue;
        }
        if (!best || follower.spawnOrder < bestOrder) {
            best = enemy;
            bestOrder = follower.spawnOrder;
        }
    }
    return best;
}

std::optional<ecs::Entity> CombatResolver::AcquireTarget(
    const SimulationState& state, const Tower& tower, const TowerStats& stats) {
    if (tower.kind == TowerKind::Beam) {
        return OldestInRange(state, tower.position, stats.range);
    }
    return FurthestInRange(state, tower.position, stats.range);
}

}  // namespace tds::game
