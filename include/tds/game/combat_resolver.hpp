#pragma once

/// @file combat_resolver.hpp
/// @brief Damage application, kill rewards, and target acquisition.
///
/// Shared by the tower and projectile systems.  Every damage site
/// (direct hit, splash, beam) goes through ApplyDamage() so that the
/// variant modifier and the single-reward rule apply uniformly.

#include <cstdint>
#include <optional>

#include "tds/ecs/entity.hpp"
#include "tds/game/defense_components.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/tower_stats.hpp"

namespace tds::game {

class SimulationState;

/// Stateless combat helpers operating on a SimulationState.
class CombatResolver {
public:
    /// Final damage after the variant modifier.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static float CalculateDamage(const GameRules& rules,
                                               float baseDamage,
                                               TowerKind source,
                                               EnemyKind target);

    /// Money paid for killing an enemy of @p kind with @p maxHp.
    ///
    /// Bosses pay the flat boss reward; everything else pays
    /// `max(minKillReward, round(maxHp * killRewardRatio))`.
    [[nodiscard]] static int64_t KillReward(const GameRules& rules, EnemyKind kind, double maxHp);

    /// Apply @p baseDamage from a tower of kind @p source to @p enemy.
    ///
    /// Dead or missing enemies are ignored.  When this application drops
    /// hp to zero or below, the enemy is marked dead and its reward is
    /// paid; this happens at most once per enemy.
    ///
    /// @return true if this call killed the enemy.
    static bool ApplyDamage(SimulationState& state, ecs::Entity enemy,
                            float baseDamage, TowerKind source);

    /// Furthest-progressed alive enemy within range (largest arc length).
    /// Ties go to the earliest spawned enemy.
    [[nodiscard]] static std::optional<ecs::Entity> FurthestInRange(
        const SimulationState& state, const Vector2& origin, float range);

    /// Oldest alive enemy within range (smallest spawn order).
    [[nodiscard]] static std::optional<ecs::Entity> OldestInRange(
        const SimulationState& state, const Vector2& origin, float range);

    /// Target for @p tower according to its kind's targeting rule.
    [[nodiscard]] static std::optional<ecs::Entity> AcquireTarget(
        const SimulationState& state, const Tower& tower, const TowerStats& stats);
};

}  // namespace tds::game
