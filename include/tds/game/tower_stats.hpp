#pragma once

/// @file tower_stats.hpp
/// @brief Derived tower statistics and the upgrade cost curve.

#include <cstdint>

#include "tds/game/game_rules.hpp"

namespace tds::game {

/// Effective stats of a tower at a given level.
struct TowerStats {
    float range = 0.0f;
    /// Per-hit damage, or damage per second for beam towers.
    float damage = 0.0f;
    /// Shots per second; zero for beam towers.
    float fireRate = 0.0f;
    float projectileSpeed = 0.0f;
    float splashRadius = 0.0f;
    float splashRatio = 0.0f;
};

/// Compute the stats of a tower of @p spec at @p level (>= 1).
///
/// Up to the cap every stat grows linearly.  Above it range, rate and
/// splash radius stay at their cap values and damage grows by
/// `overlevelDamageGrowth` per extra level.
[[nodiscard]] TowerStats ComputeTowerStats(const TowerSpec& spec, int32_t level);

/// Cost to upgrade a tower from @p level to `level + 1`.
///
/// `round(upgradeBase * upgradeGrowth^(level - 1))` below the cap, the
/// flat overlevel cost from the cap onwards.
[[nodiscard]] int32_t ComputeUpgradeCost(const TowerSpec& spec, int32_t level);

}  // namespace tds::game
