#pragma once

/// @file game_rules.hpp
/// @brief Tunable constants for every part of the simulation.
///
/// GameRules is a plain aggregate.  Defaults reproduce the stock game;
/// the rules loader overrides individual fields from configuration.

#include <array>
#include <cstdint>
#include <vector>

#include "tds/game/defense_types.hpp"
#include "tds/game/math_types.hpp"

namespace tds::game {

/// Per-kind tower catalog entry.
///
/// Derived stats grow linearly with level up to levelCap:
/// `stat = base + perLevel * (level - 1)`.  Beyond the cap only damage
/// keeps growing, geometrically by overlevelDamageGrowth.
struct TowerSpec {
    int32_t baseCost = 50;

    float range = 140.0f;
    float rangePerLevel = 12.0f;

    /// Per-hit damage, or damage per second for beam towers.
    float damage = 12.0f;
    float damagePerLevel = 6.0f;

    /// Shots per second.  Zero for continuous (beam) towers.
    float fireRate = 1.6f;
    float fireRatePerLevel = 0.18f;

    /// Zero for towers that do not fire projectiles.
    float projectileSpeed = 500.0f;

    /// Zero for towers without area damage.
    float splashRadius = 0.0f;
    float splashRadiusPerLevel = 0.0f;

    /// Fraction of hit damage dealt to enemies inside the splash radius.
    float splashRatio = 0.0f;

    int32_t levelCap = 6;
    int32_t upgradeBase = 60;
    float upgradeGrowth = 1.6f;
    int32_t overlevelCost = 400;
    float overlevelDamageGrowth = 1.25f;
};

/// Play field geometry and placement constraints.
struct FieldRules {
    float width = 960.0f;
    float height = 540.0f;
    /// Minimum distance from every field edge for a tower center.
    float placementInset = 20.0f;
    /// Minimum distance from the path polyline for a tower center.
    float pathClearance = 28.0f;
    /// Minimum distance between two tower centers.
    float towerSpacing = 30.0f;
    /// Pick radius for selecting a tower by position.
    float selectRadius = 18.0f;
    /// Projectiles further than this outside the field are discarded.
    float projectileMargin = 20.0f;
};

struct EconomyRules {
    int32_t startMoney = 120;
    int32_t startLives = 20;
    int32_t waveRewardFlat = 50;
    /// Share of the balance paid as a bonus on wave completion.
    float waveInterestRate = 0.05f;
    int32_t minKillReward = 5;
    float killRewardRatio = 0.1f;
};

struct WaveRules {
    int32_t baseCount = 12;
    float countPerWave = 2.5f;
    float maxExtraCount = 40.0f;

    float baseHp = 24.0f;
    float hpGrowth = 1.22f;

    float baseSpeed = 70.0f;
    float speedPerWave = 2.0f;
    float maxSpeed = 140.0f;

    float baseGap = 0.7f;
    float gapPerWave = 0.02f;
    float minGap = 0.33f;

    /// First 0-based wave index that contains armored enemies.
    uint32_t armoredFromWave = 4;
    float armoredShare = 0.2f;
    float armoredHpMultiplier = 2.5f;
    float armoredSpeedMultiplier = 0.85f;

    /// First 0-based wave index that ends with a boss.
    uint32_t bossFromWave = 9;
    float bossHpMultiplier = 12.0f;
    float bossSpeedMultiplier = 0.6f;
    float bossRadius = 22.0f;
    int32_t bossReward = 100;

    /// Seconds between a wave completing and the next auto-started wave.
    float autoWaveDelay = 5.0f;
};

struct EnemyRules {
    float radius = 14.0f;
    /// Leaked enemies are removed this far past the path end.
    float exitMargin = 40.0f;
    /// Killed enemies are removed after this many seconds.
    float corpseGrace = 0.25f;
};

struct CombatRules {
    float impactRadius = 10.0f;
    float beamHitDistance = 18.0f;
    /// Beam length as a multiple of tower range.
    float beamLengthFactor = 2.0f;
    /// damageMultipliers[tower kind][enemy kind].
    std::array<std::array<float, kEnemyKindCount>, kTowerKindCount> damageMultipliers = {{
        {1.0f, 0.4f, 1.0f},  // Basic
        {1.0f, 1.0f, 1.0f},  // Splash
        {1.0f, 1.0f, 1.0f},  // Beam
    }};
};

struct LoopRules {
    /// Upper bound for a single frame's delta time, in seconds.
    float maxFrameDelta = 0.05f;
    /// Ticks per frame while turbo is enabled.
    uint32_t turboMultiplier = 2;
};

/// Stock tower catalog entry for @p kind.
[[nodiscard]] TowerSpec defaultTowerSpec(TowerKind kind);

/// Stock path through the 960x540 field.
[[nodiscard]] std::vector<Vector2> defaultPathWaypoints();

/// Complete rule set for one session.
struct GameRules {
    FieldRules field;
    EconomyRules economy;
    WaveRules waves;
    EnemyRules enemies;
    CombatRules combat;
    LoopRules loop;
    std::array<TowerSpec, kTowerKindCount> towers = {
        defaultTowerSpec(TowerKind::Basic),
        defaultTowerSpec(TowerKind::Splash),
        defaultTowerSpec(TowerKind::Beam),
    };
    std::vector<Vector2> pathWaypoints = defaultPathWaypoints();

    [[nodiscard]] const TowerSpec& tower(TowerKind kind) const {
        return towers[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] TowerSpec& tower(TowerKind kind) {
        return towers[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] float damageMultiplier(TowerKind source, EnemyKind target) const {
        return combat.damageMultipliers[static_cast<std::size_t>(source)]
                                       [static_cast<std::size_t>(target)];
    }
};

}  // namespace tds::game
