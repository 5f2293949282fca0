#pragma once

/// @file defense_types.hpp
/// @brief Enumerations shared by the tower defense simulation.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tds::game {

/// Tower variant.  Stats and damage logic switch on this tag.
enum class TowerKind : uint8_t {
    Basic,   ///< Single-target homing projectile.
    Splash,  ///< Homing projectile with area damage on impact.
    Beam     ///< Continuous piercing damage along a segment.
};

/// Number of tower kinds (for array sizing).
constexpr std::size_t kTowerKindCount = 3;

/// Enemy variant.
enum class EnemyKind : uint8_t {
    Normal,   ///< Regular wave unit.
    Armored,  ///< Tougher, slower, resists basic towers.
    Boss      ///< One per wave late in the game, flat kill reward.
};

/// Number of enemy kinds (for array sizing).
constexpr std::size_t kEnemyKindCount = 3;

/// Wave lifecycle phase.  Game over is tracked separately.
enum class WavePhase : uint8_t {
    Idle,          ///< Session start or after reset.
    WaveActive,    ///< Spawning and/or enemies alive.
    WaveComplete   ///< Rewards paid, waiting for the next start.
};

/// What a projectile does when it reaches its target.
enum class PayloadKind : uint8_t {
    Direct,  ///< Damage the target only.
    Splash   ///< Damage the target plus nearby enemies.
};

constexpr std::string_view towerKindName(TowerKind kind) {
    constexpr std::array<std::string_view, kTowerKindCount> names = {
        "basic", "splash", "beam"
    };
    auto idx = static_cast<std::size_t>(kind);
    return idx < kTowerKindCount ? names[idx] : "unknown";
}

constexpr std::string_view enemyKindName(EnemyKind kind) {
    constexpr std::array<std::string_view, kEnemyKindCount> names = {
        "normal", "armored", "boss"
    };
    auto idx = static_cast<std::size_t>(kind);
    return idx < kEnemyKindCount ? names[idx] : "unknown";
}

constexpr std::string_view wavePhaseName(WavePhase phase) {
    switch (phase) {
        case WavePhase::Idle:         return "Idle";
        case WavePhase::WaveActive:   return "WaveActive";
        case WavePhase::WaveComplete: return "WaveComplete";
    }
    return "Unknown";
}

/// Parse a lowercase tower kind name as used in configuration files.
constexpr std::optional<TowerKind> parseTowerKind(std::string_view name) {
    if (name == "basic") {
        return TowerKind::Basic;
    }
    if (name == "splash") {
        return TowerKind::Splash;
    }
    if (name == "beam") {
        return TowerKind::Beam;
    }
    return std::nullopt;
}

}  // namespace tds::game
