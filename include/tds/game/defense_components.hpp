#pragma once

/// @file defense_components.hpp
/// @brief ECS components for enemies, towers, and projectiles.
///
/// An enemy is an entity with PathFollower + Vitality + EnemyTraits.
/// A tower is an entity with Tower.  A projectile is an entity with
/// Projectile.  Beams are not entities: they are rebuilt every tick.

#include <cstdint>

#include "tds/ecs/entity.hpp"
#include "tds/game/defense_types.hpp"
#include "tds/game/math_types.hpp"

namespace tds::game {

/// Position along the path, expressed as arc length.
struct PathFollower {
    float s = 0.0f;
    /// Units per second.
    float speed = 0.0f;
    /// Monotonic spawn counter; lower means older on the field.
    uint64_t spawnOrder = 0;
};

/// Hit points and life state of an enemy.
///
/// Hit points are double: late-wave hp is large enough that a single
/// precision value would absorb small per-tick beam damage.
///
/// `alive` turns false exactly once, either on kill or on leak.  Leaked
/// enemies keep walking until the exit margin; killed enemies stay where
/// they fell until the corpse grace time has elapsed.
struct Vitality {
    double hp = 0.0;
    double maxHp = 0.0;
    bool alive = true;
    bool leaked = false;
    /// Seconds since the enemy died.
    float deadTime = 0.0f;
};

/// Static per-enemy attributes fixed at spawn.
struct EnemyTraits {
    EnemyKind kind = EnemyKind::Normal;
    float radius = 14.0f;
    /// Money paid when this enemy is killed.
    int64_t reward = 0;
};

/// Player-built tower.
struct Tower {
    Vector2 position;
    TowerKind kind = TowerKind::Basic;
    int32_t level = 1;
    /// Seconds until the next shot; may stay negative while idle.
    float cooldown = 0.0f;
};

/// Homing projectile in flight.
struct Projectile {
    Vector2 position;
    Vector2 velocity;
    float speed = 0.0f;
    float damage = 0.0f;
    /// Weak handle: checked for liveness every tick.
    ecs::Entity target;
    PayloadKind payload = PayloadKind::Direct;
    float splashRadius = 0.0f;
    float splashDamage = 0.0f;
    TowerKind source = TowerKind::Basic;
};

/// Beam fired by a beam tower during the current tick.
struct Beam {
    ecs::Entity tower;
    Vector2 start;
    Vector2 end;
    float dps = 0.0f;
};

}  // namespace tds::game
