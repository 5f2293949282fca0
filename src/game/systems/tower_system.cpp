/// @file tower_system.cpp
/// @brief Tower firing, beams, and projectile resolution.

#include "tds/game/tower_system.hpp"

#include "tds/game/combat_resolver.hpp"

namespace tds::game {

// ── TowerSystem ─────────────────────────────────────────────────────────

void TowerSystem::Execute(float deltaTime) {
    state_.beams.clear();
    if (state_.gameOver) {
        return;
    }

    for (std::size_t i = 0; i < state_.towers.Size(); ++i) {
        const auto towerEntity = state_.towers.EntityAt(i);
        auto& tower = state_.towers.At(i);
        const auto stats = ComputeTowerStats(state_.rules.tower(tower.kind), tower.level);

        if (tower.kind == TowerKind::Beam) {
            fireBeam(towerEntity, tower, stats, deltaTime);
            continue;
        }

        tower.cooldown -= deltaTime;
        if (tower.cooldown > 0.0f) {
            continue;
        }

        const auto target = CombatResolver::AcquireTarget(state_, tower, stats);
        if (!target) {
            continue;
        }

        fireProjectile(tower, stats, *target);
        tower.cooldown = stats.fireRate > 0.0f ? 1.0f / stats.fireRate : 0.0f;
    }
}

void TowerSystem::fireBeam(ecs::Entity towerEntity, const Tower& tower,
                           const TowerStats& stats, float deltaTime) {
    const auto target = CombatResolver::AcquireTarget(state_, tower, stats);
    if (!target) {
        return;
    }

    const auto targetPos = state_.EnemyPosition(*target);
    if (!targetPos) {
        return;
    }

    const Vector2 direction = (*targetPos - tower.position).Normalized();
    Beam beam;
    beam.tower = towerEntity;
    beam.start = tower.position;
    beam.end = tower.position + direction * (stats.range * state_.rules.combat.beamLengthFactor);
    beam.dps = stats.damage;
    state_.beams.push_back(beam);

    const float hitDistance = state_.rules.combat.beamHitDistance;
    const float damage = stats.damage * deltaTime;

    for (std::size_t i = 0; i < state_.followers.Size(); ++i) {
        const auto enemy = state_.followers.EntityAt(i);
        const auto position = state_.path.PositionAt(state_.followers.At(i).s);
        if (PointSegmentDistance(position, beam.start, beam.end) <= hitDistance) {
            CombatResolver::ApplyDamage(state_, enemy, damage, TowerKind::Beam);
        }
    }
}

void TowerSystem::fireProjectile(const Tower& tower, const TowerStats& stats, ecs::Entity target) {
    const auto targetPos = state_.EnemyPosition(target);
    if (!targetPos) {
        return;
    }

    Projectile projectile;
    projectile.position = tower.position;
    projectile.speed = stats.projectileSpeed;
    projectile.velocity = (*targetPos - tower.position).Normalized() * stats.projectileSpeed;
    projectile.damage = stats.damage;
    projectile.target = target;
    projectile.source = tower.kind;
    if (stats.splashRadius > 0.0f) {
        projectile.payload = PayloadKind::Splash;
        projectile.splashRadius = stats.splashRadius;
        projectile.splashDamage = stats.damage * stats.splashRatio;
    }

    const auto entity = state_.entities.Create();
    state_.projectiles.Add(entity, projectile);
}

// ── ProjectileSystem ────────────────────────────────────────────────────

void ProjectileSystem::Execute(float deltaTime) {
    if (state_.gameOver) {
        return;
    }

    for (std::size_t i = 0; i < state_.projectiles.Size(); ++i) {
        if (step(state_.projectiles.At(i), deltaTime)) {
            state_.entities.DestroyDeferred(state_.projectiles.EntityAt(i));
        }
    }

    state_.entities.FlushDeferred();
}

bool ProjectileSystem::step(Projectile& projectile, float deltaTime) {
    const auto* vitality = state_.vitals.Find(projectile.target);
    if (vitality == nullptr || !vitality->alive) {
        return true;
    }

    const auto targetPos = state_.EnemyPosition(projectile.target);
    if (!targetPos) {
        return true;
    }

    const Vector2 toTarget = *targetPos - projectile.position;
    const float distance = toTarget.Length();
    const float travel = projectile.speed * deltaTime;

    // A step that would carry the projectile past its target is an impact.
    if (distance <= state_.rules.combat.impactRadius || travel >= distance) {
        projectile.position = *targetPos;
        CombatResolver::ApplyDamage(state_, projectile.target, projectile.damage, projectile.source);
        if (projectile.payload == PayloadKind::Splash) {
            applySplash(projectile, *targetPos);
        }
        return true;
    }

    projectile.velocity = toTarget * (projectile.speed / distance);
    projectile.position += projectile.velocity * deltaTime;

    return outOfBounds(projectile.position);
}

void ProjectileSystem::applySplash(const Projectile& projectile, const Vector2& impact) {
    for (std::size_t i = 0; i < state_.followers.Size(); ++i) {
        const auto enemy = state_.followers.EntityAt(i);
        if (enemy == projectile.target) {
            continue;
        }
        if (Distance(state_.path.PositionAt(state_.followers.At(i).s), impact) <= projectile.splashRadius) {
            // ApplyDamage skips enemies that are already dead.
            CombatResolver::ApplyDamage(state_, enemy, projectile.splashDamage, projectile.source);
        }
    }
}

bool ProjectileSystem::outOfBounds(const Vector2& position) const {
    const auto& field = state_.rules.field;
    return position.x < -field.projectileMargin ||
           position.x > field.width + field.projectileMargin ||
           position.y < -field.projectileMargin ||
           position.y > field.height + field.projectileMargin;
}

}  // namespace tds::game
