#pragma once

/// @file tower_system.hpp
/// @brief TowerSystem and ProjectileSystem: per-tick combat processing.

#include <string_view>

#include "tds/ecs/system_scheduler.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/game/tower_stats.hpp"

namespace tds::game {

/// Fires towers at their targets.
///
/// Execution each tick:
///   1. Clear the beam list.
///   2. Beam towers with a target emit a beam and damage every alive
///      enemy along it by `dps * dt`.
///   3. Other towers tick their cooldown and, once expired and with a
///      target, launch a homing projectile and reset the cooldown.
class TowerSystem final : public tds::ecs::ISystem {
public:
    explicit TowerSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "TowerSystem"; }

private:
    void fireBeam(ecs::Entity towerEntity, const Tower& tower,
                  const TowerStats& stats, float deltaTime);

    void fireProjectile(const Tower& tower, const TowerStats& stats, ecs::Entity target);

    SimulationState& state_;
};

/// Moves homing projectiles and resolves impacts.
///
/// A projectile whose target is gone is discarded without effect, as is
/// one that leaves the field by more than the projectile margin.
class ProjectileSystem final : public tds::ecs::ISystem {
public:
    explicit ProjectileSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "ProjectileSystem"; }

private:
    /// Advance one projectile.
    /// @return true when the projectile is spent.
    bool step(Projectile& projectile, float deltaTime);

    void applySplash(const Projectile& projectile, const Vector2& impact);

    [[nodiscard]] bool outOfBounds(const Vector2& position) const;

    SimulationState& state_;
};

}  // namespace tds::game
