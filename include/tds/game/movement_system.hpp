#pragma once

/// @file movement_system.hpp
/// @brief MovementSystem and PruneSystem: enemy motion along the path.

#include <string_view>

#include "tds/ecs/system_scheduler.hpp"
#include "tds/game/simulation_state.hpp"

namespace tds::game {

/// Advances enemies along the path and detects leaks.
///
/// An alive enemy reaching the path end leaks: it dies, costs one life,
/// and sets the game over flag when no lives remain.  Leaked enemies keep
/// walking off the field; killed enemies accumulate corpse time.
class MovementSystem final : public tds::ecs::ISystem {
public:
    explicit MovementSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "MovementSystem"; }

private:
    void onLeak(ecs::Entity enemy);

    SimulationState& state_;
};

/// Destroys enemies that have left the field or finished their corpse
/// grace time.
class PruneSystem final : public tds::ecs::ISystem {
public:
    explicit PruneSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "PruneSystem"; }

private:
    SimulationState& state_;
};

}  // namespace tds::game
