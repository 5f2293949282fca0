#pragma once

/// @file wave_system.hpp
/// @brief SpawnSystem and WaveSystem: wave lifecycle per tick.

#include <string_view>

#include "tds/ecs/system_scheduler.hpp"
#include "tds/foundation/game_result.hpp"
#include "tds/game/simulation_state.hpp"

namespace tds::game {

/// Releases queued enemies onto the path at the wave's spawn interval.
///
/// The first spawn happens one interval after the wave starts.  Several
/// spawns may happen in one tick when the accumulator allows it.
class SpawnSystem final : public tds::ecs::ISystem {
public:
    explicit SpawnSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] tds::ecs::SystemStage GetStage() const override {
        return tds::ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "SpawnSystem"; }

private:
    SimulationState& state_;
};

/// Detects wave completion, pays the wave reward, and runs the
/// auto-wave countdown.
///
/// Execution each tick:
///   1. If the active wave has nothing left to spawn and no enemy is
///      alive, complete it (reward, overlay, advance index).
///   2. Otherwise, while no wave runs, count down and auto-start.
class WaveSystem final : public tds::ecs::ISystem {
public:
    explicit WaveSystem(SimulationState& state) : state_(state) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] tds::ecs::SystemStage GetStage() const override {
        return tds::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "WaveSystem"; }

    /// Start the wave at the current index.
    ///
    /// @return GameIsOver or WaveAlreadyActive with no state change.
    static foundation::GameResult<void> StartWave(SimulationState& state);

private:
    void completeWave();

    SimulationState& state_;
};

}  // namespace tds::game
