#pragma once

/// @file simulation_state.hpp
/// @brief Single container for all mutable simulation state.
///
/// Systems receive the state by reference.  The entity manager holds
/// raw pointers to the storages below, so the container is neither
/// copyable nor movable; the owner keeps it behind a unique_ptr.

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "tds/ecs/component_storage.hpp"
#include "tds/ecs/entity_manager.hpp"
#include "tds/game/defense_components.hpp"
#include "tds/game/economy.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/path.hpp"
#include "tds/game/wave_director.hpp"

namespace tds::game {

/// Spawning and wave lifecycle state.
struct WaveState {
    /// 0-based index of the current (or next) wave.
    uint32_t index = 0;
    std::deque<SpawnRecord> queue;
    float interval = 0.0f;
    float elapsed = 0.0f;
    /// Enemies spawned during the current wave.
    uint32_t spawned = 0;
    bool autoWave = false;
    /// Seconds until the next automatic start, if one is pending.
    std::optional<float> autoCountdown;
};

/// Summary shown after a wave completes.
struct WaveOverlay {
    /// 1-based number of the completed wave.
    uint32_t waveNumber = 0;
    int64_t reward = 0;
    int64_t bonus = 0;
};

/// All state of one session.
class SimulationState {
public:
    SimulationState(GameRules rules, Path path);

    SimulationState(const SimulationState&) = delete;
    SimulationState& operator=(const SimulationState&) = delete;
    SimulationState(SimulationState&&) = delete;
    SimulationState& operator=(SimulationState&&) = delete;

    /// Restore the session start: no entities, stock money and lives,
    /// wave 1 pending, phase Idle, game over cleared.  Auto-wave and
    /// turbo preferences are kept.
    void Reset();

    /// Spawn an enemy at the path start from @p record.
    ecs::Entity SpawnEnemy(const SpawnRecord& record);

    /// Position of @p enemy on the path, or nullopt if it has no follower.
    [[nodiscard]] std::optional<Vector2> EnemyPosition(ecs::Entity enemy) const;

    /// True if any spawned enemy is still alive.
    [[nodiscard]] bool AnyEnemyAlive() const;

    // ── Immutable session data ──────────────────────────────────────

    const GameRules rules;
    const Path path;
    const WaveDirector director{rules.waves};

    // ── ECS ─────────────────────────────────────────────────────────

    ecs::EntityManager entities;
    ecs::ComponentStorage<PathFollower> followers;
    ecs::ComponentStorage<Vitality> vitals;
    ecs::ComponentStorage<EnemyTraits> traits;
    ecs::ComponentStorage<Tower> towers;
    ecs::ComponentStorage<Projectile> projectiles;

    // ── Session state ───────────────────────────────────────────────

    Economy economy;
    WaveState wave;
    WavePhase phase = WavePhase::Idle;
    bool gameOver = false;
    bool turbo = false;
    std::optional<WaveOverlay> overlay;
    std::optional<ecs::Entity> selectedTower;
    /// Rebuilt by the tower system every tick.
    std::vector<Beam> beams;
    /// Simulated seconds since the session (re)started.
    double time = 0.0;
    uint64_t nextSpawnOrder = 0;
};

}  // namespace tds::game
