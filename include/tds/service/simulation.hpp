#pragma once

/// @file simulation.hpp
/// @brief Simulation facade: owns the session state, runs the systems,
///        accepts player actions, and publishes read-only snapshots.
///
/// Simulation wires the six game systems into an ECS SystemScheduler:
///   PreUpdate:  SpawnSystem
///   Update:     MovementSystem -> PruneSystem -> TowerSystem -> ProjectileSystem
///   PostUpdate: WaveSystem
///
/// Actions are applied immediately between ticks.  Every action that can
/// be refused returns a GameResult and leaves the state untouched when
/// refused.

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "tds/ecs/entity.hpp"
#include "tds/foundation/game_result.hpp"
#include "tds/game/defense_types.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/math_types.hpp"
#include "tds/game/tower_stats.hpp"

namespace tds::game {
class SimulationState;
}  // namespace tds::game

namespace tds::service {

// -- Snapshot ----------------------------------------------------------------

struct TowerView {
    ecs::Entity id;
    game::Vector2 position;
    game::TowerKind kind = game::TowerKind::Basic;
    int32_t level = 1;
    game::TowerStats stats;
    int32_t upgradeCost = 0;
};

struct EnemyView {
    ecs::Entity id;
    game::Vector2 position;
    double hp = 0.0;
    double maxHp = 0.0;
    game::EnemyKind kind = game::EnemyKind::Normal;
    float radius = 0.0f;
    /// Arc length travelled along the path.
    float progress = 0.0f;
};

struct ProjectileView {
    game::Vector2 position;
    game::PayloadKind payload = game::PayloadKind::Direct;
};

struct BeamView {
    game::Vector2 start;
    game::Vector2 end;
};

struct OverlayView {
    uint32_t waveNumber = 0;
    int64_t reward = 0;
    int64_t bonus = 0;
    /// Seconds until the next wave starts automatically, if pending.
    std::optional<float> countdown;
};

/// Everything a presentation layer needs to draw one frame.
struct Snapshot {
    int64_t money = 0;
    int32_t lives = 0;
    /// 1-based number of the current (or next) wave.
    uint32_t waveNumber = 1;
    game::WavePhase phase = game::WavePhase::Idle;
    bool gameOver = false;
    bool autoWave = false;
    bool turbo = false;
    std::optional<ecs::Entity> selectedTower;
    std::vector<TowerView> towers;
    std::vector<EnemyView> enemies;
    std::vector<ProjectileView> projectiles;
    std::vector<BeamView> beams;
    std::optional<OverlayView> overlay;
    std::vector<game::Vector2> path;
};

// -- Statistics ---------------------------------------------------------------

/// Runtime counters for the session, reset by resetGame().
struct SimulationStats {
    uint64_t totalTicks = 0;
    uint64_t totalFrames = 0;
    double simulatedSeconds = 0.0;
    std::size_t entityCount = 0;
    std::size_t towerCount = 0;
    std::size_t enemyCount = 0;
    std::size_t projectileCount = 0;
};

// -- Simulation --------------------------------------------------------------

/// Tower defense session.
///
/// Usage:
/// @code
///   auto created = Simulation::create(game::GameRules{});
///   if (!created) { ... }
///   auto sim = std::move(created).value();
///
///   sim.placeTower({300.0f, 140.0f}, game::TowerKind::Basic);
///   sim.startWave();
///   sim.frame(1.0f / 60.0f);
///   auto view = sim.snapshot();
/// @endcode
class Simulation {
public:
    /// Build a session from @p rules.
    ///
    /// @return InvalidArgument if the path is degenerate, or
    ///         SystemSchedulerBuildFailed if system ordering fails.
    [[nodiscard]] static foundation::GameResult<Simulation> create(game::GameRules rules);

    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) noexcept;
    Simulation& operator=(Simulation&&) noexcept;

    // -- Time -----------------------------------------------------------------

    /// Run one simulation tick of @p deltaTime seconds.
    /// Ignored once the game is over.
    void tick(float deltaTime);

    /// Run one frame: one tick, or `turboMultiplier` ticks in turbo mode.
    /// @p deltaTime is expected to be clamped by the frame clock already.
    void frame(float deltaTime);

    // -- Actions --------------------------------------------------------------

    /// Place a tower of @p kind at @p position and pay its base cost.
    [[nodiscard]] foundation::GameResult<ecs::Entity> placeTower(const game::Vector2& position,
                                                                 game::TowerKind kind);

    /// Upgrade the selected tower by one level.
    /// @return The new level.
    [[nodiscard]] foundation::GameResult<int32_t> upgradeSelectedTower();

    /// Select @p tower, or clear the selection with std::nullopt.
    /// @return TowerNotFound if the handle is not a live tower.
    [[nodiscard]] foundation::GameResult<void> selectTower(std::optional<ecs::Entity> tower);

    /// Select the tower nearest to @p position within the pick radius,
    /// or clear the selection when none is close enough.
    /// @return The new selection.
    std::optional<ecs::Entity> selectTowerAt(const game::Vector2& position);

    /// Start the next wave.
    /// @return WaveAlreadyActive during a wave, GameIsOver after game over.
    [[nodiscard]] foundation::GameResult<void> startWave();

    /// Enable or disable automatic wave starts.
    ///
    /// Enabling while waiting after a completed wave starts the countdown;
    /// disabling cancels a pending countdown.
    void setAutoWave(bool enabled);

    /// Enable or disable turbo (multiple ticks per frame).
    void setTurbo(bool enabled);

    /// Reinitialize the whole session.  Auto-wave and turbo are kept.
    void resetGame();

    // -- Queries --------------------------------------------------------------

    /// Whether a tower of @p kind could be placed at @p position now.
    [[nodiscard]] foundation::GameResult<void> canPlace(const game::Vector2& position,
                                                        game::TowerKind kind) const;

    /// Cost of the next upgrade of @p tower.
    [[nodiscard]] foundation::GameResult<int32_t> upgradeCost(ecs::Entity tower) const;

    [[nodiscard]] Snapshot snapshot() const;

    [[nodiscard]] SimulationStats stats() const;

    [[nodiscard]] int64_t money() const noexcept;
    [[nodiscard]] int32_t lives() const noexcept;
    [[nodiscard]] uint32_t waveNumber() const noexcept;
    [[nodiscard]] game::WavePhase phase() const noexcept;
    [[nodiscard]] bool isGameOver() const noexcept;
    [[nodiscard]] bool isTurbo() const noexcept;
    [[nodiscard]] bool isAutoWave() const noexcept;

    [[nodiscard]] const game::GameRules& rules() const noexcept;

    /// Read-only access to the full state (diagnostics and tests).
    [[nodiscard]] const game::SimulationState& state() const noexcept;

private:
    struct Impl;
    explicit Simulation(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

}  // namespace tds::service
