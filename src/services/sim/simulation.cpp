/// @file simulation.cpp
/// @brief Simulation implementation: system wiring, actions, snapshots.

#include "tds/service/simulation.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include "tds/ecs/system_scheduler.hpp"
#include "tds/foundation/error_code.hpp"
#include "tds/foundation/game_error.hpp"
#include "tds/foundation/game_logger.hpp"
#include "tds/game/movement_system.hpp"
#include "tds/game/path.hpp"
#include "tds/game/placement.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/game/tower_system.hpp"
#include "tds/game/wave_system.hpp"

namespace tds::service {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameLogger;
using tds::foundation::GameResult;
using tds::foundation::LogCategory;
using tds::foundation::LogContext;
using tds::foundation::LogLevel;
using tds::game::SimulationState;
using tds::game::TowerKind;
using tds::game::Vector2;
using tds::game::WavePhase;

namespace {

GameError gameOverError() {
    return GameError(ErrorCode::GameIsOver, "game is over; reset to play again");
}

/// Routine rejections go to Debug; anything else is unexpected here.
void logRejected(std::string_view action, const GameError& error) {
    const auto level = error.isRejection() ? LogLevel::Debug : LogLevel::Warning;
    auto& logger = GameLogger::instance();
    if (logger.isEnabled(level, LogCategory::Input)) {
        LogContext ctx;
        ctx.extra["action"] = std::string(action);
        logger.logWithContext(level, LogCategory::Input,
                              "Action rejected: " + error.describe(), ctx);
    }
}

} // namespace

// -- Impl --------------------------------------------------------------------

struct Simulation::Impl {
    std::unique_ptr<SimulationState> state;
    tds::ecs::SystemScheduler scheduler;

    uint64_t totalTicks = 0;
    uint64_t totalFrames = 0;

    explicit Impl(std::unique_ptr<SimulationState> s) : state(std::move(s)) {}

    /// Register the six game systems and fix their order.
    [[nodiscard]] bool registerSystems() {
        // PreUpdate stage
        scheduler.Register<tds::game::SpawnSystem>(*state);

        // Update stage
        scheduler.Register<tds::game::MovementSystem>(*state);
        scheduler.Register<tds::game::PruneSystem>(*state);
        scheduler.Register<tds::game::TowerSystem>(*state);
        scheduler.Register<tds::game::ProjectileSystem>(*state);

        // PostUpdate stage
        scheduler.Register<tds::game::WaveSystem>(*state);

        bool ok = scheduler.AddDependency<tds::game::MovementSystem, tds::game::PruneSystem>();
        ok = ok && scheduler.AddDependency<tds::game::PruneSystem, tds::game::TowerSystem>();
        ok = ok && scheduler.AddDependency<tds::game::TowerSystem, tds::game::ProjectileSystem>();
        return ok && scheduler.Build();
    }

    [[nodiscard]] std::optional<ecs::Entity> liveTower(ecs::Entity tower) const {
        if (state->entities.IsAlive(tower) && state->towers.Find(tower) != nullptr) {
            return tower;
        }
        return std::nullopt;
    }
};

// -- Construction ------------------------------------------------------------

Simulation::Simulation(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Simulation::~Simulation() = default;
Simulation::Simulation(Simulation&&) noexcept = default;
Simulation& Simulation::operator=(Simulation&&) noexcept = default;

GameResult<Simulation> Simulation::create(game::GameRules rules) {
    auto path = game::Path::Build(rules.pathWaypoints);
    if (!path) {
        return GameResult<Simulation>::err(path.error());
    }

    auto impl = std::make_unique<Impl>(
        std::make_unique<SimulationState>(std::move(rules), std::move(path).value()));

    if (!impl->registerSystems()) {
        return GameResult<Simulation>::err(
            GameError(ErrorCode::SystemSchedulerBuildFailed, impl->scheduler.GetLastError()));
    }

    TDS_LOG_INFO(LogCategory::Core,
                 "Simulation created (path length " +
                     std::to_string(static_cast<int32_t>(impl->state->path.Length())) + ")");

    return GameResult<Simulation>::ok(Simulation(std::move(impl)));
}

// -- Time --------------------------------------------------------------------

void Simulation::tick(float deltaTime) {
    auto& state = *impl_->state;
    if (state.gameOver) {
        return;
    }

    state.time += deltaTime;
    impl_->scheduler.Execute(deltaTime);
    ++impl_->totalTicks;
}

void Simulation::frame(float deltaTime) {
    ++impl_->totalFrames;

    const auto& state = *impl_->state;
    const uint32_t ticks = state.turbo ? std::max<uint32_t>(state.rules.loop.turboMultiplier, 1) : 1;
    for (uint32_t i = 0; i < ticks && !state.gameOver; ++i) {
        tick(deltaTime);
    }
}

// -- Actions -----------------------------------------------------------------

GameResult<ecs::Entity> Simulation::placeTower(const Vector2& position, TowerKind kind) {
    auto& state = *impl_->state;
    if (state.gameOver) {
        logRejected("placeTower", gameOverError());
        return GameResult<ecs::Entity>::err(gameOverError());
    }

    auto check = game::CheckPlacement(state, position, kind);
    if (!check) {
        logRejected("placeTower", check.error());
        return GameResult<ecs::Entity>::err(check.error());
    }

    auto paid = state.economy.Spend(state.rules.tower(kind).baseCost);
    if (!paid) {
        logRejected("placeTower", paid.error());
        return GameResult<ecs::Entity>::err(paid.error());
    }

    const auto entity = state.entities.Create();
    game::Tower tower;
    tower.position = position;
    tower.kind = kind;
    state.towers.Add(entity, tower);

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Economy)) {
        LogContext ctx;
        ctx.entityId = entity.raw;
        ctx.extra["kind"] = std::string(game::towerKindName(kind));
        ctx.extra["money"] = std::to_string(state.economy.Money());
        logger.logWithContext(LogLevel::Info, LogCategory::Economy, "Tower placed", ctx);
    }

    return GameResult<ecs::Entity>::ok(entity);
}

GameResult<int32_t> Simulation::upgradeSelectedTower() {
    auto& state = *impl_->state;
    if (state.gameOver) {
        logRejected("upgradeSelectedTower", gameOverError());
        return GameResult<int32_t>::err(gameOverError());
    }

    if (!state.selectedTower || !impl_->liveTower(*state.selectedTower)) {
        GameError error(ErrorCode::NoTowerSelected, "no tower selected");
        logRejected("upgradeSelectedTower", error);
        return GameResult<int32_t>::err(std::move(error));
    }

    auto& tower = state.towers.Get(*state.selectedTower);
    const auto cost = game::ComputeUpgradeCost(state.rules.tower(tower.kind), tower.level);

    auto paid = state.economy.Spend(cost);
    if (!paid) {
        logRejected("upgradeSelectedTower", paid.error());
        return GameResult<int32_t>::err(paid.error());
    }

    ++tower.level;

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Economy)) {
        LogContext ctx;
        ctx.entityId = state.selectedTower->raw;
        ctx.extra["level"] = std::to_string(tower.level);
        ctx.extra["cost"] = std::to_string(cost);
        ctx.extra["money"] = std::to_string(state.economy.Money());
        logger.logWithContext(LogLevel::Info, LogCategory::Economy, "Tower upgraded", ctx);
    }

    return GameResult<int32_t>::ok(tower.level);
}

GameResult<void> Simulation::selectTower(std::optional<ecs::Entity> tower) {
    auto& state = *impl_->state;
    if (!tower) {
        state.selectedTower.reset();
        return GameResult<void>::ok();
    }

    if (!impl_->liveTower(*tower)) {
        GameError error(ErrorCode::TowerNotFound, "entity is not a tower");
        logRejected("selectTower", error);
        return GameResult<void>::err(std::move(error));
    }

    state.selectedTower = tower;
    return GameResult<void>::ok();
}

std::optional<ecs::Entity> Simulation::selectTowerAt(const Vector2& position) {
    auto& state = *impl_->state;
    state.selectedTower = game::TowerAt(state, position);
    return state.selectedTower;
}

GameResult<void> Simulation::startWave() {
    auto result = tds::game::WaveSystem::StartWave(*impl_->state);
    if (!result) {
        logRejected("startWave", result.error());
    }
    return result;
}

void Simulation::setAutoWave(bool enabled) {
    auto& state = *impl_->state;
    state.wave.autoWave = enabled;

    if (!enabled) {
        state.wave.autoCountdown.reset();
    } else if (state.phase == WavePhase::WaveComplete && !state.gameOver &&
               !state.wave.autoCountdown) {
        state.wave.autoCountdown = state.rules.waves.autoWaveDelay;
    }

    TDS_LOG_DEBUG(LogCategory::Input, enabled ? "Auto-wave enabled" : "Auto-wave disabled");
}

void Simulation::setTurbo(bool enabled) {
    impl_->state->turbo = enabled;
    TDS_LOG_DEBUG(LogCategory::Input, enabled ? "Turbo enabled" : "Turbo disabled");
}

void Simulation::resetGame() {
    impl_->state->Reset();
    impl_->totalTicks = 0;
    impl_->totalFrames = 0;
    TDS_LOG_INFO(LogCategory::Core, "Game reset");
}

// -- Queries -----------------------------------------------------------------

GameResult<void> Simulation::canPlace(const Vector2& position, TowerKind kind) const {
    if (impl_->state->gameOver) {
        return GameResult<void>::err(gameOverError());
    }
    return game::CheckPlacement(*impl_->state, position, kind);
}

GameResult<int32_t> Simulation::upgradeCost(ecs::Entity tower) const {
    if (!impl_->liveTower(tower)) {
        return GameResult<int32_t>::err(
            GameError(ErrorCode::TowerNotFound, "entity is not a tower"));
    }
    const auto& t = impl_->state->towers.Get(tower);
    return GameResult<int32_t>::ok(
        game::ComputeUpgradeCost(impl_->state->rules.tower(t.kind), t.level));
}

Snapshot Simulation::snapshot() const {
    const auto& state = *impl_->state;

    Snapshot snap;
    snap.money = state.economy.Money();
    snap.lives = state.economy.Lives();
    snap.waveNumber = state.wave.index + 1;
    snap.phase = state.phase;
    snap.gameOver = state.gameOver;
    snap.autoWave = state.wave.autoWave;
    snap.turbo = state.turbo;
    snap.selectedTower = state.selectedTower;
    snap.path = state.path.Waypoints();

    snap.towers.reserve(state.towers.Size());
    for (std::size_t i = 0; i < state.towers.Size(); ++i) {
        const auto& tower = state.towers.At(i);
        const auto& spec = state.rules.tower(tower.kind);

        TowerView view;
        view.id = state.towers.EntityAt(i);
        view.position = tower.position;
        view.kind = tower.kind;
        view.level = tower.level;
        view.stats = game::ComputeTowerStats(spec, tower.level);
        view.upgradeCost = game::ComputeUpgradeCost(spec, tower.level);
        snap.towers.push_back(view);
    }

    for (std::size_t i = 0; i < state.followers.Size(); ++i) {
        const auto enemy = state.followers.EntityAt(i);
        const auto& follower = state.followers.At(i);
        const auto* vitality = state.vitals.Find(enemy);
        const auto* traits = state.traits.Find(enemy);
        if (vitality == nullptr || traits == nullptr || !vitality->alive) {
            continue;
        }

        EnemyView view;
        view.id = enemy;
        view.position = state.path.PositionAt(follower.s);
        view.hp = vitality->hp;
        view.maxHp = vitality->maxHp;
        view.kind = traits->kind;
        view.radius = traits->radius;
        view.progress = follower.s;
        snap.enemies.push_back(view);
    }

    snap.projectiles.reserve(state.projectiles.Size());
    for (const auto& projectile : state.projectiles) {
        snap.projectiles.push_back(ProjectileView{projectile.position, projectile.payload});
    }

    snap.beams.reserve(state.beams.size());
    for (const auto& beam : state.beams) {
        snap.beams.push_back(BeamView{beam.start, beam.end});
    }

    if (state.overlay) {
        OverlayView overlay;
        overlay.waveNumber = state.overlay->waveNumber;
        overlay.reward = state.overlay->reward;
        overlay.bonus = state.overlay->bonus;
        overlay.countdown = state.wave.autoCountdown;
        snap.overlay = overlay;
    }

    return snap;
}

SimulationStats Simulation::stats() const {
    const auto& state = *impl_->state;

    SimulationStats s;
    s.totalTicks = impl_->totalTicks;
    s.totalFrames = impl_->totalFrames;
    s.simulatedSeconds = state.time;
    s.entityCount = state.entities.Count();
    s.towerCount = state.towers.Size();
    s.enemyCount = state.followers.Size();
    s.projectileCount = state.projectiles.Size();
    return s;
}

int64_t Simulation::money() const noexcept {
    return impl_->state->economy.Money();
}

int32_t Simulation::lives() const noexcept {
    return impl_->state->economy.Lives();
}

uint32_t Simulation::waveNumber() const noexcept {
    return impl_->state->wave.index + 1;
}

WavePhase Simulation::phase() const noexcept {
    return impl_->state->phase;
}

bool Simulation::isGameOver() const noexcept {
    return impl_->state->gameOver;
}

bool Simulation::isTurbo() const noexcept {
    return impl_->state->turbo;
}

bool Simulation::isAutoWave() const noexcept {
    return impl_->state->wave.autoWave;
}

const game::GameRules& Simulation::rules() const noexcept {
    return impl_->state->rules;
}

const SimulationState& Simulation::state() const noexcept {
    return *impl_->state;
}

}  // namespace tds::service
