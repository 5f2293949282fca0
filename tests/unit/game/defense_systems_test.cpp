#include <gtest/gtest.h>

#include <memory>

#include "tds/game/combat_resolver.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/movement_system.hpp"
#include "tds/game/path.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/game/tower_system.hpp"
#include "tds/game/wave_system.hpp"

using namespace tds::game;
using tds::ecs::Entity;
using tds::foundation::ErrorCode;

class DefenseSystemsTest : public ::testing::Test {
protected:
    void SetUp() override { makeState(GameRules{}); }

    void makeState(GameRules rules) {
        state_.reset();
        state_ = std::make_unique<SimulationState>(
            std::move(rules), Path::Build(defaultPathWaypoints()).value());
    }

    Entity spawnAt(float s, double hp = 24.0, EnemyKind kind = EnemyKind::Normal) {
        auto enemy = state_->SpawnEnemy(SpawnRecord{hp, 70.0f, kind});
        state_->followers.Get(enemy).s = s;
        return enemy;
    }

    Entity addTower(float x, float y, TowerKind kind, int32_t level = 1) {
        auto entity = state_->entities.Create();
        state_->towers.Add(entity, Tower{Vector2{x, y}, kind, level, 0.0f});
        return entity;
    }

    double hp(Entity enemy) { return state_->vitals.Get(enemy).hp; }

    std::unique_ptr<SimulationState> state_;
};

// ===========================================================================
// SpawnSystem
// ===========================================================================

TEST_F(DefenseSystemsTest, FirstSpawnAfterOneInterval) {
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    SpawnSystem spawner(*state_);

    EXPECT_FLOAT_EQ(state_->wave.interval, 0.7f);
    EXPECT_EQ(state_->wave.queue.size(), 12u);

    spawner.Execute(0.6f);
    EXPECT_EQ(state_->followers.Size(), 0u);

    spawner.Execute(0.2f);
    EXPECT_EQ(state_->followers.Size(), 1u);
    EXPECT_EQ(state_->wave.queue.size(), 11u);
    EXPECT_EQ(state_->wave.spawned, 1u);
}

TEST_F(DefenseSystemsTest, SpawnCatchesUpOnLongTick) {
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    SpawnSystem spawner(*state_);

    spawner.Execute(2.2f);
    EXPECT_EQ(state_->followers.Size(), 3u);
    EXPECT_NEAR(state_->wave.elapsed, 0.1f, 1e-4f);
}

TEST_F(DefenseSystemsTest, SpawnIdleOutsideActiveWave) {
    SpawnSystem spawner(*state_);
    spawner.Execute(10.0f);
    EXPECT_EQ(state_->followers.Size(), 0u);
}

TEST_F(DefenseSystemsTest, SpawnedEnemiesStartAtPathStart) {
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    SpawnSystem spawner(*state_);
    spawner.Execute(1.5f);

    ASSERT_EQ(state_->followers.Size(), 2u);
    const auto& first = state_->followers.At(0);
    const auto& second = state_->followers.At(1);
    EXPECT_FLOAT_EQ(first.s, 0.0f);
    EXPECT_FLOAT_EQ(first.speed, 70.0f);
    EXPECT_LT(first.spawnOrder, second.spawnOrder);
    EXPECT_FLOAT_EQ(state_->vitals.At(0).hp, 24.0f);
}

// ===========================================================================
// MovementSystem / PruneSystem
// ===========================================================================

TEST_F(DefenseSystemsTest, EnemiesAdvanceBySpeed) {
    auto enemy = spawnAt(100.0f);
    MovementSystem movement(*state_);
    movement.Execute(0.5f);
    EXPECT_FLOAT_EQ(state_->followers.Get(enemy).s, 135.0f);
}

TEST_F(DefenseSystemsTest, LeakCostsOneLife) {
    auto enemy = spawnAt(3099.0f);
    MovementSystem movement(*state_);
    movement.Execute(0.1f);

    const auto& vitality = state_->vitals.Get(enemy);
    EXPECT_FALSE(vitality.alive);
    EXPECT_TRUE(vitality.leaked);
    EXPECT_EQ(state_->economy.Lives(), 19);
    EXPECT_EQ(state_->economy.Money(), 120);

    // A leaked enemy keeps walking and never costs a second life.
    movement.Execute(0.1f);
    EXPECT_GT(state_->followers.Get(enemy).s, 3106.0f);
    EXPECT_EQ(state_->economy.Lives(), 19);
}

TEST_F(DefenseSystemsTest, LastLifeEndsGame) {
    GameRules rules;
    rules.economy.startLives = 1;
    makeState(rules);

    auto enemy = spawnAt(3099.0f);
    auto other = spawnAt(1000.0f);
    MovementSystem movement(*state_);
    movement.Execute(0.1f);

    EXPECT_TRUE(state_->gameOver);
    EXPECT_EQ(state_->economy.Lives(), 0);
    EXPECT_FALSE(state_->vitals.Get(enemy).alive);

    // Frozen after game over.
    const float s = state_->followers.Get(other).s;
    movement.Execute(1.0f);
    EXPECT_FLOAT_EQ(state_->followers.Get(other).s, s);
}

TEST_F(DefenseSystemsTest, LeakedEnemyRemovedPastExitMargin) {
    auto enemy = spawnAt(3099.0f);
    MovementSystem movement(*state_);
    PruneSystem prune(*state_);

    movement.Execute(0.1f);
    prune.Execute(0.1f);
    EXPECT_TRUE(state_->entities.IsAlive(enemy));

    state_->followers.Get(enemy).s = 3140.0f;
    prune.Execute(0.0f);
    EXPECT_FALSE(state_->entities.IsAlive(enemy));
    EXPECT_EQ(state_->vitals.Size(), 0u);
}

TEST_F(DefenseSystemsTest, CorpseRemovedAfterGrace) {
    auto enemy = spawnAt(500.0f);
    ASSERT_TRUE(CombatResolver::ApplyDamage(*state_, enemy, 100.0f, TowerKind::Basic));

    MovementSystem movement(*state_);
    PruneSystem prune(*state_);

    movement.Execute(0.1f);
    prune.Execute(0.1f);
    EXPECT_TRUE(state_->entities.IsAlive(enemy));
    // Corpses stay where they fell.
    EXPECT_FLOAT_EQ(state_->followers.Get(enemy).s, 500.0f);

    movement.Execute(0.2f);
    prune.Execute(0.2f);
    EXPECT_FALSE(state_->entities.IsAlive(enemy));
}

// ===========================================================================
// TowerSystem / ProjectileSystem
// ===========================================================================

TEST_F(DefenseSystemsTest, BasicTowerFiresAndCoolsDown) {
    spawnAt(300.0f);
    auto towerEntity = addTower(250.0f, 140.0f, TowerKind::Basic);
    TowerSystem towers(*state_);

    towers.Execute(0.016f);
    EXPECT_EQ(state_->projectiles.Size(), 1u);
    EXPECT_FLOAT_EQ(state_->towers.Get(towerEntity).cooldown, 1.0f / 1.6f);

    towers.Execute(0.016f);
    EXPECT_EQ(state_->projectiles.Size(), 1u);
}

TEST_F(DefenseSystemsTest, TowerHoldsFireWithoutTarget) {
    spawnAt(1000.0f);
    addTower(250.0f, 140.0f, TowerKind::Basic);
    TowerSystem towers(*state_);

    towers.Execute(0.5f);
    EXPECT_EQ(state_->projectiles.Size(), 0u);
}

TEST_F(DefenseSystemsTest, ProjectileHitsTarget) {
    auto enemy = spawnAt(300.0f);
    addTower(250.0f, 140.0f, TowerKind::Basic);
    TowerSystem towers(*state_);
    ProjectileSystem projectiles(*state_);

    towers.Execute(0.016f);
    ASSERT_EQ(state_->projectiles.Size(), 1u);

    projectiles.Execute(0.2f);
    EXPECT_EQ(state_->projectiles.Size(), 0u);
    EXPECT_FLOAT_EQ(hp(enemy), 12.0f);
}

TEST_F(DefenseSystemsTest, ProjectileHomesInSmallSteps) {
    auto enemy = spawnAt(300.0f);
    addTower(250.0f, 140.0f, TowerKind::Basic);
    TowerSystem towers(*state_);
    ProjectileSystem projectiles(*state_);

    towers.Execute(0.016f);
    projectiles.Execute(0.016f);
    ASSERT_EQ(state_->projectiles.Size(), 1u);
    EXPECT_FLOAT_EQ(hp(enemy), 24.0f);

    for (int i = 0; i < 20 && state_->projectiles.Size() > 0; ++i) {
        projectiles.Execute(0.016f);
    }
    EXPECT_EQ(state_->projectiles.Size(), 0u);
    EXPECT_FLOAT_EQ(hp(enemy), 12.0f);
}

TEST_F(DefenseSystemsTest, ProjectileDiscardedWhenTargetDies) {
    auto enemy = spawnAt(300.0f);
    addTower(250.0f, 140.0f, TowerKind::Basic);
    TowerSystem towers(*state_);
    ProjectileSystem projectiles(*state_);

    towers.Execute(0.016f);
    ASSERT_TRUE(CombatResolver::ApplyDamage(*state_, enemy, 100.0f, TowerKind::Beam));
    const auto money = state_->economy.Money();

    projectiles.Execute(0.016f);
    EXPECT_EQ(state_->projectiles.Size(), 0u);
    EXPECT_EQ(state_->economy.Money(), money);
}

TEST_F(DefenseSystemsTest, ProjectileLeavingFieldIsDiscarded) {
    // The path starts off the field at (-80, 80); the tower reaches it.
    auto enemy = spawnAt(0.0f);
    addTower(30.0f, 40.0f, TowerKind::Basic);
    TowerSystem towers(*state_);
    ProjectileSystem projectiles(*state_);

    towers.Execute(0.016f);
    ASSERT_EQ(state_->projectiles.Size(), 1u);

    // 32 units per step: the first stays inside x >= -20, the second does not.
    projectiles.Execute(0.1f);
    ASSERT_EQ(state_->projectiles.Size(), 1u);
    EXPECT_GT(state_->projectiles.At(0).position.x, -state_->rules.field.projectileMargin);

    projectiles.Execute(0.1f);
    EXPECT_EQ(state_->projectiles.Size(), 0u);
    EXPECT_FLOAT_EQ(hp(enemy), 24.0f);
    EXPECT_TRUE(state_->vitals.Get(enemy).alive);
}

TEST_F(DefenseSystemsTest, SplashSparesPrimaryTarget) {
    auto target = spawnAt(350.0f);    // (270, 80)
    auto neighbor = spawnAt(320.0f);  // (240, 80)
    auto far = spawnAt(600.0f);       // (520, 80)
    addTower(250.0f, 140.0f, TowerKind::Splash);
    TowerSystem towers(*state_);
    ProjectileSystem projectiles(*state_);

    towers.Execute(0.016f);
    ASSERT_EQ(state_->projectiles.Size(), 1u);
    projectiles.Execute(0.5f);

    EXPECT_FLOAT_EQ(hp(target), 14.0f);
    EXPECT_FLOAT_EQ(hp(neighbor), 18.0f);
    EXPECT_FLOAT_EQ(hp(far), 24.0f);
}

TEST_F(DefenseSystemsTest, BeamPiercesAlongItsLine) {
    auto target = spawnAt(380.0f);  // (300, 80), oldest
    auto behind = spawnAt(385.0f);  // (305, 80), next to the beam line
    auto away = spawnAt(700.0f);    // (620, 80)
    addTower(400.0f, 140.0f, TowerKind::Beam);
    TowerSystem towers(*state_);

    towers.Execute(0.1f);
    ASSERT_EQ(state_->beams.size(), 1u);
    EXPECT_FLOAT_EQ(state_->beams.front().dps, 30.0f);
    EXPECT_NEAR(Distance(state_->beams.front().start, state_->beams.front().end), 260.0f, 1e-3f);

    EXPECT_NEAR(hp(target), 21.0f, 1e-4f);
    EXPECT_NEAR(hp(behind), 21.0f, 1e-4f);
    EXPECT_FLOAT_EQ(hp(away), 24.0f);
    EXPECT_EQ(state_->projectiles.Size(), 0u);
}

TEST_F(DefenseSystemsTest, BeamsRebuiltEveryTick) {
    auto enemy = spawnAt(380.0f);
    addTower(400.0f, 140.0f, TowerKind::Beam);
    TowerSystem towers(*state_);

    towers.Execute(0.1f);
    towers.Execute(0.1f);
    EXPECT_EQ(state_->beams.size(), 1u);

    state_->entities.Destroy(enemy);
    towers.Execute(0.1f);
    EXPECT_TRUE(state_->beams.empty());
}

// ===========================================================================
// WaveSystem
// ===========================================================================

TEST_F(DefenseSystemsTest, StartWaveRejectsWhileActive) {
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    auto again = WaveSystem::StartWave(*state_);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::WaveAlreadyActive);
}

TEST_F(DefenseSystemsTest, StartWaveRejectsAfterGameOver) {
    state_->gameOver = true;
    auto started = WaveSystem::StartWave(*state_);
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), ErrorCode::GameIsOver);
    EXPECT_EQ(state_->phase, WavePhase::Idle);
}

TEST_F(DefenseSystemsTest, WaveCompletesOnceAndPays) {
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    WaveSystem waves(*state_);

    auto straggler = spawnAt(100.0f);
    state_->wave.queue.clear();

    waves.Execute(0.016f);
    EXPECT_EQ(state_->phase, WavePhase::WaveActive);

    ASSERT_TRUE(CombatResolver::ApplyDamage(*state_, straggler, 100.0f, TowerKind::Basic));
    EXPECT_EQ(state_->economy.Money(), 125);

    waves.Execute(0.016f);
    EXPECT_EQ(state_->phase, WavePhase::WaveComplete);
    EXPECT_EQ(state_->wave.index, 1u);
    // 50 flat + floor(0.05 * 125)
    EXPECT_EQ(state_->economy.Money(), 125 + 50 + 6);
    ASSERT_TRUE(state_->overlay.has_value());
    EXPECT_EQ(state_->overlay->waveNumber, 1u);
    EXPECT_EQ(state_->overlay->reward, 50);
    EXPECT_EQ(state_->overlay->bonus, 6);
    EXPECT_FALSE(state_->wave.autoCountdown.has_value());

    waves.Execute(0.016f);
    EXPECT_EQ(state_->economy.Money(), 181);
    EXPECT_EQ(state_->wave.index, 1u);
}

TEST_F(DefenseSystemsTest, AutoWaveCountsDownToNextWave) {
    state_->wave.autoWave = true;
    ASSERT_TRUE(WaveSystem::StartWave(*state_).hasValue());
    state_->wave.queue.clear();

    WaveSystem waves(*state_);
    waves.Execute(0.016f);
    ASSERT_EQ(state_->phase, WavePhase::WaveComplete);
    ASSERT_TRUE(state_->wave.autoCountdown.has_value());
    EXPECT_FLOAT_EQ(*state_->wave.autoCountdown, 5.0f);

    waves.Execute(4.0f);
    EXPECT_EQ(state_->phase, WavePhase::WaveComplete);

    waves.Execute(1.5f);
    EXPECT_EQ(state_->phase, WavePhase::WaveActive);
    EXPECT_EQ(state_->wave.index, 1u);
    EXPECT_FALSE(state_->wave.queue.empty());
    EXPECT_FALSE(state_->overlay.has_value());
    EXPECT_FALSE(state_->wave.autoCountdown.has_value());
}
