#include <gtest/gtest.h>

#include "tds/foundation/config_manager.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/service/game_loop.hpp"
#include "tds/service/rules_loader.hpp"
#include "tds/service/simulation.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace tds::service;
using tds::foundation::ConfigManager;
using tds::game::WavePhase;

// =============================================================================
// Integration fixture: stock configuration driven through the game loop
// =============================================================================

class SimulationIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(config_.load(std::string(TDS_SOURCE_DIR) + "/config/tds.yaml").hasValue());

        auto rules = loadRules(config_);
        ASSERT_TRUE(rules.hasValue()) << rules.error().message();
        rules_ = rules.value();

        auto settings = loadRunnerSettings(config_);
        ASSERT_TRUE(settings.hasValue()) << settings.error().message();
        settings_ = settings.value();
    }

    std::unique_ptr<Simulation> makeSimulation() const {
        auto created = Simulation::create(rules_);
        EXPECT_TRUE(created.hasValue());
        return std::make_unique<Simulation>(std::move(created).value());
    }

    /// Place every layout tower that is affordable and not yet built.
    void placeLayout(Simulation& sim, std::vector<bool>& placed) const {
        placed.resize(settings_.layout.size(), false);
        for (std::size_t i = 0; i < settings_.layout.size(); ++i) {
            const auto& tower = settings_.layout[i];
            if (placed[i] || !sim.canPlace(tower.position, tower.kind)) {
                continue;
            }
            placed[i] = sim.placeTower(tower.position, tower.kind).hasValue();
        }
    }

    ConfigManager config_;
    tds::game::GameRules rules_;
    RunnerSettings settings_;
};

// =============================================================================
// Long run with invariant checks
// =============================================================================

TEST_F(SimulationIntegrationTest, StockLayoutHoldsInvariants) {
    constexpr uint64_t kMaxFrames = 40000;

    auto sim = makeSimulation();
    sim->setAutoWave(true);
    std::vector<bool> placed;
    placeLayout(*sim, placed);
    ASSERT_GE(sim->snapshot().towers.size(), 2u);
    ASSERT_TRUE(sim->startWave().hasValue());

    const float pathLength = sim->state().path.Length();
    int32_t lastLives = sim->lives();
    uint32_t lastWave = sim->waveNumber();
    uint64_t violations = 0;

    GameLoop loop(settings_.frameRate, rules_.loop.maxFrameDelta);
    loop.setFrameCallback([&](float dt) {
        sim->frame(dt);
        placeLayout(*sim, placed);

        const auto snap = sim->snapshot();
        if (snap.money < 0 || snap.lives < 0 || snap.lives > lastLives ||
            snap.waveNumber < lastWave) {
            ++violations;
        }
        for (const auto& enemy : snap.enemies) {
            if (enemy.hp <= 0.0f || enemy.hp > enemy.maxHp ||
                enemy.progress < 0.0f || enemy.progress > pathLength) {
                ++violations;
            }
        }
        if (snap.gameOver != (snap.lives == 0)) {
            ++violations;
        }
        lastLives = snap.lives;
        lastWave = snap.waveNumber;
        return !snap.gameOver;
    });

    const auto period = loop.targetFrameTime();
    auto now = FrameClock::Clock::time_point{} + std::chrono::seconds(1);
    for (uint64_t i = 0; i < kMaxFrames && !loop.finished(); ++i) {
        (void)loop.frame(now);
        now += period;
    }

    EXPECT_EQ(violations, 0u);
    EXPECT_GT(sim->waveNumber(), 1u);

    auto stats = sim->stats();
    EXPECT_GT(stats.totalTicks, 0u);
    EXPECT_GE(stats.towerCount, 2u);

    if (sim->isGameOver()) {
        // Game over freezes the session.
        const auto before = sim->snapshot();
        sim->frame(1.0f / 60.0f);
        const auto after = sim->snapshot();
        EXPECT_EQ(before.money, after.money);
        EXPECT_EQ(before.enemies.size(), after.enemies.size());
        EXPECT_EQ(sim->stats().totalTicks, stats.totalTicks);
    }
}

// =============================================================================
// Determinism
// =============================================================================

TEST_F(SimulationIntegrationTest, IdenticalInputsGiveIdenticalSessions) {
    constexpr int kFrames = 6000;

    auto a = makeSimulation();
    auto b = makeSimulation();
    std::vector<bool> placedA;
    std::vector<bool> placedB;

    for (auto* sim : {a.get(), b.get()}) {
        sim->setAutoWave(true);
        sim->setTurbo(true);
    }
    placeLayout(*a, placedA);
    placeLayout(*b, placedB);
    ASSERT_TRUE(a->startWave().hasValue());
    ASSERT_TRUE(b->startWave().hasValue());

    for (int i = 0; i < kFrames; ++i) {
        a->frame(1.0f / 60.0f);
        b->frame(1.0f / 60.0f);
        placeLayout(*a, placedA);
        placeLayout(*b, placedB);
    }

    const auto sa = a->snapshot();
    const auto sb = b->snapshot();
    EXPECT_EQ(sa.money, sb.money);
    EXPECT_EQ(sa.lives, sb.lives);
    EXPECT_EQ(sa.waveNumber, sb.waveNumber);
    EXPECT_EQ(sa.phase, sb.phase);
    ASSERT_EQ(sa.enemies.size(), sb.enemies.size());
    for (std::size_t i = 0; i < sa.enemies.size(); ++i) {
        EXPECT_FLOAT_EQ(sa.enemies[i].hp, sb.enemies[i].hp);
        EXPECT_FLOAT_EQ(sa.enemies[i].progress, sb.enemies[i].progress);
    }
    EXPECT_EQ(placedA, placedB);
}

// =============================================================================
// Reset mid-session
// =============================================================================

TEST_F(SimulationIntegrationTest, ResetMidWaveStartsCleanSession) {
    auto sim = makeSimulation();
    std::vector<bool> placed;
    placeLayout(*sim, placed);
    ASSERT_TRUE(sim->startWave().hasValue());

    for (int i = 0; i < 300; ++i) {
        sim->frame(1.0f / 60.0f);
    }
    ASSERT_EQ(sim->phase(), WavePhase::WaveActive);
    ASSERT_FALSE(sim->snapshot().enemies.empty());

    sim->resetGame();
    EXPECT_EQ(sim->money(), rules_.economy.startMoney);
    EXPECT_EQ(sim->lives(), rules_.economy.startLives);
    EXPECT_EQ(sim->phase(), WavePhase::Idle);
    EXPECT_TRUE(sim->snapshot().enemies.empty());
    EXPECT_TRUE(sim->snapshot().towers.empty());

    // The reset session plays like a fresh one.
    placed.clear();
    placeLayout(*sim, placed);
    ASSERT_TRUE(sim->startWave().hasValue());
    for (int i = 0; i < 120; ++i) {
        sim->frame(1.0f / 60.0f);
    }
    EXPECT_FALSE(sim->snapshot().enemies.empty());
}
