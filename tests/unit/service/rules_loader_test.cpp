/// @file rules_loader_test.cpp
/// @brief Unit tests for configuration-driven rules and runner settings.

#include <gtest/gtest.h>

#include <string>

#include "tds/foundation/config_manager.hpp"
#include "tds/foundation/game_logger.hpp"
#include "tds/service/rules_loader.hpp"

using namespace tds::service;
using tds::foundation::ConfigManager;
using tds::foundation::ErrorCode;
using tds::foundation::GameLogger;
using tds::foundation::LogCategory;
using tds::foundation::LogLevel;
using tds::game::TowerKind;

namespace {

ConfigManager parse(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadString(yaml);
    EXPECT_TRUE(loaded.hasValue());
    return config;
}

} // namespace

// ============================================================================
// loadRules
// ============================================================================

TEST(RulesLoaderTest, EmptyConfigKeepsDefaults) {
    auto rules = loadRules(parse("{}"));
    ASSERT_TRUE(rules.hasValue());

    const auto& r = rules.value();
    EXPECT_EQ(r.economy.startMoney, 120);
    EXPECT_EQ(r.economy.startLives, 20);
    EXPECT_EQ(r.tower(TowerKind::Basic).baseCost, 50);
    EXPECT_EQ(r.tower(TowerKind::Beam).baseCost, 120);
    EXPECT_EQ(r.pathWaypoints.size(), 8u);
    EXPECT_FLOAT_EQ(r.damageMultiplier(TowerKind::Basic, tds::game::EnemyKind::Armored), 0.4f);
}

TEST(RulesLoaderTest, OverridesIndividualKeys) {
    auto rules = loadRules(parse(R"(
economy:
  start_money: 500
  wave_interest_rate: 0.1
waves:
  armored_from_wave: 2
  auto_wave_delay: 3.5
towers:
  splash:
    base_cost: 90
    splash_ratio: 0.75
combat:
  damage_multipliers:
    basic:
      armored: 0.5
loop:
  turbo_multiplier: 4
)"));
    ASSERT_TRUE(rules.hasValue());

    const auto& r = rules.value();
    EXPECT_EQ(r.economy.startMoney, 500);
    EXPECT_EQ(r.economy.startLives, 20);
    EXPECT_FLOAT_EQ(r.economy.waveInterestRate, 0.1f);
    EXPECT_EQ(r.waves.armoredFromWave, 2u);
    EXPECT_FLOAT_EQ(r.waves.autoWaveDelay, 3.5f);
    EXPECT_EQ(r.tower(TowerKind::Splash).baseCost, 90);
    EXPECT_FLOAT_EQ(r.tower(TowerKind::Splash).splashRatio, 0.75f);
    EXPECT_FLOAT_EQ(r.tower(TowerKind::Splash).range, 120.0f);
    EXPECT_FLOAT_EQ(r.damageMultiplier(TowerKind::Basic, tds::game::EnemyKind::Armored), 0.5f);
    EXPECT_EQ(r.loop.turboMultiplier, 4u);
}

TEST(RulesLoaderTest, TypeMismatchReported) {
    auto rules = loadRules(parse("economy:\n  start_money: plenty\n"));
    ASSERT_TRUE(rules.hasError());
    EXPECT_EQ(rules.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RulesLoaderTest, OutOfRangeValuesRejected) {
    auto noLives = loadRules(parse("economy:\n  start_lives: 0\n"));
    ASSERT_TRUE(noLives.hasError());
    EXPECT_EQ(noLives.error().code(), ErrorCode::InvalidArgument);

    auto share = loadRules(parse("waves:\n  armored_share: 1.5\n"));
    ASSERT_TRUE(share.hasError());
    EXPECT_EQ(share.error().code(), ErrorCode::InvalidArgument);

    auto rate = loadRules(parse("towers:\n  basic:\n    fire_rate: 0\n"));
    ASSERT_TRUE(rate.hasError());
    EXPECT_EQ(rate.error().code(), ErrorCode::InvalidArgument);
}

TEST(RulesLoaderTest, BeamMayHaveZeroFireRate) {
    auto rules = loadRules(parse("towers:\n  beam:\n    fire_rate: 0\n    damage: 45\n"));
    ASSERT_TRUE(rules.hasValue());
    EXPECT_FLOAT_EQ(rules.value().tower(TowerKind::Beam).damage, 45.0f);
}

TEST(RulesLoaderTest, PathWaypointsOverride) {
    auto rules = loadRules(parse(R"(
path:
  waypoints:
    - [0, 100]
    - [500, 100]
    - [500, 400]
)"));
    ASSERT_TRUE(rules.hasValue());

    const auto& waypoints = rules.value().pathWaypoints;
    ASSERT_EQ(waypoints.size(), 3u);
    EXPECT_FLOAT_EQ(waypoints[1].x, 500.0f);
    EXPECT_FLOAT_EQ(waypoints[2].y, 400.0f);
}

TEST(RulesLoaderTest, MalformedWaypointRejected) {
    auto rules = loadRules(parse("path:\n  waypoints:\n    - [0, 100, 5]\n    - [500, 100]\n"));
    ASSERT_TRUE(rules.hasError());
    EXPECT_EQ(rules.error().code(), ErrorCode::InvalidArgument);
}

TEST(RulesLoaderTest, ValidateRulesAcceptsDefaults) {
    EXPECT_TRUE(validateRules(tds::game::GameRules{}).hasValue());
}

// ============================================================================
// applyLogLevels
// ============================================================================

class ApplyLogLevelsTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& logger = GameLogger::instance();
        logger.setCategoryLevel(LogCategory::Wave, LogLevel::Info);
        logger.setCategoryLevel(LogCategory::Combat, LogLevel::Debug);
    }
};

TEST_F(ApplyLogLevelsTest, SetsCategoryLevels) {
    auto result = applyLogLevels(parse("logging:\n  levels:\n    Wave: warning\n    Combat: TRACE\n"));
    ASSERT_TRUE(result.hasValue());

    auto& logger = GameLogger::instance();
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Wave), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Trace);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
}

TEST_F(ApplyLogLevelsTest, UnknownLevelRejected) {
    auto result = applyLogLevels(parse("logging:\n  levels:\n    Wave: loud\n"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(GameLogger::instance().getCategoryLevel(LogCategory::Wave), LogLevel::Info);
}

// ============================================================================
// loadRunnerSettings
// ============================================================================

TEST(RunnerSettingsTest, Defaults) {
    auto settings = loadRunnerSettings(parse("{}"));
    ASSERT_TRUE(settings.hasValue());

    const auto& s = settings.value();
    EXPECT_EQ(s.frameRate, 60u);
    EXPECT_EQ(s.maxFrames, 0u);
    EXPECT_TRUE(s.unpaced);
    EXPECT_FALSE(s.turbo);
    EXPECT_TRUE(s.autoWave);
    EXPECT_TRUE(s.layout.empty());
}

TEST(RunnerSettingsTest, ReadsLayout) {
    auto settings = loadRunnerSettings(parse(R"(
runner:
  frame_rate: 30
  max_frames: 1000
  turbo: true
layout:
  towers:
    - { x: 300, y: 140, kind: basic, level: 3 }
    - { x: 480, y: 260, kind: splash }
    - { x: 760, y: 390 }
)"));
    ASSERT_TRUE(settings.hasValue());

    const auto& s = settings.value();
    EXPECT_EQ(s.frameRate, 30u);
    EXPECT_EQ(s.maxFrames, 1000u);
    EXPECT_TRUE(s.turbo);
    ASSERT_EQ(s.layout.size(), 3u);
    EXPECT_FLOAT_EQ(s.layout[0].position.x, 300.0f);
    EXPECT_EQ(s.layout[0].level, 3);
    EXPECT_EQ(s.layout[1].kind, TowerKind::Splash);
    EXPECT_EQ(s.layout[1].level, 1);
    EXPECT_EQ(s.layout[2].kind, TowerKind::Basic);
}

TEST(RunnerSettingsTest, UnknownTowerKindRejected) {
    auto settings = loadRunnerSettings(parse("layout:\n  towers:\n    - { x: 1, y: 2, kind: laser }\n"));
    ASSERT_TRUE(settings.hasError());
    EXPECT_EQ(settings.error().code(), ErrorCode::InvalidArgument);
}

TEST(RunnerSettingsTest, LayoutMustBeSequence) {
    auto settings = loadRunnerSettings(parse("layout:\n  towers: 5\n"));
    ASSERT_TRUE(settings.hasError());
    EXPECT_EQ(settings.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RunnerSettingsTest, MissingCoordinateRejected) {
    auto settings = loadRunnerSettings(parse("layout:\n  towers:\n    - { y: 2 }\n"));
    ASSERT_TRUE(settings.hasError());
    EXPECT_EQ(settings.error().code(), ErrorCode::ConfigTypeMismatch);
}
