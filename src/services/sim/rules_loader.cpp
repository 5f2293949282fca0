/// @file rules_loader.cpp
/// @brief Configuration to GameRules mapping.

#include "tds/service/rules_loader.hpp"

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "tds/foundation/game_logger.hpp"

namespace tds::service {

using tds::foundation::ConfigManager;
using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameLogger;
using tds::foundation::GameResult;
using tds::foundation::LogCategory;
using tds::foundation::kLogCategoryCount;
using tds::game::EnemyKind;
using tds::game::GameRules;
using tds::game::TowerKind;
using tds::game::TowerSpec;

namespace {

/// Overwrite @p field with the value at @p key, if present.
template <typename T>
GameResult<void> read(const ConfigManager& config, const std::string& key, T& field) {
    auto value = config.getOr<T>(key, field);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    field = value.value();
    return GameResult<void>::ok();
}

GameError invalid(const std::string& what) {
    return GameError(ErrorCode::InvalidArgument, "invalid rules: " + what);
}

/// Collects the first failure of a sequence of reads.
class Reader {
public:
    explicit Reader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    Reader& operator()(const std::string& key, T& field) {
        if (!error_) {
            auto r = read(config_, key, field);
            if (!r) {
                error_ = r.error();
            }
        }
        return *this;
    }

    [[nodiscard]] const std::optional<GameError>& error() const noexcept { return error_; }

private:
    const ConfigManager& config_;
    std::optional<GameError> error_;
};

void readTower(Reader& r, TowerKind kind, TowerSpec& spec) {
    const std::string prefix = "towers." + std::string(game::towerKindName(kind)) + ".";
    r(prefix + "base_cost", spec.baseCost)
     (prefix + "range", spec.range)
     (prefix + "range_per_level", spec.rangePerLevel)
     (prefix + "damage", spec.damage)
     (prefix + "damage_per_level", spec.damagePerLevel)
     (prefix + "fire_rate", spec.fireRate)
     (prefix + "fire_rate_per_level", spec.fireRatePerLevel)
     (prefix + "projectile_speed", spec.projectileSpeed)
     (prefix + "splash_radius", spec.splashRadius)
     (prefix + "splash_radius_per_level", spec.splashRadiusPerLevel)
     (prefix + "splash_ratio", spec.splashRatio)
     (prefix + "level_cap", spec.levelCap)
     (prefix + "upgrade_base", spec.upgradeBase)
     (prefix + "upgrade_growth", spec.upgradeGrowth)
     (prefix + "overlevel_cost", spec.overlevelCost)
     (prefix + "overlevel_damage_growth", spec.overlevelDamageGrowth);
}

GameResult<void> readPath(const ConfigManager& config, GameRules& rules) {
    if (!config.hasKey("path.waypoints")) {
        return GameResult<void>::ok();
    }

    auto points = config.get<std::vector<std::vector<float>>>("path.waypoints");
    if (!points) {
        return GameResult<void>::err(points.error());
    }

    std::vector<game::Vector2> waypoints;
    for (const auto& point : points.value()) {
        if (point.size() != 2) {
            return GameResult<void>::err(invalid("path waypoints must be [x, y] pairs"));
        }
        waypoints.emplace_back(point[0], point[1]);
    }
    rules.pathWaypoints = std::move(waypoints);
    return GameResult<void>::ok();
}

} // namespace

GameResult<GameRules> loadRules(const ConfigManager& config) {
    GameRules rules;
    Reader r(config);

    r("field.width", rules.field.width)
     ("field.height", rules.field.height)
     ("field.placement_inset", rules.field.placementInset)
     ("field.path_clearance", rules.field.pathClearance)
     ("field.tower_spacing", rules.field.towerSpacing)
     ("field.select_radius", rules.field.selectRadius)
     ("field.projectile_margin", rules.field.projectileMargin);

    r("economy.start_money", rules.economy.startMoney)
     ("economy.start_lives", rules.economy.startLives)
     ("economy.wave_reward", rules.economy.waveRewardFlat)
     ("economy.wave_interest_rate", rules.economy.waveInterestRate)
     ("economy.min_kill_reward", rules.economy.minKillReward)
     ("economy.kill_reward_ratio", rules.economy.killRewardRatio);

    r("waves.base_count", rules.waves.baseCount)
     ("waves.count_per_wave", rules.waves.countPerWave)
     ("waves.max_extra_count", rules.waves.maxExtraCount)
     ("waves.base_hp", rules.waves.baseHp)
     ("waves.hp_growth", rules.waves.hpGrowth)
     ("waves.base_speed", rules.waves.baseSpeed)
     ("waves.speed_per_wave", rules.waves.speedPerWave)
     ("waves.max_speed", rules.waves.maxSpeed)
     ("waves.base_gap", rules.waves.baseGap)
     ("waves.gap_per_wave", rules.waves.gapPerWave)
     ("waves.min_gap", rules.waves.minGap)
     ("waves.armored_from_wave", rules.waves.armoredFromWave)
     ("waves.armored_share", rules.waves.armoredShare)
     ("waves.armored_hp_multiplier", rules.waves.armoredHpMultiplier)
     ("waves.armored_speed_multiplier", rules.waves.armoredSpeedMultiplier)
     ("waves.boss_from_wave", rules.waves.bossFromWave)
     ("waves.boss_hp_multiplier", rules.waves.bossHpMultiplier)
     ("waves.boss_speed_multiplier", rules.waves.bossSpeedMultiplier)
     ("waves.boss_radius", rules.waves.bossRadius)
     ("waves.boss_reward", rules.waves.bossReward)
     ("waves.auto_wave_delay", rules.waves.autoWaveDelay);

    r("enemies.radius", rules.enemies.radius)
     ("enemies.exit_margin", rules.enemies.exitMargin)
     ("enemies.corpse_grace", rules.enemies.corpseGrace);

    r("combat.impact_radius", rules.combat.impactRadius)
     ("combat.beam_hit_distance", rules.combat.beamHitDistance)
     ("combat.beam_length_factor", rules.combat.beamLengthFactor);

    for (std::size_t t = 0; t < game::kTowerKindCount; ++t) {
        for (std::size_t e = 0; e < game::kEnemyKindCount; ++e) {
            const auto key = "combat.damage_multipliers." +
                             std::string(game::towerKindName(static_cast<TowerKind>(t))) + "." +
                             std::string(game::enemyKindName(static_cast<EnemyKind>(e)));
            r(key, rules.combat.damageMultipliers[t][e]);
        }
    }

    r("loop.max_frame_delta", rules.loop.maxFrameDelta)
     ("loop.turbo_multiplier", rules.loop.turboMultiplier);

    readTower(r, TowerKind::Basic, rules.tower(TowerKind::Basic));
    readTower(r, TowerKind::Splash, rules.tower(TowerKind::Splash));
    readTower(r, TowerKind::Beam, rules.tower(TowerKind::Beam));

    if (r.error()) {
        return GameResult<GameRules>::err(*r.error());
    }

    auto path = readPath(config, rules);
    if (!path) {
        return GameResult<GameRules>::err(path.error());
    }

    auto valid = validateRules(rules);
    if (!valid) {
        return GameResult<GameRules>::err(valid.error());
    }

    return GameResult<GameRules>::ok(std::move(rules));
}

GameResult<void> validateRules(const GameRules& rules) {
    if (rules.field.width <= 0.0f || rules.field.height <= 0.0f) {
        return GameResult<void>::err(invalid("field size must be positive"));
    }
    if (rules.economy.startLives <= 0) {
        return GameResult<void>::err(invalid("economy.start_lives must be positive"));
    }
    if (rules.economy.startMoney < 0) {
        return GameResult<void>::err(invalid("economy.start_money must not be negative"));
    }
    if (rules.waves.baseCount < 0 || rules.waves.baseHp <= 0.0f || rules.waves.baseSpeed <= 0.0f) {
        return GameResult<void>::err(invalid("wave base count, hp and speed are out of range"));
    }
    if (rules.waves.minGap <= 0.0f || rules.waves.baseGap <= 0.0f) {
        return GameResult<void>::err(invalid("spawn gaps must be positive"));
    }
    if (rules.waves.armoredShare < 0.0f || rules.waves.armoredShare > 1.0f) {
        return GameResult<void>::err(invalid("waves.armored_share must be within [0, 1]"));
    }
    if (rules.loop.maxFrameDelta <= 0.0f || rules.loop.turboMultiplier == 0) {
        return GameResult<void>::err(invalid("loop settings must be positive"));
    }
    if (rules.combat.impactRadius <= 0.0f) {
        return GameResult<void>::err(invalid("combat.impact_radius must be positive"));
    }

    for (std::size_t t = 0; t < game::kTowerKindCount; ++t) {
        const auto kind = static_cast<TowerKind>(t);
        const auto& spec = rules.tower(kind);
        const auto name = std::string(game::towerKindName(kind));

        if (spec.baseCost < 0 || spec.range <= 0.0f || spec.damage < 0.0f) {
            return GameResult<void>::err(invalid("towers." + name + " cost, range or damage"));
        }
        if (spec.levelCap < 1 || spec.upgradeGrowth <= 0.0f) {
            return GameResult<void>::err(invalid("towers." + name + " level curve"));
        }
        if (kind != TowerKind::Beam && (spec.fireRate <= 0.0f || spec.projectileSpeed <= 0.0f)) {
            return GameResult<void>::err(
                invalid("towers." + name + " needs a positive fire rate and projectile speed"));
        }
    }

    return GameResult<void>::ok();
}

GameResult<void> applyLogLevels(const ConfigManager& config) {
    auto& logger = GameLogger::instance();

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        const auto category = static_cast<LogCategory>(i);
        const auto key = "logging.levels." + std::string(foundation::logCategoryName(category));
        if (!config.hasKey(key)) {
            continue;
        }

        auto name = config.get<std::string>(key);
        if (!name) {
            return GameResult<void>::err(name.error());
        }

        auto level = foundation::parseLogLevel(name.value());
        if (!level) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidArgument, "unknown log level: " + name.value()));
        }
        logger.setCategoryLevel(category, *level);
    }
    return GameResult<void>::ok();
}

GameResult<RunnerSettings> loadRunnerSettings(const ConfigManager& config) {
    RunnerSettings settings;
    Reader r(config);

    r("runner.frame_rate", settings.frameRate)
     ("runner.max_frames", settings.maxFrames)
     ("runner.unpaced", settings.unpaced)
     ("runner.turbo", settings.turbo)
     ("runner.auto_wave", settings.autoWave);

    if (r.error()) {
        return GameResult<RunnerSettings>::err(*r.error());
    }

    if (!config.hasKey("layout.towers")) {
        return GameResult<RunnerSettings>::ok(std::move(settings));
    }

    auto towers = config.get<YAML::Node>("layout.towers");
    if (!towers) {
        return GameResult<RunnerSettings>::err(towers.error());
    }
    if (!towers.value().IsSequence()) {
        return GameResult<RunnerSettings>::err(
            GameError(ErrorCode::ConfigTypeMismatch, "layout.towers must be a sequence"));
    }

    try {
        for (const auto& entry : towers.value()) {
            TowerPlacement placement;
            placement.position = {entry["x"].as<float>(), entry["y"].as<float>()};
            placement.level = entry["level"].as<int32_t>(1);

            const auto kindName = entry["kind"].as<std::string>("basic");
            auto kind = game::parseTowerKind(kindName);
            if (!kind) {
                return GameResult<RunnerSettings>::err(
                    GameError(ErrorCode::InvalidArgument, "unknown tower kind: " + kindName));
            }
            placement.kind = *kind;
            settings.layout.push_back(placement);
        }
    } catch (const YAML::Exception& e) {
        return GameResult<RunnerSettings>::err(
            GameError(ErrorCode::ConfigTypeMismatch, std::string("layout.towers: ") + e.what()));
    }

    return GameResult<RunnerSettings>::ok(std::move(settings));
}

}  // namespace tds::service
