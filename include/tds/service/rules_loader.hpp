#pragma once

/// @file rules_loader.hpp
/// @brief Maps configuration keys onto GameRules and runner settings.
///
/// Every key is optional: an absent key keeps the stock default.  A key
/// with the wrong type is reported as ConfigTypeMismatch, and a value
/// outside its valid range as InvalidArgument.

#include <cstdint>
#include <vector>

#include "tds/foundation/config_manager.hpp"
#include "tds/foundation/game_result.hpp"
#include "tds/game/defense_types.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/math_types.hpp"

namespace tds::service {

/// Build GameRules from the `field`, `economy`, `waves`, `enemies`,
/// `combat`, `loop`, `towers` and `path` sections of @p config.
[[nodiscard]] foundation::GameResult<game::GameRules>
loadRules(const foundation::ConfigManager& config);

/// Check that @p rules are internally consistent.
[[nodiscard]] foundation::GameResult<void> validateRules(const game::GameRules& rules);

/// Apply `logging.levels.<Category>: <level>` entries to the global logger.
[[nodiscard]] foundation::GameResult<void>
applyLogLevels(const foundation::ConfigManager& config);

/// One scripted tower for the headless runner.
struct TowerPlacement {
    game::Vector2 position;
    game::TowerKind kind = game::TowerKind::Basic;
    /// Target level; upgrades are bought when money allows.
    int32_t level = 1;
};

/// Headless runner settings from the `runner` and `layout` sections.
struct RunnerSettings {
    uint32_t frameRate = 60;
    /// Frames to run before stopping (0 = until game over).
    uint64_t maxFrames = 0;
    /// Run frames back to back instead of pacing them in real time.
    bool unpaced = true;
    bool turbo = false;
    bool autoWave = true;
    std::vector<TowerPlacement> layout;
};

[[nodiscard]] foundation::GameResult<RunnerSettings>
loadRunnerSettings(const foundation::ConfigManager& config);

}  // namespace tds::service
