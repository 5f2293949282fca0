#pragma once

/// @file tds.hpp
/// @brief Umbrella header for the tower defense simulation.

#include "tds/version.hpp"

#include "tds/core/result.hpp"
#include "tds/foundation/config_manager.hpp"
#include "tds/foundation/error_code.hpp"
#include "tds/foundation/game_error.hpp"
#include "tds/foundation/game_logger.hpp"
#include "tds/foundation/game_result.hpp"

#include "tds/ecs/component_storage.hpp"
#include "tds/ecs/entity.hpp"
#include "tds/ecs/entity_manager.hpp"
#include "tds/ecs/system_scheduler.hpp"

#include "tds/game/combat_resolver.hpp"
#include "tds/game/defense_components.hpp"
#include "tds/game/defense_types.hpp"
#include "tds/game/economy.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/math_types.hpp"
#include "tds/game/movement_system.hpp"
#include "tds/game/path.hpp"
#include "tds/game/placement.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/game/tower_stats.hpp"
#include "tds/game/tower_system.hpp"
#include "tds/game/wave_director.hpp"
#include "tds/game/wave_system.hpp"

#include "tds/service/game_loop.hpp"
#include "tds/service/rules_loader.hpp"
#include "tds/service/service_runner.hpp"
#include "tds/service/simulation.hpp"
