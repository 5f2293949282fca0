#pragma once

/// @file placement.hpp
/// @brief Tower placement validation and picking.

#include <optional>

#include "tds/ecs/entity.hpp"
#include "tds/foundation/game_result.hpp"
#include "tds/game/defense_types.hpp"
#include "tds/game/game_rules.hpp"
#include "tds/game/math_types.hpp"

namespace tds::game {

class SimulationState;

/// True if @p position lies inside the field shrunk by the placement inset
/// (edges inclusive).
[[nodiscard]] bool InsidePlacementArea(const FieldRules& field, const Vector2& position);

/// Validate placing a tower of @p kind at @p position.
///
/// Checks run in order and the first failure is reported:
///   1. PlacementOutOfBounds      - outside the inset rectangle
///   2. PlacementOnPath           - closer than pathClearance to the path
///   3. PlacementTooCloseToTower  - closer than towerSpacing to a tower
///   4. InsufficientFunds         - money below the kind's base cost
[[nodiscard]] foundation::GameResult<void> CheckPlacement(const SimulationState& state,
                                                          const Vector2& position,
                                                          TowerKind kind);

/// Nearest tower within the select radius of @p position, if any.
[[nodiscard]] std::optional<ecs::Entity> TowerAt(const SimulationState& state,
                                                 const Vector2& position);

}  // namespace tds::game
