/// @file placement.cpp
/// @brief Tower placement validation and picking.

#include "tds/game/placement.hpp"

#include <string>

#include "tds/game/simulation_state.hpp"

namespace tds::game {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameResult;

bool InsidePlacementArea(const FieldRules& field, const Vector2& position) {
    return position.x >= field.placementInset &&
           position.x <= field.width - field.placementInset &&
           position.y >= field.placementInset &&
           position.y <= field.height - field.placementInset;
}

GameResult<void> CheckPlacement(const SimulationState& state,
                                const Vector2& position,
                                TowerKind kind) {
    const auto& field = state.rules.field;

    if (!InsidePlacementArea(field, position)) {
        return GameResult<void>::err(
            GameError(ErrorCode::PlacementOutOfBounds, "position is outside the build area"));
    }

    if (state.path.DistanceTo(position) < field.pathClearance) {
        return GameResult<void>::err(
            GameError(ErrorCode::PlacementOnPath, "position is too close to the path"));
    }

    for (const auto& tower : state.towers) {
        if (Distance(tower.position, position) < field.towerSpacing) {
            return GameResult<void>::err(
                GameError(ErrorCode::PlacementTooCloseToTower,
                          "position is too close to another tower"));
        }
    }

    const auto cost = state.rules.tower(kind).baseCost;
    if (!state.economy.CanAfford(cost)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InsufficientFunds,
                      std::string(towerKindName(kind)) + " tower costs " + std::to_string(cost)));
    }

    return GameResult<void>::ok();
}

std::optional<ecs::Entity> TowerAt(const SimulationState& state, const Vector2& position) {
    std::optional<ecs::Entity> best;
    float bestDistance = state.rules.field.selectRadius;

    for (std::size_t i = 0; i < state.towers.Size(); ++i) {
        const float d = Distance(state.towers.At(i).position, position);
        if (d <= bestDistance) {
            best = state.towers.EntityAt(i);
            bestDistance = d;
        }
    }
    return best;
}

}  // namespace tds::game
