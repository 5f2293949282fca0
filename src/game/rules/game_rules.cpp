/// @file game_rules.cpp
/// @brief Stock tower catalog and path.

#include "tds/game/game_rules.hpp"

namespace tds::game {

TowerSpec defaultTowerSpec(TowerKind kind) {
    TowerSpec spec;
    switch (kind) {
        case TowerKind::Basic:
            // Member defaults are the basic tower.
            break;
        case TowerKind::Splash:
            spec.baseCost = 80;
            spec.range = 120.0f;
            spec.rangePerLevel = 10.0f;
            spec.damage = 10.0f;
            spec.damagePerLevel = 5.0f;
            spec.fireRate = 0.8f;
            spec.fireRatePerLevel = 0.08f;
            spec.projectileSpeed = 320.0f;
            spec.splashRadius = 55.0f;
            spec.splashRadiusPerLevel = 5.0f;
            spec.splashRatio = 0.6f;
            spec.upgradeBase = 80;
            spec.upgradeGrowth = 1.7f;
            spec.overlevelCost = 500;
            break;
        case TowerKind::Beam:
            spec.baseCost = 120;
            spec.range = 130.0f;
            spec.rangePerLevel = 10.0f;
            spec.damage = 30.0f;
            spec.damagePerLevel = 12.0f;
            spec.fireRate = 0.0f;
            spec.fireRatePerLevel = 0.0f;
            spec.projectileSpeed = 0.0f;
            spec.upgradeBase = 100;
            spec.upgradeGrowth = 1.8f;
            spec.overlevelCost = 600;
            break;
    }
    return spec;
}

std::vector<Vector2> defaultPathWaypoints() {
    return {
        {-80.0f, 80.0f},
        {880.0f, 80.0f},
        {880.0f, 200.0f},
        {80.0f, 200.0f},
        {80.0f, 320.0f},
        {880.0f, 320.0f},
        {880.0f, 460.0f},
        {1040.0f, 460.0f},
    };
}

}  // namespace tds::game
