/// @file tower_stats.cpp
/// @brief Tower level curve.

#include "tds/game/tower_stats.hpp"

#include <algorithm>
#include <cmath>

namespace tds::game {

namespace {

float linear(float base, float perLevel, int32_t level) {
    return base + perLevel * static_cast<float>(level - 1);
}

} // namespace

TowerStats ComputeTowerStats(const TowerSpec& spec, int32_t level) {
    level = std::max(level, 1);
    const int32_t capped = std::min(level, std::max(spec.levelCap, 1));

    TowerStats stats;
    stats.range = linear(spec.range, spec.rangePerLevel, capped);
    stats.fireRate = linear(spec.fireRate, spec.fireRatePerLevel, capped);
    stats.projectileSpeed = spec.projectileSpeed;
    stats.splashRatio = spec.splashRatio;
    stats.splashRadius = spec.splashRadius > 0.0f
        ? linear(spec.splashRadius, spec.splashRadiusPerLevel, capped)
        : 0.0f;

    stats.damage = linear(spec.damage, spec.damagePerLevel, capped);
    if (level > capped) {
        stats.damage *= std::pow(spec.overlevelDamageGrowth,
                                 static_cast<float>(level - capped));
    }
    return stats;
}

int32_t ComputeUpgradeCost(const TowerSpec& spec, int32_t level) {
    level = std::max(level, 1);
    if (level >= spec.levelCap) {
        return spec.overlevelCost;
    }
    const double cost = static_cast<double>(spec.upgradeBase)
        * std::pow(static_cast<double>(spec.upgradeGrowth), level - 1);
    return static_cast<int32_t>(std::lround(cost));
}

}  // namespace tds::game
