/// @file wave_director.cpp
/// @brief Wave scaling curves and spawn queue composition.

#include "tds/game/wave_director.hpp"

#include <algorithm>
#include <cmath>

namespace tds::game {

WaveParameters WaveDirector::Parameters(uint32_t waveIndex) const {
    const auto steps = static_cast<float>(waveIndex);

    WaveParameters params;
    params.hp = std::round(
        static_cast<double>(rules_.baseHp) * std::pow(static_cast<double>(rules_.hpGrowth), waveIndex));
    params.count = static_cast<int32_t>(std::lround(
        static_cast<float>(rules_.baseCount) + std::min(rules_.maxExtraCount, rules_.countPerWave * steps)));
    params.speed = std::min(rules_.maxSpeed, rules_.baseSpeed + rules_.speedPerWave * steps);
    params.gap = std::max(rules_.minGap, rules_.baseGap - rules_.gapPerWave * steps);
    return params;
}

int32_t WaveDirector::ArmoredCount(uint32_t waveIndex, int32_t count) const {
    if (waveIndex < rules_.armoredFromWave || count <= 0) {
        return 0;
    }
    const auto armored = static_cast<int32_t>(std::floor(static_cast<float>(count) * rules_.armoredShare));
    return std::clamp(armored, 0, count);
}

std::deque<SpawnRecord> WaveDirector::BuildSpawnQueue(uint32_t waveIndex) const {
    const auto params = Parameters(waveIndex);

    std::deque<SpawnRecord> queue(static_cast<std::size_t>(std::max(params.count, 0)),
                                  SpawnRecord{params.hp, params.speed, EnemyKind::Normal});

    const int32_t armored = ArmoredCount(waveIndex, params.count);
    for (int32_t k = 0; k < armored; ++k) {
        // Spread evenly: slot floor((k + 0.5) * count / armored).
        const auto slot = static_cast<std::size_t>(std::floor(
            (static_cast<double>(k) + 0.5) * params.count / armored));
        auto& record = queue[std::min(slot, queue.size() - 1)];
        record.kind = EnemyKind::Armored;
        record.hp = std::round(params.hp * static_cast<double>(rules_.armoredHpMultiplier));
        record.speed = params.speed * rules_.armoredSpeedMultiplier;
    }

    if (HasBoss(waveIndex)) {
        queue.push_back(SpawnRecord{
            std::round(params.hp * static_cast<double>(rules_.bossHpMultiplier)),
            params.speed * rules_.bossSpeedMultiplier,
            EnemyKind::Boss});
    }

    return queue;
}

}  // namespace tds::game
