#pragma once

/// @file wave_director.hpp
/// @brief Deterministic wave scaling and spawn queue generation.

#include <cstdint>
#include <deque>

#include "tds/game/defense_types.hpp"
#include "tds/game/game_rules.hpp"

namespace tds::game {

/// Scaled parameters of one wave.
struct WaveParameters {
    int32_t count = 0;
    double hp = 0.0;
    float speed = 0.0f;
    /// Seconds between two spawns.
    float gap = 0.0f;

    constexpr bool operator==(const WaveParameters&) const = default;
};

/// One pending spawn.
struct SpawnRecord {
    double hp = 0.0;
    float speed = 0.0f;
    EnemyKind kind = EnemyKind::Normal;
};

/// Pure wave generator.  Holds no per-session state.
///
/// With `n = waveIndex + 1`:
///   - hp    = round(baseHp * hpGrowth^(n-1))
///   - count = round(baseCount + min(maxExtraCount, countPerWave * (n-1)))
///   - speed = min(maxSpeed, baseSpeed + speedPerWave * (n-1))
///   - gap   = max(minGap, baseGap - gapPerWave * (n-1))
class WaveDirector {
public:
    explicit WaveDirector(const WaveRules& rules) : rules_(rules) {}

    [[nodiscard]] WaveParameters Parameters(uint32_t waveIndex) const;

    /// Build the ordered spawn queue of a wave.
    ///
    /// Armored enemies replace evenly spread slots from `armoredFromWave`
    /// onwards; a boss is appended from `bossFromWave` onwards.
    [[nodiscard]] std::deque<SpawnRecord> BuildSpawnQueue(uint32_t waveIndex) const;

    /// Number of armored slots in a wave of @p count at @p waveIndex.
    [[nodiscard]] int32_t ArmoredCount(uint32_t waveIndex, int32_t count) const;

    [[nodiscard]] bool HasBoss(uint32_t waveIndex) const noexcept {
        return waveIndex >= rules_.bossFromWave;
    }

private:
    const WaveRules& rules_;
};

}  // namespace tds::game
