/// @file simulation_state.cpp
/// @brief Session state container.

#include "tds/game/simulation_state.hpp"

#include "tds/game/combat_resolver.hpp"

namespace tds::game {

SimulationState::SimulationState(GameRules rulesIn, Path pathIn)
    : rules(std::move(rulesIn)),
      path(std::move(pathIn)),
      economy(rules.economy) {
    entities.RegisterStorage(&followers);
    entities.RegisterStorage(&vitals);
    entities.RegisterStorage(&traits);
    entities.RegisterStorage(&towers);
    entities.RegisterStorage(&projectiles);
}

void SimulationState::Reset() {
    entities.Reset();

    const bool autoWave = wave.autoWave;
    wave = WaveState{};
    wave.autoWave = autoWave;

    economy = Economy(rules.economy);
    phase = WavePhase::Idle;
    gameOver = false;
    overlay.reset();
    selectedTower.reset();
    beams.clear();
    time = 0.0;
    nextSpawnOrder = 0;
}

ecs::Entity SimulationState::SpawnEnemy(const SpawnRecord& record) {
    const auto enemy = entities.Create();

    followers.Add(enemy, PathFollower{0.0f, record.speed, nextSpawnOrder++});
    vitals.Add(enemy, Vitality{record.hp, record.hp, true, false, 0.0f});

    EnemyTraits enemyTraits;
    enemyTraits.kind = record.kind;
    enemyTraits.radius = record.kind == EnemyKind::Boss ? rules.waves.bossRadius
                                                        : rules.enemies.radius;
    enemyTraits.reward = CombatResolver::KillReward(rules, record.kind, record.hp);
    traits.Add(enemy, enemyTraits);

    ++wave.spawned;
    return enemy;
}

std::optional<Vector2> SimulationState::EnemyPosition(ecs::Entity enemy) const {
    const auto* follower = followers.Find(enemy);
    if (follower == nullptr) {
        return std::nullopt;
    }
    return path.PositionAt(follower->s);
}

bool SimulationState::AnyEnemyAlive() const {
    for (const auto& vitality : vitals) {
        if (vitality.alive) {
            return true;
        }
    }
    return false;
}

}  // namespace tds::game
