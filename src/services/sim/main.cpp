/// @file main.cpp
/// @brief Headless simulation entry point.
///
/// Loads the rules and a scripted tower layout from YAML, then plays
/// waves until the game is over, a frame limit is hit, or SIGINT/SIGTERM
/// arrives.  Prints a summary on exit.

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tds/foundation/config_manager.hpp"
#include "tds/foundation/game_logger.hpp"
#include "tds/game/simulation_state.hpp"
#include "tds/service/game_loop.hpp"
#include "tds/service/rules_loader.hpp"
#include "tds/service/service_runner.hpp"
#include "tds/service/simulation.hpp"

namespace {

using tds::foundation::LogCategory;

struct ScriptedTower {
    tds::service::TowerPlacement placement;
    std::optional<tds::ecs::Entity> entity;
};

/// Place pending towers and buy pending upgrades while money allows.
void applyLayout(tds::service::Simulation& sim, std::vector<ScriptedTower>& script) {
    for (auto& scripted : script) {
        if (!scripted.entity) {
            if (!sim.canPlace(scripted.placement.position, scripted.placement.kind)) {
                continue;
            }
            auto placed = sim.placeTower(scripted.placement.position, scripted.placement.kind);
            if (!placed) {
                continue;
            }
            scripted.entity = placed.value();
        }

        const auto* tower = sim.state().towers.Find(*scripted.entity);
        if (tower == nullptr || tower->level >= scripted.placement.level) {
            continue;
        }

        auto cost = sim.upgradeCost(*scripted.entity);
        if (!cost || sim.money() < cost.value()) {
            continue;
        }

        auto selected = sim.selectTower(scripted.entity);
        auto upgraded = selected ? sim.upgradeSelectedTower()
                                 : tds::foundation::GameResult<int32_t>::err(selected.error());
        if (!upgraded) {
            TDS_LOG_WARN(LogCategory::Input, "Scripted upgrade failed: " +
                                                 std::string(upgraded.error().message()));
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    tds::service::SignalHandler signals;

    auto configPath = tds::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/tds.yaml";
    }

    tds::foundation::ConfigManager config;
    auto loadResult = tds::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    // Category levels filter first; the sink passes everything through.
    tds::service::installConsoleLogger(tds::foundation::LogLevel::Trace);

    auto levels = tds::service::applyLogLevels(config);
    if (!levels) {
        std::cerr << "Invalid logging config: " << levels.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto rules = tds::service::loadRules(config);
    if (!rules) {
        std::cerr << "Invalid rules: " << rules.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = tds::service::loadRunnerSettings(config);
    if (!settings) {
        std::cerr << "Invalid runner config: " << settings.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const auto runner = settings.value();

    const float maxFrameDelta = rules.value().loop.maxFrameDelta;
    auto created = tds::service::Simulation::create(std::move(rules).value());
    if (!created) {
        std::cerr << "Failed to create simulation: "
                  << created.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    auto sim = std::move(created).value();

    std::vector<ScriptedTower> script;
    for (const auto& placement : runner.layout) {
        script.push_back(ScriptedTower{placement, std::nullopt});
    }

    sim.setTurbo(runner.turbo);
    sim.setAutoWave(runner.autoWave);
    applyLayout(sim, script);

    auto started = sim.startWave();
    if (!started) {
        std::cerr << "Failed to start first wave: " << started.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Simulation started (frame_rate: " << runner.frameRate
              << " Hz, towers: " << sim.snapshot().towers.size()
              << ", auto_wave: " << (runner.autoWave ? "on" : "off") << ")\n";

    tds::service::GameLoop loop(runner.frameRate, maxFrameDelta);
    loop.setFrameCallback([&](float dt) {
        if (signals.shutdownRequested()) {
            loop.stop();
            return true;
        }
        sim.frame(dt);
        applyLayout(sim, script);
        // Without auto-wave nothing restarts play once a wave completes.
        const bool idle = !sim.isAutoWave() &&
                          sim.phase() == tds::game::WavePhase::WaveComplete;
        return !sim.isGameOver() && !idle;
    });

    if (runner.unpaced) {
        // Synthetic timestamps: every frame advances exactly one frame period.
        auto now = tds::service::FrameClock::Clock::now();
        uint64_t frames = 0;
        while (!loop.finished() && !signals.shutdownRequested() &&
               (runner.maxFrames == 0 || frames < runner.maxFrames)) {
            loop.frame(now);
            now += loop.targetFrameTime();
            ++frames;
        }
    } else {
        auto runResult = loop.run(runner.maxFrames);
        if (!runResult) {
            std::cerr << "Game loop failed: " << runResult.error().describe() << "\n";
            return EXIT_FAILURE;
        }
    }

    const auto snap = sim.snapshot();
    const auto stats = sim.stats();
    TDS_LOG_INFO(LogCategory::Core, "Headless run finished after " +
                                        std::to_string(stats.totalFrames) + " frames");

    std::cout << (snap.gameOver ? "Game over" : "Stopped")
              << " on wave " << snap.waveNumber
              << " (money: " << snap.money
              << ", lives: " << snap.lives
              << ", towers: " << snap.towers.size()
              << ", simulated: " << stats.simulatedSeconds << " s)\n";

    auto flushed = tds::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().describe() << "\n";
    }
    return EXIT_SUCCESS;
}
