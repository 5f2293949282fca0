#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the headless entry point.
///
/// Provides signal handling, configuration loading, and CLI argument
/// parsing for the tds executables.

#include <atomic>
#include <filesystem>

#include "tds/foundation/config_manager.hpp"
#include "tds/foundation/game_logger.hpp"
#include "tds/foundation/game_result.hpp"

namespace tds::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// On destruction the default handlers are restored.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Register a stderr-backed logger as the kcenon default logger.
///
/// GameLogger routes every category through the registry, so after this
/// call all simulation logs reach the terminal.  Entries below
/// @p minLevel are discarded by the sink itself.
void installConsoleLogger(tds::foundation::LogLevel minLevel = tds::foundation::LogLevel::Info);

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. TDS_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] tds::foundation::GameResult<void>
loadConfig(tds::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace tds::service
