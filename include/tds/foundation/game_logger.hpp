#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for the simulation.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tds/foundation/game_result.hpp"

namespace tds::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulation log categories for structured filtering.
///
/// Each category can have its own minimum log level, enabling
/// fine-grained control over logging verbosity per subsystem.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Session lifecycle, loop, configuration
    ECS     = 1, ///< Entity-Component-System
    World   = 2, ///< Path and enemy movement
    Wave    = 3, ///< Wave lifecycle and spawning
    Combat  = 4, ///< Targeting, firing, damage
    Economy = 5, ///< Money, lives, upgrades, rewards
    Input   = 6  ///< Player actions and their rejections
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "World", "Wave", "Combat", "Economy", "Input"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = enemy.raw;
///   ctx.waveNumber = 3;
///   ctx.extra["reward"] = "5";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Enemy killed", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<uint32_t> waveNumber;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulation logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | World    | Info          |
/// | Wave     | Info          |
/// | Combat   | Debug         |
/// | Economy  | Info          |
/// | Input    | Debug         |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "INFO", ...) as used in configuration files.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace tds::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name TDS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// TDS_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TDS_MIN_LOG_LEVEL
    #define TDS_MIN_LOG_LEVEL 0
#endif

#define TDS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TDS_MIN_LOG_LEVEL &&                      \
            ::tds::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tds::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TDS_LOG_DEBUG(cat, msg) \
    TDS_LOG(::tds::foundation::LogLevel::Debug, (cat), (msg))

#define TDS_LOG_INFO(cat, msg) \
    TDS_LOG(::tds::foundation::LogLevel::Info, (cat), (msg))

#define TDS_LOG_WARN(cat, msg) \
    TDS_LOG(::tds::foundation::LogLevel::Warning, (cat), (msg))

#define TDS_LOG_ERROR(cat, msg) \
    TDS_LOG(::tds::foundation::LogLevel::Error, (cat), (msg))

/// @}
