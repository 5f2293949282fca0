#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the tower defense simulation.

#include <cstdint>
#include <string_view>

namespace tds::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // ECS (0x0300 - 0x03FF)
    SystemSchedulerBuildFailed = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0802,

    // Placement (0x0900 - 0x09FF)
    PlacementOutOfBounds = 0x0900,
    PlacementOnPath = 0x0901,
    PlacementTooCloseToTower = 0x0902,

    // Economy (0x0A00 - 0x0AFF)
    InsufficientFunds = 0x0A00,
    NoTowerSelected = 0x0A01,
    TowerNotFound = 0x0A02,

    // Wave (0x0B00 - 0x0BFF)
    WaveAlreadyActive = 0x0B00,

    // Simulation (0x0C00 - 0x0CFF)
    GameIsOver = 0x0C00,
    GameLoopAlreadyRunning = 0x0C01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Placement";
        case 0x0A00: return "Economy";
        case 0x0B00: return "Wave";
        case 0x0C00: return "Simulation";
        default: return "Unknown";
    }
}

} // namespace tds::foundation
