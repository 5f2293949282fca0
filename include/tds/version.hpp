#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TDS_VERSION_MAJOR 0
#define TDS_VERSION_MINOR 3
#define TDS_VERSION_PATCH 0
#define TDS_VERSION_STRING "0.3.0"

namespace tds {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TDS_VERSION_MAJOR;
    static constexpr int minor = TDS_VERSION_MINOR;
    static constexpr int patch = TDS_VERSION_PATCH;
    static constexpr const char* string = TDS_VERSION_STRING;
};

} // namespace tds
