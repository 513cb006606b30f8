#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TOURNEY_VERSION_MAJOR 0
#define TOURNEY_VERSION_MINOR 3
#define TOURNEY_VERSION_PATCH 0
#define TOURNEY_VERSION_STRING "0.3.0"

namespace tourney {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TOURNEY_VERSION_MAJOR;
    static constexpr int minor = TOURNEY_VERSION_MINOR;
    static constexpr int patch = TOURNEY_VERSION_PATCH;
    static constexpr const char* string = TOURNEY_VERSION_STRING;
};

} // namespace tourney
