#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define INTG_VERSION_MAJOR 0
#define INTG_VERSION_MINOR 3
#define INTG_VERSION_PATCH 0
#define INTG_VERSION_STRING "0.3.0"

namespace intg {

/// Project version information at compile time.
struct Version {
    static constexpr int major = INTG_VERSION_MAJOR;
    static constexpr int minor = INTG_VERSION_MINOR;
    static constexpr int patch = INTG_VERSION_PATCH;
    static constexpr const char* string = INTG_VERSION_STRING;
};

} // namespace intg
