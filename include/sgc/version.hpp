#pragma once

/// @file version.hpp
/// @brief Version of the spell grid combat core.

#define SGC_VERSION_MAJOR 0
#define SGC_VERSION_MINOR 1
#define SGC_VERSION_PATCH 0
#define SGC_VERSION_STRING "0.1.0"

namespace sgc {

/// Compile-time version, printed by sgc_replay on usage errors.
struct Version {
    static constexpr int major = SGC_VERSION_MAJOR;
    static constexpr int minor = SGC_VERSION_MINOR;
    static constexpr int patch = SGC_VERSION_PATCH;
    static constexpr const char* string = SGC_VERSION_STRING;
};

} // namespace sgc
