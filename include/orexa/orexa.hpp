// Orexa - Game Server Supervisor
// Main header file

#ifndef OREXA_OREXA_HPP
#define OREXA_OREXA_HPP

/**
 * @file orexa.hpp
 * @brief Main header file for the Orexa library
 *
 * Orexa supervises game server processes: it launches them, captures and
 * fans out their console output, polls their health, schedules restarts and
 * backups, and installs server artifacts.
 *
 * Supported platforms:
 * - Linux (kernel 5.4+)
 */

// Version information
#define OREXA_VERSION_MAJOR 0
#define OREXA_VERSION_MINOR 1
#define OREXA_VERSION_PATCH 0
#define OREXA_VERSION_STRING "0.1.0"

// Core types
#include "orexa/core/result.hpp"
#include "orexa/core/error_codes.hpp"
#include "orexa/core/types.hpp"

// Public API
#include "orexa/api/supervisor.hpp"

namespace orexa {

/**
 * @brief Get the library version as a string.
 * @return Version string in format "major.minor.patch"
 */
inline const char* version() {
    return OREXA_VERSION_STRING;
}

inline int versionMajor() {
    return OREXA_VERSION_MAJOR;
}

inline int versionMinor() {
    return OREXA_VERSION_MINOR;
}

inline int versionPatch() {
    return OREXA_VERSION_PATCH;
}

} // namespace orexa

#endif // OREXA_OREXA_HPP
