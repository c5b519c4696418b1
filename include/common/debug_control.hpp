#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace zkrv {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - ZKRV_PROFILE: Enable/disable profiling output (phase timings)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - ZKRV_DEBUG: Enable/disable debug output (instruction traces, chip heights)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag("ZKRV_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag("ZKRV_DEBUG");
    return cached;
}

} // namespace debug
} // namespace zkrv

// Profile printing (timing measurements)
#define ZKRV_PROFILE_ENABLED() (zkrv::debug::is_profile_enabled())

#define ZKRV_PROFILE_PRINT(...) \
    do { \
        if (zkrv::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define ZKRV_PROFILE_COUT(expr) \
    do { \
        if (zkrv::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define ZKRV_DEBUG_ENABLED() (zkrv::debug::is_debug_enabled())

#define ZKRV_DEBUG_PRINT(...) \
    do { \
        if (zkrv::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define ZKRV_DEBUG_COUT(expr) \
    do { \
        if (zkrv::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define ZKRV_IF_PROFILE if (zkrv::debug::is_profile_enabled())
#define ZKRV_IF_DEBUG if (zkrv::debug::is_debug_enabled())
