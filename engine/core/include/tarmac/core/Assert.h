#pragma once

#include "tarmac/core/Log.h"

#ifdef _MSC_VER
    #define TARMAC_DEBUG_BREAK() __debugbreak()
#else
    #define TARMAC_DEBUG_BREAK() __builtin_trap()
#endif

namespace tarmac {

// Extract just the filename from a path
inline const char* ExtractFilename(const char* path) {
    const char* file = path;
    while (*path) {
        if (*path == '/' || *path == '\\') {
            file = path + 1;
        }
        ++path;
    }
    return file;
}

} // namespace tarmac

// Internal invariants only. Conditions a caller can trigger are reported through results.
#if TARMAC_DEBUG
    #define TARMAC_CORE_ASSERT(condition, ...)                                     \
        do {                                                                        \
            if (!(condition)) {                                                     \
                TARMAC_CORE_CRITICAL("Core assertion failed: {}", #condition);      \
                TARMAC_CORE_CRITICAL("  File: {}:{}", ::tarmac::ExtractFilename(__FILE__), __LINE__); \
                TARMAC_CORE_CRITICAL("  " __VA_ARGS__);                             \
                TARMAC_DEBUG_BREAK();                                               \
            }                                                                       \
        } while (false)
#else
    #define TARMAC_CORE_ASSERT(condition, ...) ((void)0)
#endif
