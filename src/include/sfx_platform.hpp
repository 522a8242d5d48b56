#pragma once
/**
 * @file sfx_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (SCENEFIX_PLATFORM_WIN64, SCENEFIX_IS_POSIX, etc.) or Windows
 * headers should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define SCENEFIX_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)

#define SCENEFIX_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define SCENEFIX_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define SCENEFIX_PLATFORM_LINUX 1

#else
// Fallback detection
#if defined(_WIN64)
#define SCENEFIX_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(__APPLE__) && defined(__MACH__)
#define SCENEFIX_PLATFORM_APPLE 1

#elif defined(__FreeBSD__)
#define SCENEFIX_PLATFORM_FREEBSD 1

#elif defined(__linux__)
#define SCENEFIX_PLATFORM_LINUX 1

#else
#define SCENEFIX_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(SCENEFIX_PLATFORM_WIN64)
#define SCENEFIX_IS_WINDOWS 1
#undef SCENEFIX_IS_POSIX
#elif defined(SCENEFIX_PLATFORM_APPLE) || defined(SCENEFIX_PLATFORM_FREEBSD) ||                    \
    defined(SCENEFIX_PLATFORM_LINUX)
#undef SCENEFIX_IS_WINDOWS
#define SCENEFIX_IS_POSIX 1
#else
#undef SCENEFIX_IS_WINDOWS
#undef SCENEFIX_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "scenefix_utils_export.h"

namespace scenefix::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
SCENEFIX_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
SCENEFIX_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the full version string (major.minor.patch) of scenefix.
 */
SCENEFIX_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
SCENEFIX_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, or 0 if start_ns lies in the future.
 */
SCENEFIX_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace scenefix::platform
