#pragma once
/**
 * @file tsp_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (TREESPEC_PLATFORM_LINUX, TREESPEC_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define TREESPEC_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define TREESPEC_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define TREESPEC_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define TREESPEC_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(_WIN64)
#define TREESPEC_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define TREESPEC_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define TREESPEC_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define TREESPEC_PLATFORM_LINUX 1
#else
#define TREESPEC_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(TREESPEC_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(TREESPEC_PLATFORM_WIN64)
#define TREESPEC_IS_WINDOWS 1
#elif defined(TREESPEC_PLATFORM_APPLE) || defined(TREESPEC_PLATFORM_FREEBSD) ||                    \
    defined(TREESPEC_PLATFORM_LINUX)
#define TREESPEC_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::source_location, concepts and __VA_OPT__.
// For MSVC use _MSVC_LANG (MSVC sets __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "treespec_export.h"

namespace treespec::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
TREESPEC_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
TREESPEC_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @details Uses std::chrono::steady_clock. The absolute value is meaningless;
 *          use for computing time deltas only (test durations).
 */
TREESPEC_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns; 0 if start_ns is in the future.
 */
TREESPEC_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace treespec::platform
