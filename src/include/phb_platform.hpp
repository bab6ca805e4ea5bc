#pragma once
/**
 * @file phb_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (PUBHUB_PLATFORM_LINUX, PUBHUB_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>

#if defined(PLATFORM_WIN64)
#define PUBHUB_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define PUBHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define PUBHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define PUBHUB_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(_WIN64)
#define PUBHUB_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define PUBHUB_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define PUBHUB_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define PUBHUB_PLATFORM_LINUX 1
#else
#define PUBHUB_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(PUBHUB_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(PUBHUB_PLATFORM_WIN64)
#define PUBHUB_IS_WINDOWS 1
#undef PUBHUB_IS_POSIX
#elif defined(PUBHUB_PLATFORM_APPLE) || defined(PUBHUB_PLATFORM_FREEBSD) ||                        \
    defined(PUBHUB_PLATFORM_LINUX)
#undef PUBHUB_IS_WINDOWS
#define PUBHUB_IS_POSIX 1
#else
#undef PUBHUB_IS_WINDOWS
#undef PUBHUB_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "pubhub_utils_export.h"

namespace pubhub::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
PUBHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the current process ID.
 * @details A forked child observes a different value than its parent; the
 *          transport context registry is keyed on it.
 */
PUBHUB_UTILS_EXPORT uint64_t get_pid() noexcept;

} // namespace pubhub::platform
