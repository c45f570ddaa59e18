#pragma once

/// @file platform.hpp
/// @brief Platform, standard feature and build switch macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__linux__)
/// @brief True when building for Linux.
#define FAKETIME_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define FAKETIME_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define FAKETIME_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define FAKETIME_PLATFORM_MACOS 0
#endif

#if defined(__unix__) || FAKETIME_PLATFORM_MACOS || FAKETIME_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define FAKETIME_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define FAKETIME_PLATFORM_POSIX 0
#endif

#if !FAKETIME_PLATFORM_POSIX
#error "faketime requires a POSIX platform"
#endif

#if __cplusplus < 202002L
#error "faketime requires at least C++20"
#endif

// Compile-time switch. Builds that define FAKETIME_DISABLED=1 resolve every
// time query from the real clock and never look at thread state, the
// environment or timestamp files.
#if defined(FAKETIME_DISABLED) && FAKETIME_DISABLED
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when fake time resolution is compiled in.
#define FAKETIME_ENABLED 0
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when fake time resolution is compiled in.
#define FAKETIME_ENABLED 1
#endif
