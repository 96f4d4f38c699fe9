#pragma once

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
//
//   SC_COMPILER_MSVC / SC_COMPILER_CLANG / SC_COMPILER_GCC   exactly one is defined
//   SC_COMPILER_POSIX                                        clang or gcc (gnu attributes and builtins)
//   SC_OS_WINDOWS / SC_OS_LINUX / SC_OS_APPLE / SC_OS_OTHER  exactly one is defined
//

#if defined(_MSC_VER)
#define SC_COMPILER_MSVC
#elif defined(__clang__)
#define SC_COMPILER_CLANG
#define SC_COMPILER_POSIX
#elif defined(__GNUC__)
#define SC_COMPILER_GCC
#define SC_COMPILER_POSIX
#else
#error "stack-core requires msvc, clang or gcc"
#endif

#if defined(_WIN32)
#define SC_OS_WINDOWS
#elif defined(__APPLE__)
#define SC_OS_APPLE
#elif defined(__linux__)
#define SC_OS_LINUX
#else
#define SC_OS_OTHER
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
//
// CMake defines one of SC_DEBUG, SC_RELEASE, SC_RELWITHDEBINFO and sets SC_ASSERT_ENABLED.
// Consumers that include the headers without the CMake target get assertions unless NDEBUG is set.
//

#ifndef SC_ASSERT_ENABLED
#ifdef NDEBUG
#define SC_ASSERT_ENABLED 0
#else
#define SC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Attributes and helpers
// =========================================================================================================

// SC_FORCE_INLINE - for one-line helpers that must not survive as calls in debug builds (move, forward, ...)
// SC_COLD_FUNC - failure paths (assertion reporting)
// SC_BUILTIN_UNREACHABLE - after exhaustive switches, UB if reached
// SC_UNUSED(expr) - type-checks expr without evaluating it

#if defined(SC_COMPILER_MSVC)
#define SC_FORCE_INLINE __forceinline
#define SC_COLD_FUNC
#define SC_BUILTIN_UNREACHABLE __assume(0)
#else
// gcc needs the extra inline
#define SC_FORCE_INLINE __attribute__((always_inline)) inline
#define SC_COLD_FUNC __attribute__((cold))
#define SC_BUILTIN_UNREACHABLE __builtin_unreachable()
#endif

#define SC_UNUSED(expr) (void)(sizeof((expr)))
