#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: AX_COMPILER_MSVC, AX_COMPILER_CLANG, AX_COMPILER_GCC, AX_COMPILER_MINGW, AX_COMPILER_POSIX

#if defined(_MSC_VER)
#define AX_COMPILER_MSVC
#elif defined(__clang__)
#define AX_COMPILER_CLANG
#elif defined(__GNUC__)
#define AX_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define AX_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(AX_COMPILER_CLANG) || defined(AX_COMPILER_GCC) || defined(AX_COMPILER_MINGW)
#define AX_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: AX_OS_WINDOWS, AX_OS_LINUX, AX_OS_APPLE, AX_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define AX_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define AX_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define AX_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define AX_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: AX_DEBUG, AX_RELEASE, AX_RELWITHDEBINFO
// Optional:   AX_ENABLE_ASSERT_IN_RELEASE
// Derived:    AX_ASSERT_ENABLED (always defined, 0 or 1)
//
// Assertions are active in debug and release-with-debug-info builds.
// Plain release builds strip them unless AX_ENABLE_ASSERT_IN_RELEASE is set.
// Argument validation that throws ax::error is NOT affected by this switch.

#ifndef AX_ASSERT_ENABLED
#if defined(AX_DEBUG) || defined(AX_RELWITHDEBINFO) || defined(AX_ENABLE_ASSERT_IN_RELEASE)
#define AX_ASSERT_ENABLED 1
#elif defined(AX_RELEASE)
#define AX_ASSERT_ENABLED 0
#else
// no build type from CMake (e.g. a consumer compiling the headers directly): keep checks on
#define AX_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// AX_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: AX_COLD_FUNC void handle_error() { ... }
#define AX_COLD_FUNC AX_IMPL_COLD_FUNC

// AX_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Note: Indirection ensures arguments are expanded before concatenation
#define AX_MACRO_JOIN(arg1, arg2) AX_IMPL_MACRO_JOIN(arg1, arg2)

// AX_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define AX_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(AX_COMPILER_MSVC)

#define AX_IMPL_COLD_FUNC

#elif defined(AX_COMPILER_POSIX)

#define AX_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define AX_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
