#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: PC_COMPILER_MSVC, PC_COMPILER_CLANG, PC_COMPILER_GCC, PC_COMPILER_POSIX

#if defined(_MSC_VER)
#define PC_COMPILER_MSVC
#elif defined(__clang__)
#define PC_COMPILER_CLANG
#elif defined(__GNUC__)
#define PC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(PC_COMPILER_CLANG) || defined(PC_COMPILER_GCC)
#define PC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: PC_OS_WINDOWS, PC_OS_LINUX, PC_OS_APPLE, PC_OS_BSD
// From CMake: PC_DEBUG, PC_RELEASE, PC_RELWITHDEBINFO, PC_ASSERT_ENABLED, PC_STRING_TELEMETRY_ENABLED

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define PC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define PC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define PC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define PC_OS_BSD
#else
#error "Unknown platform"
#endif

#ifndef PC_STRING_TELEMETRY_ENABLED
#define PC_STRING_TELEMETRY_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// PC_FORCE_INLINE - Force function to be inlined
#define PC_FORCE_INLINE PC_IMPL_FORCE_INLINE

// PC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: PC_COLD_FUNC void handle_error() { ... }
#define PC_COLD_FUNC PC_IMPL_COLD_FUNC

// PC_HOT_FUNC - Mark function as frequently executed (scanner and compare loops)
#define PC_HOT_FUNC PC_IMPL_HOT_FUNC

// PC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define PC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(PC_COMPILER_MSVC)

#define PC_IMPL_FORCE_INLINE __forceinline

#define PC_IMPL_COLD_FUNC
#define PC_IMPL_HOT_FUNC

#elif defined(PC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define PC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline

#define PC_IMPL_COLD_FUNC __attribute__((cold))
#define PC_IMPL_HOT_FUNC __attribute__((hot))

#else
#error "Unknown compiler"
#endif
