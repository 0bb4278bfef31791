#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: MM_COMPILER_MSVC, MM_COMPILER_CLANG, MM_COMPILER_GCC, MM_COMPILER_POSIX

#if defined(_MSC_VER)
#define MM_COMPILER_MSVC
#elif defined(__clang__)
#define MM_COMPILER_CLANG
#elif defined(__GNUC__)
#define MM_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(MM_COMPILER_CLANG) || defined(MM_COMPILER_GCC)
#define MM_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: MM_OS_WINDOWS, MM_OS_LINUX, MM_OS_APPLE, MM_OS_BSD
// Only used to pick the debugger detection strategy of the assertion layer.

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define MM_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define MM_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define MM_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define MM_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: MM_DEBUG, MM_RELEASE, MM_RELWITHDEBINFO, MM_ENABLE_ASSERT_IN_RELEASE
// Defined here: MM_ASSERT_ENABLED (0 or 1)

#if defined(MM_DEBUG) || defined(MM_RELWITHDEBINFO) || defined(MM_ENABLE_ASSERT_IN_RELEASE)
#define MM_ASSERT_ENABLED 1
#elif defined(MM_RELEASE)
#define MM_ASSERT_ENABLED 0
#else
// no build mode given (e.g. consumed without our CMake): keep checks on
#define MM_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// MM_FORCE_INLINE - Force function to be inlined
#define MM_FORCE_INLINE MM_IMPL_FORCE_INLINE

// MM_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: MM_COLD_FUNC void handle_error() { ... }
#define MM_COLD_FUNC MM_IMPL_COLD_FUNC

// MM_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define MM_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(MM_COMPILER_MSVC)

#define MM_IMPL_FORCE_INLINE __forceinline
#define MM_IMPL_COLD_FUNC

#elif defined(MM_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define MM_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define MM_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
