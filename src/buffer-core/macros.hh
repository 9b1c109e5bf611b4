#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: BC_COMPILER_MSVC, BC_COMPILER_CLANG, BC_COMPILER_GCC, BC_COMPILER_POSIX

#if defined(_MSC_VER)
#define BC_COMPILER_MSVC
#elif defined(__clang__)
#define BC_COMPILER_CLANG
#elif defined(__GNUC__)
#define BC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(BC_COMPILER_CLANG) || defined(BC_COMPILER_GCC)
#define BC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: BC_OS_WINDOWS, BC_OS_LINUX, BC_OS_APPLE, BC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define BC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define BC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define BC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define BC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: BC_DEBUG, BC_RELEASE, BC_RELWITHDEBINFO
// Optional:   BC_ENABLE_ASSERT_IN_RELEASE
// Derived:    BC_ASSERT_ENABLED (0 or 1)

#if defined(BC_RELEASE) && !defined(BC_ENABLE_ASSERT_IN_RELEASE)
#define BC_ASSERT_ENABLED 0
#else
#define BC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// BC_FORCE_INLINE - Force function to be inlined
#define BC_FORCE_INLINE BC_IMPL_FORCE_INLINE

// BC_COLD_FUNC - Mark function as rarely executed (growth paths, assertion handlers)
// Usage: BC_COLD_FUNC void grow() { ... }
#define BC_COLD_FUNC BC_IMPL_COLD_FUNC

// BC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define BC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(BC_COMPILER_MSVC)

#define BC_IMPL_FORCE_INLINE __forceinline
#define BC_IMPL_COLD_FUNC

#elif defined(BC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define BC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define BC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

