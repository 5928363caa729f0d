#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: KC_COMPILER_MSVC, KC_COMPILER_CLANG, KC_COMPILER_GCC, KC_COMPILER_POSIX

#if defined(_MSC_VER)
#define KC_COMPILER_MSVC
#elif defined(__clang__)
#define KC_COMPILER_CLANG
#elif defined(__GNUC__)
#define KC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(KC_COMPILER_CLANG) || defined(KC_COMPILER_GCC)
#define KC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: KC_OS_WINDOWS, KC_OS_LINUX, KC_OS_APPLE, KC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define KC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define KC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define KC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define KC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: KC_DEBUG, KC_RELEASE, KC_RELWITHDEBINFO, KC_ENABLE_ASSERT_IN_RELEASE
// Defined here: KC_ASSERT_ENABLED (0 or 1)

#if defined(KC_DEBUG) || defined(KC_RELWITHDEBINFO) || defined(KC_ENABLE_ASSERT_IN_RELEASE)
#define KC_ASSERT_ENABLED 1
#elif defined(KC_RELEASE)
#define KC_ASSERT_ENABLED 0
#else
// no configuration from the build system: assume a checked build
#define KC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// KC_FORCE_INLINE - Force function to be inlined
#define KC_FORCE_INLINE KC_IMPL_FORCE_INLINE

// KC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: KC_COLD_FUNC void throw_something() { ... }
#define KC_COLD_FUNC KC_IMPL_COLD_FUNC

// KC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define KC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(KC_COMPILER_MSVC)

#define KC_IMPL_FORCE_INLINE __forceinline
#define KC_IMPL_COLD_FUNC __declspec(noinline)

#elif defined(KC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define KC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define KC_IMPL_COLD_FUNC __attribute__((cold, noinline))

#else
#error "Unknown compiler"
#endif

