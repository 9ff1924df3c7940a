#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: LB_COMPILER_MSVC, LB_COMPILER_CLANG, LB_COMPILER_GCC, LB_COMPILER_POSIX

#if defined(_MSC_VER)
#define LB_COMPILER_MSVC
#elif defined(__clang__)
#define LB_COMPILER_CLANG
#elif defined(__GNUC__)
#define LB_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(LB_COMPILER_CLANG) || defined(LB_COMPILER_GCC)
#define LB_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: LB_HAS_CPP_EXCEPTIONS
// From CMake: LB_DEBUG, LB_RELEASE, LB_RELWITHDEBINFO, LB_ENABLE_ASSERT_IN_RELEASE
// Always defined: LB_ASSERT_ENABLED (0 or 1)

#ifdef LB_COMPILER_MSVC
#ifdef _CPPUNWIND
#define LB_HAS_CPP_EXCEPTIONS
#endif
#elif defined(LB_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define LB_HAS_CPP_EXCEPTIONS
#endif
#elif defined(LB_COMPILER_GCC)
#if __EXCEPTIONS
#define LB_HAS_CPP_EXCEPTIONS
#endif
#endif

// assertions stay on in relwithdebinfo, only plain release strips them
#if defined(LB_DEBUG) || defined(LB_RELWITHDEBINFO) || defined(LB_ENABLE_ASSERT_IN_RELEASE)
#define LB_ASSERT_ENABLED 1
#else
#define LB_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: LB_OS_WINDOWS, LB_OS_LINUX, LB_OS_APPLE, LB_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define LB_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define LB_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define LB_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define LB_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// LB_FORCE_INLINE - Force function to be inlined
#define LB_FORCE_INLINE LB_IMPL_FORCE_INLINE

// LB_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: LB_COLD_FUNC void throw_error(...) { ... }
#define LB_COLD_FUNC LB_IMPL_COLD_FUNC

// LB_MACRO_JOIN(a, b) - Concatenate two tokens after expanding both
// Usage: LB_MACRO_JOIN(_lb_deferred_, __COUNTER__) -> _lb_deferred_17
#define LB_MACRO_JOIN(arg1, arg2) LB_IMPL_MACRO_JOIN(arg1, arg2)

// LB_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define LB_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(LB_COMPILER_MSVC)

#define LB_IMPL_FORCE_INLINE __forceinline
#define LB_IMPL_COLD_FUNC

#elif defined(LB_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define LB_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define LB_IMPL_COLD_FUNC __attribute__((cold))

#endif

#define LB_IMPL_MACRO_JOIN(arg1, arg2) LB_IMPL_MACRO_JOIN_INNER(arg1, arg2)
#define LB_IMPL_MACRO_JOIN_INNER(arg1, arg2) arg1##arg2
