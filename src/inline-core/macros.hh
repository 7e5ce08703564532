#pragma once

// Platform and build configuration for inline-core
//
// Compiler:   IC_COMPILER_MSVC | IC_COMPILER_CLANG | IC_COMPILER_GCC | IC_COMPILER_MINGW (exactly one)
//             IC_COMPILER_POSIX for the gcc-style ones
// OS:         IC_OS_WINDOWS | IC_OS_APPLE | IC_OS_LINUX | IC_OS_BSD (exactly one)
// Features:   IC_HAS_CPP_EXCEPTIONS if exceptions are enabled
//
// Build modes come from CMake (IC_DEBUG, IC_RELEASE, IC_RELWITHDEBINFO) and decide IC_ASSERT_ENABLED:
//   1 unless this is an IC_RELEASE build without IC_ENABLE_ASSERT_IN_RELEASE.
//   Consumers that do not define any build mode keep their debug assertions.

#if defined(_MSC_VER)
#define IC_COMPILER_MSVC
#elif defined(__clang__)
#define IC_COMPILER_CLANG
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define IC_COMPILER_MINGW
#elif defined(__GNUC__)
#define IC_COMPILER_GCC
#else
#error "inline-core: unsupported compiler"
#endif

#if !defined(IC_COMPILER_MSVC)
#define IC_COMPILER_POSIX
#endif

#if defined(_WIN32)
#define IC_OS_WINDOWS
#elif defined(__APPLE__)
#define IC_OS_APPLE
#elif defined(__linux__)
#define IC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define IC_OS_BSD
#else
#error "inline-core: unsupported platform"
#endif

#if defined(IC_COMPILER_MSVC)
#if defined(_CPPUNWIND)
#define IC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(__cpp_exceptions)
#define IC_HAS_CPP_EXCEPTIONS
#endif

#if defined(IC_RELEASE) && !defined(IC_ENABLE_ASSERT_IN_RELEASE)
#define IC_ASSERT_ENABLED 0
#else
#define IC_ASSERT_ENABLED 1
#endif

// IC_FORCE_INLINE: for tiny helpers that must not show up as calls in debug builds
// IC_COLD_FUNC:    for failure paths, moves the code out of the hot section
#if defined(IC_COMPILER_MSVC)
#define IC_FORCE_INLINE __forceinline
#define IC_COLD_FUNC
#else
// gcc needs the extra 'inline'
#define IC_FORCE_INLINE __attribute__((always_inline)) inline
#define IC_COLD_FUNC __attribute__((cold))
#endif

// IC_UNUSED(expr): type-checks expr without evaluating it
#define IC_UNUSED(expr) (void)(sizeof((expr)))
