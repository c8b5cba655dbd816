#pragma once

// Platform and build configuration for numvec.
//
//   NV_COMPILER_MSVC / NV_COMPILER_POSIX   - which attribute syntax the compiler speaks
//   NV_OS_LINUX                            - /proc is available for debugger detection
//   NV_ASSERT_ENABLED                      - 1 if NV_ASSERT / NV_ASSERTF are checked (see <numvec/assert.hh>)
//
// The build system defines exactly one of NV_DEBUG, NV_RELEASE and NV_RELWITHDEBINFO,
// and optionally NV_ENABLE_ASSERT_IN_RELEASE.

#if defined(_MSC_VER)
#define NV_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__)
#define NV_COMPILER_POSIX
#else
#error "numvec supports MSVC, clang and gcc"
#endif

#if defined(__linux__)
#define NV_OS_LINUX
#endif

#if defined(NV_DEBUG) || defined(NV_RELWITHDEBINFO) || defined(NV_ENABLE_ASSERT_IN_RELEASE)
#define NV_ASSERT_ENABLED 1
#else
#define NV_ASSERT_ENABLED 0
#endif

// always inline, used for the tiny move/forward helpers
#ifdef NV_COMPILER_MSVC
#define NV_FORCE_INLINE __forceinline
#else
#define NV_FORCE_INLINE __attribute__((always_inline)) inline
#endif

// rarely executed paths: assertion failures and container growth
#ifdef NV_COMPILER_MSVC
#define NV_COLD_FUNC
#else
#define NV_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define NV_UNUSED(expr) (void)(sizeof((expr)))
