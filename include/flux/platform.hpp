/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros for flux.
 */

#ifndef FLUX_PLATFORM_HPP_
#define FLUX_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace flux {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FLUX_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FLUX_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define FLUX_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Exception Support
// ============================================================================

// Callback wrappers capture thrown errors only when the translation unit is
// built with exceptions. With -fno-exceptions a callback reports failure
// through its return value.
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define FLUX_HAS_EXCEPTIONS 1
#else
#define FLUX_HAS_EXCEPTIONS 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define FLUX_LIKELY(x) __builtin_expect(!!(x), 1)
#define FLUX_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define FLUX_LIKELY(x) (x)
#define FLUX_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "FLUX_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FLUX_ASSERT(cond) ((void)0)
#else
#define FLUX_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::flux::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define FLUX_CONCAT_IMPL(a, b) a##b
#define FLUX_CONCAT(a, b) FLUX_CONCAT_IMPL(a, b)

}  // namespace flux

#endif  // FLUX_PLATFORM_HPP_
