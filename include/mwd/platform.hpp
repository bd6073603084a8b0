/**
 * @file platform.hpp
 * @brief Platform detection, assertion and clock helpers.
 */

#ifndef MWD_PLATFORM_HPP_
#define MWD_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace mwd {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MWD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MWD_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MWD_PLATFORM_WINDOWS 1
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
  (void)std::fprintf(stderr, "MWD_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MWD_ASSERT(cond) ((void)0)
#else
#define MWD_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::mwd::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Clocks
// ============================================================================

/// Monotonic time in milliseconds (retry deadlines, cache staleness).
inline uint64_t SteadyNowMs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
}

/// Wall-clock seconds since the epoch (record expiry timestamps).
inline int64_t WallNowSec() noexcept {
  const auto dur = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(dur).count());
}

// ============================================================================
// FNV-1a Hash
// ============================================================================

/// 64-bit FNV-1a over a byte range; stable across processes and platforms.
inline uint64_t Fnv1a64(const void* data, size_t size,
                        uint64_t seed = 14695981039346656037ULL) noexcept {
  const auto* p = static_cast<const uint8_t*>(data);
  uint64_t hash = seed;
  for (size_t i = 0; i < size; ++i) {
    hash ^= static_cast<uint64_t>(p[i]);
    hash *= 1099511628211ULL;
  }
  return hash;
}

// ============================================================================
// Macro Helpers
// ============================================================================

#define MWD_CONCAT_IMPL(a, b) a##b
#define MWD_CONCAT(a, b) MWD_CONCAT_IMPL(a, b)

}  // namespace mwd

#endif  // MWD_PLATFORM_HPP_
