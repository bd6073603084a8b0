/**
 * @file log.hpp
 * @brief Leveled printf-style logger with category tags.
 *
 * Output format (stderr):
 *   [2026-10-18 12:00:00.123] [INFO] [Dispatch] message (file.hpp:42)
 *
 * Two filters apply:
 *   - MWD_LOG_MIN_LEVEL   compile-time floor (0=Debug .. 5=Off)
 *   - log::SetLevel()     runtime threshold
 *
 * Usage:
 * @code
 *   MWD_LOG_INFO("Dispatch", "submission %s complete", sid.c_str());
 * @endcode
 */

#ifndef MWD_LOG_HPP_
#define MWD_LOG_HPP_

#include "mwd/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(MWD_PLATFORM_LINUX) || defined(MWD_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef MWD_LOG_MIN_LEVEL
#ifdef NDEBUG
#define MWD_LOG_MIN_LEVEL 1
#else
#define MWD_LOG_MIN_LEVEL 0
#endif
#endif

namespace mwd {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

/// Serializes whole lines so concurrent loops do not interleave output.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff: return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(MWD_PLATFORM_LINUX) || defined(MWD_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local == nullptr) {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
    return;
  }
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                      tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                      tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                      tm_local->tm_sec);
#endif
}

}  // namespace detail

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

/// Marks the logger ready; kept explicit so the app owns its lifecycle.
inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/// Parses "debug"/"info"/"warn"/"error"/"fatal"/"off" (case-insensitive).
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  char lower[8] = {};
  size_t i = 0;
  for (; name[i] != '\0' && i < sizeof(lower) - 1; ++i) {
    char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (name[i] != '\0') return fallback;
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0) return Level::kWarn;
  if (std::strcmp(lower, "warning") == 0) return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return fallback;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace mwd

// ============================================================================
// Macros
// ============================================================================

#define MWD_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (MWD_LOG_MIN_LEVEL <= 0) {                                           \
      ::mwd::log::LogWrite(::mwd::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define MWD_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (MWD_LOG_MIN_LEVEL <= 1) {                                           \
      ::mwd::log::LogWrite(::mwd::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define MWD_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (MWD_LOG_MIN_LEVEL <= 2) {                                           \
      ::mwd::log::LogWrite(::mwd::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define MWD_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (MWD_LOG_MIN_LEVEL <= 3) {                                           \
      ::mwd::log::LogWrite(::mwd::log::Level::kError, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define MWD_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::mwd::log::LogWrite(::mwd::log::Level::kFatal, cat, __FILE__,          \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                           \
  } while (0)

#endif  // MWD_LOG_HPP_
