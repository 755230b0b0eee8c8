/**
 * @file log.hpp
 * @brief Synchronous leveled logging for flux.
 *
 * printf-style macros tagged with a category string:
 *
 *   FLUX_LOG_INFO("dispatcher", "broadcast #%llu opened", seq);
 *
 * Output line format (stderr):
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [category] message (file:line)
 *
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Two filters apply:
 *   - FLUX_LOG_MIN_LEVEL (compile time, 0=DEBUG .. 4=FATAL) removes calls
 *     below the floor entirely.
 *   - SetLevel() (runtime) drops messages below the current threshold.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FLUX_LOG_HPP_
#define FLUX_LOG_HPP_

#include "flux/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(FLUX_PLATFORM_LINUX) || defined(FLUX_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef FLUX_LOG_MIN_LEVEL
#ifdef NDEBUG
#define FLUX_LOG_MIN_LEVEL 1
#else
#define FLUX_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef FLUX_LOG_LINE_MAX
#define FLUX_LOG_LINE_MAX 512U
#endif

namespace flux {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
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

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall clock as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(FLUX_PLATFORM_LINUX) || defined(FLUX_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  time_t t = ts.tv_sec;
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
#else
  time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                        tm_local->tm_mday, tm_local->tm_hour,
                        tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/** @brief Mark logging as initialized. Idempotent. */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and mark logging as shut down. */
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", "warning", "error",
 *        "fatal", "off"), case-insensitive.
 *
 * @return @p fallback when @p name is nullptr or unrecognized.
 */
inline Level ParseLevel(const char* name, Level fallback = Level::kInfo) noexcept {
  if (name == nullptr) return fallback;
  char lower[16];
  uint32_t i = 0;
  for (; name[i] != '\0' && i < sizeof(lower) - 1U; ++i) {
    char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (name[i] != '\0') return fallback;
  lower[i] = '\0';

  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0 || std::strcmp(lower, "warning") == 0)
    return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return fallback;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[FLUX_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "", msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "", msg,
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
}  // namespace flux

// ============================================================================
// Macros
// ============================================================================

#define FLUX_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                      \
    if (FLUX_LOG_MIN_LEVEL <= 0) {                                          \
      ::flux::log::LogWrite(::flux::log::Level::kDebug, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define FLUX_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                      \
    if (FLUX_LOG_MIN_LEVEL <= 1) {                                          \
      ::flux::log::LogWrite(::flux::log::Level::kInfo, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define FLUX_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                      \
    if (FLUX_LOG_MIN_LEVEL <= 2) {                                          \
      ::flux::log::LogWrite(::flux::log::Level::kWarn, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define FLUX_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                      \
    ::flux::log::LogWrite(::flux::log::Level::kError, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
  } while (0)

#define FLUX_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                      \
    ::flux::log::LogWrite(::flux::log::Level::kFatal, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                           \
  } while (0)

#endif  // FLUX_LOG_HPP_
