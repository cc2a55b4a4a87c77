/**
 * @file log.hpp
 * @brief Synchronous, category-tagged printf-style logging.
 *
 * Two filters apply to every message:
 *   - compile time: MIRROR_LOG_MIN_LEVEL (0=debug .. 5=off) removes calls
 *   - run time: log::SetLevel() gates what reaches the sink
 *
 * Output line:  [2026-01-01 12:00:00.123] [INFO] [Session] message
 * Debug builds append (file:line).
 */

#ifndef MIRROR_LOG_HPP_
#define MIRROR_LOG_HPP_

#include "mirror/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <time.h>

#ifndef MIRROR_LOG_MIN_LEVEL
#ifdef NDEBUG
#define MIRROR_LOG_MIN_LEVEL 1
#else
#define MIRROR_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef MIRROR_LOG_MESSAGE_SIZE
#define MIRROR_LOG_MESSAGE_SIZE 512U
#endif

namespace mirror {
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

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  timespec ts{};
  (void)clock_gettime(CLOCK_REALTIME, &ts);
  std::tm tm_buf{};
  (void)localtime_r(&ts.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld", ts.tv_nsec / 1000000L);
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// Mark the logger ready. Idempotent; the sink works without it.
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

/** @brief Parse "debug".."off" (case-sensitive, lower case); kInfo on miss. */
inline Level ParseLevel(const char* name) noexcept {
  if (name == nullptr) return Level::kInfo;
  if (std::strcmp(name, "debug") == 0) return Level::kDebug;
  if (std::strcmp(name, "warn") == 0) return Level::kWarn;
  if (std::strcmp(name, "error") == 0) return Level::kError;
  if (std::strcmp(name, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(name, "off") == 0) return Level::kOff;
  return Level::kInfo;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  char message[MIRROR_LOG_MESSAGE_SIZE];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, message,
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
}  // namespace mirror

// ============================================================================
// Macros
// ============================================================================

#define MIRROR_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                      \
    if (MIRROR_LOG_MIN_LEVEL <= 0) {                                        \
      ::mirror::log::LogWrite(::mirror::log::Level::kDebug, cat, __FILE__,  \
                              __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                       \
  } while (0)

#define MIRROR_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                      \
    if (MIRROR_LOG_MIN_LEVEL <= 1) {                                        \
      ::mirror::log::LogWrite(::mirror::log::Level::kInfo, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                       \
  } while (0)

#define MIRROR_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                      \
    if (MIRROR_LOG_MIN_LEVEL <= 2) {                                        \
      ::mirror::log::LogWrite(::mirror::log::Level::kWarn, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                       \
  } while (0)

#define MIRROR_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                      \
    if (MIRROR_LOG_MIN_LEVEL <= 3) {                                        \
      ::mirror::log::LogWrite(::mirror::log::Level::kError, cat, __FILE__,  \
                              __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                       \
  } while (0)

#define MIRROR_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                      \
    ::mirror::log::LogWrite(::mirror::log::Level::kFatal, cat, __FILE__,    \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                           \
  } while (0)

#endif  // MIRROR_LOG_HPP_
