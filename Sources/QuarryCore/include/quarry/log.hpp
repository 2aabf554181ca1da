#pragma once

#ifdef __cplusplus

#include <atomic>
#include <cstdio>
#include <string>

namespace quarry {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold shared by every executor and session; starts at off.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return level != log_level::off &&
           static_cast<int>(level) <= static_cast<int>(g_log_level.load(std::memory_order_relaxed));
}

/// Parse "off", "error", "warn", "info" or "debug". Throws config_error otherwise.
log_level parse_log_level(const std::string& name);

const char* log_level_name(log_level level);

/// Writes "quarry <level> [tag] message" to stderr.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void log_write(log_level level, const char* tag, const char* fmt, ...);

}  // namespace quarry

#define QUARRY_LOG_AT(level, tag, ...) \
    do { \
        if (quarry::log_enabled(level)) quarry::log_write(level, tag, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(tag, ...) QUARRY_LOG_AT(quarry::log_level::error, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...)  QUARRY_LOG_AT(quarry::log_level::warn, tag, __VA_ARGS__)
#define LOG_INFO(tag, ...)  QUARRY_LOG_AT(quarry::log_level::info, tag, __VA_ARGS__)

// Debug output costs nothing in release builds.
#ifdef NDEBUG
#define LOG_DEBUG(tag, ...) ((void)0)
#else
#define LOG_DEBUG(tag, ...) QUARRY_LOG_AT(quarry::log_level::debug, tag, __VA_ARGS__)
#endif

#endif // __cplusplus
