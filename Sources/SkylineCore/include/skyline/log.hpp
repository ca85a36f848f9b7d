#pragma once

#include <cstdio>
#include <atomic>
#include <string>

namespace skyline {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in SkylineCore/src/log.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// Parse "off" / "error" / "warn" / "info" / "debug" (case-insensitive).
/// Unknown names leave the current level untouched and return false.
bool set_log_level(const std::string& name);

/// Apply $SKYLINE_LOG_LEVEL if it is set.
void init_log_level_from_environment();

}  // namespace skyline

#define SKYLINE_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(skyline::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) SKYLINE_LOG(skyline::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  SKYLINE_LOG(skyline::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  SKYLINE_LOG(skyline::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) SKYLINE_LOG(skyline::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
