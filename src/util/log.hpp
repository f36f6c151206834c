#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Warn};
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

// Messages below the threshold are discarded before formatting.
inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_level().store(lvl, std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(log_level());
}

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        if (!log_enabled(lvl)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        detail::log_impl(lvl, fmt, args);
        va_end(args);
    }
};

} // namespace util

#define STRUCTDIFF_LOG_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define STRUCTDIFF_LOG_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define STRUCTDIFF_LOG_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define STRUCTDIFF_LOG_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define STRUCTDIFF_LOG_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define STRUCTDIFF_LOG_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
