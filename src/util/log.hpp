#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

namespace detail {
struct LogState {
    std::mutex mtx;
    std::atomic<LogLevel> min_level{LogLevel::Info};
    std::FILE* sink{nullptr}; // nullptr means stderr
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    auto& st = log_state();
    if (lvl < st.min_level.load(std::memory_order_relaxed) || lvl == LogLevel::Off) {
        return;
    }
    std::lock_guard<std::mutex> lock(st.mtx);
    std::FILE* out = st.sink ? st.sink : stderr;
    std::fprintf(out, "%s: ", level_name(lvl));
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
    std::fflush(out);
}
} // namespace detail

// Messages below the minimum level are dropped before formatting.
inline void set_log_level(LogLevel lvl) noexcept {
    detail::log_state().min_level.store(lvl, std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::log_state().min_level.load(std::memory_order_relaxed);
}

// Redirect output (tests capture into a tmpfile). Passing nullptr restores stderr.
// The caller keeps ownership of the FILE.
inline void set_log_sink(std::FILE* sink) noexcept {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    st.sink = sink;
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return lvl != LogLevel::Off && lvl >= log_level();
}

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define SNAPGATE_LOG_TRACE(FMT, ...) ::util::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define SNAPGATE_LOG_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define SNAPGATE_LOG_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define SNAPGATE_LOG_WARN(FMT, ...)  ::util::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define SNAPGATE_LOG_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
