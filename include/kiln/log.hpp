#pragma once

#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string_view>
#include <utility>

namespace kiln {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

namespace detail {

std::mutex &log_mutex();
void emit(LogLevel level, std::string_view line);

} // namespace detail

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_level());
}

template <typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args &&...args) {
    if (!log_enabled(level))
        return;
    detail::emit(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(std::format_string<Args...> fmt, Args &&...args) {
    log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args &&...args) {
    log(LogLevel::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(std::format_string<Args...> fmt, Args &&...args) {
    log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args &&...args) {
    log(LogLevel::Error, fmt, std::forward<Args>(args)...);
}

} // namespace kiln
