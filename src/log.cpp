#include "kiln/log.hpp"

#include <atomic>
#include <cstdio>
#include <print>

namespace kiln {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

namespace detail {

std::mutex &log_mutex() {
    static std::mutex mtx;
    return mtx;
}

void emit(LogLevel level, std::string_view line) {
    std::lock_guard lock(log_mutex());
    switch (level) {
    case LogLevel::Debug:
        std::println(stderr, "debug: {}", line);
        break;
    case LogLevel::Info:
        std::println(stdout, "{}", line);
        std::fflush(stdout);
        break;
    case LogLevel::Warn:
        std::println(stderr, "warning: {}", line);
        break;
    case LogLevel::Error:
        std::println(stderr, "error: {}", line);
        break;
    }
}

} // namespace detail

} // namespace kiln
