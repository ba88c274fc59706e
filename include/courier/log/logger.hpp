#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <chrono>

namespace courier::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";
        case level::info:    return "\033[32m";
        case level::warning: return "\033[33m";
        case level::error:   return "\033[31m";
        default:             return "\033[0m";
    }
}

/// Process-wide logger
/// Lines are written as `[TIMESTAMP] [LEVEL] [file:line] message`.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output (stderr by default). Colors are only emitted on a tty-like
    /// stream the caller opts into with `colored`.
    void set_output(std::FILE* out, bool colored = false) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : stderr;
        colored_ = colored;
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(out_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored_ ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg,
            colored_ ? "\033[0m" : ""
        );
        std::fflush(out_);
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::mutex mutex_;
    std::FILE* out_ = stderr;
    bool colored_ = true;
};

} // namespace courier::log
