#pragma once

#include "logger.hpp"

#include <string_view>

namespace courier::log::detail {

/// Last path component of a __FILE__ string
constexpr const char* source_file_name(const char* path) noexcept {
    std::string_view p(path);
    auto slash = p.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path + slash + 1;
}

} // namespace courier::log::detail

/// Log at lvl with the caller's file and line
/// Format arguments are not evaluated when lvl is filtered out.
#define COURIER_LOG_AT(lvl, fmt, ...)                                                   \
    do {                                                                                \
        auto& courier_logger_ = ::courier::log::logger::instance();                     \
        if (courier_logger_.enabled(lvl)) {                                             \
            courier_logger_.log(lvl, ::courier::log::detail::source_file_name(__FILE__), \
                                __LINE__, fmt __VA_OPT__(,) __VA_ARGS__);               \
        }                                                                               \
    } while (0)

#ifdef COURIER_DEBUG
    #define COURIER_LOG_DEBUG(fmt, ...) COURIER_LOG_AT(::courier::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define COURIER_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define COURIER_LOG_INFO(fmt, ...) COURIER_LOG_AT(::courier::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)
#define COURIER_LOG_WARNING(fmt, ...) COURIER_LOG_AT(::courier::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)
#define COURIER_LOG_ERROR(fmt, ...) COURIER_LOG_AT(::courier::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)
