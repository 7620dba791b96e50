#ifndef AMT_DREAM_LOG_HPP
#define AMT_DREAM_LOG_HPP

#include <cstdio>
#include <utility>
#include <fmt/core.h>
#include "config.hpp"

namespace dream::log {

    inline auto enabled(LogLevel level) noexcept -> bool {
        auto current = config().log_level();
        return current != LogLevel::off && level >= current;
    }

    template <typename... Args>
    auto write(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        if (!enabled(level)) return;
        fmt::print(stderr, "[dream:{}] {}\n", to_string(level), fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    auto trace(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        write(LogLevel::trace, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto debug(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        write(LogLevel::debug, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto info(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        write(LogLevel::info, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto warn(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        write(LogLevel::warn, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto error(fmt::format_string<Args...> fmt_str, Args&&... args) -> void {
        write(LogLevel::error, fmt_str, std::forward<Args>(args)...);
    }

} // namespace dream::log

#endif // AMT_DREAM_LOG_HPP
