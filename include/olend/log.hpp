#pragma once

/// @file include/olend/log.hpp
/// @brief Levelled diagnostic lines on stderr, formatted with fmt.
///
/// Usage:
/// ```cpp
/// log::warn("config_loader", "skipped {} malformed rows", skipped);
/// ```
/// Debug lines are compiled in only when OLEND_DEBUG_LOG is defined.

#include <fmt/core.h>

#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

namespace olend::log {

enum class Level : std::uint8_t {
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] constexpr const char* to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

template <typename... Args>
void write(Level level,
           std::string_view component,
           fmt::format_string<Args...> format,
           Args&&... args) {
#ifndef OLEND_DEBUG_LOG
    if (level == Level::Debug) {
        return;
    }
#endif
    fmt::print(stderr, "[{}] {}: {}\n",
               component, to_string(level),
               fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, component, format, std::forward<Args>(args)...);
}

} // namespace olend::log
