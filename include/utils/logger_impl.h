#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <utility>

namespace sidx {
namespace utils {

namespace detail {

inline spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace detail

// Format strings are runtime strings; the level check runs before formatting.
template<typename FormatString, typename... Args>
void Logger::log(Level level, FormatString&& fmt, Args&&... args) {
    if (!logger_)
        return;
    auto lvl = detail::toSpdlogLevel(level);
    if (!logger_->should_log(lvl))
        return;
    logger_->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace sidx
