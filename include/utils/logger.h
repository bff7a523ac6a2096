#pragma once

#include <memory>
#include <string>
#include <utility>

namespace spdlog { class logger; }

namespace sidx {
namespace utils {

/// Shared spdlog logger "sidx" for the whole index and query layer.
///
/// init() attaches a console sink and, for a non-empty path, a truncating file
/// sink. Before init() every message is dropped; get() initializes lazily.
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    static void init(const std::string& log_file = "", Level level = Level::INFO);
    static void shutdown();
    static std::shared_ptr<spdlog::logger> get();
    static bool isInitialized();

    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);
    static bool isEnabled(Level level);

    // INFO bei unbekanntem Namen
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args) {
        log(Level::TRACE, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args) {
        log(Level::DEBUG, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args) {
        log(Level::INFO, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args) {
        log(Level::WARN, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args) {
        log(Level::ERROR, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }
    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args) {
        log(Level::CRITICAL, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace sidx

#include "utils/logger_impl.h"

#define SIDX_TRACE(...) ::sidx::utils::Logger::trace(__VA_ARGS__)
#define SIDX_DEBUG(...) ::sidx::utils::Logger::debug(__VA_ARGS__)
#define SIDX_INFO(...) ::sidx::utils::Logger::info(__VA_ARGS__)
#define SIDX_WARN(...) ::sidx::utils::Logger::warn(__VA_ARGS__)
#define SIDX_ERROR(...) ::sidx::utils::Logger::error(__VA_ARGS__)
#define SIDX_CRITICAL(...) ::sidx::utils::Logger::critical(__VA_ARGS__)
