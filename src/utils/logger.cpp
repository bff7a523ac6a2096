#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <vector>
#include <iostream>
#include <cctype>

namespace sidx {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

using detail::toSpdlogLevel;

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        }

        logger_ = std::make_shared<spdlog::logger>("sidx", sinks.begin(), sinks.end());
        logger_->set_level(toSpdlogLevel(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");

        spdlog::set_default_logger(logger_);
        logger_->debug("Logger initialized (level={}, file='{}')", levelToString(level), log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

bool Logger::isEnabled(Level level) {
    return logger_ && logger_->should_log(toSpdlogLevel(level));
}

void Logger::setLevel(Level level) {
    get()->set_level(toSpdlogLevel(level));
}

void Logger::setPattern(const std::string& pattern) {
    get()->set_pattern(pattern);
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace sidx
