#include "logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace minawallet {

namespace {

// Quiet unless --verbose: stderr also carries the one-line CLI errors
spdlog::level::level_enum default_level = spdlog::level::warn;

// Guards default_level and logger registration
std::mutex logger_mutex;

void set_global_pattern(spdlog::logger& logger) {
    logger.set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
}

} // namespace

Logger create_logger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
        // stdout carries command output, so logs go to stderr
        logger = spdlog::stderr_color_mt(tag);
        set_global_pattern(*logger);
        logger->set_level(default_level);
    }
    return logger;
}

void set_log_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    default_level = level;
    spdlog::set_level(level);
}

} // namespace minawallet
