#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace minawallet {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Provide logger object
 * @param tag - tagging name for identifying logger
 * @return logger writing to stderr, shared by every caller using the same tag
 */
Logger create_logger(const std::string& tag);

// Applies level to every registered logger and to loggers created later
void set_log_level(spdlog::level::level_enum level);

} // namespace minawallet
