// json_model/basic/logging.hpp - Library logger
#pragma once

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace json_model
{

using Logger = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Name under which the library logger is registered with spdlog.
inline constexpr const char * k_logger_name = "json_model";

/**
 * Logger used by the library.
 *
 * Cloned from the spdlog default logger on first use and registered under
 * k_logger_name, so applications can tune it with spdlog::get().
 */
[[nodiscard]] LoggerPtr get_logger();

}  // namespace json_model
