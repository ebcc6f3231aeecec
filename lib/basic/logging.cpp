// json_model/basic/logging.cpp - Library logger
#include "json_model/basic/logging.hpp"

#include <mutex>

namespace json_model
{

LoggerPtr get_logger()
{
  static std::mutex mutex;
  const std::lock_guard<std::mutex> lock(mutex);

  if (auto logger = spdlog::get(k_logger_name)) {
    return logger;
  }

  auto logger = spdlog::default_logger()->clone(k_logger_name);
  try {
    spdlog::register_logger(logger);
  } catch (const spdlog::spdlog_ex & ex) {
    // Registered concurrently by someone outside this function.
    spdlog::debug("json_model logger registration: {}", ex.what());
    if (auto existing = spdlog::get(k_logger_name)) {
      return existing;
    }
  }
  return logger;
}

}  // namespace json_model
