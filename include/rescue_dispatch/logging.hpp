// === Logging =================================================================
//
// One process-wide spdlog logger named "rescue_dispatch": colour console output
// plus a rotating JSON-line audit file in the configured log directory.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace rescue_dispatch {

/** @brief Create the shared logger on first call; later calls return it unchanged. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialize_logger. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Apply an spdlog level name ("warning" and "error" accepted); unknown names select info. */
void set_log_level(const std::string& str_level);

}  // namespace rescue_dispatch
