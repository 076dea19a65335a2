/**
 * Warden logging setup
 *
 * Installs the process-wide spdlog logger used by every subsystem.
 */
#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace warden::util {

// Create the colored console logger and make it the default
void init_logger();

void set_log_level(spdlog::level::level_enum level);

// "debug", "info", "warn", "error" (case-insensitive); unknown -> info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace warden::util
