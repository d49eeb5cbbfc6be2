#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace sandkit::util {

// Install the colored console logger as spdlog's default
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"
// Unknown names map to info
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace sandkit::util
