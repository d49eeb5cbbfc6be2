#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sandkit::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("sandkit");
    if (!console) {
        console = spdlog::stderr_color_mt("sandkit");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace sandkit::util
