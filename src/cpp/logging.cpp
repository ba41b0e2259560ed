#include "logging.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw std::runtime_error("Unknown log level: " + name);
}

void init_logging(const std::string& level) {
    spdlog::set_level(parse_log_level(level));
    spdlog::debug("log level set to {}", level);
}
