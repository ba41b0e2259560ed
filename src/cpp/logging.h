#pragma once

#include <spdlog/common.h>
#include <string>

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off".
// Throws std::runtime_error on anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Sets the global spdlog level. The default logger (stdout, colour) is kept.
void init_logging(const std::string& level);
