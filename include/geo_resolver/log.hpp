#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace geo_resolver {

// [14:30:05.123][info] loaded 12 cached locations
inline void install_log_format() { spdlog::set_pattern("[%H:%M:%S.%e][%^%l%$] %v"); }

std::optional<spdlog::level::level_enum> parse_log_level(const std::string &name);

} // namespace geo_resolver
