#include "geo_resolver/log.hpp"

#include <algorithm>
#include <cctype>

namespace geo_resolver {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "trace")
    return spdlog::level::trace;
  if (s == "debug")
    return spdlog::level::debug;
  if (s == "info")
    return spdlog::level::info;
  if (s == "warn" || s == "warning")
    return spdlog::level::warn;
  if (s == "error")
    return spdlog::level::err;
  if (s == "off")
    return spdlog::level::off;
  return std::nullopt;
}

} // namespace geo_resolver
