#include "geo_resolver/config.hpp"
#include "geo_resolver/json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace geo_resolver {
namespace {
void read_ms(const std::string &text, const std::string &key, Millis lo,
             Millis hi, Millis &out) {
  if (auto v = json_find_i64(text, key))
    out = std::clamp(Millis(*v), lo, hi);
}
} // namespace

bool load_config(const std::string &path, ResolverConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  ResolverConfig c = cfg;
  constexpr Millis kSecond{1000};
  constexpr Millis kDay{24 * 60 * 60 * 1000LL};

  read_ms(text, "local_retention_ms", kSecond, 365 * kDay, c.local.retention);
  read_ms(text, "flush_debounce_ms", Millis(0), 10 * 60 * kSecond,
          c.local.flush_debounce);
  read_ms(text, "flush_interval_ms", kSecond, kDay, c.local.flush_interval);
  if (auto s = json_find_string(text, "storage_key"); s && !s->empty())
    c.local.storage_key = *s;

  read_ms(text, "lookup_ttl_ms", Millis(0), kDay, c.remote.lookup_ttl);
  read_ms(text, "upsert_interval_ms", Millis(0), kDay, c.remote.upsert_interval);

  read_ms(text, "min_dispatch_interval_ms", Millis(0), 60 * kSecond,
          c.queue.min_dispatch_interval);
  if (auto v = json_find_i64(text, "max_concurrent"))
    c.queue.max_concurrent =
        static_cast<std::size_t>(std::clamp<std::int64_t>(*v, 1, 64));
  read_ms(text, "item_timeout_ms", Millis(100), 10 * 60 * kSecond,
          c.queue.item_timeout);
  read_ms(text, "redispatch_debounce_ms", Millis(0), 60 * kSecond,
          c.queue.redispatch_debounce);
  read_ms(text, "rate_limit_recheck_ms", Millis(100), 60 * 60 * kSecond,
          c.queue.rate_limit_recheck);
  read_ms(text, "rate_limit_fallback_ms", Millis(0), kDay,
          c.queue.rate_limit_fallback);

  read_ms(text, "maintenance_interval_ms", kSecond, kDay,
          c.maintenance_interval);

  cfg = c;
  return true;
}

std::optional<Endpoint> parse_endpoint(const std::string &url) {
  const std::string scheme = "http://";
  if (url.rfind(scheme, 0) != 0)
    return std::nullopt;
  std::string rest = url.substr(scheme.size());
  Endpoint ep;
  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    ep.base_path = rest.substr(slash);
    rest = rest.substr(0, slash);
    while (!ep.base_path.empty() && ep.base_path.back() == '/')
      ep.base_path.pop_back();
  }
  const auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    try {
      std::size_t idx = 0;
      const std::string port = rest.substr(colon + 1);
      ep.port = std::stoi(port, &idx);
      if (idx != port.size() || ep.port <= 0 || ep.port > 65535)
        return std::nullopt;
    } catch (const std::exception &) {
      return std::nullopt;
    }
    rest = rest.substr(0, colon);
  }
  if (rest.empty())
    return std::nullopt;
  ep.host = rest;
  return ep;
}

} // namespace geo_resolver
