#pragma once

#include "geo_resolver/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace geo_resolver {

struct LocalCacheConfig {
  Millis retention{std::chrono::hours(24 * 30)};
  Millis flush_debounce{5000};
  Millis flush_interval{30000};
  std::string storage_key{"location_cache"};
};

struct RemoteCacheConfig {
  Millis lookup_ttl{15 * 60 * 1000};
  Millis upsert_interval{3 * 60 * 1000};
};

struct QueueConfig {
  Millis min_dispatch_interval{500};
  std::size_t max_concurrent{4};
  Millis item_timeout{10000};
  Millis redispatch_debounce{200};
  Millis rate_limit_recheck{60000};
  Millis rate_limit_fallback{60000};
};

struct ResolverConfig {
  LocalCacheConfig local;
  RemoteCacheConfig remote;
  QueueConfig queue;
  Millis maintenance_interval{60000};
};

// Values are clamped; cfg is left untouched when the file is missing or is
// not a JSON object.
bool load_config(const std::string &path, ResolverConfig &cfg,
                 std::string *err = nullptr);

struct Endpoint {
  std::string host;
  int port{80};
  std::string base_path;
  Millis timeout{5000};
};

// http://host[:port][/base]
std::optional<Endpoint> parse_endpoint(const std::string &url);

} // namespace geo_resolver
