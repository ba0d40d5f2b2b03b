#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace geo_resolver {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// A resolved location; nullopt means "no value found".
using Value = std::optional<std::string>;

struct CacheEntry {
  std::string value;
  TimePoint cached_at{};
  TimePoint expires_at{};
};

struct FetchResult {
  Value value;
  bool rate_limited{false};
  bool timed_out{false};
};

struct TransportResponse {
  bool ok{false};
  int status{0};
  std::string data;
  std::unordered_map<std::string, std::string> headers;
  std::string error;
};

inline std::int64_t to_epoch_ms(TimePoint t) {
  return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(std::int64_t ms) { return TimePoint(Millis(ms)); }

} // namespace geo_resolver
