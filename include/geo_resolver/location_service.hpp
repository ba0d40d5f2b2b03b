#pragma once

#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/http.hpp"
#include "geo_resolver/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace geo_resolver {

struct LocationRecord {
  Value value;
  TimePoint fetched_at{};
};

struct ServiceStats {
  std::uint64_t checks{0};
  std::uint64_t fresh_hits{0};
  std::uint64_t stale_or_missing{0};
  std::uint64_t adds{0};
  std::uint64_t rejected{0};
  std::uint64_t persists{0};
  std::uint64_t persist_failures{0};
};

struct ServiceReply {
  int status{200};
  std::string body;
};

std::string iso8601(TimePoint t);

// The shared remote cache behind /check, /add and /healthcheck. Usernames are
// stored lower-cased; a record is served as cached while younger than ttl.
class LocationService {
public:
  LocationService(Millis ttl, IDurableStore &store);

  // Reads every record already held by the store.
  bool load(const StoreMap &records, std::string *err = nullptr);

  ServiceReply handle(const HttpRequest &req, TimePoint now);

  ServiceReply check(const std::string &username, TimePoint now);
  ServiceReply add(const std::string &body, TimePoint now);
  ServiceReply health() const;

  // Writes records changed since the last persist.
  Future<bool> persist();
  bool dirty() const { return !changed_.empty(); }

  std::size_t size() const { return records_.size(); }
  std::string info() const;
  const ServiceStats &stats() const { return stats_; }

private:
  static std::string encode(const LocationRecord &r);
  ServiceReply reply(int status, const std::string &username,
                     const LocationRecord &r, bool cached) const;

  Millis ttl_;
  IDurableStore &store_;
  std::unordered_map<std::string, LocationRecord> records_;
  StoreMap changed_;
  ServiceStats stats_;
  bool store_ok_{true};
};

} // namespace geo_resolver
