#pragma once

#include "geo_resolver/config.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/future.hpp"
#include "geo_resolver/local_cache.hpp"
#include "geo_resolver/transport.hpp"
#include "geo_resolver/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace geo_resolver {

struct RemoteCacheStats {
  std::uint64_t memo_hits{0};
  std::uint64_t joined_lookups{0};
  std::uint64_t network_reads{0};
  std::uint64_t read_failures{0};
  std::uint64_t upserts_sent{0};
  std::uint64_t upserts_failed{0};
  std::uint64_t upserts_skipped{0};
  std::uint64_t upserts_throttled{0};
  std::uint64_t upserts_joined{0};
};

// Client for the shared remote cache. Reads are memoized for lookup_ttl
// (absent answers included) and concurrent reads of one key share a single
// request. Write-back is best-effort and throttled per key.
class RemoteCacheClient {
public:
  RemoteCacheClient(RemoteCacheConfig cfg, ITransport &transport,
                    LocalCache &local, EventLoop &loop);
  RemoteCacheClient(const RemoteCacheClient &) = delete;
  RemoteCacheClient &operator=(const RemoteCacheClient &) = delete;

  // A read already in flight is joined even when force is set.
  Future<Value> lookup(const std::string &key, bool force = false);

  // Sends the canonical country spelling; values outside the vocabulary are
  // skipped without a request. Resolves false on any failure.
  Future<bool> upsert(const std::string &key, const std::string &value);

  // Throttled upsert: resolves false immediately when the key was attempted
  // within upsert_interval.
  Future<bool> ensure_upsert(const std::string &key, const std::string &value);

  // Drops settled memos and throttle records past their windows.
  std::size_t prune();

  std::size_t memo_size() const { return memo_.size(); }
  std::size_t throttle_size() const { return throttle_.size(); }
  const RemoteCacheStats &stats() const { return stats_; }

private:
  struct LookupMemo {
    TimePoint checked_at{};
    Value value;
    std::optional<Future<Value>> pending;
  };

  struct UpsertThrottle {
    TimePoint last_attempt_at{};
    std::optional<Future<bool>> pending;
  };

  Future<Value> read_remote(const std::string &key);

  RemoteCacheConfig cfg_;
  ITransport &transport_;
  LocalCache &local_;
  EventLoop &loop_;
  std::unordered_map<std::string, LookupMemo> memo_;
  std::unordered_map<std::string, UpsertThrottle> throttle_;
  RemoteCacheStats stats_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

} // namespace geo_resolver
