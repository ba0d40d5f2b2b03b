#pragma once

#include "geo_resolver/config.hpp"
#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/future.hpp"
#include "geo_resolver/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace geo_resolver {

struct LocalCacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t puts{0};
  std::uint64_t rejected_puts{0};
  std::uint64_t loaded{0};
  std::uint64_t load_discarded{0};
  std::uint64_t flushes{0};
  std::uint64_t flush_failures{0};
};

// Durable key -> location map with per-entry expiry. Absent values are never
// stored, so a miss always leads to a retry further down the chain. Writes
// are coalesced: the first put after a flush arms a debounce timer, and at
// most one flush runs per window. Store writes never overlap.
class LocalCache {
public:
  LocalCache(LocalCacheConfig cfg, IDurableStore &store, EventLoop &loop);
  ~LocalCache();
  LocalCache(const LocalCache &) = delete;
  LocalCache &operator=(const LocalCache &) = delete;

  Value get(const std::string &key);
  bool put(const std::string &key, const std::string &value);

  Future<bool> load();
  Future<bool> flush();

  // Arms the periodic flush; shutdown() disarms every timer and flushes.
  void start();
  Future<bool> shutdown();

  std::optional<CacheEntry> peek(const std::string &key) const;
  std::size_t size() const { return entries_.size(); }
  bool dirty() const { return dirty_; }
  bool writing() const { return writing_; }
  const LocalCacheStats &stats() const { return stats_; }

private:
  void arm_periodic();
  void purge_expired(TimePoint now);
  Future<bool> write_snapshot();
  std::string serialize() const;

  LocalCacheConfig cfg_;
  IDurableStore &store_;
  EventLoop &loop_;
  std::unordered_map<std::string, CacheEntry> entries_;
  LocalCacheStats stats_;
  bool dirty_{false};
  bool writing_{false};
  std::optional<Promise<bool>> queued_flush_;
  std::optional<TimerId> debounce_timer_;
  std::optional<TimerId> periodic_timer_;
};

} // namespace geo_resolver
