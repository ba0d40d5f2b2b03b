#pragma once

#include "geo_resolver/config.hpp"
#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/future.hpp"
#include "geo_resolver/local_cache.hpp"
#include "geo_resolver/rate_limiter.hpp"
#include "geo_resolver/remote_cache_client.hpp"
#include "geo_resolver/request_queue.hpp"
#include "geo_resolver/transport.hpp"
#include "geo_resolver/upstream.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace geo_resolver {

struct ResolverStats {
  std::uint64_t requests{0};
  std::uint64_t local_hits{0};
  std::uint64_t remote_hits{0};
  std::uint64_t upstream_hits{0};
  std::uint64_t upstream_absent{0};
  std::uint64_t rate_limited{0};
  std::uint64_t timeouts{0};
  std::uint64_t forced_refreshes{0};
  std::uint64_t forced_hits{0};
};

// Entry point of the lookup chain: local cache, then the shared remote cache,
// then the rate-limited upstream behind the request queue. A rate-limited or
// timed-out upstream attempt falls back to a forced remote read. resolve()
// always settles and never throws.
class Resolver {
public:
  Resolver(ResolverConfig cfg, IDurableStore &store, ITransport &remote,
           IUpstreamFetcher &upstream, RateLimiter &limiter, EventLoop &loop);
  ~Resolver();
  Resolver(const Resolver &) = delete;
  Resolver &operator=(const Resolver &) = delete;

  Future<Value> resolve(const std::string &key);

  // Loads the local cache and arms the flush and maintenance timers.
  Future<bool> start();
  // Disarms every timer and performs the final flush.
  Future<bool> shutdown();

  std::string info() const;

  LocalCache &local() { return local_; }
  RemoteCacheClient &remote() { return remote_; }
  RequestQueue &queue() { return queue_; }
  const ResolverStats &stats() const { return stats_; }

private:
  Future<Value> share(const std::string &key, const std::string &value);
  void resolve_upstream(const std::string &key, const Promise<Value> &done);
  void forced_refresh(const std::string &key, const Promise<Value> &done);
  void arm_maintenance();

  ResolverConfig cfg_;
  EventLoop &loop_;
  RateLimiter &limiter_;
  LocalCache local_;
  RemoteCacheClient remote_;
  RequestQueue queue_;
  ResolverStats stats_;
  std::optional<TimerId> maintenance_timer_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

} // namespace geo_resolver
