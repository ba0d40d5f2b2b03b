#pragma once

#include "geo_resolver/config.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/future.hpp"
#include "geo_resolver/rate_limiter.hpp"
#include "geo_resolver/upstream.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace geo_resolver {

struct QueueStats {
  std::uint64_t enqueued{0};
  std::uint64_t joined{0};
  std::uint64_t dispatched{0};
  std::uint64_t completed{0};
  std::uint64_t timed_out{0};
  std::uint64_t rate_limited{0};
  std::uint64_t late_results{0};
  std::uint64_t fetch_errors{0};
  std::size_t max_in_flight{0};
};

// FIFO dispatcher in front of the upstream fetcher. Starts at most one fetch
// per min_dispatch_interval, keeps at most max_concurrent in flight, and
// holds everything while the rate limiter is blocked. Each dispatched item
// settles on its own timeout without cancelling the fetch behind it.
class RequestQueue {
public:
  RequestQueue(QueueConfig cfg, IUpstreamFetcher &fetcher, RateLimiter &limiter,
               EventLoop &loop);
  ~RequestQueue();
  RequestQueue(const RequestQueue &) = delete;
  RequestQueue &operator=(const RequestQueue &) = delete;

  // A key already queued or in flight joins the existing item.
  Future<FetchResult> enqueue(const std::string &key);

  std::size_t queued() const { return items_.size(); }
  std::size_t in_flight() const { return in_flight_; }
  const QueueStats &stats() const { return stats_; }

private:
  struct QueueItem {
    std::string key;
    TimePoint enqueued_at;
    Promise<FetchResult> result;
  };

  void schedule_pump(Millis delay);
  void pump();
  void dispatch(QueueItem item);

  QueueConfig cfg_;
  IUpstreamFetcher &fetcher_;
  RateLimiter &limiter_;
  EventLoop &loop_;
  std::deque<QueueItem> items_;
  std::unordered_map<std::string, Future<FetchResult>> pending_;
  std::size_t in_flight_{0};
  std::optional<TimePoint> last_dispatch_;
  std::optional<TimerId> pump_timer_;
  TimePoint pump_at_{};
  QueueStats stats_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

} // namespace geo_resolver
