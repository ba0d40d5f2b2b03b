#include "geo_resolver/request_queue.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace geo_resolver {

RequestQueue::RequestQueue(QueueConfig cfg, IUpstreamFetcher &fetcher,
                           RateLimiter &limiter, EventLoop &loop)
    : cfg_(std::move(cfg)), fetcher_(fetcher), limiter_(limiter), loop_(loop) {
  cfg_.max_concurrent = std::max<std::size_t>(1, cfg_.max_concurrent);
}

RequestQueue::~RequestQueue() {
  if (pump_timer_)
    loop_.cancel(*pump_timer_);
}

Future<FetchResult> RequestQueue::enqueue(const std::string &key) {
  auto it = pending_.find(key);
  if (it != pending_.end()) {
    ++stats_.joined;
    return it->second;
  }
  QueueItem item{key, loop_.now(), Promise<FetchResult>{}};
  auto f = item.result.future();
  pending_.emplace(key, f);
  items_.push_back(std::move(item));
  ++stats_.enqueued;
  spdlog::debug("queued upstream request for {} ({} waiting)", key,
                items_.size());
  schedule_pump(Millis(0));
  return f;
}

void RequestQueue::schedule_pump(Millis delay) {
  const auto at = loop_.now() + std::max(delay, Millis(0));
  if (pump_timer_ && pump_at_ <= at)
    return;
  if (pump_timer_)
    loop_.cancel(*pump_timer_);
  pump_at_ = at;
  pump_timer_ = loop_.schedule_at(at, [this] {
    pump_timer_.reset();
    pump();
  });
}

void RequestQueue::pump() {
  if (items_.empty())
    return;
  const auto now = loop_.now();
  if (limiter_.is_blocked(now)) {
    // Re-check in bounded chunks so an externally cleared window is seen.
    schedule_pump(std::min(limiter_.remaining(now), cfg_.rate_limit_recheck));
    return;
  }
  // A settling item schedules the next pump.
  if (in_flight_ >= cfg_.max_concurrent)
    return;
  if (last_dispatch_) {
    const auto since = std::chrono::duration_cast<Millis>(now - *last_dispatch_);
    if (since < cfg_.min_dispatch_interval) {
      schedule_pump(cfg_.min_dispatch_interval - since);
      return;
    }
  }
  QueueItem item = std::move(items_.front());
  items_.pop_front();
  dispatch(std::move(item));
  if (!items_.empty())
    schedule_pump(cfg_.min_dispatch_interval);
}

void RequestQueue::dispatch(QueueItem item) {
  ++in_flight_;
  ++stats_.dispatched;
  stats_.max_in_flight = std::max(stats_.max_in_flight, in_flight_);
  last_dispatch_ = loop_.now();
  spdlog::debug("dispatching upstream fetch for {} after {}ms in queue",
                item.key,
                std::chrono::duration_cast<Millis>(loop_.now() - item.enqueued_at)
                    .count());

  auto settled = std::make_shared<bool>(false);
  auto timeout = std::make_shared<std::optional<TimerId>>();
  std::weak_ptr<bool> alive = alive_;
  const std::string key = item.key;
  const Promise<FetchResult> result = item.result;

  auto finish = [this, alive, key, result, settled, timeout](FetchResult r) {
    if (alive.expired() || *settled)
      return false;
    *settled = true;
    if (*timeout)
      loop_.cancel(**timeout);
    --in_flight_;
    ++stats_.completed;
    auto it = pending_.find(key);
    if (it != pending_.end() && it->second.same_state(result.future()))
      pending_.erase(it);
    if (r.rate_limited) {
      ++stats_.rate_limited;
      const auto now = loop_.now();
      if (!limiter_.is_blocked(now) && cfg_.rate_limit_fallback > Millis(0))
        limiter_.set_resume_at(now + cfg_.rate_limit_fallback);
    }
    schedule_pump(cfg_.redispatch_debounce);
    // Continuations may enqueue again, so the queue is consistent first.
    result.set_value(std::move(r));
    return true;
  };

  *timeout = loop_.schedule(cfg_.item_timeout, [this, alive, key, finish, timeout] {
    if (alive.expired())
      return;
    timeout->reset();
    ++stats_.timed_out;
    spdlog::info("upstream fetch for {} timed out, not caching", key);
    finish(FetchResult{std::nullopt, false, true});
  });

  Future<FetchResult> fetched;
  try {
    fetched = fetcher_.fetch(key);
  } catch (const std::exception &e) {
    ++stats_.fetch_errors;
    spdlog::warn("upstream fetch for {} failed: {}", key, e.what());
    finish(FetchResult{});
    return;
  }
  if (!fetched.valid()) {
    ++stats_.fetch_errors;
    finish(FetchResult{});
    return;
  }
  fetched.then([this, alive, key, finish](const FetchResult &r) {
    if (alive.expired())
      return;
    if (!finish(r)) {
      ++stats_.late_results;
      spdlog::debug("discarding late upstream result for {}", key);
    }
  });
}

} // namespace geo_resolver
