#include "geo_resolver/resolver.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace geo_resolver {

Resolver::Resolver(ResolverConfig cfg, IDurableStore &store, ITransport &remote,
                   IUpstreamFetcher &upstream, RateLimiter &limiter,
                   EventLoop &loop)
    : cfg_(std::move(cfg)), loop_(loop), limiter_(limiter),
      local_(cfg_.local, store, loop), remote_(cfg_.remote, remote, local_, loop),
      queue_(cfg_.queue, upstream, limiter, loop) {}

Resolver::~Resolver() {
  if (maintenance_timer_)
    loop_.cancel(*maintenance_timer_);
}

Future<Value> Resolver::resolve(const std::string &key) {
  ++stats_.requests;
  if (key.empty())
    return make_ready_future<Value>(std::nullopt);

  if (auto v = local_.get(key)) {
    ++stats_.local_hits;
    spdlog::debug("local hit for {}", key);
    return share(key, *v);
  }

  Promise<Value> done;
  std::weak_ptr<bool> alive = alive_;
  remote_.lookup(key).then([this, alive, key, done](const Value &v) {
    if (alive.expired()) {
      done.set_value(v);
      return;
    }
    if (v) {
      ++stats_.remote_hits;
      share(key, *v).then([done](const Value &shared) { done.set_value(shared); });
      return;
    }
    resolve_upstream(key, done);
  });
  return done.future();
}

void Resolver::resolve_upstream(const std::string &key,
                                const Promise<Value> &done) {
  std::weak_ptr<bool> alive = alive_;
  queue_.enqueue(key).then([this, alive, key, done](const FetchResult &r) {
    if (alive.expired()) {
      done.set_value(std::nullopt);
      return;
    }
    if (r.rate_limited || r.timed_out) {
      if (r.rate_limited)
        ++stats_.rate_limited;
      else
        ++stats_.timeouts;
      forced_refresh(key, done);
      return;
    }
    if (!r.value) {
      ++stats_.upstream_absent;
      done.set_value(std::nullopt);
      return;
    }
    ++stats_.upstream_hits;
    local_.put(key, *r.value);
    share(key, *r.value).then([done](const Value &shared) { done.set_value(shared); });
  });
}

void Resolver::forced_refresh(const std::string &key,
                              const Promise<Value> &done) {
  ++stats_.forced_refreshes;
  spdlog::debug("upstream unavailable for {}, re-reading the remote cache", key);
  std::weak_ptr<bool> alive = alive_;
  remote_.lookup(key, true).then([this, alive, key, done](const Value &v) {
    if (v && !alive.expired()) {
      ++stats_.forced_hits;
      local_.put(key, *v);
    }
    done.set_value(v);
  });
}

Future<Value> Resolver::share(const std::string &key, const std::string &value) {
  Promise<Value> done;
  remote_.ensure_upsert(key, value).then(
      [done, value](bool) { done.set_value(value); });
  return done.future();
}

Future<bool> Resolver::start() {
  local_.start();
  if (!maintenance_timer_)
    arm_maintenance();
  return local_.load();
}

Future<bool> Resolver::shutdown() {
  if (maintenance_timer_) {
    loop_.cancel(*maintenance_timer_);
    maintenance_timer_.reset();
  }
  return local_.shutdown();
}

void Resolver::arm_maintenance() {
  maintenance_timer_ = loop_.schedule(cfg_.maintenance_interval, [this] {
    maintenance_timer_.reset();
    remote_.prune();
    arm_maintenance();
  });
}

std::string Resolver::info() const {
  const auto &ls = local_.stats();
  const auto &rs = remote_.stats();
  const auto &qs = queue_.stats();
  std::ostringstream os;
  os << "requests:" << stats_.requests << "\n";
  os << "local_hits:" << stats_.local_hits << "\n";
  os << "remote_hits:" << stats_.remote_hits << "\n";
  os << "upstream_hits:" << stats_.upstream_hits << "\n";
  os << "upstream_absent:" << stats_.upstream_absent << "\n";
  os << "rate_limited:" << stats_.rate_limited << "\n";
  os << "timeouts:" << stats_.timeouts << "\n";
  os << "forced_refreshes:" << stats_.forced_refreshes << "\n";
  os << "forced_hits:" << stats_.forced_hits << "\n";
  os << "local_keys:" << local_.size() << "\n";
  os << "local_dirty:" << (local_.dirty() ? 1 : 0) << "\n";
  os << "local_expirations:" << ls.expirations << "\n";
  os << "local_flushes:" << ls.flushes << "\n";
  os << "local_flush_failures:" << ls.flush_failures << "\n";
  os << "remote_memo_keys:" << remote_.memo_size() << "\n";
  os << "remote_memo_hits:" << rs.memo_hits << "\n";
  os << "remote_joined_lookups:" << rs.joined_lookups << "\n";
  os << "remote_reads:" << rs.network_reads << "\n";
  os << "remote_read_failures:" << rs.read_failures << "\n";
  os << "upserts_sent:" << rs.upserts_sent << "\n";
  os << "upserts_failed:" << rs.upserts_failed << "\n";
  os << "upserts_skipped:" << rs.upserts_skipped << "\n";
  os << "upserts_throttled:" << rs.upserts_throttled << "\n";
  os << "queue_waiting:" << queue_.queued() << "\n";
  os << "queue_in_flight:" << queue_.in_flight() << "\n";
  os << "queue_dispatched:" << qs.dispatched << "\n";
  os << "queue_joined:" << qs.joined << "\n";
  os << "queue_timed_out:" << qs.timed_out << "\n";
  os << "queue_late_results:" << qs.late_results << "\n";
  os << "queue_max_in_flight:" << qs.max_in_flight << "\n";
  os << "rate_limit_windows:" << limiter_.windows_opened() << "\n";
  os << "rate_limit_active:" << (limiter_.resume_at() ? 1 : 0) << "\n";
  return os.str();
}

} // namespace geo_resolver
