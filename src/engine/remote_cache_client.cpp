#include "geo_resolver/remote_cache_client.hpp"
#include "geo_resolver/http.hpp"
#include "geo_resolver/json.hpp"
#include "geo_resolver/vocabulary.hpp"

#include <spdlog/spdlog.h>

namespace geo_resolver {

RemoteCacheClient::RemoteCacheClient(RemoteCacheConfig cfg,
                                     ITransport &transport, LocalCache &local,
                                     EventLoop &loop)
    : cfg_(std::move(cfg)), transport_(transport), local_(local), loop_(loop) {}

Future<Value> RemoteCacheClient::lookup(const std::string &key, bool force) {
  const auto now = loop_.now();
  auto it = memo_.find(key);
  Value previous;
  if (it != memo_.end()) {
    if (it->second.pending) {
      ++stats_.joined_lookups;
      return *it->second.pending;
    }
    if (!force && now - it->second.checked_at < cfg_.lookup_ttl) {
      ++stats_.memo_hits;
      spdlog::debug("remote memo hit for {}", key);
      return make_ready_future<Value>(it->second.value);
    }
    previous = it->second.value;
  }

  Promise<Value> done;
  // Registered before the request goes out so a synchronous reply finds it.
  memo_[key] = LookupMemo{now, previous, done.future()};
  ++stats_.network_reads;

  std::weak_ptr<bool> alive = alive_;
  read_remote(key).then([this, alive, key, done](const Value &v) {
    if (!alive.expired()) {
      memo_[key] = LookupMemo{loop_.now(), v, std::nullopt};
      if (v)
        local_.put(key, *v);
    }
    done.set_value(v);
  });
  return done.future();
}

Future<Value> RemoteCacheClient::read_remote(const std::string &key) {
  Promise<Value> done;
  std::weak_ptr<bool> alive = alive_;
  transport_.call("/check?a=" + url_encode(key), "GET", "")
      .then([this, alive, key, done](const TransportResponse &resp) {
        if (!resp.ok || resp.status != 200) {
          if (!alive.expired())
            ++stats_.read_failures;
          spdlog::warn("remote cache read for {} failed: {}", key,
                       resp.ok ? "status " + std::to_string(resp.status)
                               : resp.error);
          done.set_value(std::nullopt);
          return;
        }
        if (json_is_null(resp.data, "value")) {
          done.set_value(std::nullopt);
          return;
        }
        auto v = json_find_string(resp.data, "value");
        if (v && v->empty())
          v.reset();
        done.set_value(v);
      });
  return done.future();
}

Future<bool> RemoteCacheClient::upsert(const std::string &key,
                                       const std::string &value) {
  auto canonical = canonical_country(value);
  if (!canonical) {
    ++stats_.upserts_skipped;
    spdlog::debug("not sharing unrecognized location '{}' for {}", value, key);
    return make_ready_future(false);
  }
  ++stats_.upserts_sent;
  const std::string body =
      "{\"key\":" + json_quote(key) + ",\"value\":" + json_quote(*canonical) + "}";

  Promise<bool> done;
  std::weak_ptr<bool> alive = alive_;
  transport_.call("/add", "POST", body)
      .then([this, alive, key, done](const TransportResponse &resp) {
        const bool ok = resp.ok && resp.status >= 200 && resp.status < 300;
        if (!ok) {
          if (!alive.expired())
            ++stats_.upserts_failed;
          spdlog::warn("remote cache upsert for {} failed: {}", key,
                       resp.ok ? "status " + std::to_string(resp.status)
                               : resp.error);
        }
        done.set_value(ok);
      });
  return done.future();
}

Future<bool> RemoteCacheClient::ensure_upsert(const std::string &key,
                                              const std::string &value) {
  if (key.empty() || value.empty())
    return make_ready_future(false);
  const auto now = loop_.now();
  auto it = throttle_.find(key);
  if (it != throttle_.end()) {
    if (it->second.pending) {
      ++stats_.upserts_joined;
      return *it->second.pending;
    }
    if (now - it->second.last_attempt_at < cfg_.upsert_interval) {
      ++stats_.upserts_throttled;
      return make_ready_future(false);
    }
  }

  Promise<bool> done;
  throttle_[key] = UpsertThrottle{now, done.future()};
  std::weak_ptr<bool> alive = alive_;
  upsert(key, value).then([this, alive, key, done](bool ok) {
    if (!alive.expired())
      throttle_[key] = UpsertThrottle{loop_.now(), std::nullopt};
    done.set_value(ok);
  });
  return done.future();
}

std::size_t RemoteCacheClient::prune() {
  const auto now = loop_.now();
  std::size_t removed = 0;
  for (auto it = memo_.begin(); it != memo_.end();) {
    if (!it->second.pending && now - it->second.checked_at >= cfg_.lookup_ttl) {
      it = memo_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  for (auto it = throttle_.begin(); it != throttle_.end();) {
    if (!it->second.pending &&
        now - it->second.last_attempt_at >= cfg_.upsert_interval) {
      it = throttle_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0)
    spdlog::debug("pruned {} remote cache records", removed);
  return removed;
}

} // namespace geo_resolver
