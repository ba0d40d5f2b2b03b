#include "geo_resolver/local_cache.hpp"
#include "geo_resolver/json.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace geo_resolver {

LocalCache::LocalCache(LocalCacheConfig cfg, IDurableStore &store,
                       EventLoop &loop)
    : cfg_(std::move(cfg)), store_(store), loop_(loop) {}

LocalCache::~LocalCache() {
  if (debounce_timer_)
    loop_.cancel(*debounce_timer_);
  if (periodic_timer_)
    loop_.cancel(*periodic_timer_);
}

Value LocalCache::get(const std::string &key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  if (it->second.expires_at <= loop_.now()) {
    entries_.erase(it);
    dirty_ = true;
    ++stats_.expirations;
    ++stats_.misses;
    return std::nullopt;
  }
  if (it->second.value.empty()) {
    entries_.erase(it);
    ++stats_.misses;
    return std::nullopt;
  }
  ++stats_.hits;
  return it->second.value;
}

bool LocalCache::put(const std::string &key, const std::string &value) {
  if (key.empty() || value.empty()) {
    ++stats_.rejected_puts;
    return false;
  }
  const auto now = loop_.now();
  entries_[key] = {value, now, now + cfg_.retention};
  dirty_ = true;
  ++stats_.puts;
  if (!debounce_timer_) {
    debounce_timer_ = loop_.schedule(cfg_.flush_debounce, [this] {
      debounce_timer_.reset();
      flush();
    });
  }
  return true;
}

Future<bool> LocalCache::load() {
  Promise<bool> done;
  store_.get({cfg_.storage_key}).then([this, done](const std::optional<StoreMap> &got) {
    if (!got.has_value()) {
      spdlog::warn("storage unavailable: local cache load skipped");
      done.set_value(false);
      return;
    }
    auto doc = got->find(cfg_.storage_key);
    if (doc == got->end()) {
      done.set_value(true);
      return;
    }
    const auto now = loop_.now();
    for (const auto &[key, body] : json_object_members(doc->second)) {
      auto value = json_find_string(body, "value");
      auto expires = json_find_i64(body, "expires_at");
      auto cached = json_find_i64(body, "cached_at");
      if (!value || value->empty() || !expires || from_epoch_ms(*expires) <= now) {
        ++stats_.load_discarded;
        continue;
      }
      // Entries written since startup are newer than the stored copy.
      if (entries_.contains(key))
        continue;
      entries_[key] = {*value, cached ? from_epoch_ms(*cached) : now,
                       from_epoch_ms(*expires)};
      ++stats_.loaded;
    }
    spdlog::info("loaded {} cached locations ({} discarded)", stats_.loaded,
                 stats_.load_discarded);
    done.set_value(true);
  });
  return done.future();
}

Future<bool> LocalCache::flush() {
  if (debounce_timer_) {
    loop_.cancel(*debounce_timer_);
    debounce_timer_.reset();
  }
  // One write at a time: a flush requested mid-write runs after it lands,
  // so an older snapshot can never overwrite a newer one.
  if (writing_) {
    if (!queued_flush_)
      queued_flush_ = Promise<bool>();
    return queued_flush_->future();
  }
  if (!dirty_)
    return make_ready_future(true);
  return write_snapshot();
}

Future<bool> LocalCache::write_snapshot() {
  purge_expired(loop_.now());
  dirty_ = false;
  writing_ = true;
  Promise<bool> done;
  store_.set({{cfg_.storage_key, serialize()}}).then([this, done](bool ok) {
    writing_ = false;
    if (ok) {
      ++stats_.flushes;
    } else {
      ++stats_.flush_failures;
      dirty_ = true;
      spdlog::warn("storage unavailable: local cache flush failed, will retry");
    }
    if (queued_flush_) {
      const Promise<bool> next = *queued_flush_;
      queued_flush_.reset();
      flush().then([next](bool r) { next.set_value(r); });
    }
    done.set_value(ok);
  });
  return done.future();
}

void LocalCache::start() {
  if (!periodic_timer_)
    arm_periodic();
}

Future<bool> LocalCache::shutdown() {
  if (periodic_timer_) {
    loop_.cancel(*periodic_timer_);
    periodic_timer_.reset();
  }
  return flush();
}

std::optional<CacheEntry> LocalCache::peek(const std::string &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

void LocalCache::arm_periodic() {
  periodic_timer_ = loop_.schedule(cfg_.flush_interval, [this] {
    periodic_timer_.reset();
    if (dirty_)
      flush();
    arm_periodic();
  });
}

void LocalCache::purge_expired(TimePoint now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      ++stats_.expirations;
    } else {
      ++it;
    }
  }
}

std::string LocalCache::serialize() const {
  std::ostringstream os;
  os << "{";
  bool first = true;
  for (const auto &[key, e] : entries_) {
    if (!first)
      os << ",";
    first = false;
    os << json_quote(key) << ":{\"value\":" << json_quote(e.value)
       << ",\"cached_at\":" << to_epoch_ms(e.cached_at)
       << ",\"expires_at\":" << to_epoch_ms(e.expires_at) << "}";
  }
  os << "}";
  return os.str();
}

} // namespace geo_resolver
