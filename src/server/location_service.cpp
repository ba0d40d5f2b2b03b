#include "geo_resolver/location_service.hpp"
#include "geo_resolver/json.hpp"
#include "geo_resolver/vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

#include <spdlog/spdlog.h>

namespace geo_resolver {
namespace {
std::string trim(const std::string &s) {
  const auto b = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
  const auto e = std::find_if_not(s.rbegin(), s.rend(),
                                  [](unsigned char c) { return std::isspace(c); })
                     .base();
  return b < e ? std::string(b, e) : std::string();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

ServiceReply detail_reply(int status, const std::string &msg) {
  return {status, "{\"detail\":" + json_quote(msg) + "}"};
}
} // namespace

std::string iso8601(TimePoint t) {
  const auto ms = to_epoch_ms(t);
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char frac[8];
  std::snprintf(frac, sizeof(frac), ".%03dZ", static_cast<int>(ms % 1000));
  return std::string(buf) + frac;
}

LocationService::LocationService(Millis ttl, IDurableStore &store)
    : ttl_(ttl), store_(store) {}

bool LocationService::load(const StoreMap &records, std::string *err) {
  std::size_t skipped = 0;
  for (const auto &[key, encoded] : records) {
    auto fetched = json_find_i64(encoded, "fetched_at");
    if (!fetched) {
      ++skipped;
      continue;
    }
    LocationRecord r;
    r.fetched_at = from_epoch_ms(*fetched);
    if (!json_is_null(encoded, "value"))
      r.value = json_find_string(encoded, "value");
    records_[key] = std::move(r);
  }
  spdlog::info("loaded {} location records", records_.size());
  if (skipped > 0) {
    if (err)
      *err = std::to_string(skipped) + " unreadable records skipped";
    return false;
  }
  return true;
}

ServiceReply LocationService::handle(const HttpRequest &req, TimePoint now) {
  if (req.malformed) {
    ++stats_.rejected;
    return detail_reply(400, "malformed request");
  }
  if (req.path == "/healthcheck") {
    if (req.method != "GET")
      return detail_reply(405, "method not allowed");
    return health();
  }
  if (req.path == "/check") {
    if (req.method != "GET")
      return detail_reply(405, "method not allowed");
    auto a = req.query.find("a");
    return check(a == req.query.end() ? "" : a->second, now);
  }
  if (req.path == "/add") {
    if (req.method != "POST")
      return detail_reply(405, "method not allowed");
    return add(req.body, now);
  }
  return detail_reply(404, "not found");
}

ServiceReply LocationService::check(const std::string &username, TimePoint now) {
  ++stats_.checks;
  const std::string name = trim(username);
  if (name.empty()) {
    ++stats_.rejected;
    return detail_reply(400, "username must not be blank");
  }
  auto it = records_.find(lower(name));
  if (it != records_.end() && now - it->second.fetched_at < ttl_) {
    ++stats_.fresh_hits;
    return reply(200, name, it->second, true);
  }
  ++stats_.stale_or_missing;
  return reply(200, name, LocationRecord{std::nullopt, now}, false);
}

ServiceReply LocationService::add(const std::string &body, TimePoint now) {
  ++stats_.adds;
  auto key = json_find_string(body, "key");
  if (!key)
    key = json_find_string(body, "username");
  const std::string name = key ? trim(*key) : "";
  if (name.empty()) {
    ++stats_.rejected;
    return detail_reply(400, "username must not be blank");
  }

  LocationRecord r;
  r.fetched_at = now;
  const bool has_value =
      json_find_string(body, "value").has_value() || json_is_null(body, "value");
  const char *field = has_value ? "value" : "location";
  if (!json_is_null(body, field)) {
    if (auto v = json_find_string(body, field)) {
      r.value = canonical_country(*v);
      if (!r.value) {
        ++stats_.rejected;
        return detail_reply(422, "location must be one of the allowed country names");
      }
    }
  }

  const std::string normalized = lower(name);
  records_[normalized] = r;
  changed_[normalized] = encode(r);
  spdlog::debug("stored {} -> {}", normalized, r.value.value_or("null"));
  return reply(201, name, r, false);
}

ServiceReply LocationService::health() const {
  if (!store_ok_)
    return detail_reply(503, "database unavailable");
  return {200, "{\"status\":\"ok\",\"database\":\"available\"}"};
}

Future<bool> LocationService::persist() {
  if (changed_.empty())
    return make_ready_future(true);
  StoreMap batch = std::move(changed_);
  changed_.clear();
  Promise<bool> done;
  store_.set(batch).then([this, batch, done](bool ok) {
    store_ok_ = ok;
    if (ok) {
      ++stats_.persists;
    } else {
      ++stats_.persist_failures;
      // Newer writes since the batch was taken win.
      for (const auto &[k, v] : batch)
        changed_.emplace(k, v);
      spdlog::warn("persisting {} location records failed", batch.size());
    }
    done.set_value(ok);
  });
  return done.future();
}

std::string LocationService::info() const {
  std::ostringstream os;
  os << "records:" << records_.size() << "\n";
  os << "unpersisted:" << changed_.size() << "\n";
  os << "checks:" << stats_.checks << "\n";
  os << "fresh_hits:" << stats_.fresh_hits << "\n";
  os << "stale_or_missing:" << stats_.stale_or_missing << "\n";
  os << "adds:" << stats_.adds << "\n";
  os << "rejected:" << stats_.rejected << "\n";
  os << "persists:" << stats_.persists << "\n";
  os << "persist_failures:" << stats_.persist_failures << "\n";
  return os.str();
}

std::string LocationService::encode(const LocationRecord &r) {
  return "{\"value\":" + json_string_or_null(r.value) +
         ",\"fetched_at\":" + std::to_string(to_epoch_ms(r.fetched_at)) + "}";
}

ServiceReply LocationService::reply(int status, const std::string &username,
                                    const LocationRecord &r, bool cached) const {
  std::ostringstream os;
  os << "{\"key\":" << json_quote(username)
     << ",\"value\":" << json_string_or_null(r.value)
     << ",\"cached\":" << (cached ? "true" : "false")
     << ",\"last_checked\":" << json_quote(iso8601(r.fetched_at))
     << ",\"expires_at\":" << json_quote(iso8601(r.fetched_at + ttl_)) << "}";
  return {status, os.str()};
}

} // namespace geo_resolver
