#include "fakes.hpp"
#include "geo_resolver/json.hpp"
#include "geo_resolver/local_cache.hpp"

#include <catch2/catch.hpp>

using namespace geo_resolver;
using namespace geo_resolver::testing;

namespace {
// Holds every write open until complete() is called.
class DeferredStore final : public IDurableStore {
public:
  Future<std::optional<StoreMap>> get(const std::vector<std::string> &keys) override {
    StoreMap out;
    for (const auto &k : keys)
      if (auto it = data.find(k); it != data.end())
        out.emplace(k, it->second);
    return make_ready_future<std::optional<StoreMap>>(std::move(out));
  }

  Future<bool> set(const StoreMap &mapping) override {
    writes.push_back({mapping, Promise<bool>()});
    return writes.back().done.future();
  }

  void complete(std::size_t i) {
    auto w = writes.at(i);
    for (const auto &[k, v] : w.mapping)
      data[k] = v;
    w.done.set_value(true);
  }

  struct Write {
    StoreMap mapping;
    Promise<bool> done;
  };
  std::vector<Write> writes;
  StoreMap data;
};
} // namespace

TEST_CASE("put stores present values with a 30 day expiry", "[local]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCache cache({}, store, loop);

  REQUIRE(cache.put("bob", "France"));
  auto e = cache.peek("bob");
  REQUIRE(e.has_value());
  CHECK(e->value == "France");
  CHECK(e->expires_at - e->cached_at == std::chrono::hours(24 * 30));
  CHECK(cache.get("bob") == Value("France"));

  REQUIRE(cache.put("bob", "Spain"));
  CHECK(cache.get("bob") == Value("Spain"));
}

TEST_CASE("absent and empty values are never stored", "[local]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCache cache({}, store, loop);

  CHECK_FALSE(cache.put("bob", ""));
  CHECK_FALSE(cache.put("", "France"));
  CHECK(cache.size() == 0);
  CHECK_FALSE(cache.dirty());
  CHECK(cache.stats().rejected_puts == 2);
}

TEST_CASE("expired entries are erased on read", "[local][ttl]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCacheConfig cfg;
  cfg.retention = Millis(1000);
  LocalCache cache(cfg, store, loop);

  REQUIRE(cache.put("bob", "France"));
  loop.advance(Millis(999));
  CHECK(cache.get("bob").has_value());
  loop.advance(Millis(1));
  CHECK_FALSE(cache.get("bob").has_value());
  CHECK(cache.size() == 0);
  CHECK(cache.stats().expirations == 1);
}

TEST_CASE("writes within the debounce window coalesce into one flush",
          "[local][flush]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCache cache({}, store, loop);

  cache.put("a", "France");
  loop.advance(Millis(1000));
  cache.put("b", "Japan");
  loop.advance(Millis(1000));
  cache.put("c", "Brazil");
  CHECK(store.sets == 0);
  loop.advance(Millis(3000));
  CHECK(store.sets == 1);
  CHECK_FALSE(cache.dirty());

  const auto &doc = store.data.at("location_cache");
  const auto members = json_object_members(doc);
  CHECK(members.size() == 3);
}

TEST_CASE("periodic flush runs only while dirty", "[local][flush]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCacheConfig cfg;
  cfg.flush_debounce = Millis(60000);
  LocalCache cache(cfg, store, loop);
  cache.start();

  loop.advance(Millis(30000));
  CHECK(store.sets == 0);
  cache.put("a", "France");
  loop.advance(Millis(30000));
  CHECK(store.sets == 1);
  loop.advance(Millis(90000));
  CHECK(store.sets == 1);
}

TEST_CASE("shutdown flushes pending writes", "[local][flush]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  LocalCache cache({}, store, loop);
  cache.start();
  cache.put("a", "France");

  bool ok = false;
  cache.shutdown().then([&](bool r) { ok = r; });
  CHECK(ok);
  CHECK(store.sets == 1);
  CHECK(loop.pending_timers() == 0);
}

TEST_CASE("load skips expired entries and keeps newer in-memory writes",
          "[local][load]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  const auto now = to_epoch_ms(loop.now());
  store.data["location_cache"] =
      "{\"old\":{\"value\":\"Peru\",\"cached_at\":0,\"expires_at\":" +
      std::to_string(now - 1) + "},\"alice\":{\"value\":\"Japan\",\"cached_at\":" +
      std::to_string(now) + ",\"expires_at\":" + std::to_string(now + 5000) +
      "},\"bob\":{\"value\":\"Chile\",\"cached_at\":" + std::to_string(now) +
      ",\"expires_at\":" + std::to_string(now + 5000) + "}}";
  LocalCache cache({}, store, loop);
  cache.put("bob", "France");

  bool ok = false;
  cache.load().then([&](bool r) { ok = r; });
  REQUIRE(ok);
  CHECK(cache.get("alice") == Value("Japan"));
  CHECK(cache.get("bob") == Value("France"));
  CHECK_FALSE(cache.get("old").has_value());
  CHECK(cache.stats().load_discarded == 1);
}

TEST_CASE("storage failures degrade to no-ops and retry later",
          "[local][storage]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  store.fail_reads = true;
  store.fail_writes = true;
  LocalCache cache({}, store, loop);

  bool loaded = true;
  cache.load().then([&](bool r) { loaded = r; });
  CHECK_FALSE(loaded);

  cache.put("a", "France");
  bool flushed = true;
  cache.flush().then([&](bool r) { flushed = r; });
  CHECK_FALSE(flushed);
  CHECK(cache.dirty());
  CHECK(cache.get("a") == Value("France"));

  store.fail_writes = false;
  cache.flush().then([&](bool r) { flushed = r; });
  CHECK(flushed);
  CHECK(store.data.contains("location_cache"));
}

TEST_CASE("values containing braces survive a flush and reload",
          "[local][load]") {
  EventLoop loop = manual_loop();
  MemoryStore store;
  {
    LocalCache cache({}, store, loop);
    cache.put("bob", "Earth {home}");
    cache.put("amy", "France");
    cache.put("cy", "} \"quoted\" {");
    bool ok = false;
    cache.flush().then([&](bool r) { ok = r; });
    REQUIRE(ok);
  }

  LocalCache reloaded({}, store, loop);
  bool ok = false;
  reloaded.load().then([&](bool r) { ok = r; });
  REQUIRE(ok);
  CHECK(reloaded.get("bob") == Value("Earth {home}"));
  CHECK(reloaded.get("amy") == Value("France"));
  CHECK(reloaded.get("cy") == Value("} \"quoted\" {"));
  CHECK(reloaded.stats().loaded == 3);
  CHECK(reloaded.stats().load_discarded == 0);
}

TEST_CASE("a flush requested mid-write runs after the write lands",
          "[local][flush]") {
  EventLoop loop = manual_loop();
  DeferredStore store;
  LocalCache cache({}, store, loop);

  cache.put("a", "France");
  auto first = cache.flush();
  REQUIRE(store.writes.size() == 1);
  CHECK(cache.writing());

  cache.put("b", "Japan");
  auto last = cache.shutdown();
  CHECK(store.writes.size() == 1);
  CHECK(cache.dirty());

  store.complete(0);
  CHECK(first.ready());
  REQUIRE(store.writes.size() == 2);
  CHECK_FALSE(last.ready());

  store.complete(1);
  REQUIRE(last.ready());
  CHECK(last.get());
  CHECK_FALSE(cache.dirty());
  CHECK_FALSE(cache.writing());
  const auto members = json_object_members(store.data.at("location_cache"));
  CHECK(members.size() == 2);

  // Nothing is left to write.
  bool ok = false;
  cache.shutdown().then([&](bool r) { ok = r; });
  CHECK(ok);
  CHECK(store.writes.size() == 2);
}
