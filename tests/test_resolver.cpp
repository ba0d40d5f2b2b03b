#include "fakes.hpp"
#include "geo_resolver/resolver.hpp"

#include <catch2/catch.hpp>

#include <unordered_map>

using namespace geo_resolver;
using namespace geo_resolver::testing;

namespace {
struct Harness {
  Harness() {
    remote.handler = remote_cache_handler([this](const std::string &key) {
      auto it = remote_values.find(key);
      return it == remote_values.end() ? Value() : it->second;
    });
  }

  EventLoop loop = manual_loop();
  MemoryStore store;
  FakeTransport remote;
  FakeFetcher upstream;
  RateLimiter limiter;
  std::unordered_map<std::string, Value> remote_values;
  Resolver resolver{ResolverConfig{}, store, remote, upstream, limiter, loop};
};
} // namespace

TEST_CASE("scenario: upstream answer is cached locally and shared",
          "[resolver][scenario]") {
  Harness h;
  auto r = h.resolver.resolve("bob");
  CHECK(h.remote.count("GET", "/check?a=bob") == 1);
  h.loop.run_due();
  REQUIRE(h.upstream.fetches.size() == 1);
  CHECK(h.upstream.fetches[0].key == "bob");

  h.upstream.complete(0, {Value("France"), false, false});
  REQUIRE(r.ready());
  CHECK(r.get() == Value("France"));

  auto e = h.resolver.local().peek("bob");
  REQUIRE(e.has_value());
  CHECK(e->value == "France");
  CHECK(e->expires_at - h.loop.now() == std::chrono::hours(24 * 30));

  REQUIRE(h.remote.count("POST", "/add") == 1);
  CHECK(h.remote.calls.back().body == R"({"key":"bob","value":"France"})");
}

TEST_CASE("repeated resolves are answered locally", "[resolver][idempotence]") {
  Harness h;
  h.remote_values["alice"] = Value("Japan");
  auto first = h.resolver.resolve("alice");
  REQUIRE(first.ready());
  CHECK(first.get() == Value("Japan"));
  const auto calls = h.remote.calls.size();

  auto second = h.resolver.resolve("alice");
  REQUIRE(second.ready());
  CHECK(second.get() == Value("Japan"));
  // Local hit, and the write-back is still inside its throttle window.
  CHECK(h.remote.calls.size() == calls);
  CHECK(h.upstream.fetches.empty());
  CHECK(h.resolver.stats().local_hits == 1);
}

TEST_CASE("five concurrent resolves cost one read and one fetch",
          "[resolver][dedupe]") {
  Harness h;
  h.remote.handler = nullptr;
  std::vector<Future<Value>> results;
  for (int i = 0; i < 5; ++i)
    results.push_back(h.resolver.resolve("alice"));
  REQUIRE(h.remote.calls.size() == 1);

  h.remote.handler = remote_cache_handler([](const std::string &) { return Value(); });
  h.remote.reply(0, json_reply(200, R"({"key":"alice","value":null})"));
  h.loop.advance(Millis(2000));
  REQUIRE(h.upstream.fetches.size() == 1);

  h.upstream.complete(0, {Value("Japan"), false, false});
  for (const auto &r : results) {
    REQUIRE(r.ready());
    CHECK(r.get() == Value("Japan"));
  }
  CHECK(h.remote.count("GET", "/check") == 1);
  CHECK(h.remote.count("POST", "/add") == 1);
}

TEST_CASE("absent results are never persisted", "[resolver][null]") {
  Harness h;
  auto r = h.resolver.resolve("ghost");
  h.loop.run_due();
  REQUIRE(h.upstream.fetches.size() == 1);
  h.upstream.complete(0, {std::nullopt, false, false});
  REQUIRE(r.ready());
  CHECK_FALSE(r.get().has_value());
  CHECK_FALSE(h.resolver.local().peek("ghost").has_value());
  CHECK(h.remote.count("POST", "/add") == 0);

  // Still unknown, so the next call asks upstream again.
  h.resolver.resolve("ghost");
  h.loop.advance(Millis(1000));
  CHECK(h.upstream.fetches.size() == 2);
}

TEST_CASE("scenario: rate-limited fetch falls back to a forced remote read",
          "[resolver][scenario][ratelimit]") {
  Harness h;
  auto r = h.resolver.resolve("carol");
  h.loop.run_due();
  REQUIRE(h.upstream.fetches.size() == 1);

  const auto resume = h.loop.now() + Millis(120000);
  h.limiter.set_resume_at(resume);
  h.remote_values["carol"] = Value("Japan");
  h.upstream.complete(0, {std::nullopt, true, false});

  REQUIRE(r.ready());
  CHECK(r.get() == Value("Japan"));
  CHECK(h.remote.count("GET", "/check?a=carol") == 2);
  CHECK(h.resolver.local().get("carol") == Value("Japan"));
  CHECK(h.resolver.stats().forced_hits == 1);

  h.resolver.resolve("dave");
  h.loop.advance(Millis(119000));
  CHECK(h.upstream.fetches.size() == 1);
  h.loop.advance(Millis(1000));
  CHECK(h.upstream.fetches.size() == 2);
}

TEST_CASE("a timed-out fetch falls back to a forced remote read",
          "[resolver][timeout]") {
  Harness h;
  auto r = h.resolver.resolve("erin");
  h.loop.run_due();
  REQUIRE(h.upstream.fetches.size() == 1);

  h.loop.advance(Millis(9000));
  CHECK_FALSE(r.ready());
  h.loop.advance(Millis(1000));
  REQUIRE(r.ready());
  CHECK_FALSE(r.get().has_value());
  CHECK(h.resolver.stats().timeouts == 1);
  CHECK(h.remote.count("GET", "/check?a=erin") == 2);

  // The late upstream answer is dropped.
  h.upstream.complete(0, {Value("Kenya"), false, false});
  CHECK_FALSE(h.resolver.local().peek("erin").has_value());
}

TEST_CASE("start loads the durable cache and shutdown flushes it",
          "[resolver][lifecycle]") {
  Harness h;
  const auto now = to_epoch_ms(h.loop.now());
  h.store.data["location_cache"] = "{\"zoe\":{\"value\":\"Chile\",\"cached_at\":" +
                                   std::to_string(now) + ",\"expires_at\":" +
                                   std::to_string(now + 60000) + "}}";
  bool loaded = false;
  h.resolver.start().then([&](bool ok) { loaded = ok; });
  REQUIRE(loaded);

  auto r = h.resolver.resolve("zoe");
  REQUIRE(r.ready());
  CHECK(r.get() == Value("Chile"));
  CHECK(h.remote.count("GET", "/check") == 0);

  h.remote_values["yan"] = Value("Peru");
  h.resolver.resolve("yan");
  const auto sets = h.store.sets;
  bool flushed = false;
  h.resolver.shutdown().then([&](bool ok) { flushed = ok; });
  CHECK(flushed);
  CHECK(h.store.sets == sets + 1);
  CHECK(h.store.data.at("location_cache").find("\"yan\"") != std::string::npos);

  const auto info = h.resolver.info();
  CHECK(info.find("local_hits:1\n") != std::string::npos);
  CHECK(info.find("remote_hits:1\n") != std::string::npos);
}
