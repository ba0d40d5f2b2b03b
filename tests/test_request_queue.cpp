#include "fakes.hpp"
#include "geo_resolver/request_queue.hpp"

#include <catch2/catch.hpp>

using namespace geo_resolver;
using namespace geo_resolver::testing;

namespace {
struct Harness {
  EventLoop loop = manual_loop();
  FakeFetcher fetcher;
  RateLimiter limiter;
  RequestQueue queue{QueueConfig{}, fetcher, limiter, loop};
};
} // namespace

TEST_CASE("dispatches in FIFO order one interval apart", "[queue]") {
  Harness h;
  for (const char *k : {"a", "b", "c"})
    h.queue.enqueue(k);

  h.loop.run_due();
  REQUIRE(h.fetcher.fetches.size() == 1);
  CHECK(h.fetcher.fetches[0].key == "a");
  h.loop.advance(Millis(499));
  CHECK(h.fetcher.fetches.size() == 1);
  h.loop.advance(Millis(1));
  REQUIRE(h.fetcher.fetches.size() == 2);
  CHECK(h.fetcher.fetches[1].key == "b");
  h.loop.advance(Millis(500));
  REQUIRE(h.fetcher.fetches.size() == 3);
  CHECK(h.fetcher.fetches[2].key == "c");
}

TEST_CASE("never more than four fetches in flight", "[queue][concurrency]") {
  Harness h;
  std::vector<Future<FetchResult>> results;
  for (int i = 0; i < 10; ++i)
    results.push_back(h.queue.enqueue("user" + std::to_string(i)));

  h.loop.advance(Millis(5000));
  CHECK(h.fetcher.fetches.size() == 4);
  CHECK(h.queue.in_flight() == 4);
  CHECK(h.queue.queued() == 6);

  h.fetcher.complete(0, {Value("France"), false, false});
  REQUIRE(results[0].ready());
  CHECK(results[0].get().value == Value("France"));
  h.loop.advance(Millis(199));
  CHECK(h.fetcher.fetches.size() == 4);
  h.loop.advance(Millis(1));
  CHECK(h.fetcher.fetches.size() == 5);
  CHECK(h.fetcher.max_active <= 4);
  CHECK(h.queue.stats().max_in_flight == 4);
}

TEST_CASE("a slow fetch times out without being cancelled", "[queue][timeout]") {
  Harness h;
  auto r = h.queue.enqueue("slow");
  h.loop.run_due();
  REQUIRE(h.fetcher.fetches.size() == 1);

  h.loop.advance(Millis(9999));
  CHECK_FALSE(r.ready());
  h.loop.advance(Millis(1));
  REQUIRE(r.ready());
  CHECK(r.get().timed_out);
  CHECK_FALSE(r.get().value.has_value());
  CHECK(h.queue.in_flight() == 0);

  // The late answer is discarded.
  h.fetcher.complete(0, {Value("Japan"), false, false});
  CHECK_FALSE(r.get().value.has_value());
  CHECK(h.queue.stats().late_results == 1);
  CHECK(h.queue.stats().timed_out == 1);
}

TEST_CASE("rate-limit window freezes dispatch until it elapses",
          "[queue][ratelimit]") {
  Harness h;
  auto first = h.queue.enqueue("carol");
  h.queue.enqueue("dave");
  h.loop.run_due();
  REQUIRE(h.fetcher.fetches.size() == 1);

  h.limiter.set_resume_at(h.loop.now() + Millis(120000));
  h.fetcher.complete(0, {std::nullopt, true, false});
  REQUIRE(first.ready());
  CHECK(first.get().rate_limited);

  h.loop.advance(Millis(119999));
  CHECK(h.fetcher.fetches.size() == 1);
  h.loop.advance(Millis(1));
  CHECK(h.fetcher.fetches.size() == 2);
  CHECK(h.fetcher.fetches[1].key == "dave");
}

TEST_CASE("an unsignaled rate limit opens the fallback window",
          "[queue][ratelimit]") {
  Harness h;
  h.queue.enqueue("carol");
  h.queue.enqueue("dave");
  h.loop.run_due();
  h.fetcher.complete(0, {std::nullopt, true, false});
  REQUIRE(h.limiter.resume_at().has_value());
  CHECK(*h.limiter.resume_at() - h.loop.now() == Millis(60000));

  h.loop.advance(Millis(59999));
  CHECK(h.fetcher.fetches.size() == 1);
  h.loop.advance(Millis(1));
  CHECK(h.fetcher.fetches.size() == 2);
}

TEST_CASE("a cleared window is noticed at the next recheck",
          "[queue][ratelimit]") {
  Harness h;
  h.limiter.set_resume_at(h.loop.now() + std::chrono::hours(2));
  h.queue.enqueue("erin");
  h.loop.advance(Millis(1000));
  CHECK(h.fetcher.fetches.empty());

  h.limiter.clear();
  h.loop.advance(Millis(59000));
  CHECK(h.fetcher.fetches.size() == 1);
}

TEST_CASE("the same key queued twice shares one fetch", "[queue][dedupe]") {
  Harness h;
  auto a = h.queue.enqueue("alice");
  auto b = h.queue.enqueue("alice");
  CHECK(a.same_state(b));
  h.loop.advance(Millis(2000));
  REQUIRE(h.fetcher.fetches.size() == 1);
  h.fetcher.complete(0, {Value("Japan"), false, false});
  CHECK(b.get().value == Value("Japan"));
  CHECK(h.queue.stats().joined == 1);

  // Settled keys can be queued again.
  h.queue.enqueue("alice");
  h.loop.advance(Millis(1000));
  CHECK(h.fetcher.fetches.size() == 2);
}

TEST_CASE("a throwing fetcher settles the item as absent", "[queue]") {
  Harness h;
  h.fetcher.throw_on_fetch = true;
  auto r = h.queue.enqueue("x");
  h.loop.run_due();
  REQUIRE(r.ready());
  CHECK_FALSE(r.get().value.has_value());
  CHECK(h.queue.stats().fetch_errors == 1);
  CHECK(h.queue.in_flight() == 0);
}
