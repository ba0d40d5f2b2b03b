#pragma once

#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/transport.hpp"
#include "geo_resolver/upstream.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace geo_resolver::testing {

inline TransportResponse json_reply(int status, const std::string &body) {
  TransportResponse r;
  r.ok = true;
  r.status = status;
  r.data = body;
  return r;
}

inline TransportResponse network_error() {
  TransportResponse r;
  r.error = "connection refused";
  return r;
}

// Records every call. With a handler set, calls complete synchronously;
// otherwise they stay open until reply() is called.
class FakeTransport final : public ITransport {
public:
  using Handler = std::function<TransportResponse(
      const std::string &, const std::string &, const std::string &)>;

  struct Call {
    std::string path;
    std::string method;
    std::string body;
    Promise<TransportResponse> reply;
  };

  Future<TransportResponse> call(const std::string &path,
                                 const std::string &method,
                                 const std::string &body) override {
    Promise<TransportResponse> p;
    calls.push_back({path, method, body, p});
    auto f = p.future();
    if (handler)
      p.set_value(handler(path, method, body));
    return f;
  }

  void reply(std::size_t i, TransportResponse r) {
    auto p = calls.at(i).reply;
    p.set_value(std::move(r));
  }

  std::size_t count(const std::string &method, const std::string &prefix) const {
    std::size_t n = 0;
    for (const auto &c : calls)
      if (c.method == method && c.path.rfind(prefix, 0) == 0)
        ++n;
    return n;
  }

  Handler handler;
  std::vector<Call> calls;
};

// Remote cache stand-in: /check answers from `values`, /add succeeds.
inline FakeTransport::Handler remote_cache_handler(
    std::function<Value(const std::string &)> lookup) {
  return [lookup](const std::string &path, const std::string &method,
                  const std::string &) {
    if (method == "POST")
      return json_reply(201, "{}");
    const std::string key = path.substr(path.find("a=") + 2);
    const Value v = lookup(key);
    return json_reply(200, "{\"key\":\"" + key + "\",\"value\":" +
                               (v ? "\"" + *v + "\"" : std::string("null")) +
                               ",\"cached\":true}");
  };
}

// Upstream whose fetches stay open until complete() is called.
class FakeFetcher final : public IUpstreamFetcher {
public:
  struct Fetch {
    std::string key;
    Promise<FetchResult> result;
  };

  Future<FetchResult> fetch(const std::string &key) override {
    if (throw_on_fetch)
      throw std::runtime_error("fetcher exploded");
    Promise<FetchResult> p;
    fetches.push_back({key, p});
    ++active;
    max_active = std::max(max_active, active);
    return p.future();
  }

  void complete(std::size_t i, FetchResult r) {
    auto p = fetches.at(i).result;
    if (!p.fulfilled())
      --active;
    p.set_value(std::move(r));
  }

  std::vector<Fetch> fetches;
  std::size_t active{0};
  std::size_t max_active{0};
  bool throw_on_fetch{false};
};

class MemoryStore final : public IDurableStore {
public:
  Future<std::optional<StoreMap>> get(const std::vector<std::string> &keys) override {
    ++gets;
    if (fail_reads)
      return make_ready_future<std::optional<StoreMap>>(std::nullopt);
    StoreMap out;
    for (const auto &k : keys) {
      auto it = data.find(k);
      if (it != data.end())
        out.emplace(k, it->second);
    }
    return make_ready_future<std::optional<StoreMap>>(std::move(out));
  }

  Future<bool> set(const StoreMap &mapping) override {
    ++sets;
    if (fail_writes)
      return make_ready_future(false);
    for (const auto &[k, v] : mapping)
      data[k] = v;
    return make_ready_future(true);
  }

  StoreMap data;
  std::size_t gets{0};
  std::size_t sets{0};
  bool fail_reads{false};
  bool fail_writes{false};
};

inline EventLoop manual_loop() { return EventLoop(std::make_unique<ManualClock>()); }

} // namespace geo_resolver::testing
