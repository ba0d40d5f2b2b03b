#pragma once

#include "geo_resolver/config.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/future.hpp"
#include "geo_resolver/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace geo_resolver {

// Request/response channel to an HTTP-speaking peer. Never throws: every
// failure (connect, timeout, malformed reply) surfaces as ok == false.
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual Future<TransportResponse> call(const std::string &path,
                                         const std::string &method,
                                         const std::string &body) = 0;
};

struct TransportStats {
  std::uint64_t calls{0};
  std::uint64_t failures{0};
  std::uint64_t timeouts{0};
};

// One non-blocking connection per call, driven by the event loop;
// HTTP/1.1 with Connection: close.
class HttpTransport final : public ITransport {
public:
  HttpTransport(Endpoint endpoint, EventLoop &loop);
  ~HttpTransport() override;
  HttpTransport(const HttpTransport &) = delete;
  HttpTransport &operator=(const HttpTransport &) = delete;

  Future<TransportResponse> call(const std::string &path,
                                 const std::string &method,
                                 const std::string &body) override;

  const Endpoint &endpoint() const { return endpoint_; }
  const TransportStats &stats() const { return stats_; }

private:
  struct Call;
  void on_ready(const std::shared_ptr<Call> &c, unsigned events);
  void finish(const std::shared_ptr<Call> &c, TransportResponse r);

  Endpoint endpoint_;
  EventLoop &loop_;
  TransportStats stats_;
  std::unordered_map<int, std::shared_ptr<Call>> calls_;
};

} // namespace geo_resolver
