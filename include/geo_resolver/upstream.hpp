#pragma once

#include "geo_resolver/future.hpp"
#include "geo_resolver/rate_limiter.hpp"
#include "geo_resolver/transport.hpp"
#include "geo_resolver/types.hpp"

#include <string>

namespace geo_resolver {

// The authoritative, rate-limited source. Called once per queue dispatch.
class IUpstreamFetcher {
public:
  virtual ~IUpstreamFetcher() = default;
  virtual Future<FetchResult> fetch(const std::string &key) = 0;
};

// GET <path>?screen_name=<key> -> {"location": string|null}. A 429 reply is
// reported as rate limited, and its x-rate-limit-reset header (epoch seconds)
// opens the limiter's window.
class HttpUpstreamFetcher final : public IUpstreamFetcher {
public:
  HttpUpstreamFetcher(ITransport &transport, RateLimiter &limiter,
                      std::string path = "/location");

  Future<FetchResult> fetch(const std::string &key) override;

private:
  ITransport &transport_;
  RateLimiter &limiter_;
  std::string path_;
};

} // namespace geo_resolver
