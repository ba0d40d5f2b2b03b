#include "geo_resolver/http.hpp"
#include "geo_resolver/json.hpp"
#include "geo_resolver/upstream.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace geo_resolver {

HttpUpstreamFetcher::HttpUpstreamFetcher(ITransport &transport,
                                         RateLimiter &limiter, std::string path)
    : transport_(transport), limiter_(limiter), path_(std::move(path)) {}

Future<FetchResult> HttpUpstreamFetcher::fetch(const std::string &key) {
  Promise<FetchResult> done;
  RateLimiter &limiter = limiter_;
  transport_.call(path_ + "?screen_name=" + url_encode(key), "GET", "")
      .then([&limiter, key, done](const TransportResponse &resp) {
        FetchResult r;
        if (!resp.ok) {
          spdlog::warn("upstream fetch for {} failed: {}", key, resp.error);
          done.set_value(r);
          return;
        }
        if (resp.status == 429) {
          r.rate_limited = true;
          auto reset = resp.headers.find("x-rate-limit-reset");
          if (reset != resp.headers.end()) {
            try {
              limiter.set_resume_at(from_epoch_ms(std::stoll(reset->second) * 1000));
            } catch (const std::exception &) {
              spdlog::warn("ignoring unparsable x-rate-limit-reset '{}'",
                           reset->second);
            }
          }
          done.set_value(r);
          return;
        }
        if (resp.status != 200) {
          spdlog::warn("upstream fetch for {} returned status {}", key,
                       resp.status);
          done.set_value(r);
          return;
        }
        if (!json_is_null(resp.data, "location")) {
          r.value = json_find_string(resp.data, "location");
          if (r.value && r.value->empty())
            r.value.reset();
        }
        done.set_value(r);
      });
  return done.future();
}

} // namespace geo_resolver
