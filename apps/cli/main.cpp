#include "geo_resolver/config.hpp"
#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/event_loop.hpp"
#include "geo_resolver/log.hpp"
#include "geo_resolver/rate_limiter.hpp"
#include "geo_resolver/resolver.hpp"
#include "geo_resolver/transport.hpp"
#include "geo_resolver/upstream.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
volatile std::sig_atomic_t running = 1;
void on_sigint(int) { running = 0; }

void usage() {
  std::cerr << "usage: geo_resolve [--remote URL] [--upstream URL] "
               "[--data-dir DIR] [--config FILE] [--log-level LEVEL] [--stats]\n"
               "reads one username per line from stdin\n";
}
} // namespace

int main(int argc, char **argv) {
  std::string remote_url = "http://127.0.0.1:8000";
  std::string upstream_url = "http://127.0.0.1:8001/location";
  std::string data_dir = "./data";
  std::string config_path;
  std::string log_level = "warn";
  bool show_stats = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--remote" && i + 1 < argc)
      remote_url = argv[++i];
    else if (a == "--upstream" && i + 1 < argc)
      upstream_url = argv[++i];
    else if (a == "--data-dir" && i + 1 < argc)
      data_dir = argv[++i];
    else if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--log-level" && i + 1 < argc)
      log_level = argv[++i];
    else if (a == "--stats")
      show_stats = true;
    else {
      usage();
      return 2;
    }
  }

  geo_resolver::install_log_format();
  auto lvl = geo_resolver::parse_log_level(log_level);
  if (!lvl) {
    std::cerr << "unknown log level " << log_level << "\n";
    return 2;
  }
  spdlog::set_level(*lvl);

  geo_resolver::ResolverConfig cfg;
  std::string err;
  if (!config_path.empty() && !geo_resolver::load_config(config_path, cfg, &err)) {
    std::cerr << config_path << ": " << err << "\n";
    return 2;
  }
  auto remote_ep = geo_resolver::parse_endpoint(remote_url);
  auto upstream_ep = geo_resolver::parse_endpoint(upstream_url);
  if (!remote_ep || !upstream_ep) {
    std::cerr << "endpoints must look like http://host[:port][/path]\n";
    return 2;
  }
  // The whole upstream path comes from the URL when one is given.
  const std::string upstream_path = upstream_ep->base_path.empty() ? "/location" : "";

  geo_resolver::FileStore store({data_dir, "resolver.tsv", true});
  if (!store.init(&err))
    spdlog::warn("storage unavailable: {}", err);

  geo_resolver::EventLoop loop;
  geo_resolver::RateLimiter limiter;
  geo_resolver::HttpTransport remote(*remote_ep, loop);
  geo_resolver::HttpTransport upstream_transport(*upstream_ep, loop);
  geo_resolver::HttpUpstreamFetcher upstream(upstream_transport, limiter,
                                             upstream_path);
  geo_resolver::Resolver resolver(cfg, store, remote, upstream, limiter, loop);
  resolver.start();

  std::vector<std::string> names;
  std::string line;
  while (std::getline(std::cin, line)) {
    const auto b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos)
      continue;
    const auto e = line.find_last_not_of(" \t\r");
    names.push_back(line.substr(b, e - b + 1));
  }

  std::signal(SIGINT, on_sigint);
  std::vector<geo_resolver::Value> results(names.size());
  std::size_t settled = 0;
  for (std::size_t i = 0; i < names.size(); ++i) {
    resolver.resolve(names[i]).then(
        [&results, &settled, i](const geo_resolver::Value &v) {
          results[i] = v;
          ++settled;
        });
  }
  while (running && settled < names.size())
    loop.run_once(geo_resolver::Millis(100));

  for (std::size_t i = 0; i < names.size(); ++i)
    std::cout << names[i] << '\t' << results[i].value_or("-") << '\n';

  bool flushed = false;
  resolver.shutdown().then([&flushed](bool ok) { flushed = ok; });
  if (!flushed)
    spdlog::warn("final local cache flush failed");
  if (show_stats)
    std::cerr << resolver.info();
  return settled == names.size() ? 0 : 1;
}
