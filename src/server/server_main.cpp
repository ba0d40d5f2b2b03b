#include "geo_resolver/durable_store.hpp"
#include "geo_resolver/http.hpp"
#include "geo_resolver/location_service.hpp"
#include "geo_resolver/log.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <chrono>
#include <csignal>
#include <netinet/in.h>
#include <sstream>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
volatile std::sig_atomic_t running = 1;
void on_sigint(int) { running = 0; }

struct ClientState {
  geo_resolver::HttpRequestParser parser;
  std::string out;
  bool close_after_write{false};
};

struct ServerStats {
  std::uint64_t rejected_requests{0};
  std::uint64_t total_request_bytes{0};
  std::uint64_t request_count{0};
};

} // namespace

int main(int argc, char **argv) {
  int port = 8000;
  int ttl_days = 7;
  std::size_t max_connections = 512;
  std::size_t max_pending_out = 1 << 20;
  std::size_t max_reqs_per_iteration = 64;
  geo_resolver::FileStoreConfig store_cfg;
  store_cfg.file = "locations.tsv";
  std::string log_level = "info";

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--port" && i + 1 < argc)
        port = std::stoi(argv[++i]);
      else if (a == "--ttl-days" && i + 1 < argc)
        ttl_days = std::max(1, std::stoi(argv[++i]));
      else if (a == "--data-dir" && i + 1 < argc)
        store_cfg.dir = argv[++i];
      else if (a == "--max-connections" && i + 1 < argc)
        max_connections = std::stoul(argv[++i]);
      else if (a == "--no-fsync")
        store_cfg.fsync = false;
      else if (a == "--log-level" && i + 1 < argc)
        log_level = argv[++i];
    }
  } catch (const std::exception &e) {
    spdlog::error("invalid argument: {}", e.what());
    return 2;
  }

  geo_resolver::install_log_format();
  if (auto lvl = geo_resolver::parse_log_level(log_level))
    spdlog::set_level(*lvl);

  geo_resolver::FileStore store(store_cfg);
  std::string err;
  if (!store.init(&err)) {
    spdlog::error("{}", err);
    return 1;
  }
  geo_resolver::LocationService service(
      std::chrono::hours(24 * ttl_days), store);
  if (!service.load(store.records(), &err))
    spdlog::warn("{}", err);

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  int one = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(port);
  if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    spdlog::error("bind failed on port {}", port);
    return 1;
  }
  if (listen(server_fd, 128) < 0) {
    spdlog::error("listen failed");
    return 1;
  }

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);
  std::signal(SIGPIPE, SIG_IGN);
  std::unordered_map<int, ClientState> clients;
  ServerStats stats;
  auto last_persist = std::chrono::steady_clock::now();
  spdlog::info("geo_cache_server listening on {} (ttl {} days, data in {})",
               port, ttl_days, store_cfg.dir);

  while (running) {
    const auto tick = std::chrono::steady_clock::now();
    if (service.dirty() && tick - last_persist >= std::chrono::seconds(1)) {
      service.persist();
      last_persist = tick;
    }

    fd_set readfds, writefds;
    FD_ZERO(&readfds);
    FD_ZERO(&writefds);
    FD_SET(server_fd, &readfds);
    int maxfd = server_fd;
    for (const auto &[fd, st] : clients) {
      FD_SET(fd, &readfds);
      if (!st.out.empty())
        FD_SET(fd, &writefds);
      maxfd = std::max(maxfd, fd);
    }
    timeval tv{0, 20000};
    int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
    if (n < 0)
      continue;

    if (FD_ISSET(server_fd, &readfds)) {
      int cfd = accept(server_fd, nullptr, nullptr);
      if (cfd >= 0) {
        if (clients.size() >= max_connections) {
          const auto msg = geo_resolver::http_response(
              503, "{\"detail\":\"connection limit reached\"}");
          send(cfd, msg.data(), msg.size(), MSG_NOSIGNAL);
          close(cfd);
          ++stats.rejected_requests;
        } else {
          clients[cfd] = {};
        }
      }
    }

    std::vector<int> to_close;
    for (auto &[fd, st] : clients) {
      if (FD_ISSET(fd, &readfds)) {
        char buf[4096];
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r <= 0) {
          to_close.push_back(fd);
          continue;
        }
        stats.total_request_bytes += static_cast<std::uint64_t>(r);
        st.parser.feed(std::string(buf, static_cast<std::size_t>(r)));
        std::size_t processed = 0;
        while (processed < max_reqs_per_iteration && !st.close_after_write) {
          auto req = st.parser.next_request();
          if (!req.has_value())
            break;
          ++processed;
          ++stats.request_count;

          geo_resolver::ServiceReply reply;
          if (!req->malformed && req->path == "/info" && req->method == "GET") {
            std::ostringstream info;
            info << service.info();
            info << "connected_clients:" << clients.size() << "\n";
            info << "rejected_requests:" << stats.rejected_requests << "\n";
            info << "request_count:" << stats.request_count << "\n";
            reply = {200, info.str()};
          } else {
            reply = service.handle(*req, geo_resolver::Clock::now());
          }
          if (reply.status >= 400)
            ++stats.rejected_requests;
          st.out += geo_resolver::http_response(
              reply.status, reply.body,
              req->path == "/info" ? "text/plain" : "application/json");

          auto conn = req->headers.find("connection");
          if (req->malformed ||
              (conn != req->headers.end() && conn->second == "close"))
            st.close_after_write = true;

          if (st.out.size() > max_pending_out) {
            ++stats.rejected_requests;
            to_close.push_back(fd);
            break;
          }
        }
      }

      if (!st.out.empty()) {
        const std::size_t send_bytes = std::min<std::size_t>(st.out.size(), 8192);
        ssize_t w = send(fd, st.out.data(), send_bytes, MSG_NOSIGNAL);
        if (w <= 0)
          to_close.push_back(fd);
        else
          st.out.erase(0, static_cast<std::size_t>(w));
      }
      if (st.out.empty() && st.close_after_write)
        to_close.push_back(fd);
    }

    std::sort(to_close.begin(), to_close.end());
    to_close.erase(std::unique(to_close.begin(), to_close.end()), to_close.end());
    for (int fd : to_close) {
      close(fd);
      clients.erase(fd);
    }
  }

  for (auto &[fd, _] : clients)
    close(fd);
  close(server_fd);
  bool flushed = true;
  service.persist().then([&flushed](bool ok) { flushed = ok; });
  spdlog::info("geo_cache_server stopped ({} records{})", service.size(),
               flushed ? "" : ", final persist failed");
  return flushed ? 0 : 1;
}
