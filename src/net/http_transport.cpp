#include "geo_resolver/http.hpp"
#include "geo_resolver/transport.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace geo_resolver {

struct HttpTransport::Call {
  int fd{-1};
  std::string out;
  std::size_t sent{0};
  bool connected{false};
  bool done{false};
  std::optional<TimerId> timer;
  HttpResponseParser parser;
  Promise<TransportResponse> result;
};

namespace {
TransportResponse failure(std::string error) {
  TransportResponse r;
  r.error = std::move(error);
  return r;
}

int open_socket(const Endpoint &ep, std::string *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const std::string port = std::to_string(ep.port);
  const int rc = getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    *err = std::string("resolve ") + ep.host + ": " + gai_strerror(rc);
    return -1;
  }
  int fd = -1;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
      continue;
    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0 || errno == EINPROGRESS)
      break;
    close(fd);
    fd = -1;
  }
  if (fd < 0)
    *err = std::string("connect ") + ep.host + ": " + std::strerror(errno);
  freeaddrinfo(res);
  return fd;
}
} // namespace

HttpTransport::HttpTransport(Endpoint endpoint, EventLoop &loop)
    : endpoint_(std::move(endpoint)), loop_(loop) {}

HttpTransport::~HttpTransport() {
  for (auto &[fd, c] : calls_) {
    if (c->timer)
      loop_.cancel(*c->timer);
    loop_.unwatch(fd);
    close(fd);
  }
}

Future<TransportResponse> HttpTransport::call(const std::string &path,
                                              const std::string &method,
                                              const std::string &body) {
  ++stats_.calls;
  std::string err;
  const int fd = open_socket(endpoint_, &err);
  if (fd < 0) {
    ++stats_.failures;
    spdlog::debug("{}", err);
    return make_ready_future(failure(err));
  }

  auto c = std::make_shared<Call>();
  c->fd = fd;
  c->out = http_request(method, endpoint_.host, endpoint_.base_path + path, body);
  calls_[fd] = c;
  c->timer = loop_.schedule(endpoint_.timeout, [this, c] {
    c->timer.reset();
    ++stats_.timeouts;
    finish(c, failure("timed out after " +
                      std::to_string(endpoint_.timeout.count()) + "ms"));
  });
  loop_.watch(fd, kFdWrite, [this, c](unsigned events) { on_ready(c, events); });
  return c->result.future();
}

void HttpTransport::on_ready(const std::shared_ptr<Call> &c, unsigned events) {
  if (c->done)
    return;
  if (!c->connected) {
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(c->fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      finish(c, failure(std::string("connect: ") +
                        std::strerror(so_error != 0 ? so_error : errno)));
      return;
    }
    c->connected = true;
  }

  if (c->sent < c->out.size()) {
    if (!(events & kFdWrite))
      return;
    const ssize_t w = send(c->fd, c->out.data() + c->sent,
                           c->out.size() - c->sent, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK)
        finish(c, failure(std::string("send: ") + std::strerror(errno)));
      return;
    }
    c->sent += static_cast<std::size_t>(w);
    if (c->sent == c->out.size())
      loop_.watch(c->fd, kFdRead,
                  [this, c](unsigned ev) { on_ready(c, ev); });
    return;
  }

  if (!(events & kFdRead))
    return;
  char buf[4096];
  const ssize_t r = recv(c->fd, buf, sizeof(buf), 0);
  if (r < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK)
      finish(c, failure(std::string("recv: ") + std::strerror(errno)));
    return;
  }
  if (r > 0) {
    c->parser.feed(std::string(buf, static_cast<std::size_t>(r)));
    if (!c->parser.complete())
      return;
  }
  std::string perr;
  auto resp = c->parser.finish(&perr);
  if (!resp) {
    finish(c, failure(perr));
    return;
  }
  TransportResponse out;
  out.ok = true;
  out.status = resp->status;
  out.data = std::move(resp->body);
  out.headers = std::move(resp->headers);
  finish(c, std::move(out));
}

void HttpTransport::finish(const std::shared_ptr<Call> &c, TransportResponse r) {
  if (c->done)
    return;
  c->done = true;
  if (c->timer) {
    loop_.cancel(*c->timer);
    c->timer.reset();
  }
  loop_.unwatch(c->fd);
  close(c->fd);
  calls_.erase(c->fd);
  if (!r.ok)
    ++stats_.failures;
  c->result.set_value(std::move(r));
}

} // namespace geo_resolver
