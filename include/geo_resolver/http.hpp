#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace geo_resolver {

struct HttpRequest {
  std::string method;
  std::string target;
  std::string path;
  std::unordered_map<std::string, std::string> query;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  bool malformed{false};
};

struct HttpResponse {
  int status{0};
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

// Incremental server-side parser. A request whose head cannot be parsed is
// returned once with malformed set, and the buffer is dropped.
class HttpRequestParser {
public:
  void feed(const std::string &data);
  std::optional<HttpRequest> next_request();
  std::size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_;
};

// Client-side parser for a single response on a Connection: close socket.
class HttpResponseParser {
public:
  void feed(const std::string &data);
  // True once the body is complete according to Content-Length.
  bool complete();
  // Called at EOF; a response without Content-Length ends here.
  std::optional<HttpResponse> finish(std::string *err = nullptr);

private:
  bool parse_head(std::string *err);

  std::string buffer_;
  std::optional<HttpResponse> head_;
  std::size_t body_start_{0};
  std::optional<std::size_t> content_length_;
  bool bad_{false};
};

constexpr std::size_t kMaxHttpHead = 16 * 1024;
constexpr std::size_t kMaxHttpBody = 1024 * 1024;

std::string http_reason(int status);
std::string http_response(int status, const std::string &body,
                          const std::string &content_type = "application/json");
std::string http_request(const std::string &method, const std::string &host,
                         const std::string &target, const std::string &body);

std::string url_encode(const std::string &s);
std::string url_decode(const std::string &s);
std::unordered_map<std::string, std::string> parse_query(const std::string &q);

} // namespace geo_resolver
