#include "geo_resolver/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace geo_resolver {
namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

bool parse_size(const std::string &s, std::size_t &out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(),
                                [](unsigned char c) { return std::isdigit(c); }))
    return false;
  try {
    out = static_cast<std::size_t>(std::stoull(s));
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

// Parses header lines between [pos, end) into out.
bool parse_headers(const std::string &buf, std::size_t pos, std::size_t end,
                   std::unordered_map<std::string, std::string> &out) {
  while (pos < end) {
    auto eol = buf.find("\r\n", pos);
    if (eol == std::string::npos || eol > end)
      eol = end;
    const std::string line = buf.substr(pos, eol - pos);
    pos = eol + 2;
    if (line.empty())
      continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
      return false;
    out[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return true;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

void HttpRequestParser::feed(const std::string &data) { buffer_ += data; }

std::optional<HttpRequest> HttpRequestParser::next_request() {
  const auto head_end = buffer_.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    if (buffer_.size() > kMaxHttpHead) {
      buffer_.clear();
      HttpRequest bad;
      bad.malformed = true;
      return bad;
    }
    return std::nullopt;
  }

  HttpRequest req;
  const auto line_end = buffer_.find("\r\n");
  std::istringstream line(buffer_.substr(0, line_end));
  std::string version;
  line >> req.method >> req.target >> version;
  if (req.method.empty() || req.target.empty() || req.target[0] != '/' ||
      version.rfind("HTTP/1.", 0) != 0 ||
      !parse_headers(buffer_, line_end + 2, head_end, req.headers)) {
    buffer_.clear();
    req.malformed = true;
    return req;
  }

  std::size_t len = 0;
  if (auto it = req.headers.find("content-length"); it != req.headers.end()) {
    if (!parse_size(it->second, len) || len > kMaxHttpBody) {
      buffer_.clear();
      req.malformed = true;
      return req;
    }
  }
  const std::size_t body_start = head_end + 4;
  if (buffer_.size() < body_start + len)
    return std::nullopt;
  req.body = buffer_.substr(body_start, len);
  buffer_.erase(0, body_start + len);

  const auto q = req.target.find('?');
  req.path = url_decode(req.target.substr(0, q));
  if (q != std::string::npos)
    req.query = parse_query(req.target.substr(q + 1));
  return req;
}

void HttpResponseParser::feed(const std::string &data) { buffer_ += data; }

bool HttpResponseParser::parse_head(std::string *err) {
  if (head_.has_value() || bad_)
    return !bad_;
  const auto head_end = buffer_.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    if (buffer_.size() > kMaxHttpHead) {
      bad_ = true;
      if (err)
        *err = "response head too large";
    }
    return false;
  }
  const auto line_end = buffer_.find("\r\n");
  std::istringstream line(buffer_.substr(0, line_end));
  std::string version, status;
  line >> version >> status;
  HttpResponse r;
  std::size_t code = 0;
  if (version.rfind("HTTP/1.", 0) != 0 || !parse_size(status, code) ||
      !parse_headers(buffer_, line_end + 2, head_end, r.headers)) {
    bad_ = true;
    if (err)
      *err = "malformed response head";
    return false;
  }
  r.status = static_cast<int>(code);
  if (auto it = r.headers.find("content-length"); it != r.headers.end()) {
    std::size_t len = 0;
    if (!parse_size(it->second, len) || len > kMaxHttpBody) {
      bad_ = true;
      if (err)
        *err = "bad content-length";
      return false;
    }
    content_length_ = len;
  }
  body_start_ = head_end + 4;
  head_ = std::move(r);
  return true;
}

bool HttpResponseParser::complete() {
  if (!parse_head(nullptr))
    return false;
  return content_length_.has_value() &&
         buffer_.size() >= body_start_ + *content_length_;
}

std::optional<HttpResponse> HttpResponseParser::finish(std::string *err) {
  if (!head_.has_value() && !parse_head(err)) {
    if (err && err->empty())
      *err = "truncated response";
    return std::nullopt;
  }
  HttpResponse r = *head_;
  if (content_length_.has_value()) {
    if (buffer_.size() < body_start_ + *content_length_) {
      if (err)
        *err = "truncated body";
      return std::nullopt;
    }
    r.body = buffer_.substr(body_start_, *content_length_);
  } else {
    r.body = buffer_.substr(body_start_);
  }
  return r;
}

std::string http_reason(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 422:
    return "Unprocessable Entity";
  case 429:
    return "Too Many Requests";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::string http_response(int status, const std::string &body,
                          const std::string &content_type) {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " +
                    http_reason(status) + "\r\n";
  out += "Content-Type: " + content_type + "\r\n";
  out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  out += "\r\n";
  out += body;
  return out;
}

std::string http_request(const std::string &method, const std::string &host,
                         const std::string &target, const std::string &body) {
  std::string out = method + " " + target + " HTTP/1.1\r\n";
  out += "Host: " + host + "\r\n";
  out += "Connection: close\r\n";
  out += "Accept: application/json\r\n";
  if (!body.empty() || method == "POST") {
    out += "Content-Type: application/json\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  out += "\r\n";
  out += body;
  return out;
}

std::string url_encode(const std::string &s) {
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string url_decode(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
               hex_value(s[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query(const std::string &q) {
  std::unordered_map<std::string, std::string> out;
  std::size_t pos = 0;
  while (pos <= q.size()) {
    auto amp = q.find('&', pos);
    if (amp == std::string::npos)
      amp = q.size();
    const std::string pair = q.substr(pos, amp - pos);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      if (eq == std::string::npos)
        out[url_decode(pair)] = "";
      else
        out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
    pos = amp + 1;
  }
  return out;
}

} // namespace geo_resolver
