#include "geo_resolver/durable_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace geo_resolver {
namespace {
std::string escape_field(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\')
      out += "\\\\";
    else if (c == '\t')
      out += "\\t";
    else if (c == '\n')
      out += "\\n";
    else
      out.push_back(c);
  }
  return out;
}

std::string unescape_field(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char c = s[++i];
      out.push_back(c == 't' ? '\t' : c == 'n' ? '\n' : c);
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

bool fsync_path(const std::string &p, int flags) {
  int fd = open(p.c_str(), flags);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  return ok;
}
} // namespace

FileStore::FileStore(FileStoreConfig cfg) : cfg_(std::move(cfg)) {}

std::string FileStore::path() const { return cfg_.dir + "/" + cfg_.file; }

bool FileStore::init(std::string *err) {
  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create data dir: " + ec.message();
    return false;
  }
  records_.clear();
  std::ifstream in(path());
  if (in.is_open()) {
    std::string line;
    while (std::getline(in, line)) {
      const auto tab = line.find('\t');
      // A torn tail line has no separator; stop there.
      if (tab == std::string::npos)
        break;
      records_[unescape_field(line.substr(0, tab))] =
          unescape_field(line.substr(tab + 1));
    }
  }
  stats_.records = records_.size();
  ready_ = true;
  return true;
}

Future<std::optional<StoreMap>> FileStore::get(const std::vector<std::string> &keys) {
  ++stats_.reads;
  if (!ready_)
    return make_ready_future<std::optional<StoreMap>>(std::nullopt);
  StoreMap out;
  for (const auto &k : keys) {
    auto it = records_.find(k);
    if (it != records_.end())
      out.emplace(k, it->second);
  }
  return make_ready_future<std::optional<StoreMap>>(std::move(out));
}

Future<bool> FileStore::set(const StoreMap &mapping) {
  ++stats_.writes;
  if (!ready_) {
    ++stats_.write_failures;
    return make_ready_future(false);
  }
  auto previous = records_;
  for (const auto &[k, v] : mapping)
    records_[k] = v;
  std::string err;
  if (!write_all(&err)) {
    records_ = std::move(previous);
    ++stats_.write_failures;
    spdlog::warn("file store write failed: {}", err);
    return make_ready_future(false);
  }
  stats_.records = records_.size();
  return make_ready_future(true);
}

bool FileStore::write_all(std::string *err) {
  const std::string tmp = path() + ".tmp";
  const std::string final = path();
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      if (err)
        *err = "cannot open " + tmp;
      return false;
    }
    for (const auto &[k, v] : records_)
      out << escape_field(k) << '\t' << escape_field(v) << '\n';
    out.flush();
    if (!out) {
      if (err)
        *err = "short write to " + tmp;
      return false;
    }
  }
  if (cfg_.fsync && !fsync_path(tmp, O_RDONLY)) {
    if (err)
      *err = "fsync failed";
    return false;
  }
  if (std::rename(tmp.c_str(), final.c_str()) != 0) {
    if (err)
      *err = "rename failed";
    return false;
  }
  if (cfg_.fsync && !fsync_path(cfg_.dir, O_RDONLY | O_DIRECTORY)) {
    if (err)
      *err = "directory fsync failed";
    return false;
  }
  return true;
}

} // namespace geo_resolver
