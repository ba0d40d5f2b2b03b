#pragma once

#include "geo_resolver/future.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geo_resolver {

using StoreMap = std::unordered_map<std::string, std::string>;

// Asynchronous key/value persistence. A failed read resolves to nullopt and a
// failed write to false; implementations never throw.
class IDurableStore {
public:
  virtual ~IDurableStore() = default;
  virtual Future<std::optional<StoreMap>> get(const std::vector<std::string> &keys) = 0;
  virtual Future<bool> set(const StoreMap &mapping) = 0;
};

struct FileStoreConfig {
  std::string dir{"./data"};
  std::string file{"store.tsv"};
  bool fsync{true};
};

struct FileStoreStats {
  std::uint64_t reads{0};
  std::uint64_t writes{0};
  std::uint64_t write_failures{0};
  std::size_t records{0};
};

// One record per line: key TAB escaped-value. Every write rewrites the file
// through a temp file that is fsync'd and renamed into place.
class FileStore final : public IDurableStore {
public:
  explicit FileStore(FileStoreConfig cfg);

  bool init(std::string *err = nullptr);

  Future<std::optional<StoreMap>> get(const std::vector<std::string> &keys) override;
  Future<bool> set(const StoreMap &mapping) override;

  const StoreMap &records() const { return records_; }
  const FileStoreStats &stats() const { return stats_; }

private:
  std::string path() const;
  bool write_all(std::string *err);

  FileStoreConfig cfg_;
  FileStoreStats stats_;
  StoreMap records_;
  bool ready_{false};
};

} // namespace geo_resolver
