#pragma once
#include "histo/config.hpp"
#include "histo/file.hpp"
#include "histo/hash.hpp"
#include "histo/object.hpp"

#include <filesystem>
#include <string_view>

namespace histo {

/**
 * Reads and writes single objects under a base directory. Holds nothing but
 * the base path and settings; every call goes straight to the filesystem.
 */
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path base, StoreConfig config = {})
    : base_(std::move(base)), config_(config) {}

  [[nodiscard]] const std::filesystem::path &base() const { return base_; }
  [[nodiscard]] const StoreConfig &config() const { return config_; }

  // Idempotent mkdir -p of <base>/<storage_name(kind)>.
  void ensure_kind_dir(ObjectKind kind) const;

  // Write a hash-addressed object, overwriting identical content. Returns its hash.
  Hash write(const File &file) const;

  // Write the object under `name` (named kinds only), last writer wins.
  void write_named(std::string_view name, const File &file) const;

  // Read the object `hash` of `kind`; verified against its content hash if
  // config().verify. Throws NotFound if absent.
  [[nodiscard]] File read(ObjectKind kind, const Hash &hash) const;

  // Read the object stored under `name`. Throws NotFound if absent.
  [[nodiscard]] File read_named(ObjectKind kind, std::string_view name) const;

private:
  [[nodiscard]] std::vector<std::uint8_t> load(const std::filesystem::path &p) const;
  void store(const std::filesystem::path &p, const File &file) const;

  std::filesystem::path base_;
  StoreConfig config_;
};

} // namespace histo
