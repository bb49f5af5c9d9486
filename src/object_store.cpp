#include "histo/object_store.hpp"

#include "histo/error.hpp"
#include "histo/fs.hpp"

#include <stdexcept>
#include <string>

namespace hfs = histo::fs;

namespace histo {

void ObjectStore::ensure_kind_dir(ObjectKind kind) const { hfs::ensure_dir(kind_dir(base_, kind)); }

std::vector<std::uint8_t> ObjectStore::load(const std::filesystem::path &p) const {
  auto bytes = hfs::read_file(p);
  if (config_.compress) {
    return hfs::z_decompress(bytes);
  }
  return bytes;
}

void ObjectStore::store(const std::filesystem::path &p, const File &file) const {
  if (config_.compress) {
    hfs::write_file_atomic(p, hfs::z_compress(file.content));
  } else {
    hfs::write_file_atomic(p, file.content);
  }
}

Hash ObjectStore::write(const File &file) const {
  if (supports_named(file.kind)) {
    throw std::invalid_argument("objects of kind " + std::string(storage_name(file.kind)) +
                                " are stored by name only");
  }
  store(hashed_path(base_, file.kind, file.hash), file);
  return file.hash;
}

void ObjectStore::write_named(std::string_view name, const File &file) const {
  store(named_path(base_, file.kind, name), file);
}

File ObjectStore::read(ObjectKind kind, const Hash &hash) const {
  const auto path = hashed_path(base_, kind, hash);
  File file{.content = load(path), .hash = hash, .kind = kind};
  if (config_.verify && sha256(file.content) != hash) {
    throw SerializationError("content hash mismatch: " + path.string());
  }
  return file;
}

File ObjectStore::read_named(ObjectKind kind, std::string_view name) const {
  return File::from_content(kind, load(named_path(base_, kind, name)));
}

} // namespace histo
