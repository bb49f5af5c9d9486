#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace histo {

// Filesystem failure: permission, disk full, failed mkdir, short read.
class IoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A named or hash-addressed object that is absent from the store.
class NotFound : public IoError {
public:
  explicit NotFound(const std::filesystem::path &p)
      : IoError("object not found: " + p.string()), path_(p) {}

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Corrupt, truncated or kind-mismatched bytes, or a content hash mismatch.
class SerializationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace histo
