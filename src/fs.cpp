#include "histo/fs.hpp"

#include "histo/consts.hpp"
#include "histo/error.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <zlib.h>

namespace histo::fs {

namespace {

// Unique per process and thread, so concurrent writers of one path never
// share a temp file.
std::filesystem::path temp_sibling(const std::filesystem::path &p) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  auto tmp = p;
  tmp += std::string(consts::kTmpMarker) + std::to_string(tid) + "." +
         std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  return tmp;
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec && !std::filesystem::is_directory(dir)) {
    throw IoError("mkdir -p failed: " + dir.string() + ": " + ec.message());
  }
}

void ensure_parent_dir(const std::filesystem::path &p) { ensure_dir(p.parent_path()); }

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::error_code ec;
  const auto st = std::filesystem::status(p, ec);
  if (st.type() == std::filesystem::file_type::not_found) {
    throw NotFound(p);
  }
  if (ec) {
    throw IoError("stat failed: " + p.string() + ": " + ec.message());
  }
  if (st.type() != std::filesystem::file_type::regular) {
    throw IoError("not a regular file: " + p.string());
  }
  const auto n = static_cast<std::size_t>(std::filesystem::file_size(p, ec));
  if (ec) {
    throw IoError("size failed: " + p.string() + ": " + ec.message());
  }

  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    const int err = errno;
    if (!histo::fs::exists(p)) {
      throw NotFound(p);
    }
    throw IoError("open for read failed: " + p.string() + ": " + std::strerror(err));
  }
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs || ifs.gcount() != static_cast<std::streamsize>(n))
    throw IoError("short read: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  const auto tmp = temp_sibling(p);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw IoError("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw IoError("flush temp failed: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw IoError("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw SerializationError("zlib compress failed");
  out.resize(bound);
  return out;
}

// Inflate one complete zlib stream. Input that ends early or carries bytes
// past the end of the stream is rejected.
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw SerializationError("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 4096> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw SerializationError(rc == Z_BUF_ERROR ? "zlib stream truncated"
                                                 : "zlib stream corrupt");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs.avail_out));
  }
  const auto trailing = zs.avail_in;
  inflateEnd(&zs);
  if (trailing != 0) {
    throw SerializationError("zlib stream followed by " + std::to_string(trailing) + " bytes");
  }
  return out;
}

} // namespace histo::fs
