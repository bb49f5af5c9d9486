#include "histo/hash.hpp"
#include "histo/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace histo {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

} // namespace

Hash sha256(std::span<const std::uint8_t> data) {
  Hash out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(EVP_sha256) failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

std::string to_hex(const Hash &h) {
  std::string s;
  s.reserve(consts::kHashHexLen);
  for (const std::uint8_t b : h) {
    s.push_back(kHexDigits[b >> 4]);
    s.push_back(kHexDigits[b & 0xF]);
  }
  return s;
}

bool from_hex(std::string_view hex, Hash &out) {
  if (hex.size() != consts::kHashHexLen) {
    return false;
  }
  Hash tmp{};
  for (std::size_t i = 0; i < tmp.size(); ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    tmp[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = tmp;
  return true;
}

} // namespace histo
