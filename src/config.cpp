#include "histo/config.hpp"

#include "histo/consts.hpp"
#include "histo/fs.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool parse_bool(std::string_view key, const std::string &value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw std::invalid_argument("config: bad boolean for " + std::string(key) + ": " + value);
}

std::size_t parse_count(std::string_view key, const std::string &value) {
  std::size_t n = 0;
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, n);
  if (ec != std::errc{} || ptr != end) {
    throw std::invalid_argument("config: bad number for " + std::string(key) + ": " + value);
  }
  return n;
}

} // namespace

namespace histo {

std::filesystem::path cfg_path(const std::filesystem::path &base) {
  return base / consts::kConfigFile;
}

auto load_store_config(const std::filesystem::path &base) -> StoreConfig {
  StoreConfig out{};
  const auto path = cfg_path(base);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = trim(sv.substr(0, colon));
    const std::string value = trim(sv.substr(colon + 1));
    if (key == "compress") {
      out.compress = parse_bool(key, value);
    } else if (key == "verify") {
      out.verify = parse_bool(key, value);
    } else if (key == "jobs") {
      out.jobs = parse_count(key, value);
    }
  }
  return out;
}

void save_store_config(const std::filesystem::path &base, const StoreConfig &cfg) {
  std::ostringstream os;
  os << "compress: " << (cfg.compress ? "true" : "false") << '\n'
     << "verify: " << (cfg.verify ? "true" : "false") << '\n'
     << "jobs: " << cfg.jobs << '\n';

  const auto path = cfg_path(base);
  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::ensure_parent_dir(path);
  fs::write_file_atomic(path, std::span(data, s.size()));
}

} // namespace histo
