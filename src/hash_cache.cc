#include "hash_cache.hh"

#include <xxhash.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

#include "config.hh"
#include "error.hh"
#include "log.hh"

namespace imdupe {

inline namespace detail_v1 {

namespace {

// RAII wrapper for xxhash library.
class hasher_t {
  XXH3_state_t *_state;

 public:
  hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    if (XXH3_64bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw std::runtime_error("XXH3_64bits_reset_withSeed failed");
    }
  }
  ~hasher_t() noexcept {
    if (_state != nullptr) {
      XXH3_freeState(_state);
    }
  }

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void update(std::string_view data) {
    if (XXH3_64bits_update(_state, data.data(), data.size()) == XXH_ERROR) {
      throw std::runtime_error("XXH3_64bits_update failed");
    }
  }
  XXH64_hash_t digest() noexcept { return XXH3_64bits_digest(_state); }
};

constexpr std::string_view trailer_tag = "# xxh3 ";

template <typename Tp>
bool parse_num(std::string_view str, Tp &val) noexcept {
  const auto *first = str.data();
  const auto *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, val);
  return ec == std::errc() && ptr == last && first != last;
}

std::string to_hex64(uint64_t val) {
  std::ostringstream oss_hex;
  oss_hex.width(16);
  oss_hex.fill('0');
  oss_hex << std::hex << val;
  return oss_hex.str();
}

std::vector<std::string_view> split(std::string_view str, char delim,
                                    std::size_t max_parts) {
  std::vector<std::string_view> parts;
  while (parts.size() + 1 < max_parts) {
    const auto at = str.find(delim);
    if (at == std::string_view::npos) {
      break;
    }
    parts.push_back(str.substr(0, at));
    str.remove_prefix(at + 1);
  }
  parts.push_back(str);
  return parts;
}

}  // namespace

void hash_cache_t::parse_header(const std::string &line) const {
  std::istringstream iss(line);
  std::string magic, version_str, name, bits_str, rest;
  iss >> magic >> version_str >> name >> bits_str;
  uint32_t version = 0;
  uint32_t bits = 0;
  if (magic != cache_magic || !parse_num(version_str, version) ||
      name.empty() || !parse_num(bits_str, bits) || (iss >> rest)) {
    throw cache_corrupt_error("unreadable cache header: " + line);
  }
  if (version != cache_format_version) {
    throw cache_version_mismatch(
        "cache format version " + std::to_string(version) + ", expected " +
        std::to_string(cache_format_version));
  }
  if (name != algo_name || bits != hash_bits(_algo)) {
    throw cache_version_mismatch(
        "cache holds " + name + " " + std::to_string(bits) +
        "-bit fingerprints, active algorithm is " + std::string(algo_name) +
        " " + std::to_string(hash_bits(_algo)) + "-bit");
  }
}

std::optional<std::string> hash_cache_t::load(
    const std::filesystem::path &path) {
  _entries.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    throw cache_corrupt_error("cannot open cache: " + path.string());
  }
  return load(ifs);
}

std::optional<std::string> hash_cache_t::load(std::istream &is) {
  _entries.clear();
  std::string line;
  if (!std::getline(is, line)) {
    throw cache_corrupt_error("missing cache header");
  }
  try {
    parse_header(line);
  } catch (const cache_version_mismatch &e) {
    return e.what();
  }

  const auto bits = hash_bits(_algo);
  std::unordered_map<std::string, cache_entry_t> entries;
  hasher_t hasher;
  std::size_t line_no = 1;
  auto discard = [&](const std::string &reason) {
    return reason + " at line " + std::to_string(line_no);
  };

  while (std::getline(is, line)) {
    ++line_no;
    if (line.starts_with(trailer_tag)) {
      uint64_t expect = 0;
      const std::string_view digest(line.data() + trailer_tag.size(),
                                    line.size() - trailer_tag.size());
      const auto *first = digest.data();
      const auto *last = first + digest.size();
      auto [ptr, ec] = std::from_chars(first, last, expect, 16);
      if (ec != std::errc() || ptr != last || first == last) {
        return discard("malformed cache checksum");
      }
      if (expect != hasher.digest()) {
        return discard("cache checksum mismatch");
      }
      _entries = std::move(entries);
      return std::nullopt;
    }

    hasher.update(line);
    hasher.update("\n");
    const auto parts = split(line, '\t', 4);
    if (parts.size() != 4 || parts[3].empty()) {
      return discard("malformed cache record");
    }
    cache_entry_t entry;
    try {
      entry.fp = fingerprint_t::from_hex(parts[0], bits);
    } catch (const std::invalid_argument &e) {
      return discard(e.what());
    }
    if (!parse_num(parts[1], entry.meta.size) ||
        !parse_num(parts[2], entry.meta.mtime)) {
      return discard("malformed cache record");
    }
    if (!entries.emplace(std::string(parts[3]), std::move(entry)).second) {
      return discard("duplicate cache record");
    }
  }
  return discard("missing cache checksum");
}

void hash_cache_t::write(std::ostream &os, const fp_store_t &store) const {
  os << cache_magic << ' ' << cache_format_version << ' ' << algo_name << ' '
     << hash_bits(_algo) << '\n';
  hasher_t hasher;
  for (const auto &rec : store) {
    if (!rec.meta().has_value()) {
      continue;
    }
    if (rec.id().find_first_of("\r\n") != std::string::npos) {
      oss(std::cerr) << "[warn] not caching identifier with line break: "
                     << rec.id() << '\n';
      continue;
    }
    if (rec.fingerprint().size() != hash_bits(_algo)) {
      throw std::invalid_argument("cache write: fingerprint length mismatch: " +
                                  rec.id());
    }
    std::string line = rec.fingerprint().to_hex();
    line += '\t';
    line += std::to_string(rec.meta()->size);
    line += '\t';
    line += std::to_string(rec.meta()->mtime);
    line += '\t';
    line += rec.id();
    line += '\n';
    hasher.update(line);
    os << line;
  }
  os << trailer_tag << to_hex64(hasher.digest()) << '\n';
}

void hash_cache_t::save(const std::filesystem::path &path,
                        const fp_store_t &store) const {
  auto tmp_path = path;
  tmp_path += ".tmp";
  try {
    {
      std::ofstream ofs(tmp_path, std::ios::out | std::ios::trunc);
      if (!ofs.is_open()) {
        throw std::runtime_error("cannot write cache: " + tmp_path.string());
      }
      write(ofs, store);
      ofs.flush();
      if (!ofs.good()) {
        throw std::runtime_error("cannot write cache: " + tmp_path.string());
      }
    }
    std::filesystem::rename(tmp_path, path);
  } catch (const std::exception &) {
    // no partial file left behind, the error still reaches the caller
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

const cache_entry_t *hash_cache_t::lookup(
    const std::string &id, const file_meta_t &meta) const noexcept {
  auto it = _entries.find(id);
  if (it == _entries.end() || !(it->second.meta == meta)) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace detail_v1

}  // namespace imdupe
