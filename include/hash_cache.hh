#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>

#include "extract.hh"
#include "fingerprint.hh"
#include "fp_store.hh"
#include "image_record.hh"

namespace imdupe {

inline namespace detail_v1 {

struct cache_entry_t {
  fingerprint_t fp;
  file_meta_t meta;
};

/**
 * @brief fingerprints persisted by an earlier run, keyed by identifier.
 *
 * File layout, one item per line:
 *   imdupe-cache <format version> dhash <bits>
 *   <hex fingerprint>\t<size>\t<mtime>\t<identifier>
 *   ...
 *   # xxh3 <XXH3-64 of every record line, newline included>
 *
 * A cache is only usable with the algorithm it was written with; any other
 * header is discarded as a whole.
 */
class hash_cache_t {
  hash_algo_t _algo;
  std::unordered_map<std::string, cache_entry_t> _entries;

  void parse_header(const std::string &line) const;

 public:
  explicit hash_cache_t(hash_algo_t algo) noexcept : _algo(algo) {}

  /**
   * @brief replace the content with a cache file, a missing file loads as
   * empty
   *
   * @return reason the file content was discarded, nullopt if it was used
   * @throws cache_corrupt_error if the header cannot be read at all
   */
  std::optional<std::string> load(const std::filesystem::path &path);
  std::optional<std::string> load(std::istream &is);

  /**
   * @brief write every store record that carries file metadata,
   * through a temporary file renamed over path
   *
   * @throws std::runtime_error on I/O failure
   */
  void save(const std::filesystem::path &path, const fp_store_t &store) const;
  void write(std::ostream &os, const fp_store_t &store) const;

  // entry for id if its stamp still matches meta
  const cache_entry_t *lookup(const std::string &id,
                              const file_meta_t &meta) const noexcept;

  inline hash_algo_t algo() const noexcept { return _algo; }
  inline std::size_t size() const noexcept { return _entries.size(); }
  inline void clear() noexcept { _entries.clear(); }
};

}  // namespace detail_v1

}  // namespace imdupe
