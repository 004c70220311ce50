#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "config.hh"
#include "decoder.hh"
#include "extract.hh"
#include "fp_store.hh"
#include "grouper.hh"
#include "ls_dir_rec.hh"
#include "sim_index.hh"

namespace imdupe {

inline namespace detail_v1 {

struct config_t {
  std::vector<std::filesystem::path> search_dir;
  std::vector<std::regex> exclude_regex;
  uint32_t threshold = default_threshold;
  hash_algo_t algo = hash_algo_t::dhash64;
  index_kind_t index = index_kind_t::mih;
  uint32_t max_thread = default_max_thread;
  std::optional<std::filesystem::path> cache_path;
};

// image left out of the run and why
struct warning_t {
  std::string identifier;
  std::string reason;
};

struct run_result_t {
  fp_store_t store;
  std::vector<dupe_group_t> groups;
  std::vector<warning_t> skipped;
  // cache discarded or not saved, the run itself went on
  std::vector<std::string> cache_warnings;
  std::size_t cache_hits = 0;
  bool cancelled = false;
};

/**
 * @brief map the similarity percentage of the command line to a threshold,
 * 100% is 0 and 0% is a quarter of the fingerprint length
 *
 * @throws std::invalid_argument outside [0, 100]
 */
uint32_t similarity_to_threshold(double percent, uint32_t bits);

// default_threshold scaled from 64 bits to the fingerprint length of algo
uint32_t default_threshold_for(hash_algo_t algo) noexcept;

/**
 * @brief fingerprint the given images and group near duplicates.
 *
 * Cached fingerprints are reused when cfg.cache_path is set and the file
 * stamp still matches; everything else is decoded and hashed on a thread
 * pool. Records enter the store in the order of entries. Images that fail to
 * decode are skipped with a warning. Once cancel is set no new image is
 * started, grouping is not run and the cache is left untouched.
 *
 * @param entries images to process, identifiers are their paths
 * @param cfg run configuration, search_dir and exclude_regex are unused
 * @param decoder decoding capability, called concurrently
 * @param cancel cooperative cancellation flag
 * @throws duplicate_identifier_error if a path appears twice
 * @throws cache_corrupt_error if the cache header is unreadable
 */
run_result_t run(const std::vector<image_entry_t> &entries,
                 const config_t &cfg, const decoder_t &decoder,
                 const std::atomic<bool> &cancel);

/**
 * @brief list the images under cfg.search_dir, then run on them
 */
run_result_t run(const config_t &cfg, const decoder_t &decoder,
                 const std::atomic<bool> &cancel);

}  // namespace detail_v1

}  // namespace imdupe
