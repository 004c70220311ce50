#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sim_index.hh"

namespace imdupe {

inline namespace detail_v1 {

/**
 * @brief multi-index hashing.
 *
 * The L fingerprint bits are cut into k contiguous blocks,
 * k = max(max_threshold + 1, ceil(L / 64)), and every record is bucketed by
 * the exact value of each block. Two fingerprints within distance
 * T <= max_threshold differ in at most T blocks, so with k > T they agree on
 * at least one block and share a bucket. Candidates are then verified with
 * the full distance.
 *
 * Queries above max_threshold, and layouts where k would exceed L, fall back
 * to a linear scan so results stay exact.
 */
class mih_index_t final : public similarity_index_t {
  using bucket_map_t = std::unordered_map<uint64_t, std::vector<std::size_t>>;

  uint32_t _max_threshold;
  uint32_t _bits = 0;
  bool _scan_only = false;
  // (first bit, width) per block
  std::vector<std::pair<uint32_t, uint32_t>> _blocks;
  std::vector<bucket_map_t> _tables;
  std::vector<std::size_t> _positions;

  void layout(uint32_t bits);
  std::vector<match_t> scan(const fingerprint_t &fp, uint32_t threshold) const;

 public:
  mih_index_t(const fp_store_t &store, uint32_t max_threshold) noexcept
      : similarity_index_t(store), _max_threshold(max_threshold) {}

  void insert(std::size_t pos) override;
  std::vector<match_t> query(const fingerprint_t &fp,
                             uint32_t threshold) const override;
  void clear() override;
  std::size_t size() const noexcept override { return _positions.size(); }

  // number of blocks in use, 0 before the first insert or in scan mode
  inline std::size_t block_count() const noexcept { return _blocks.size(); }
};

}  // namespace detail_v1

}  // namespace imdupe
