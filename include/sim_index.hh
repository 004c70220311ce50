#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "fingerprint.hh"
#include "fp_store.hh"

namespace imdupe {

inline namespace detail_v1 {

// store position of an indexed record and its exact distance to the query
struct match_t {
  std::size_t pos;
  uint32_t distance;

  bool operator==(const match_t &rhs) const noexcept = default;
};

/**
 * @brief threshold-bounded Hamming search over the records of a store.
 *
 * An index refers to records by store position only and never modifies the
 * store; the store must outlive the index.
 */
class similarity_index_t {
 protected:
  const fp_store_t &_store;

  // (distance, position) ascending
  static void sort_matches(std::vector<match_t> &matches);

 public:
  explicit similarity_index_t(const fp_store_t &store) noexcept
      : _store(store) {}
  virtual ~similarity_index_t() = default;

  similarity_index_t(const similarity_index_t &) = delete;
  similarity_index_t &operator=(const similarity_index_t &) = delete;

  // drop everything and index every record currently in the store
  void build();

  /**
   * @brief index one more record
   *
   * @param pos store position, each position at most once
   */
  virtual void insert(std::size_t pos) = 0;

  /**
   * @brief every indexed record within Hamming distance threshold of fp,
   * ordered by (distance, position)
   *
   * @throws std::invalid_argument if fp length differs from the indexed ones
   */
  virtual std::vector<match_t> query(const fingerprint_t &fp,
                                     uint32_t threshold) const = 0;

  virtual void clear() = 0;
  virtual std::size_t size() const noexcept = 0;

  inline const fp_store_t &store() const noexcept { return _store; }
};

// brute-force scan, exact by construction
class linear_index_t final : public similarity_index_t {
  std::vector<std::size_t> _positions;

 public:
  using similarity_index_t::similarity_index_t;

  void insert(std::size_t pos) override;
  std::vector<match_t> query(const fingerprint_t &fp,
                             uint32_t threshold) const override;
  void clear() override { _positions.clear(); }
  std::size_t size() const noexcept override { return _positions.size(); }
};

enum class index_kind_t {
  mih,     // multi-index hashing
  bktree,  // BK-tree
  linear   // brute force
};

// "mih", "bk" or "linear"
std::optional<index_kind_t> index_kind_from_name(std::string_view name);

/**
 * @brief create an empty index of the given kind
 *
 * @param max_threshold largest threshold queries are expected to use, lets
 * multi-index hashing pick its block count
 */
std::unique_ptr<similarity_index_t> make_index(index_kind_t kind,
                                               const fp_store_t &store,
                                               uint32_t max_threshold);

}  // namespace detail_v1

}  // namespace imdupe
