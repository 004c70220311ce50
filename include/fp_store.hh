#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "image_record.hh"

namespace imdupe {

inline namespace detail_v1 {

/**
 * @brief append-only collection of image records for one run,
 * iterated in insertion order.
 *
 * Positions returned by insert stay valid for the lifetime of the store and
 * are what indexes and the grouper refer to.
 */
class fp_store_t {
  std::vector<image_record_t> _records;
  std::unordered_map<std::string, std::size_t> _pos_map;

 public:
  using const_iterator = std::vector<image_record_t>::const_iterator;

  fp_store_t() = default;
  fp_store_t(const fp_store_t &) = delete;
  fp_store_t(fp_store_t &&) = default;
  fp_store_t &operator=(const fp_store_t &) = delete;
  fp_store_t &operator=(fp_store_t &&) = default;

  /**
   * @brief add a record
   *
   * @return position of the new record
   * @throws duplicate_identifier_error if id was already inserted
   * @throws std::invalid_argument if the fingerprint length differs from
   * the records already stored
   */
  std::size_t insert(const std::string &id, fingerprint_t fp,
                     std::optional<file_meta_t> meta = std::nullopt);

  /**
   * @throws not_found_error if id was never inserted
   */
  const image_record_t &get(const std::string &id) const;

  // nullptr if absent
  const image_record_t *find(const std::string &id) const noexcept;

  /**
   * @throws not_found_error if id was never inserted
   */
  std::size_t position(const std::string &id) const;

  inline const image_record_t &at(std::size_t pos) const {
    return _records.at(pos);
  }
  inline std::size_t size() const noexcept { return _records.size(); }
  inline bool empty() const noexcept { return _records.empty(); }

  // length shared by every fingerprint, 0 while empty
  inline uint32_t fingerprint_bits() const noexcept {
    return _records.empty() ? 0U : _records.front().fingerprint().size();
  }

  inline const_iterator begin() const noexcept { return _records.begin(); }
  inline const_iterator end() const noexcept { return _records.end(); }
};

}  // namespace detail_v1

}  // namespace imdupe
