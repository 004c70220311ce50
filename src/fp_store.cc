#include "fp_store.hh"

#include <stdexcept>
#include <utility>

#include "error.hh"

namespace imdupe {

inline namespace detail_v1 {

std::size_t fp_store_t::insert(const std::string &id, fingerprint_t fp,
                               std::optional<file_meta_t> meta) {
  if (_pos_map.contains(id)) {
    throw duplicate_identifier_error(id);
  }
  if (fp.empty()) {
    throw std::invalid_argument("empty fingerprint: " + id);
  }
  if (!_records.empty() && fp.size() != fingerprint_bits()) {
    throw std::invalid_argument("fingerprint length mismatch: " + id);
  }
  const auto pos = _records.size();
  _records.emplace_back(id, std::move(fp), meta);
  _pos_map.emplace(id, pos);
  return pos;
}

const image_record_t &fp_store_t::get(const std::string &id) const {
  return _records[position(id)];
}

const image_record_t *fp_store_t::find(const std::string &id) const noexcept {
  auto it = _pos_map.find(id);
  if (it == _pos_map.end()) {
    return nullptr;
  }
  return &_records[it->second];
}

std::size_t fp_store_t::position(const std::string &id) const {
  auto it = _pos_map.find(id);
  if (it == _pos_map.end()) {
    throw not_found_error(id);
  }
  return it->second;
}

}  // namespace detail_v1

}  // namespace imdupe
