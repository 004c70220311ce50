#include "sim_index.hh"

#include <algorithm>

#include "bk_tree.hh"
#include "mih_index.hh"

namespace imdupe {

inline namespace detail_v1 {

void similarity_index_t::sort_matches(std::vector<match_t> &matches) {
  std::sort(matches.begin(), matches.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.distance != rhs.distance) {
                return lhs.distance < rhs.distance;
              }
              return lhs.pos < rhs.pos;
            });
}

void similarity_index_t::build() {
  clear();
  for (std::size_t pos = 0; pos < _store.size(); ++pos) {
    insert(pos);
  }
}

void linear_index_t::insert(std::size_t pos) { _positions.push_back(pos); }

std::vector<match_t> linear_index_t::query(const fingerprint_t &fp,
                                           uint32_t threshold) const {
  std::vector<match_t> matches;
  for (auto pos : _positions) {
    const auto dist = hamming_distance(fp, _store.at(pos).fingerprint());
    if (dist <= threshold) {
      matches.push_back({pos, dist});
    }
  }
  sort_matches(matches);
  return matches;
}

std::optional<index_kind_t> index_kind_from_name(std::string_view name) {
  if (name == "mih") {
    return index_kind_t::mih;
  }
  if (name == "bk" || name == "bktree") {
    return index_kind_t::bktree;
  }
  if (name == "linear") {
    return index_kind_t::linear;
  }
  return std::nullopt;
}

std::unique_ptr<similarity_index_t> make_index(index_kind_t kind,
                                               const fp_store_t &store,
                                               uint32_t max_threshold) {
  switch (kind) {
    case index_kind_t::bktree:
      return std::make_unique<bk_tree_t>(store);
    case index_kind_t::linear:
      return std::make_unique<linear_index_t>(store);
    case index_kind_t::mih:
    default:
      return std::make_unique<mih_index_t>(store, max_threshold);
  }
}

}  // namespace detail_v1

}  // namespace imdupe
