#include "grouper.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "disjoint_set.hh"

namespace imdupe {

inline namespace detail_v1 {

// collect components of the union-find into groups ordered by first member
static std::vector<dupe_group_t> collect(const fp_store_t &store,
                                         disjoint_set_t &sets,
                                         std::vector<similarity_edge_t> &edges) {
  constexpr auto unset = std::numeric_limits<std::size_t>::max();
  std::vector<std::size_t> group_of_root(store.size(), unset);
  std::vector<dupe_group_t> groups;
  for (std::size_t pos = 0; pos < store.size(); ++pos) {
    const auto root = sets.find(pos);
    if (group_of_root[root] == unset) {
      group_of_root[root] = groups.size();
      groups.emplace_back();
    }
    auto &grp = groups[group_of_root[root]];
    grp.members.push_back(store.at(pos).id());
    grp.positions.push_back(pos);
  }
  std::sort(edges.begin(), edges.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.lhs != rhs.lhs ? lhs.lhs < rhs.lhs : lhs.rhs < rhs.rhs;
  });
  for (auto &edge : edges) {
    groups[group_of_root[sets.find(edge.lhs)]].edges.push_back(edge);
  }
  return groups;
}

std::vector<dupe_group_t> group(const fp_store_t &store,
                                const similarity_index_t &index,
                                uint32_t threshold) {
  if (&index.store() != &store || index.size() != store.size()) {
    throw std::invalid_argument("group: index does not cover the store");
  }
  disjoint_set_t sets(store.size());
  std::vector<similarity_edge_t> edges;
  for (std::size_t pos = 0; pos < store.size(); ++pos) {
    for (const auto &match :
         index.query(store.at(pos).fingerprint(), threshold)) {
      // each unordered pair is seen from both ends, keep the later one
      if (match.pos <= pos) {
        continue;
      }
      sets.unite(pos, match.pos);
      edges.push_back({pos, match.pos, match.distance});
    }
  }
  return collect(store, sets, edges);
}

std::vector<dupe_group_t> group_streaming(const fp_store_t &store,
                                          similarity_index_t &index,
                                          uint32_t threshold) {
  if (&index.store() != &store || index.size() != 0) {
    throw std::invalid_argument("group_streaming: index must start empty");
  }
  disjoint_set_t sets(store.size());
  std::vector<similarity_edge_t> edges;
  for (std::size_t pos = 0; pos < store.size(); ++pos) {
    for (const auto &match :
         index.query(store.at(pos).fingerprint(), threshold)) {
      sets.unite(match.pos, pos);
      edges.push_back({match.pos, pos, match.distance});
    }
    index.insert(pos);
  }
  return collect(store, sets, edges);
}

}  // namespace detail_v1

}  // namespace imdupe
