#include "bk_tree.hh"

#include <limits>

namespace imdupe {

inline namespace detail_v1 {

void bk_tree_t::insert(std::size_t pos) {
  const auto &fp = _store.at(pos).fingerprint();
  if (_nodes.empty()) {
    _nodes.push_back({pos, {}});
    return;
  }
  std::size_t cur = 0;
  while (true) {
    const auto dist =
        hamming_distance(fp, _store.at(_nodes[cur].pos).fingerprint());
    auto it = _nodes[cur].children.find(dist);
    if (it == _nodes[cur].children.end()) {
      // push_back may reallocate, take the index first
      const auto next = _nodes.size();
      _nodes[cur].children.emplace(dist, next);
      _nodes.push_back({pos, {}});
      return;
    }
    cur = it->second;
  }
}

std::vector<match_t> bk_tree_t::query(const fingerprint_t &fp,
                                      uint32_t threshold) const {
  std::vector<match_t> matches;
  if (_nodes.empty()) {
    return matches;
  }
  std::vector<std::size_t> stack{0};
  while (!stack.empty()) {
    const auto &node = _nodes[stack.back()];
    stack.pop_back();
    const auto dist = hamming_distance(fp, _store.at(node.pos).fingerprint());
    if (dist <= threshold) {
      matches.push_back({node.pos, dist});
    }
    const auto lo = dist > threshold ? dist - threshold : 0U;
    const auto hi = threshold > std::numeric_limits<uint32_t>::max() - dist
                        ? std::numeric_limits<uint32_t>::max()
                        : dist + threshold;
    for (auto it = node.children.lower_bound(lo);
         it != node.children.end() && it->first <= hi; ++it) {
      stack.push_back(it->second);
    }
  }
  sort_matches(matches);
  return matches;
}

}  // namespace detail_v1

}  // namespace imdupe
