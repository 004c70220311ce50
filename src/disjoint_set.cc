#include "disjoint_set.hh"

#include <numeric>
#include <utility>

namespace imdupe {

inline namespace detail_v1 {

disjoint_set_t::disjoint_set_t(std::size_t count)
    : _parent(count), _size(count, 1) {
  std::iota(_parent.begin(), _parent.end(), 0UL);
}

std::size_t disjoint_set_t::find(std::size_t elem) {
  auto root = elem;
  while (_parent[root] != root) {
    root = _parent[root];
  }
  // second pass points the whole path at the root
  while (_parent[elem] != root) {
    elem = std::exchange(_parent[elem], root);
  }
  return root;
}

bool disjoint_set_t::unite(std::size_t lhs, std::size_t rhs) {
  auto lroot = find(lhs);
  auto rroot = find(rhs);
  if (lroot == rroot) {
    return false;
  }
  if (_size[lroot] < _size[rroot] ||
      (_size[lroot] == _size[rroot] && rroot < lroot)) {
    std::swap(lroot, rroot);
  }
  _parent[rroot] = lroot;
  _size[lroot] += _size[rroot];
  return true;
}

}  // namespace detail_v1

}  // namespace imdupe
