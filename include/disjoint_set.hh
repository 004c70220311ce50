#pragma once

#include <cstddef>
#include <vector>

namespace imdupe {

inline namespace detail_v1 {

/**
 * @brief union-find with union by size and path compression.
 *
 * find is iterative so long chains cannot exhaust the stack. On equal sizes
 * the lower element becomes the root, which keeps roots reproducible for a
 * fixed sequence of unions.
 */
class disjoint_set_t {
  std::vector<std::size_t> _parent;
  std::vector<std::size_t> _size;

 public:
  explicit disjoint_set_t(std::size_t count);

  std::size_t find(std::size_t elem);

  // true if two sets were merged
  bool unite(std::size_t lhs, std::size_t rhs);

  inline std::size_t set_size(std::size_t elem) { return _size[find(elem)]; }
  inline std::size_t size() const noexcept { return _parent.size(); }
};

}  // namespace detail_v1

}  // namespace imdupe
