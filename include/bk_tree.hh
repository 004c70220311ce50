#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "sim_index.hh"

namespace imdupe {

inline namespace detail_v1 {

/**
 * @brief BK-tree over Hamming distance.
 *
 * Each child edge is labelled with the distance between parent and child.
 * A search at distance d from a node only descends into edges labelled
 * within [d - threshold, d + threshold], which the triangle inequality
 * guarantees loses no match. Insert and search are iterative.
 */
class bk_tree_t final : public similarity_index_t {
  struct node_t {
    std::size_t pos;
    std::map<uint32_t, std::size_t> children;  // edge label -> node
  };
  std::vector<node_t> _nodes;

 public:
  using similarity_index_t::similarity_index_t;

  void insert(std::size_t pos) override;
  std::vector<match_t> query(const fingerprint_t &fp,
                             uint32_t threshold) const override;
  void clear() override { _nodes.clear(); }
  std::size_t size() const noexcept override { return _nodes.size(); }
};

}  // namespace detail_v1

}  // namespace imdupe
