#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fp_store.hh"
#include "sim_index.hh"

namespace imdupe {

inline namespace detail_v1 {

// lhs < rhs, both store positions
struct similarity_edge_t {
  std::size_t lhs;
  std::size_t rhs;
  uint32_t distance;

  bool operator==(const similarity_edge_t &rhs) const noexcept = default;
};

/**
 * @brief one connected component of the similarity graph.
 *
 * members and positions are parallel and in insertion order; edges are the
 * pairs found within the threshold, so a member may be far from another
 * member and only linked through a chain of edges.
 */
struct dupe_group_t {
  std::vector<std::string> members;
  std::vector<std::size_t> positions;
  std::vector<similarity_edge_t> edges;

  inline std::size_t size() const noexcept { return members.size(); }
};

/**
 * @brief partition every record of the store into duplicate groups
 *
 * Records are visited in insertion order, each one queried against the index
 * and united with every neighbour within threshold. Groups are returned in
 * order of their first member; singletons included.
 *
 * @param store records to group
 * @param index must already hold every record of store
 * @param threshold maximum Hamming distance of an edge
 * @throws std::invalid_argument if the index does not cover the store
 */
std::vector<dupe_group_t> group(const fp_store_t &store,
                                const similarity_index_t &index,
                                uint32_t threshold);

/**
 * @brief same partition as group, but the index is filled while grouping:
 * each record is queried against the records before it, then inserted.
 *
 * @param index empty index over store
 * @throws std::invalid_argument if the index is not empty
 */
std::vector<dupe_group_t> group_streaming(const fp_store_t &store,
                                          similarity_index_t &index,
                                          uint32_t threshold);

}  // namespace detail_v1

}  // namespace imdupe
