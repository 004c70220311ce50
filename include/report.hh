#pragma once

#include <cstdint>
#include <iosfwd>

#include "fp_store.hh"
#include "grouper.hh"
#include "imdupe.hh"

namespace imdupe {

inline namespace detail_v1 {

struct report_opts_t {
  uint32_t threshold = default_threshold;
  bool refine = false;      // drop members far from most of their group
  bool singletons = false;  // print groups of one
};

/**
 * @brief tighten a chained group: a member is dropped when its distance
 * exceeds threshold from more than half the group, itself included in the
 * count. Distances are measured against the unrefined group, edges to
 * dropped members go too.
 */
dupe_group_t refine_group(const fp_store_t &store, const dupe_group_t &grp,
                          uint32_t threshold);

/**
 * @brief print groups separated by "----" lines, each member on a line and
 * each edge indented with its distance, then the skipped images and cache
 * warnings
 */
void print_report(std::ostream &os, const run_result_t &result,
                  const report_opts_t &opts);

}  // namespace detail_v1

}  // namespace imdupe
