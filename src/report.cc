#include "report.hh"

#include <algorithm>
#include <ostream>

namespace imdupe {

inline namespace detail_v1 {

dupe_group_t refine_group(const fp_store_t &store, const dupe_group_t &grp,
                          uint32_t threshold) {
  const auto n = grp.size();
  if (n < 3) {
    // a pair is within threshold by construction
    return grp;
  }
  std::vector<bool> keep(n, true);
  for (std::size_t i = 0; i < n; ++i) {
    const auto &fp = store.at(grp.positions[i]).fingerprint();
    std::size_t far = 0;
    for (std::size_t j = 0; j < n; ++j) {
      if (i != j &&
          hamming_distance(fp, store.at(grp.positions[j]).fingerprint()) >
              threshold) {
        ++far;
      }
    }
    // own distance is 0, never far
    if (2 * far > n) {
      keep[i] = false;
    }
  }

  dupe_group_t refined;
  for (std::size_t i = 0; i < n; ++i) {
    if (keep[i]) {
      refined.members.push_back(grp.members[i]);
      refined.positions.push_back(grp.positions[i]);
    }
  }
  auto kept = [&](std::size_t pos) {
    return std::binary_search(refined.positions.begin(),
                              refined.positions.end(), pos);
  };
  for (const auto &edge : grp.edges) {
    if (kept(edge.lhs) && kept(edge.rhs)) {
      refined.edges.push_back(edge);
    }
  }
  return refined;
}

void IMDUPE_EXPORT print_report(std::ostream &os, const run_result_t &result,
                                const report_opts_t &opts) {
  std::size_t printed = 0;
  for (const auto &raw : result.groups) {
    const auto grp =
        opts.refine ? refine_group(result.store, raw, opts.threshold) : raw;
    if (grp.size() == 0 || (grp.size() < 2 && !opts.singletons)) {
      continue;
    }
    ++printed;
    os << "----\n";
    for (const auto &member : grp.members) {
      os << member << '\n';
    }
    for (const auto &edge : grp.edges) {
      os << "  " << result.store.at(edge.lhs).id() << " ~ "
         << result.store.at(edge.rhs).id() << ": " << edge.distance << '\n';
    }
  }
  if (printed > 0) {
    os << "----\n";
  }
  os << "groups: " << printed << '\n';
  os << "skipped: " << result.skipped.size() << '\n';
  for (const auto &warn : result.skipped) {
    os << warn.identifier << ": " << warn.reason << '\n';
  }
  for (const auto &warn : result.cache_warnings) {
    os << "cache: " << warn << '\n';
  }
  if (result.cancelled) {
    os << "cancelled\n";
  }
}

}  // namespace detail_v1

}  // namespace imdupe
