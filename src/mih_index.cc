#include "mih_index.hh"

#include <algorithm>
#include <stdexcept>

namespace imdupe {

inline namespace detail_v1 {

void mih_index_t::layout(uint32_t bits) {
  _bits = bits;
  const auto want = std::max(_max_threshold + 1U, div_ceil(bits, 64U));
  if (_max_threshold >= bits || want > bits) {
    // every pair is within the threshold, buckets would only add work
    _scan_only = true;
    return;
  }
  // widths differ by at most one bit, wider blocks first
  const auto base = bits / want;
  const auto extra = bits % want;
  auto first = 0U;
  for (auto b = 0U; b < want; ++b) {
    const auto width = base + (b < extra ? 1U : 0U);
    _blocks.emplace_back(first, width);
    first += width;
  }
  _tables.resize(_blocks.size());
}

void mih_index_t::insert(std::size_t pos) {
  const auto &fp = _store.at(pos).fingerprint();
  if (_bits == 0) {
    layout(fp.size());
  } else if (fp.size() != _bits) {
    throw std::invalid_argument("mih_index: fingerprint length mismatch");
  }
  _positions.push_back(pos);
  for (std::size_t b = 0; b < _blocks.size(); ++b) {
    const auto &[first, width] = _blocks[b];
    _tables[b][fp.slice(first, width)].push_back(pos);
  }
}

std::vector<match_t> mih_index_t::scan(const fingerprint_t &fp,
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

std::vector<match_t> mih_index_t::query(const fingerprint_t &fp,
                                        uint32_t threshold) const {
  if (_positions.empty()) {
    return {};
  }
  if (fp.size() != _bits) {
    throw std::invalid_argument("mih_index: fingerprint length mismatch");
  }
  if (_scan_only || threshold > _max_threshold) {
    return scan(fp, threshold);
  }

  // union of the buckets hit by each block of the query
  std::vector<std::size_t> candidates;
  for (std::size_t b = 0; b < _blocks.size(); ++b) {
    const auto &[first, width] = _blocks[b];
    auto it = _tables[b].find(fp.slice(first, width));
    if (it != _tables[b].end()) {
      candidates.insert(candidates.end(), it->second.begin(),
                        it->second.end());
    }
  }
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()),
                   candidates.end());

  std::vector<match_t> matches;
  for (auto pos : candidates) {
    const auto dist = hamming_distance(fp, _store.at(pos).fingerprint());
    if (dist <= threshold) {
      matches.push_back({pos, dist});
    }
  }
  sort_matches(matches);
  return matches;
}

void mih_index_t::clear() {
  _bits = 0;
  _scan_only = false;
  _blocks.clear();
  _tables.clear();
  _positions.clear();
}

}  // namespace detail_v1

}  // namespace imdupe
