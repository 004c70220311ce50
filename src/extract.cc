#include "extract.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace imdupe {

inline namespace detail_v1 {

uint32_t hash_side(hash_algo_t algo) noexcept {
  switch (algo) {
    case hash_algo_t::dhash256:
      return 16U;
    case hash_algo_t::dhash64:
    default:
      return 8U;
  }
}

std::optional<hash_algo_t> algo_from_bits(uint32_t bits) noexcept {
  if (bits == 64U) {
    return hash_algo_t::dhash64;
  }
  if (bits == 256U) {
    return hash_algo_t::dhash256;
  }
  return std::nullopt;
}

// (source index, coverage) pairs for each output cell of one axis.
// Coverages are in units of 1/dst_len source pixels, so every output cell
// sums to src_len exactly and no rounding happens before the final divide.
using axis_weights_t = std::vector<std::vector<std::pair<uint32_t, uint64_t>>>;

static axis_weights_t area_weights(uint32_t src_len, uint32_t dst_len) {
  axis_weights_t weights(dst_len);
  for (auto j = 0U; j < dst_len; ++j) {
    const uint64_t out_st = (uint64_t)j * src_len;
    const uint64_t out_ed = out_st + src_len;
    const auto first = (uint32_t)(out_st / dst_len);
    for (auto i = first; i < src_len; ++i) {
      const uint64_t in_st = (uint64_t)i * dst_len;
      const uint64_t in_ed = in_st + dst_len;
      if (in_st >= out_ed) {
        break;
      }
      const auto overlap = std::min(in_ed, out_ed) - std::max(in_st, out_st);
      if (overlap > 0) {
        weights[j].emplace_back(i, overlap);
      }
    }
  }
  return weights;
}

// area-averaged resample of the whole grid to cols x rows cells
static std::vector<uint32_t> downsample(const pixel_grid_t &grid,
                                        uint32_t cols, uint32_t rows) {
  const auto wx = area_weights(grid.width, cols);
  const auto wy = area_weights(grid.height, rows);

  // horizontal pass keeps every source row
  std::vector<uint64_t> tmp((std::size_t)grid.height * cols, 0UL);
  for (auto r = 0U; r < grid.height; ++r) {
    for (auto c = 0U; c < cols; ++c) {
      uint64_t acc = 0;
      for (const auto &[i, w] : wx[c]) {
        acc += w * grid.at(r, i);
      }
      tmp[(std::size_t)r * cols + c] = acc;
    }
  }

  const uint64_t denom = (uint64_t)grid.width * grid.height;
  std::vector<uint32_t> cells((std::size_t)rows * cols, 0U);
  for (auto r = 0U; r < rows; ++r) {
    for (auto c = 0U; c < cols; ++c) {
      uint64_t acc = 0;
      for (const auto &[i, w] : wy[r]) {
        acc += w * tmp[(std::size_t)i * cols + c];
      }
      // round half up
      cells[(std::size_t)r * cols + c] = (uint32_t)((acc + denom / 2) / denom);
    }
  }
  return cells;
}

fingerprint_t extract(const pixel_grid_t &grid, hash_algo_t algo) {
  if (!grid.valid()) {
    throw std::invalid_argument("extract: invalid pixel grid");
  }
  const auto side = hash_side(algo);
  const auto cols = side + 1U;
  const auto cells = downsample(grid, cols, side);

  fingerprint_t fp(side * side);
  for (auto r = 0U; r < side; ++r) {
    for (auto c = 0U; c < side; ++c) {
      const auto left = cells[(std::size_t)r * cols + c];
      const auto right = cells[(std::size_t)r * cols + c + 1U];
      if (left > right) {
        fp.set(r * side + c);
      }
    }
  }
  return fp;
}

}  // namespace detail_v1

}  // namespace imdupe
