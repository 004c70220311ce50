#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "fingerprint.hh"
#include "pixel_grid.hh"

namespace imdupe {

inline namespace detail_v1 {

// fingerprint algorithm, fixed for a run and recorded in the cache header
enum class hash_algo_t {
  dhash64,   // 9x8 difference hash
  dhash256   // 17x16 difference hash
};

// side N of the N x N comparison grid
uint32_t hash_side(hash_algo_t algo) noexcept;

inline uint32_t hash_bits(hash_algo_t algo) noexcept {
  return hash_side(algo) * hash_side(algo);
}

// algorithm family written to the cache header
inline constexpr std::string_view algo_name = "dhash";

// 64 or 256, anything else has no algorithm
std::optional<hash_algo_t> algo_from_bits(uint32_t bits) noexcept;

/**
 * @brief difference hash of a grid.
 *
 * The grid is area-averaged down to (N + 1) x N cells, each cell rounded to
 * an integer intensity, and bit r * N + c is set iff cell (r, c) is brighter
 * than cell (r, c + 1).
 *
 * @param grid any valid grid, normally grid_side x grid_side
 * @param algo selects N
 * @throws std::invalid_argument if the grid is not valid
 */
fingerprint_t extract(const pixel_grid_t &grid, hash_algo_t algo);

}  // namespace detail_v1

}  // namespace imdupe
