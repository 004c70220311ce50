#pragma once

#include <filesystem>

#include "pixel_grid.hh"

namespace imdupe {

inline namespace detail_v1 {

/**
 * @brief image decoding capability used by the pipeline.
 *
 * Implementations must be safe to call from several pool threads at once.
 */
class decoder_t {
 public:
  virtual ~decoder_t() = default;

  /**
   * @brief decode an image file into a normalized grayscale grid
   *
   * @param path image file
   * @return grid_side x grid_side grid
   * @throws decode_error if the file cannot be decoded
   */
  virtual pixel_grid_t decode(const std::filesystem::path &path) const = 0;
};

}  // namespace detail_v1

}  // namespace imdupe
