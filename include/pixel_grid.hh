#pragma once

#include <cstdint>
#include <vector>

namespace imdupe {

inline namespace detail_v1 {

// 8-bit grayscale intensities, row-major
struct pixel_grid_t {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> data;

  inline uint8_t at(uint32_t row, uint32_t col) const noexcept {
    return data[(std::size_t)row * width + col];
  }
  inline bool valid() const noexcept {
    return width > 0 && height > 0 &&
           data.size() == (std::size_t)width * height;
  }
};

}  // namespace detail_v1

}  // namespace imdupe
