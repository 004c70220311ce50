#pragma once

#include <filesystem>

#include "decoder.hh"

namespace imdupe {

inline namespace detail_v1 {

// decodes with OpenCV, grayscale, area-resized to grid_side x grid_side
class cv_decoder_t final : public decoder_t {
 public:
  pixel_grid_t decode(const std::filesystem::path &path) const override;
};

}  // namespace detail_v1

}  // namespace imdupe
