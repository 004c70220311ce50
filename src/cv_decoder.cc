#include "cv_decoder.hh"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "config.hh"
#include "error.hh"

namespace imdupe {

inline namespace detail_v1 {

pixel_grid_t cv_decoder_t::decode(const std::filesystem::path &path) const {
  cv::Mat norm;
  try {
    const auto img = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    if (img.empty()) {
      throw decode_error("unsupported or corrupt image");
    }
    cv::resize(img, norm, cv::Size((int)grid_side, (int)grid_side), 0, 0,
               cv::INTER_AREA);
  } catch (const cv::Exception &e) {
    throw decode_error(e.what());
  }
  if (!norm.isContinuous()) {
    norm = norm.clone();
  }

  pixel_grid_t grid;
  grid.width = grid_side;
  grid.height = grid_side;
  grid.data.assign(norm.datastart, norm.dataend);
  return grid;
}

}  // namespace detail_v1

}  // namespace imdupe
