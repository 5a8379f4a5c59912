#include <shotimport/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <shotimport/core/image.hpp>
#include <opencv2/imgcodecs.hpp>
#include <memory>

namespace shotimport::vision {

namespace nc = shotimport::core;

std::expected<nc::RawInput, nc::ImportError> load_raw_input(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) {
    return std::unexpected(nc::make_error(nc::ErrorCode::LoadFailed, "cannot decode " + path));
  }
  if (mat.depth() != CV_8U) {
    return std::unexpected(
        nc::make_error(nc::ErrorCode::LoadFailed, "unsupported bit depth in " + path));
  }

  nc::PixelFormat format = nc::PixelFormat::BGR8;
  if (mat.channels() == 1) format = nc::PixelFormat::Grayscale8;
  else if (mat.channels() == 4) format = nc::PixelFormat::BGRA8;

  auto image = std::make_shared<const nc::Image>(detail::mat_to_image(mat, format));
  nc::RawInput input;
  input.width = image->width();
  input.height = image->height();
  input.image = std::move(image);
  input.source = path;
  return input;
}

}  // namespace shotimport::vision
