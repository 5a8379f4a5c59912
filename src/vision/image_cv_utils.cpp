#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

namespace shotimport::vision::detail {

namespace nc = shotimport::core;

std::optional<cv::Mat> image_to_mat(const nc::Image& image) {
  if (image.empty() || !image.consistent()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  const std::size_t step = static_cast<std::size_t>(image.width()) *
                           nc::Image::channels(image.format());
  void* data = const_cast<std::byte*>(image.pixels().data());

  switch (image.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::RGBA8:
    case nc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

nc::Image mat_to_image(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Image();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return nc::Image(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> to_gray(const nc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (image.format()) {
    case nc::PixelFormat::Grayscale8:
      gray = mat->clone();
      break;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case nc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case nc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

cv::Rect clip_to(const nc::Bounds& bounds, int width, int height) {
  const cv::Rect rect(static_cast<int>(std::lround(bounds.x)),
                      static_cast<int>(std::lround(bounds.y)),
                      static_cast<int>(std::lround(bounds.width)),
                      static_cast<int>(std::lround(bounds.height)));
  return rect & cv::Rect(0, 0, width, height);
}

}  // namespace shotimport::vision::detail
