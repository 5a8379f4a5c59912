#include <shotimport/vision/edge_roi_detector.hpp>
#include "image_cv_utils.hpp"
#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace shotimport::vision {

namespace nc = shotimport::core;

namespace {

nc::HeuristicResult stopped() {
  return std::unexpected(nc::make_error(nc::ErrorCode::Cancelled, "roi detection stopped"));
}

nc::HeuristicResult fallback(const nc::RawInput& input, std::string note) {
  nc::RoiResult roi;
  roi.bounds = nc::Bounds{0.0, 0.0, static_cast<double>(input.width),
                          static_cast<double>(input.height)};
  roi.confidence = 0.2;
  roi.method = nc::RoiMethod::Fallback;
  roi.note = std::move(note);
  return nc::HeuristicOutput{nc::to_record(roi), roi.confidence};
}

}  // namespace

EdgeRoiDetector::EdgeRoiDetector(double canny_low, double canny_high)
    : canny_low_(canny_low), canny_high_(canny_high) {}

nc::HeuristicResult EdgeRoiDetector::detect(const nc::RawInput& input,
                                            const nc::StageParams& params,
                                            std::stop_token stop) {
  if (!input.image) {
    return std::unexpected(nc::make_error(nc::ErrorCode::TaskExecution, "raw input has no image"));
  }
  auto gray = detail::to_gray(*input.image);
  if (!gray) {
    return std::unexpected(
        nc::make_error(nc::ErrorCode::TaskExecution, "unsupported pixel format"));
  }

  const double scale = std::clamp(params.scale, 0.05, 1.0);
  cv::Mat work;
  if (scale < 1.0) {
    cv::resize(*gray, work, cv::Size(), scale, scale, cv::INTER_AREA);
  } else {
    work = *gray;
  }
  if (stop.stop_requested()) return stopped();

  cv::GaussianBlur(work, work, cv::Size(5, 5), 0.0);
  cv::Mat edges;
  cv::Canny(work, edges, canny_low_, canny_high_);
  cv::dilate(edges, edges, cv::Mat(), cv::Point(-1, -1), 2);
  if (stop.stop_requested()) return stopped();

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) return fallback(input, "no edges found");

  const auto largest = std::max_element(
      contours.begin(), contours.end(),
      [](const auto& a, const auto& b) { return cv::contourArea(a) < cv::contourArea(b); });
  const cv::Rect box = cv::boundingRect(*largest);

  const double coverage =
      static_cast<double>(box.area()) / static_cast<double>(std::max(1, work.rows * work.cols));
  if (coverage < 0.05) return fallback(input, fmt::format("largest contour covers {:.1f}%", coverage * 100.0));

  nc::RoiResult roi;
  roi.bounds = nc::Bounds{box.x / scale, box.y / scale, box.width / scale, box.height / scale};
  roi.bounds.width = std::min(roi.bounds.width, input.width - roi.bounds.x);
  roi.bounds.height = std::min(roi.bounds.height, input.height - roi.bounds.y);
  // Build screens fill most of the capture; a box that is the whole frame is less telling.
  roi.confidence = coverage > 0.97 ? 0.6 : std::min(0.95, 0.5 + coverage * 0.6);
  roi.method = nc::RoiMethod::Edge;
  roi.note = fmt::format("contour covers {:.1f}% at scale {:.2f}", coverage * 100.0, scale);
  return nc::HeuristicOutput{nc::to_record(roi), roi.confidence};
}

}  // namespace shotimport::vision
