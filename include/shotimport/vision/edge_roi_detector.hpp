#pragma once

#include <shotimport/core/stage_heuristics.hpp>
#include <stop_token>

namespace shotimport::vision {

/// Reference ROI detector: Canny edges, then the bounding box of the largest external contour.
/// Confidence grows with how much of the screenshot the box covers; a box under 5% of the image,
/// or none at all, yields the whole image with method "fallback" and confidence 0.2.
/// Honours StageParams::scale (the image is downscaled before edge detection).
class EdgeRoiDetector : public core::IRoiDetector {
 public:
  explicit EdgeRoiDetector(double canny_low = 50.0, double canny_high = 150.0);

  [[nodiscard]] core::HeuristicResult detect(const core::RawInput& input,
                                             const core::StageParams& params,
                                             std::stop_token stop) override;

 private:
  double canny_low_;
  double canny_high_;
};

}  // namespace shotimport::vision
