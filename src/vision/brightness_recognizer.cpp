#include <shotimport/vision/brightness_recognizer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace shotimport::vision {

namespace nc = shotimport::core;

BrightnessRecognizer::BrightnessRecognizer(double threshold, std::vector<std::string> catalogue)
    : threshold_(std::clamp(threshold, 0.0, 1.0)), catalogue_(std::move(catalogue)) {}

nc::HeuristicResult BrightnessRecognizer::recognize(const nc::RegionMap& regions,
                                                    const nc::StageParams& /*params*/,
                                                    std::stop_token stop) {
  const double span = std::max(threshold_, 1.0 - threshold_);

  nc::RecognitionResult result;
  double confidence_sum = 0.0;
  std::size_t analyzed = 0;
  for (std::size_t i = 0; i < regions.regions.size(); ++i) {
    if (stop.stop_requested()) {
      return std::unexpected(nc::make_error(nc::ErrorCode::Cancelled, "recognition stopped"));
    }
    const nc::ExtractedRegion& region = regions.regions[i];
    if (!region.image) continue;
    auto gray = detail::to_gray(*region.image);
    if (!gray || gray->empty()) continue;

    const double brightness = cv::mean(*gray)[0] / 255.0;
    const double distance = std::abs(brightness - threshold_) / (span > 0.0 ? span : 1.0);
    // Low-contrast crops are harder to call either way.
    const double confidence = std::clamp((0.5 + 0.5 * distance) * (0.5 + 0.5 * region.quality),
                                         0.0, 1.0);
    confidence_sum += confidence;
    ++analyzed;

    if (brightness <= threshold_) continue;
    nc::DetectedItem item;
    item.name = i < catalogue_.size() ? catalogue_[i] : region.region_id;
    item.confidence = confidence;
    item.position = nc::Point{region.bounds.x + region.bounds.width / 2.0,
                              region.bounds.y + region.bounds.height / 2.0};
    item.region_id = region.region_id;
    result.items.push_back(std::move(item));
  }

  const double overall = analyzed > 0 ? confidence_sum / static_cast<double>(analyzed) : 0.0;
  double selected_sum = 0.0;
  for (const auto& item : result.items) selected_sum += item.confidence;
  result.stats.total_analyzed = static_cast<std::int64_t>(analyzed);
  result.stats.average_confidence =
      result.items.empty() ? 0.0 : selected_sum / static_cast<double>(result.items.size());
  return nc::HeuristicOutput{nc::to_record(result), overall};
}

}  // namespace shotimport::vision
