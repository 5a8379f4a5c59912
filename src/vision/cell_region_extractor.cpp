#include <shotimport/vision/cell_region_extractor.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <memory>

namespace shotimport::vision {

namespace nc = shotimport::core;

nc::HeuristicResult CellRegionExtractor::extract(const nc::RawInput& input,
                                                 const nc::GridMap& grid,
                                                 const nc::StageParams& params,
                                                 std::stop_token stop) {
  if (!input.image) {
    return std::unexpected(nc::make_error(nc::ErrorCode::TaskExecution, "raw input has no image"));
  }
  auto mat = detail::image_to_mat(*input.image);
  if (!mat) {
    return std::unexpected(
        nc::make_error(nc::ErrorCode::TaskExecution, "unsupported pixel format"));
  }
  const double scale = std::clamp(params.scale, 0.05, 1.0);

  nc::RegionMap regions;
  regions.regions.reserve(grid.cells.size());
  for (const auto& cell : grid.cells) {
    if (stop.stop_requested()) {
      return std::unexpected(
          nc::make_error(nc::ErrorCode::Cancelled, "region extraction stopped"));
    }
    const cv::Rect rect = detail::clip_to(cell.bounds, mat->cols, mat->rows);
    if (rect.empty()) continue;

    cv::Mat crop = (*mat)(rect).clone();
    if (scale < 1.0) {
      cv::resize(crop, crop, cv::Size(), scale, scale, cv::INTER_AREA);
      if (crop.empty()) continue;
    }
    auto crop_image =
        std::make_shared<const nc::Image>(detail::mat_to_image(crop, input.image->format()));

    double quality = 0.0;
    if (auto gray = detail::to_gray(*crop_image)) {
      cv::Scalar mean;
      cv::Scalar stddev;
      cv::meanStdDev(*gray, mean, stddev);
      quality = std::min(1.0, stddev[0] / 128.0);
    }

    nc::ExtractedRegion region;
    region.region_id = cell.region_id;
    region.row = cell.row;
    region.col = cell.col;
    region.bounds = nc::Bounds{static_cast<double>(rect.x), static_cast<double>(rect.y),
                               static_cast<double>(rect.width), static_cast<double>(rect.height)};
    region.image = std::move(crop_image);
    region.quality = quality;
    regions.regions.push_back(std::move(region));
  }

  const double confidence =
      grid.cells.empty()
          ? 0.0
          : static_cast<double>(regions.regions.size()) / static_cast<double>(grid.cells.size());
  return nc::HeuristicOutput{nc::to_record(regions), confidence};
}

}  // namespace shotimport::vision
