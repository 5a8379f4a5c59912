#pragma once

#include <shotimport/core/stage_heuristics.hpp>
#include <stop_token>

namespace shotimport::vision {

/// Reference extractor: crops every grid cell out of the screenshot (clipped to the image).
/// Region quality is the grey-level standard deviation / 128, capped at 1; stage confidence is
/// the share of cells that produced a non-empty crop. StageParams::scale < 1 downscales crops.
class CellRegionExtractor : public core::IRegionExtractor {
 public:
  [[nodiscard]] core::HeuristicResult extract(const core::RawInput& input,
                                              const core::GridMap& grid,
                                              const core::StageParams& params,
                                              std::stop_token stop) override;
};

}  // namespace shotimport::vision
