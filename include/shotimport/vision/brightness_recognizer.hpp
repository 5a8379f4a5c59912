#pragma once

#include <shotimport/core/stage_heuristics.hpp>
#include <stop_token>
#include <string>
#include <vector>

namespace shotimport::vision {

/// Reference recognizer: a region is a selected item when its mean brightness (0-1) is above
/// the threshold. Item confidence grows with the distance from the threshold. Items are named
/// from the catalogue by region order, or by region id past its end.
class BrightnessRecognizer : public core::IRecognizer {
 public:
  explicit BrightnessRecognizer(double threshold = 0.5, std::vector<std::string> catalogue = {});

  [[nodiscard]] core::HeuristicResult recognize(const core::RegionMap& regions,
                                                const core::StageParams& params,
                                                std::stop_token stop) override;

 private:
  double threshold_;
  std::vector<std::string> catalogue_;
};

}  // namespace shotimport::vision
