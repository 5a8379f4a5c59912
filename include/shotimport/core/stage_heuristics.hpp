#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>

namespace shotimport::core {

/// Knobs a heuristic may honour; degrade-and-retry lowers them.
struct StageParams {
  double scale{1.0};               // input downscale factor, 1 = full resolution
  std::uint32_t quality_level{0};  // 0 = best; each degrade step adds one
  std::chrono::milliseconds timeout{0};

  bool operator==(const StageParams&) const = default;
};

/// Raw heuristic output: an unvalidated record plus the heuristic's own confidence in [0,1].
struct HeuristicOutput {
  Record payload;
  double confidence{0.0};
};

using HeuristicResult = std::expected<HeuristicOutput, ImportError>;

/// Heuristics are external collaborators. Heavy ones (ROI, extraction, recognition) run on
/// scheduler workers and must be stateless or internally synchronized; they should poll
/// `stop` and return early when it is set. The orchestrator only reads their contract-shaped
/// output, never their internals.

/// Geometry detection: where on the screenshot is the build grid.
class IRoiDetector {
 public:
  virtual ~IRoiDetector() = default;

  /// Output must satisfy the "roi-result" contract.
  [[nodiscard]] virtual HeuristicResult detect(const RawInput& input,
                                               const StageParams& params,
                                               std::stop_token stop) = 0;
};

/// Light stage: lays out grid cells over the region of interest. Runs on the driving thread.
class IGridMapper {
 public:
  virtual ~IGridMapper() = default;

  /// Output must satisfy the "grid-map" contract.
  [[nodiscard]] virtual HeuristicResult map(const RawInput& input, const RoiResult& roi) = 0;
};

/// Cuts one image per grid cell out of the screenshot.
class IRegionExtractor {
 public:
  virtual ~IRegionExtractor() = default;

  /// Output must satisfy the "region-map" contract.
  [[nodiscard]] virtual HeuristicResult extract(const RawInput& input,
                                                const GridMap& grid,
                                                const StageParams& params,
                                                std::stop_token stop) = 0;
};

/// Classifies extracted regions into selected items.
class IRecognizer {
 public:
  virtual ~IRecognizer() = default;

  /// Output must satisfy the "recognition-result" contract.
  [[nodiscard]] virtual HeuristicResult recognize(const RegionMap& regions,
                                                  const StageParams& params,
                                                  std::stop_token stop) = 0;
};

/// The collaborators one orchestrator drives. Shared because worker tasks keep them alive
/// after a session moved on (a discarded worker may still be inside detect()).
struct StageHeuristics {
  std::shared_ptr<IRoiDetector> roi_detector;
  std::shared_ptr<IGridMapper> grid_mapper;
  std::shared_ptr<IRegionExtractor> region_extractor;
  std::shared_ptr<IRecognizer> recognizer;
};

}  // namespace shotimport::core
