#pragma once

#include <shotimport/core/stage_heuristics.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <cstdint>

namespace shotimport::vision {

/// Reference grid mapper: splits the ROI into rows x cols equal cells. With hex_offset, odd
/// rows are shifted right by half a cell and hold one cell less (honeycomb layout). Row 0 is the
/// core zone when there is more than one row.
class UniformGridMapper : public core::IGridMapper {
 public:
  UniformGridMapper(std::uint32_t rows, std::uint32_t cols, bool hex_offset = false);

  /// Confidence drops to 0.3 when cells are smaller than kMinCellPixels on either side.
  [[nodiscard]] core::HeuristicResult map(const core::RawInput& input,
                                          const core::RoiResult& roi) override;

  static constexpr double kMinCellPixels = 4.0;

 private:
  std::uint32_t rows_;
  std::uint32_t cols_;
  bool hex_offset_;
};

}  // namespace shotimport::vision
