#include <shotimport/vision/uniform_grid_mapper.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace shotimport::vision {

namespace nc = shotimport::core;

UniformGridMapper::UniformGridMapper(std::uint32_t rows, std::uint32_t cols, bool hex_offset)
    : rows_(std::max<std::uint32_t>(rows, 1)),
      cols_(std::max<std::uint32_t>(cols, 1)),
      hex_offset_(hex_offset) {}

nc::HeuristicResult UniformGridMapper::map(const nc::RawInput& /*input*/,
                                           const nc::RoiResult& roi) {
  const nc::Bounds& b = roi.bounds;
  const double cell_w = b.width / cols_;
  const double cell_h = b.height / rows_;

  nc::GridMap grid;
  grid.rows = rows_;
  grid.cols = cols_;
  grid.cells.reserve(static_cast<std::size_t>(rows_) * cols_);
  for (std::uint32_t r = 0; r < rows_; ++r) {
    const bool shifted = hex_offset_ && (r % 2 == 1) && cols_ > 1;
    const double x0 = b.x + (shifted ? cell_w / 2.0 : 0.0);
    const std::uint32_t count = shifted ? cols_ - 1 : cols_;
    for (std::uint32_t c = 0; c < count; ++c) {
      nc::GridCell cell;
      cell.region_id = fmt::format("r{}c{}", r, c);
      cell.row = r;
      cell.col = c;
      cell.bounds = nc::Bounds{x0 + c * cell_w, b.y + r * cell_h, cell_w, cell_h};
      cell.zone = (rows_ > 1 && r == 0) ? nc::GridZone::Core : nc::GridZone::Regular;
      grid.cells.push_back(std::move(cell));
    }
  }

  const double confidence = (cell_w < kMinCellPixels || cell_h < kMinCellPixels) ? 0.3 : 1.0;
  return nc::HeuristicOutput{nc::to_record(grid), confidence};
}

}  // namespace shotimport::vision
