#include <shotimport/vision/mock_heuristics.hpp>
#include <shotimport/core/image.hpp>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace shotimport::vision {

namespace nc = shotimport::core;

void ScriptedHeuristic::script(std::vector<MockStep> steps) {
  std::lock_guard lock(mutex_);
  steps_.assign(std::make_move_iterator(steps.begin()), std::make_move_iterator(steps.end()));
}

void ScriptedHeuristic::set_default_step(MockStep step) {
  std::lock_guard lock(mutex_);
  default_step_ = std::move(step);
}

std::size_t ScriptedHeuristic::calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::optional<nc::StageParams> ScriptedHeuristic::last_params() const {
  std::lock_guard lock(mutex_);
  return last_params_;
}

nc::HeuristicResult ScriptedHeuristic::respond(nc::Record payload,
                                               double confidence,
                                               const nc::StageParams* params,
                                               std::stop_token stop) {
  MockStep step;
  {
    std::lock_guard lock(mutex_);
    ++calls_;
    if (params != nullptr) last_params_ = *params;
    if (!steps_.empty()) {
      step = std::move(steps_.front());
      steps_.pop_front();
    } else {
      step = default_step_;
    }
  }

  if (step.hang.count() > 0) std::this_thread::sleep_for(step.hang);
  if (step.delay.count() > 0) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, step.delay, [] { return false; });
    if (stop.stop_requested()) {
      return std::unexpected(nc::make_error(nc::ErrorCode::Cancelled, "mock heuristic stopped"));
    }
  }
  if (step.throws) throw std::runtime_error("mock heuristic failure");
  if (step.error) return std::unexpected(*step.error);
  if (step.mutate) step.mutate(payload);
  return nc::HeuristicOutput{std::move(payload), step.confidence.value_or(confidence)};
}

// --- ROI ---

MockRoiDetector::MockRoiDetector()
    : MockRoiDetector(nc::RoiResult{nc::Bounds{10.0, 10.0, 80.0, 60.0}, 0.9, nc::RoiMethod::Edge,
                                    {}}) {}

MockRoiDetector::MockRoiDetector(nc::RoiResult result) : result_(std::move(result)) {}

void MockRoiDetector::set_result(nc::RoiResult result) {
  std::lock_guard lock(result_mutex_);
  result_ = std::move(result);
}

nc::HeuristicResult MockRoiDetector::detect(const nc::RawInput& /*input*/,
                                            const nc::StageParams& params,
                                            std::stop_token stop) {
  nc::RoiResult result;
  {
    std::lock_guard lock(result_mutex_);
    result = result_;
  }
  return respond(nc::to_record(result), result.confidence, &params, std::move(stop));
}

// --- Grid ---

MockGridMapper::MockGridMapper(std::uint32_t rows, std::uint32_t cols)
    : rows_(rows), cols_(cols) {}

nc::HeuristicResult MockGridMapper::map(const nc::RawInput& /*input*/, const nc::RoiResult& roi) {
  nc::GridMap grid;
  grid.rows = rows_;
  grid.cols = cols_;
  const double cell_w = roi.bounds.width / cols_;
  const double cell_h = roi.bounds.height / rows_;
  for (std::uint32_t r = 0; r < rows_; ++r) {
    for (std::uint32_t c = 0; c < cols_; ++c) {
      nc::GridCell cell;
      cell.region_id = "r" + std::to_string(r) + "c" + std::to_string(c);
      cell.row = r;
      cell.col = c;
      cell.bounds = nc::Bounds{roi.bounds.x + c * cell_w, roi.bounds.y + r * cell_h, cell_w, cell_h};
      grid.cells.push_back(std::move(cell));
    }
  }
  return respond(nc::to_record(grid), 1.0, nullptr, std::stop_token{});
}

// --- Extraction ---

MockRegionExtractor::MockRegionExtractor(double confidence) : confidence_(confidence) {}

nc::HeuristicResult MockRegionExtractor::extract(const nc::RawInput& /*input*/,
                                                 const nc::GridMap& grid,
                                                 const nc::StageParams& params,
                                                 std::stop_token stop) {
  auto pixel = std::make_shared<const nc::Image>(
      1u, 1u, nc::PixelFormat::Grayscale8, std::vector<std::byte>{std::byte{128}});
  nc::RegionMap regions;
  regions.regions.reserve(grid.cells.size());
  for (const auto& cell : grid.cells) {
    regions.regions.push_back(
        nc::ExtractedRegion{cell.region_id, cell.row, cell.col, cell.bounds, pixel, 0.8});
  }
  return respond(nc::to_record(regions), confidence_, &params, std::move(stop));
}

// --- Recognition ---

MockRecognizer::MockRecognizer()
    : MockRecognizer({nc::DetectedItem{"Shield", 0.95, nc::Point{20.0, 20.0}, "r0c0", false, {}},
                      nc::DetectedItem{"Blaster", 0.9, nc::Point{60.0, 20.0}, "r0c1", false, {}}}) {}

MockRecognizer::MockRecognizer(std::vector<nc::DetectedItem> items) : items_(std::move(items)) {}

void MockRecognizer::set_items(std::vector<nc::DetectedItem> items) {
  std::lock_guard lock(items_mutex_);
  items_ = std::move(items);
}

nc::HeuristicResult MockRecognizer::recognize(const nc::RegionMap& regions,
                                              const nc::StageParams& params,
                                              std::stop_token stop) {
  nc::RecognitionResult result;
  {
    std::lock_guard lock(items_mutex_);
    result.items = items_;
  }
  double sum = 0.0;
  for (const auto& item : result.items) sum += item.confidence;
  const double mean =
      result.items.empty() ? 1.0 : sum / static_cast<double>(result.items.size());
  result.stats.total_analyzed = static_cast<std::int64_t>(regions.regions.size());
  result.stats.average_confidence = result.items.empty() ? 0.0 : mean;
  return respond(nc::to_record(result), mean, &params, std::move(stop));
}

}  // namespace shotimport::vision
