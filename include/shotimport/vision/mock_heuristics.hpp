#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_heuristics.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace shotimport::vision {

/// One scripted answer of a mock heuristic (for tests/demo).
struct MockStep {
  std::optional<core::ImportError> error;  // answer with this error
  std::optional<double> confidence;        // override the mock's confidence
  std::chrono::milliseconds delay{0};      // wait before answering; honours the stop token
  std::chrono::milliseconds hang{0};       // block before answering; ignores the stop token
  bool throws{false};                      // throw std::runtime_error
  std::function<void(core::Record&)> mutate;  // tamper with the output record
};

/// Shared scripting: queued steps are consumed one per call, then the default step repeats.
class ScriptedHeuristic {
 public:
  void script(std::vector<MockStep> steps);
  void set_default_step(MockStep step);

  [[nodiscard]] std::size_t calls() const;
  [[nodiscard]] std::optional<core::StageParams> last_params() const;

 protected:
  [[nodiscard]] core::HeuristicResult respond(core::Record payload,
                                              double confidence,
                                              const core::StageParams* params,
                                              std::stop_token stop);

 private:
  mutable std::mutex mutex_;
  std::deque<MockStep> steps_;
  MockStep default_step_;
  std::size_t calls_{0};
  std::optional<core::StageParams> last_params_;
};

/// Returns a fixed roi-result; its confidence is the result's.
class MockRoiDetector : public core::IRoiDetector, public ScriptedHeuristic {
 public:
  MockRoiDetector();
  explicit MockRoiDetector(core::RoiResult result);

  void set_result(core::RoiResult result);

  [[nodiscard]] core::HeuristicResult detect(const core::RawInput& input,
                                             const core::StageParams& params,
                                             std::stop_token stop) override;

 private:
  std::mutex result_mutex_;
  core::RoiResult result_;
};

/// Lays a rows x cols grid over the ROI; confidence 1 unless scripted.
class MockGridMapper : public core::IGridMapper, public ScriptedHeuristic {
 public:
  explicit MockGridMapper(std::uint32_t rows = 2, std::uint32_t cols = 2);

  [[nodiscard]] core::HeuristicResult map(const core::RawInput& input,
                                          const core::RoiResult& roi) override;

 private:
  std::uint32_t rows_;
  std::uint32_t cols_;
};

/// One 1x1 grey region per grid cell.
class MockRegionExtractor : public core::IRegionExtractor, public ScriptedHeuristic {
 public:
  explicit MockRegionExtractor(double confidence = 0.9);

  [[nodiscard]] core::HeuristicResult extract(const core::RawInput& input,
                                              const core::GridMap& grid,
                                              const core::StageParams& params,
                                              std::stop_token stop) override;

 private:
  double confidence_;
};

/// Returns configurable items; confidence is their mean unless scripted.
class MockRecognizer : public core::IRecognizer, public ScriptedHeuristic {
 public:
  MockRecognizer();
  explicit MockRecognizer(std::vector<core::DetectedItem> items);

  void set_items(std::vector<core::DetectedItem> items);

  [[nodiscard]] core::HeuristicResult recognize(const core::RegionMap& regions,
                                                const core::StageParams& params,
                                                std::stop_token stop) override;

 private:
  std::mutex items_mutex_;
  std::vector<core::DetectedItem> items_;
};

}  // namespace shotimport::vision
