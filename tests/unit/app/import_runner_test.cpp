#include <shotimport/app/import_runner.hpp>
#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/import_orchestrator.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/task_scheduler.hpp>
#include <shotimport/vision/mock_heuristics.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace na = shotimport::app;
namespace nc = shotimport::core;
namespace nv = shotimport::vision;
using namespace std::chrono_literals;

namespace {

nc::Record make_raw_input() {
  nc::RawInput input;
  input.width = 64;
  input.height = 48;
  input.image = std::make_shared<const nc::Image>(64u, 48u, nc::PixelFormat::Grayscale8,
                                                  std::vector<std::byte>(64 * 48));
  return nc::to_record(input);
}

struct Rig {
  std::shared_ptr<nc::TaskScheduler> scheduler =
      std::make_shared<nc::TaskScheduler>(nc::SchedulerOptions{2, 500ms});
  std::shared_ptr<nv::MockRoiDetector> roi = std::make_shared<nv::MockRoiDetector>();
  std::shared_ptr<nv::MockRecognizer> recognizer = std::make_shared<nv::MockRecognizer>();

  std::unique_ptr<nc::ImportOrchestrator> make() const {
    nc::StageHeuristics h{roi, std::make_shared<nv::MockGridMapper>(),
                          std::make_shared<nv::MockRegionExtractor>(), recognizer};
    return std::make_unique<nc::ImportOrchestrator>(
        scheduler, nc::ContractValidator(nc::default_contracts()),
        nc::FallbackResolver(nc::default_fallback_strategies({})), h);
  }
};

na::ManualResponder crop_and_accept() {
  na::ManualResponder r;
  r.on_manual_crop = [](const nc::SessionSnapshot& s) -> std::optional<nc::Record> {
    nc::Bounds b = s.last_hint && s.last_hint->bounds ? *s.last_hint->bounds
                                                      : nc::Bounds{0, 0, 32, 32};
    return nc::to_record(nc::RoiResult{b, 1.0, nc::RoiMethod::Manual, {}});
  };
  r.on_review = [](const nc::SessionSnapshot& s) -> std::optional<nc::Record> {
    const auto* p = s.find(nc::contract_names::kRecognitionResult);
    if (!p) return std::nullopt;
    return nc::build_review_record(*p->get_if<nc::RecognitionResult>(), {});
  };
  return r;
}

}  // namespace

TEST(ImportRunner, AutomaticImportNeedsNoManualRounds) {
  Rig rig;
  auto orch = rig.make();
  auto report = na::run_import(*orch, make_raw_input(), {});
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->final_state, nc::ImportState::Complete);
  EXPECT_EQ(report->manual_rounds, 0u);
  ASSERT_TRUE(report->selection.has_value());
  EXPECT_EQ(report->selection->items.size(), 2u);
  EXPECT_FALSE(report->error.has_value());
}

TEST(ImportRunner, ResponderAnswersCropAndReview) {
  Rig rig;
  rig.roi->set_result(nc::RoiResult{nc::Bounds{4, 4, 40, 30}, 0.3, nc::RoiMethod::Edge, {}});
  rig.recognizer->set_items({nc::DetectedItem{"Shield", 0.9, {}, "r0c0", false, {}},
                             nc::DetectedItem{"Mine", 0.65, {}, "r1c0", false, {}}});
  auto orch = rig.make();

  auto report = na::run_import(*orch, make_raw_input(), crop_and_accept());
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->final_state, nc::ImportState::Complete);
  EXPECT_EQ(report->manual_rounds, 2u);
  ASSERT_TRUE(report->selection.has_value());
  EXPECT_TRUE(report->selection->reviewed_by_user);
}

TEST(ImportRunner, MissingHandlerLeavesSessionParked) {
  Rig rig;
  rig.roi->set_result(nc::RoiResult{nc::Bounds{4, 4, 40, 30}, 0.3, nc::RoiMethod::Edge, {}});
  auto orch = rig.make();

  auto report = na::run_import(*orch, make_raw_input(), {});
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->final_state, nc::ImportState::AwaitingManualCrop);
  EXPECT_FALSE(report->selection.has_value());
}

TEST(ImportRunner, RejectedStartIsAnError) {
  Rig rig;
  auto orch = rig.make();
  auto report = na::run_import(*orch, nc::Record{}, {});
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().code, nc::ErrorCode::ContractViolation);
}

TEST(ImportRunner, BatchResetsBetweenInputs) {
  Rig rig;
  auto orch = rig.make();
  std::vector<nc::Record> inputs(3, make_raw_input());
  std::vector<nc::ImportState> states(inputs.size(), nc::ImportState::Idle);

  na::run_import_batch(*orch, inputs, {}, [&](std::size_t i, const na::ImportReportResult& r) {
    ASSERT_TRUE(r.has_value());
    states[i] = r->final_state;
  });
  for (auto s : states) EXPECT_EQ(s, nc::ImportState::Complete);
  EXPECT_EQ(orch->state(), nc::ImportState::Idle);
}

TEST(ImportRunner, ParallelBatchUsesOneOrchestratorPerWorker) {
  Rig rig;
  std::atomic<int> created{0};
  na::OrchestratorFactory factory = [&] {
    ++created;
    return rig.make();
  };
  std::vector<nc::Record> inputs(8, make_raw_input());
  std::mutex m;
  std::vector<std::size_t> done;

  na::run_import_batch_parallel(factory, inputs, {},
                                [&](std::size_t i, const na::ImportReportResult& r) {
                                  std::lock_guard lock(m);
                                  if (r && r->final_state == nc::ImportState::Complete) {
                                    done.push_back(i);
                                  }
                                },
                                3);
  EXPECT_EQ(done.size(), inputs.size());
  EXPECT_EQ(created.load(), 3);
}

TEST(ImportRunner, ParallelBatchWithEmptyInputDoesNothing) {
  Rig rig;
  int created = 0;
  na::run_import_batch_parallel(
      [&] {
        ++created;
        return rig.make();
      },
      {}, {}, nullptr);
  EXPECT_EQ(created, 0);
}
