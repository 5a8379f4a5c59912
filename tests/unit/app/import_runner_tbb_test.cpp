#ifdef SHOTIMPORT_HAS_TBB

#include <shotimport/app/import_runner_tbb.hpp>
#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/import_orchestrator.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/task_scheduler.hpp>
#include <shotimport/vision/mock_heuristics.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace {

namespace nc = shotimport::core;
namespace nv = shotimport::vision;
using namespace std::chrono_literals;

nc::Record make_raw_input() {
  nc::RawInput input;
  input.width = 32;
  input.height = 32;
  input.image = std::make_shared<const nc::Image>(32u, 32u, nc::PixelFormat::Grayscale8,
                                                  std::vector<std::byte>(32 * 32));
  return nc::to_record(input);
}

}  // namespace

TEST(ImportRunnerTbbTest, RunsCallbackPerInput) {
  auto scheduler = std::make_shared<nc::TaskScheduler>(nc::SchedulerOptions{2, 500ms});
  shotimport::app::OrchestratorFactory factory = [scheduler] {
    nc::StageHeuristics h{std::make_shared<nv::MockRoiDetector>(),
                          std::make_shared<nv::MockGridMapper>(),
                          std::make_shared<nv::MockRegionExtractor>(),
                          std::make_shared<nv::MockRecognizer>()};
    return std::make_unique<nc::ImportOrchestrator>(
        scheduler, nc::ContractValidator(nc::default_contracts()),
        nc::FallbackResolver(nc::default_fallback_strategies({})), h);
  };

  std::vector<nc::Record> inputs(6, make_raw_input());
  std::mutex m;
  std::vector<int> seen(inputs.size(), 0);
  std::size_t completed = 0;
  shotimport::app::run_import_batch_tbb(
      factory, inputs, {},
      [&](std::size_t i, const shotimport::app::ImportReportResult& r) {
        std::lock_guard lock(m);
        ++seen[i];
        if (r && r->final_state == nc::ImportState::Complete) ++completed;
      });

  EXPECT_EQ(completed, inputs.size());
  for (int count : seen) EXPECT_EQ(count, 1);
}

TEST(ImportRunnerTbbTest, EmptyInputDoesNothing) {
  int created = 0;
  shotimport::app::run_import_batch_tbb(
      [&]() -> std::unique_ptr<nc::ImportOrchestrator> {
        ++created;
        return nullptr;
      },
      {}, {}, nullptr);
  EXPECT_EQ(created, 0);
}

#endif  // SHOTIMPORT_HAS_TBB
