#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/vision/mock_heuristics.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace nc = shotimport::core;
namespace nv = shotimport::vision;
using namespace std::chrono_literals;

TEST(MockHeuristics, DefaultOutputsSatisfyContracts) {
  nc::ContractValidator validator(nc::default_contracts());
  nc::StageParams params;

  nv::MockRoiDetector roi;
  auto roi_out = roi.detect(nc::RawInput{}, params, {});
  ASSERT_TRUE(roi_out.has_value());
  auto roi_ok = validator.validate(nc::contract_names::kRoiResult, roi_out->payload);
  ASSERT_TRUE(roi_ok.has_value());
  const auto roi_value = *roi_ok->get_if<nc::RoiResult>();

  nv::MockGridMapper grid(2, 2);
  auto grid_out = grid.map(nc::RawInput{}, roi_value);
  ASSERT_TRUE(grid_out.has_value());
  auto grid_ok = validator.validate(nc::contract_names::kGridMap, grid_out->payload);
  ASSERT_TRUE(grid_ok.has_value());
  EXPECT_EQ(grid_ok->get_if<nc::GridMap>()->cells.size(), 4u);

  nv::MockRegionExtractor extractor;
  auto regions_out = extractor.extract(nc::RawInput{}, *grid_ok->get_if<nc::GridMap>(), params, {});
  ASSERT_TRUE(regions_out.has_value());
  auto regions_ok = validator.validate(nc::contract_names::kRegionMap, regions_out->payload);
  ASSERT_TRUE(regions_ok.has_value());

  nv::MockRecognizer recognizer;
  auto rec_out = recognizer.recognize(*regions_ok->get_if<nc::RegionMap>(), params, {});
  ASSERT_TRUE(rec_out.has_value());
  EXPECT_NEAR(rec_out->confidence, 0.925, 1e-9);
  EXPECT_TRUE(validator.validate(nc::contract_names::kRecognitionResult, rec_out->payload).has_value());
}

TEST(MockHeuristics, ScriptedStepsRunInOrderThenDefault) {
  nv::MockRoiDetector roi;
  nv::MockStep fail;
  fail.error = nc::make_error(nc::ErrorCode::TaskExecution, "first");
  nv::MockStep low;
  low.confidence = 0.1;
  roi.script({fail, low});

  nc::StageParams params;
  params.scale = 0.25;
  auto a = roi.detect(nc::RawInput{}, params, {});
  auto b = roi.detect(nc::RawInput{}, params, {});
  auto c = roi.detect(nc::RawInput{}, params, {});
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error().message, "first");
  ASSERT_TRUE(b.has_value());
  EXPECT_DOUBLE_EQ(b->confidence, 0.1);
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->confidence, 0.9);
  EXPECT_EQ(roi.calls(), 3u);
  EXPECT_DOUBLE_EQ(roi.last_params()->scale, 0.25);
}

TEST(MockHeuristics, DelayHonoursStopToken) {
  nv::MockRegionExtractor extractor;
  nv::MockStep slow;
  slow.delay = 5s;
  extractor.script({slow});

  std::stop_source source;
  std::thread stopper([&] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });
  const auto start = std::chrono::steady_clock::now();
  auto out = extractor.extract(nc::RawInput{}, nc::GridMap{}, nc::StageParams{}, source.get_token());
  stopper.join();
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::ErrorCode::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(MockHeuristics, ThrowsAndMutate) {
  nv::MockRecognizer recognizer;
  nv::MockStep boom;
  boom.throws = true;
  nv::MockStep tamper;
  tamper.mutate = [](nc::Record& r) { r.set("extra", true); };
  recognizer.script({boom, tamper});

  EXPECT_THROW((void)recognizer.recognize(nc::RegionMap{}, nc::StageParams{}, {}),
               std::runtime_error);
  auto out = recognizer.recognize(nc::RegionMap{}, nc::StageParams{}, {});
  ASSERT_TRUE(out.has_value());
  nc::ContractValidator validator(nc::default_contracts());
  auto checked = validator.validate(nc::contract_names::kRecognitionResult, out->payload);
  ASSERT_FALSE(checked.has_value());
  EXPECT_EQ(checked.error().field, "extra");
}
