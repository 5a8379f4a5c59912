#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <variant>

namespace nc = shotimport::core;
using namespace std::chrono_literals;

namespace {

nc::FallbackResolver make_resolver(nc::FallbackPolicy policy = {}) {
  return nc::FallbackResolver(nc::default_fallback_strategies(policy));
}

nc::FailureContext error_context(nc::ErrorCode code,
                                 nc::PipelineStage stage = nc::PipelineStage::RoiDetection) {
  nc::FailureContext ctx;
  ctx.stage = stage;
  ctx.cause = nc::make_error(code, "boom");
  return ctx;
}

}  // namespace

TEST(FallbackResolver, FatalErrorsAbortWithTheirCode) {
  auto resolver = make_resolver();
  for (auto code : {nc::ErrorCode::SessionDeadlineExceeded, nc::ErrorCode::Cancelled,
                    nc::ErrorCode::InvalidTransition, nc::ErrorCode::SchedulerUnavailable}) {
    auto outcome = resolver.resolve(error_context(code));
    const auto* abort = std::get_if<nc::AbortSession>(&outcome);
    ASSERT_NE(abort, nullptr) << nc::to_string(code);
    EXPECT_EQ(abort->code, code);
    EXPECT_EQ(resolver.matching_strategy(error_context(code))->id, "fatal-errors");
  }
}

TEST(FallbackResolver, LowConfidenceRoiSwitchesToManualWithBoundsHint) {
  nc::ContractValidator validator(nc::default_contracts());
  auto roi = validator.validate(
      nc::contract_names::kRoiResult,
      nc::to_record(nc::RoiResult{nc::Bounds{5, 6, 70, 80}, 0.4, nc::RoiMethod::Edge, {}}));
  ASSERT_TRUE(roi.has_value());

  nc::FailureContext ctx;
  ctx.stage = nc::PipelineStage::RoiDetection;
  ctx.cause = nc::LowConfidenceResult{0.4, 0.7, *roi};

  auto outcome = make_resolver().resolve(ctx);
  const auto* manual = std::get_if<nc::SwitchToManual>(&outcome);
  ASSERT_NE(manual, nullptr);
  ASSERT_TRUE(manual->hint.has_value());
  ASSERT_TRUE(manual->hint->bounds.has_value());
  EXPECT_EQ(*manual->hint->bounds, (nc::Bounds{5, 6, 70, 80}));
  EXPECT_DOUBLE_EQ(*manual->hint->confidence, 0.4);
  EXPECT_EQ(manual->hint->note, "roi-detection confidence 0.40 below 0.70");
}

TEST(FallbackResolver, ContractViolationSwitchesToManual) {
  auto outcome = make_resolver().resolve(
      error_context(nc::ErrorCode::ContractViolation, nc::PipelineStage::GridMapping));
  const auto* manual = std::get_if<nc::SwitchToManual>(&outcome);
  ASSERT_NE(manual, nullptr);
  EXPECT_FALSE(manual->hint.has_value());
  EXPECT_NE(manual->reason.find("grid-mapping failed"), std::string::npos);
}

TEST(FallbackResolver, TimeoutDegradesOnceThenGoesManual) {
  nc::FallbackPolicy policy;
  policy.max_degrade_steps = 1;
  policy.degrade_scale = 0.5;
  policy.retry_backoff = 10ms;
  auto resolver = make_resolver(policy);

  auto ctx = error_context(nc::ErrorCode::TaskTimeout, nc::PipelineStage::RegionExtraction);
  auto first = resolver.resolve(ctx);
  const auto* degrade = std::get_if<nc::DegradeAndRetry>(&first);
  ASSERT_NE(degrade, nullptr);
  EXPECT_DOUBLE_EQ(degrade->params.scale, 0.5);
  EXPECT_EQ(degrade->params.quality_level, 1u);
  EXPECT_EQ(degrade->backoff, 10ms);

  ctx.degrade_steps = 1;
  ctx.attempts = 2;
  ctx.params = degrade->params;
  auto second = resolver.resolve(ctx);
  EXPECT_EQ(nc::outcome_name(second), "manual");
  EXPECT_EQ(resolver.matching_strategy(ctx)->id, "exhausted-manual");
}

TEST(FallbackResolver, ExecutionRetriesWithExponentialBackoff) {
  nc::FallbackPolicy policy;
  policy.max_execution_retries = 2;
  policy.retry_backoff = 50ms;
  auto resolver = make_resolver(policy);

  auto ctx = error_context(nc::ErrorCode::TaskExecution, nc::PipelineStage::Recognition);
  ctx.attempts = 1;
  EXPECT_EQ(resolver.resolve(ctx), nc::RecoveryOutcome{nc::RetrySameStage{100ms}});
  ctx.attempts = 2;
  EXPECT_EQ(resolver.resolve(ctx), nc::RecoveryOutcome{nc::RetrySameStage{200ms}});
  ctx.attempts = 3;
  EXPECT_EQ(nc::outcome_name(resolver.resolve(ctx)), "manual");
}

TEST(FallbackResolver, ResolutionIsIdempotent) {
  auto resolver = make_resolver();
  auto ctx = error_context(nc::ErrorCode::TaskExecution);
  EXPECT_EQ(resolver.resolve(ctx), resolver.resolve(ctx));
}

TEST(FallbackResolver, NoMatchAbortsWithErrorCode) {
  nc::FallbackResolver empty(std::vector<nc::FallbackStrategy>{});
  auto outcome = empty.resolve(error_context(nc::ErrorCode::TaskTimeout));
  const auto* abort = std::get_if<nc::AbortSession>(&outcome);
  ASSERT_NE(abort, nullptr);
  EXPECT_EQ(abort->code, nc::ErrorCode::TaskTimeout);
  EXPECT_EQ(empty.matching_strategy(error_context(nc::ErrorCode::TaskTimeout)), nullptr);
}

TEST(FallbackResolver, UnknownErrorCodeFallsThroughToAbort) {
  auto outcome = make_resolver().resolve(error_context(nc::ErrorCode::LoadFailed));
  const auto* abort = std::get_if<nc::AbortSession>(&outcome);
  ASSERT_NE(abort, nullptr);
  EXPECT_EQ(abort->code, nc::ErrorCode::LoadFailed);
}

TEST(FallbackResolver, FirstMatchWins) {
  std::vector<nc::FallbackStrategy> table;
  table.push_back({"always-retry", [](const nc::FailureContext&) { return true; },
                   [](const nc::FailureContext&) -> nc::RecoveryOutcome {
                     return nc::RetrySameStage{};
                   }});
  table.push_back({"always-abort", [](const nc::FailureContext&) { return true; },
                   [](const nc::FailureContext&) -> nc::RecoveryOutcome {
                     return nc::AbortSession{};
                   }});
  nc::FallbackResolver resolver(std::move(table));
  EXPECT_EQ(nc::outcome_name(resolver.resolve(error_context(nc::ErrorCode::Cancelled))), "retry");
}
