#include <shotimport/core/fallback_resolver.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <initializer_list>
#include <type_traits>

namespace shotimport::core {

namespace {

bool has_code(const FailureContext& ctx, std::initializer_list<ErrorCode> codes) {
  const ImportError* err = ctx.error();
  return err != nullptr && std::find(codes.begin(), codes.end(), err->code) != codes.end();
}

std::string error_reason(const FailureContext& ctx) {
  const ImportError* err = ctx.error();
  return fmt::format("{} failed: {}", to_string(ctx.stage), err ? describe(*err) : "unknown");
}

}  // namespace

std::string_view outcome_name(const RecoveryOutcome& outcome) noexcept {
  return std::visit(
      [](const auto& o) -> std::string_view {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, RetrySameStage>) {
          return "retry";
        } else if constexpr (std::is_same_v<T, DegradeAndRetry>) {
          return "degrade";
        } else if constexpr (std::is_same_v<T, SwitchToManual>) {
          return "manual";
        } else {
          return "abort";
        }
      },
      outcome);
}

FallbackResolver::FallbackResolver(std::vector<FallbackStrategy> strategies)
    : strategies_(std::move(strategies)) {}

const FallbackStrategy* FallbackResolver::matching_strategy(const FailureContext& context) const {
  for (const auto& s : strategies_) {
    if (s.matches && s.matches(context)) return &s;
  }
  return nullptr;
}

RecoveryOutcome FallbackResolver::resolve(const FailureContext& context) const {
  const FallbackStrategy* strategy = matching_strategy(context);
  if (strategy == nullptr || !strategy->recover) {
    spdlog::debug("[fallback] no strategy for {} (attempt {}); aborting", to_string(context.stage),
                  context.attempts);
    const ImportError* err = context.error();
    return AbortSession{err ? err->code : ErrorCode::Aborted,
                        fmt::format("no recovery for {}", to_string(context.stage))};
  }
  RecoveryOutcome outcome = strategy->recover(context);
  spdlog::debug("[fallback] {} -> {} via {}", to_string(context.stage), outcome_name(outcome),
                strategy->id);
  return outcome;
}

std::vector<FallbackStrategy> default_fallback_strategies(const FallbackPolicy& policy) {
  std::vector<FallbackStrategy> table;

  table.push_back({"fatal-errors",
                   [](const FailureContext& ctx) {
                     return has_code(ctx, {ErrorCode::SessionDeadlineExceeded, ErrorCode::Cancelled,
                                           ErrorCode::InvalidTransition,
                                           ErrorCode::SchedulerUnavailable});
                   },
                   [](const FailureContext& ctx) -> RecoveryOutcome {
                     return AbortSession{ctx.error()->code, error_reason(ctx)};
                   }});

  table.push_back(
      {"low-confidence-manual",
       [](const FailureContext& ctx) { return ctx.low_confidence() != nullptr; },
       [](const FailureContext& ctx) -> RecoveryOutcome {
         const LowConfidenceResult& low = *ctx.low_confidence();
         SuggestedHint hint;
         hint.confidence = low.confidence;
         if (low.payload) {
           if (const auto* roi = low.payload->get_if<RoiResult>()) hint.bounds = roi->bounds;
         }
         hint.note = fmt::format("{} confidence {:.2f} below {:.2f}", to_string(ctx.stage),
                                 low.confidence, low.threshold);
         std::string reason = hint.note;
         return SwitchToManual{std::move(hint), std::move(reason)};
       }});

  table.push_back({"contract-violation-manual",
                   [](const FailureContext& ctx) {
                     return has_code(ctx, {ErrorCode::ContractViolation});
                   },
                   [](const FailureContext& ctx) -> RecoveryOutcome {
                     return SwitchToManual{std::nullopt, error_reason(ctx)};
                   }});

  table.push_back({"timeout-degrade",
                   [policy](const FailureContext& ctx) {
                     return has_code(ctx, {ErrorCode::TaskTimeout}) &&
                            ctx.degrade_steps < policy.max_degrade_steps;
                   },
                   [policy](const FailureContext& ctx) -> RecoveryOutcome {
                     StageParams next = ctx.params;
                     next.scale = ctx.params.scale * policy.degrade_scale;
                     next.quality_level = ctx.params.quality_level + 1;
                     return DegradeAndRetry{next, policy.retry_backoff};
                   }});

  table.push_back({"execution-retry",
                   [policy](const FailureContext& ctx) {
                     return has_code(ctx, {ErrorCode::TaskExecution}) &&
                            ctx.attempts <= policy.max_execution_retries;
                   },
                   [policy](const FailureContext& ctx) -> RecoveryOutcome {
                     const std::uint32_t shift = std::min<std::uint32_t>(ctx.attempts, 16);
                     return RetrySameStage{policy.retry_backoff * (1LL << shift)};
                   }});

  table.push_back({"exhausted-manual",
                   [](const FailureContext& ctx) {
                     return has_code(ctx, {ErrorCode::TaskTimeout, ErrorCode::TaskExecution});
                   },
                   [](const FailureContext& ctx) -> RecoveryOutcome {
                     return SwitchToManual{std::nullopt,
                                           error_reason(ctx) + " (recovery budget spent)"};
                   }});

  return table;
}

}  // namespace shotimport::core
