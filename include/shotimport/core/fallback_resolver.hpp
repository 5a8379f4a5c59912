#pragma once

#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/error.hpp>
#include <shotimport/core/import_state.hpp>
#include <shotimport/core/stage_heuristics.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shotimport::core {

/// A stage result that passed its contract but scored under the stage threshold.
struct LowConfidenceResult {
  double confidence{0.0};
  double threshold{0.0};
  std::optional<ValidatedPayload> payload;
};

/// What went wrong at a stage, handed to the resolver.
struct FailureContext {
  PipelineStage stage{PipelineStage::RoiDetection};
  std::variant<ImportError, LowConfidenceResult> cause;
  std::uint32_t attempts{1};       // attempts at this stage so far, including the failed one
  std::uint32_t degrade_steps{0};  // degrades already applied at this stage
  StageParams params;

  [[nodiscard]] const ImportError* error() const noexcept { return std::get_if<ImportError>(&cause); }
  [[nodiscard]] const LowConfidenceResult* low_confidence() const noexcept {
    return std::get_if<LowConfidenceResult>(&cause);
  }
};

/// Starting point offered to the manual UI.
struct SuggestedHint {
  std::optional<Bounds> bounds;
  std::optional<double> confidence;
  std::string note;

  bool operator==(const SuggestedHint&) const = default;
};

struct RetrySameStage {
  std::chrono::milliseconds backoff{0};

  bool operator==(const RetrySameStage&) const = default;
};

struct DegradeAndRetry {
  StageParams params;
  std::chrono::milliseconds backoff{0};

  bool operator==(const DegradeAndRetry&) const = default;
};

struct SwitchToManual {
  std::optional<SuggestedHint> hint;
  std::string reason;

  bool operator==(const SwitchToManual&) const = default;
};

struct AbortSession {
  ErrorCode code{ErrorCode::Aborted};
  std::string reason;

  bool operator==(const AbortSession&) const = default;
};

using RecoveryOutcome = std::variant<RetrySameStage, DegradeAndRetry, SwitchToManual, AbortSession>;

/// "retry", "degrade", "manual" or "abort".
[[nodiscard]] std::string_view outcome_name(const RecoveryOutcome& outcome) noexcept;

/// One row of the recovery table. Both functions must be pure.
struct FallbackStrategy {
  std::string id;
  std::function<bool(const FailureContext&)> matches;
  std::function<RecoveryOutcome(const FailureContext&)> recover;
};

/// Selects a recovery action from an ordered, immutable strategy list: first match wins, no
/// match aborts the session. The resolver never applies outcomes itself.
class FallbackResolver {
 public:
  explicit FallbackResolver(std::vector<FallbackStrategy> strategies);

  [[nodiscard]] RecoveryOutcome resolve(const FailureContext& context) const;

  /// Strategy resolve() would use, or nullptr when none matches.
  [[nodiscard]] const FallbackStrategy* matching_strategy(const FailureContext& context) const;

  [[nodiscard]] const std::vector<FallbackStrategy>& strategies() const noexcept {
    return strategies_;
  }

 private:
  std::vector<FallbackStrategy> strategies_;
};

/// Budgets for the default strategy table.
struct FallbackPolicy {
  std::uint32_t max_execution_retries{2};
  std::uint32_t max_degrade_steps{1};
  double degrade_scale{0.5};
  std::chrono::milliseconds retry_backoff{50};
};

/// fatal-errors, low-confidence-manual, contract-violation-manual, timeout-degrade,
/// execution-retry, exhausted-manual; in that order.
[[nodiscard]] std::vector<FallbackStrategy> default_fallback_strategies(const FallbackPolicy& policy);

}  // namespace shotimport::core
