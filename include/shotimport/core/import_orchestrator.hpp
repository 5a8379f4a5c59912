#pragma once

#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/deadline_timer.hpp>
#include <shotimport/core/error.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/import_session.hpp>
#include <shotimport/core/import_state.hpp>
#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_heuristics.hpp>
#include <shotimport/core/task_scheduler.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace shotimport::core {

/// Per-stage thresholds and timeouts plus the session budget.
struct OrchestratorOptions {
  std::chrono::milliseconds session_timeout{30000};
  std::chrono::milliseconds roi_timeout{4000};
  std::chrono::milliseconds extraction_timeout{8000};
  std::chrono::milliseconds recognition_timeout{10000};
  double roi_threshold{0.70};
  double grid_threshold{0.50};
  double extraction_threshold{0.50};
  double recognition_threshold{0.60};
  /// Recognized items under this confidence are flagged for review.
  double item_review_threshold{0.70};
  /// start_import is declined while the scheduler queue is deeper than this.
  std::size_t max_queue_depth{32};
  /// Hard stop for strategy tables that keep asking for retries.
  std::uint32_t max_stage_attempts{8};
};

/// Delivered synchronously to observers after every accepted transition.
struct TransitionEvent {
  ImportState from{ImportState::Idle};
  ImportState to{ImportState::Idle};
  std::optional<StageEntry> payload;
  std::chrono::system_clock::time_point timestamp;
  std::optional<SuggestedHint> hint;
  std::optional<ImportError> error;
  SessionSnapshot session;
};

using TransitionObserver = std::function<void(const TransitionEvent&)>;
using ObserverId = std::uint64_t;

/// Drives one import session through ROI detection, grid mapping, region extraction and
/// recognition. Heavy stages run on the shared TaskScheduler; the calling thread blocks on their
/// result. Every stage output passes the ContractValidator before it enters the session, and
/// failures or low confidence go through the FallbackResolver.
///
/// start_import, supply_manual_crop, complete_review and request_recrop run until the session
/// parks in a manual state (awaiting-manual-crop, reviewing) or a terminal one, and return it.
/// cancel() and the session deadline may end the session from any thread.
///
/// Observers run while transitions are serialized; they may read snapshot() or state() but a
/// transition requested from inside an observer is rejected.
class ImportOrchestrator {
 public:
  using Outcome = std::expected<ImportState, ImportError>;

  /// Throws std::invalid_argument when the scheduler or a heuristic is missing.
  ImportOrchestrator(std::shared_ptr<TaskScheduler> scheduler,
                     ContractValidator validator,
                     FallbackResolver resolver,
                     StageHeuristics heuristics,
                     OrchestratorOptions options = {});
  ~ImportOrchestrator();

  ImportOrchestrator(const ImportOrchestrator&) = delete;
  ImportOrchestrator& operator=(const ImportOrchestrator&) = delete;

  /// Requires idle (else SessionBusy). Fails with AdmissionDenied when the scheduler is
  /// saturated and ContractViolation when `raw_input` is not a valid raw-input record; in both
  /// cases the orchestrator stays idle.
  [[nodiscard]] Outcome start_import(const Record& raw_input);

  /// awaiting-manual-crop -> mapping-grid with a user-drawn roi-result, then continues.
  [[nodiscard]] Outcome supply_manual_crop(const Record& roi);

  /// reviewing -> complete with a review-result record.
  [[nodiscard]] Outcome complete_review(const Record& review);

  /// reviewing -> awaiting-manual-crop, hinting the current ROI.
  [[nodiscard]] Outcome request_recrop();

  /// Stops the session: queued and running tasks are cancelled and the session ends in error
  /// with ErrorCode::Cancelled. No-op when idle or already terminal.
  void cancel();

  /// complete | error -> idle; the session is discarded.
  std::expected<void, ImportError> reset();

  /// Table-checked transition; merges `payload` into stage data on success.
  std::expected<void, ImportError> transition_to(ImportState next,
                                                 std::optional<StageEntry> payload = std::nullopt);

  ObserverId subscribe(TransitionObserver observer);
  bool unsubscribe(ObserverId id);

  [[nodiscard]] ImportState state() const;
  [[nodiscard]] SessionSnapshot snapshot() const;

  /// Selected items once complete: the review result, or the auto-accepted recognition result.
  [[nodiscard]] std::optional<ReviewResult> final_selection() const;

  [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }
  [[nodiscard]] const ContractValidator& validator() const noexcept { return validator_; }

 private:
  struct TransitionExtras {
    std::optional<SuggestedHint> hint;
    std::optional<ImportError> error;
  };

  /// Next stage to run, or nullopt once the session parked.
  using StageStep = std::expected<std::optional<PipelineStage>, ImportError>;

  class DriveClaim;

  std::expected<void, ImportError> do_transition(ImportState next,
                                                 std::optional<StageEntry> payload,
                                                 TransitionExtras extras,
                                                 const std::string* session_id);
  std::expected<void, ImportError> apply_transition(ImportState next,
                                                    std::optional<StageEntry> payload,
                                                    TransitionExtras extras,
                                                    const std::string* session_id);
  std::optional<std::pair<std::string, ImportError>> take_pending_cancel();

  std::expected<std::string, ImportError> claim_drive(ImportState required);
  void release_drive();

  Outcome drive(const std::string& session_id, PipelineStage first);
  StageStep run_stage(const std::string& session_id, PipelineStage stage);
  HeuristicResult execute(const std::string& session_id,
                          PipelineStage stage,
                          const StageParams& params);
  HeuristicResult run_heavy(const std::string& session_id, TaskKind kind, TaskWork work,
                            std::chrono::milliseconds timeout);
  StageStep advance(const std::string& session_id, PipelineStage stage, ValidatedPayload payload);
  StageStep move_to(const std::string& session_id,
                    ImportState next,
                    std::optional<StageEntry> entry,
                    TransitionExtras extras,
                    std::optional<PipelineStage> next_stage);
  StageStep switch_to_manual(const std::string& session_id,
                             PipelineStage stage,
                             SwitchToManual manual,
                             const LowConfidenceResult* low);
  StageStep fail(const std::string& session_id, ImportError error);
  StageStep finish_cancelled(const std::string& session_id);
  bool wait_backoff(std::chrono::milliseconds backoff);

  void on_deadline(const std::string& session_id);

  std::expected<ValidatedPayload, ImportError> flag_for_review(const RecognitionResult& result,
                                                               std::size_t* flagged) const;

  [[nodiscard]] bool cancel_requested() const;
  [[nodiscard]] std::stop_token session_token() const;
  [[nodiscard]] double threshold_for(PipelineStage stage) const noexcept;
  [[nodiscard]] std::chrono::milliseconds timeout_for(PipelineStage stage) const noexcept;

  template <typename T>
  [[nodiscard]] std::optional<T> stage_value(std::string_view contract) const;

  std::shared_ptr<TaskScheduler> scheduler_;
  ContractValidator validator_;
  FallbackResolver resolver_;
  StageHeuristics heuristics_;
  OrchestratorOptions options_;

  std::mutex transition_mutex_;
  std::atomic<std::thread::id> transition_owner_{};

  mutable std::mutex state_mutex_;
  ImportSession session_;
  bool driving_{false};
  std::optional<std::string> pending_cancel_;  // session id cancelled from inside an observer
  std::map<ObserverId, TransitionObserver> observers_;
  ObserverId next_observer_id_{1};

  DeadlineTimer timer_;
};

/// A user correction made in the review UI.
struct ItemCorrection {
  enum class Kind : std::uint8_t { Remove, Rename };

  Kind kind{Kind::Remove};
  std::string name;
  std::string new_name;  // Rename only
};

/// Builds a review-result record from a recognition result and the user's corrections.
/// Removed items are dropped, renamed items are taken as user-confirmed (confidence 1), and the
/// overall confidence is the mean of the kept items.
[[nodiscard]] Record build_review_record(const RecognitionResult& result,
                                         std::span<const ItemCorrection> corrections,
                                         bool reviewed_by_user = true);

}  // namespace shotimport::core
