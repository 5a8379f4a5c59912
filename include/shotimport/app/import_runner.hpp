#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/import_orchestrator.hpp>
#include <shotimport/core/import_session.hpp>
#include <shotimport/core/import_state.hpp>
#include <shotimport/core/record.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace shotimport::app {

/// Stands in for the manual-intervention UI. A handler returning nullopt (or missing) leaves the
/// session parked where it is.
struct ManualResponder {
  /// Called in awaiting-manual-crop; returns a roi-result record.
  std::function<std::optional<core::Record>(const core::SessionSnapshot&)> on_manual_crop;
  /// Called in reviewing; returns a review-result record.
  std::function<std::optional<core::Record>(const core::SessionSnapshot&)> on_review;
};

/// Outcome of one driven import.
struct ImportReport {
  core::ImportState final_state{core::ImportState::Idle};
  std::optional<core::ReviewResult> selection;
  std::optional<core::ImportError> error;
  core::SessionSnapshot session;
  std::size_t manual_rounds{0};
};

using ImportReportResult = std::expected<ImportReport, core::ImportError>;

/// Callback for each import of a batch; may be invoked from worker threads.
using ImportReportCallback =
    std::function<void(std::size_t index, const ImportReportResult& result)>;

/// Creates one orchestrator per batch worker; all of them should share one TaskScheduler.
using OrchestratorFactory = std::function<std::unique_ptr<core::ImportOrchestrator>()>;

/// Runs one import on `orchestrator` (which must be idle) until it completes, fails, or parks
/// in a manual state the responder declines to answer. Fails when start_import is refused or a
/// responder's record is rejected.
[[nodiscard]] ImportReportResult run_import(core::ImportOrchestrator& orchestrator,
                                            const core::Record& raw_input,
                                            const ManualResponder& responder,
                                            std::size_t max_manual_rounds = 4);

/// Runs imports sequentially on one orchestrator, resetting it between inputs.
void run_import_batch(core::ImportOrchestrator& orchestrator,
                      const std::vector<core::Record>& inputs,
                      const ManualResponder& responder,
                      ImportReportCallback callback);

/// Runs imports in parallel: each of `num_workers` threads (0 = hardware concurrency) owns an
/// orchestrator from `factory` and takes inputs from a shared queue. Callback and responder must
/// be thread-safe.
void run_import_batch_parallel(const OrchestratorFactory& factory,
                               const std::vector<core::Record>& inputs,
                               const ManualResponder& responder,
                               ImportReportCallback callback,
                               std::size_t num_workers = 0);

}  // namespace shotimport::app
