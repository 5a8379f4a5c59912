#include <shotimport/app/import_runner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace shotimport::app {

namespace nc = shotimport::core;

ImportReportResult run_import(nc::ImportOrchestrator& orchestrator,
                              const nc::Record& raw_input,
                              const ManualResponder& responder,
                              std::size_t max_manual_rounds) {
  auto outcome = orchestrator.start_import(raw_input);
  if (!outcome) return std::unexpected(outcome.error());

  ImportReport report;
  while (outcome && nc::is_manual(*outcome) && report.manual_rounds < max_manual_rounds) {
    const auto& handler = *outcome == nc::ImportState::AwaitingManualCrop ? responder.on_manual_crop
                                                                          : responder.on_review;
    if (!handler) break;
    std::optional<nc::Record> answer = handler(orchestrator.snapshot());
    if (!answer) break;
    ++report.manual_rounds;
    outcome = *outcome == nc::ImportState::AwaitingManualCrop
                  ? orchestrator.supply_manual_crop(*answer)
                  : orchestrator.complete_review(*answer);
  }
  if (!outcome) return std::unexpected(outcome.error());

  report.session = orchestrator.snapshot();
  report.final_state = report.session.state;
  report.error = report.session.last_error;
  report.selection = orchestrator.final_selection();
  return report;
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

/// Brings a finished (or parked) orchestrator back to idle for the next input.
void recycle(nc::ImportOrchestrator& orchestrator) {
  if (orchestrator.state() == nc::ImportState::Idle) return;
  if (!nc::is_terminal(orchestrator.state())) orchestrator.cancel();
  auto reset = orchestrator.reset();
  if (!reset) spdlog::warn("[runner] reset failed: {}", nc::describe(reset.error()));
}

}  // namespace

void run_import_batch(nc::ImportOrchestrator& orchestrator,
                      const std::vector<nc::Record>& inputs,
                      const ManualResponder& responder,
                      ImportReportCallback callback) {
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    auto result = run_import(orchestrator, inputs[i], responder);
    if (callback) callback(i, result);
    recycle(orchestrator);
  }
}

void run_import_batch_parallel(const OrchestratorFactory& factory,
                               const std::vector<nc::Record>& inputs,
                               const ManualResponder& responder,
                               ImportReportCallback callback,
                               std::size_t num_workers) {
  const std::size_t n = inputs.size();
  if (n == 0 || !factory) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    auto orchestrator = factory();
    if (!orchestrator) return;
    run_import_batch(*orchestrator, inputs, responder, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    auto orchestrator = factory();
    if (!orchestrator) return;
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = run_import(*orchestrator, inputs[idx], responder);
      if (callback) callback(idx, result);
      recycle(*orchestrator);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace shotimport::app
