#include <shotimport/app/import_runner_tbb.hpp>

#ifdef SHOTIMPORT_HAS_TBB

#include <shotimport/core/import_orchestrator.hpp>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <vector>

namespace shotimport::app {

namespace nc = shotimport::core;

void run_import_batch_tbb(const OrchestratorFactory& factory,
                          const std::vector<nc::Record>& inputs,
                          const ManualResponder& responder,
                          ImportReportCallback callback) {
  if (inputs.empty() || !factory) return;

  const std::size_t n = inputs.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&factory, &inputs, &responder, &callback](const tbb::blocked_range<std::size_t>& range) {
        auto orchestrator = factory();
        if (!orchestrator) return;
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = run_import(*orchestrator, inputs[i], responder);
          if (callback) callback(i, result);

          if (orchestrator->state() == nc::ImportState::Idle) continue;
          if (!nc::is_terminal(orchestrator->state())) orchestrator->cancel();
          auto reset = orchestrator->reset();
          if (!reset) spdlog::warn("[runner] reset failed: {}", nc::describe(reset.error()));
        }
      });
}

}  // namespace shotimport::app

#endif  // SHOTIMPORT_HAS_TBB
