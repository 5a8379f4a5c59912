#pragma once

#include <shotimport/app/import_runner.hpp>
#include <shotimport/core/record.hpp>
#include <vector>

#ifdef SHOTIMPORT_HAS_TBB

namespace shotimport::app {

/// Runs a batch of imports in parallel using TBB.
///
/// Each TBB chunk creates its own orchestrator from \p factory and runs its inputs sequentially,
/// resetting in between, so no orchestrator is ever driven from two threads. The heavy stages of
/// all chunks still go through the TaskScheduler the factory wires in, which bounds CPU use.
///
/// \param factory Creates an orchestrator; called once per TBB chunk.
/// \param inputs raw-input records; read only.
/// \param responder Answers manual requests. Must be thread-safe.
/// \param callback Invoked for every input with (index, result). Must be thread-safe.
void run_import_batch_tbb(const OrchestratorFactory& factory,
                          const std::vector<core::Record>& inputs,
                          const ManualResponder& responder,
                          ImportReportCallback callback);

}  // namespace shotimport::app

#endif  // SHOTIMPORT_HAS_TBB
