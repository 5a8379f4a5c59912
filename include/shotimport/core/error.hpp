#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shotimport::core {

/// Import error codes; used with std::expected for every recoverable failure.
enum class ErrorCode : std::uint8_t {
  None = 0,
  InvalidTransition,        // logic error, never retried
  ContractViolation,        // a stage produced data its contract rejects
  TaskTimeout,              // worker did not answer within the task timeout
  TaskExecution,            // worker returned an error or threw
  SessionDeadlineExceeded,  // total session budget spent
  SessionBusy,              // startImport while a session is active
  Cancelled,
  SchedulerUnavailable,
  AdmissionDenied,
  Aborted,
  InvalidConfig,
  LoadFailed,
};

/// Structured error. `contract` and `field` are set for ContractViolation.
struct ImportError {
  ErrorCode code{ErrorCode::None};
  std::string message;
  std::string contract;
  std::string field;
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// Human-readable one-line reason, e.g. "ContractViolation: roi-result.bounds.width: below minimum".
[[nodiscard]] std::string describe(const ImportError& error);

[[nodiscard]] inline ImportError make_error(ErrorCode code, std::string message) {
  return ImportError{code, std::move(message), {}, {}};
}

}  // namespace shotimport::core
