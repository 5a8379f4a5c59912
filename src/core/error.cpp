#include <shotimport/core/error.hpp>

namespace shotimport::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InvalidTransition:
      return "InvalidTransition";
    case ErrorCode::ContractViolation:
      return "ContractViolation";
    case ErrorCode::TaskTimeout:
      return "TaskTimeout";
    case ErrorCode::TaskExecution:
      return "TaskExecution";
    case ErrorCode::SessionDeadlineExceeded:
      return "SessionDeadlineExceeded";
    case ErrorCode::SessionBusy:
      return "SessionBusy";
    case ErrorCode::Cancelled:
      return "Cancelled";
    case ErrorCode::SchedulerUnavailable:
      return "SchedulerUnavailable";
    case ErrorCode::AdmissionDenied:
      return "AdmissionDenied";
    case ErrorCode::Aborted:
      return "Aborted";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
    case ErrorCode::LoadFailed:
      return "LoadFailed";
  }
  return "Unknown";
}

std::string describe(const ImportError& error) {
  std::string out(to_string(error.code));
  if (!error.contract.empty()) {
    out += ": ";
    out += error.contract;
    if (!error.field.empty()) {
      out += '.';
      out += error.field;
    }
  }
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

}  // namespace shotimport::core
