#pragma once

#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/error.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/import_state.hpp>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace shotimport::core {

/// One validated stage output, keyed by its contract name.
struct StageEntry {
  std::string stage;
  ValidatedPayload payload;
};

/// Root entity of one import attempt. Mutated only by its orchestrator's transition function.
struct ImportSession {
  std::string session_id;  // empty while idle
  ImportState state{ImportState::Idle};
  std::vector<StageEntry> stage_data;  // pipeline order
  std::chrono::steady_clock::time_point started_at{};
  std::chrono::steady_clock::time_point deadline_at{};
  std::stop_source cancel_token;
  std::optional<ImportError> cancel_reason;
  std::optional<ImportError> last_error;
  std::optional<SuggestedHint> last_hint;

  /// Appends, or replaces an existing entry of the same stage and drops every entry after it.
  void merge(StageEntry entry);

  [[nodiscard]] const ValidatedPayload* find(std::string_view stage) const noexcept;
};

/// Read-only copy handed to observers and callers.
struct SessionSnapshot {
  std::string session_id;
  ImportState state{ImportState::Idle};
  std::vector<StageEntry> stage_data;
  std::chrono::steady_clock::time_point started_at{};
  std::chrono::steady_clock::time_point deadline_at{};
  bool cancelled{false};
  std::optional<ImportError> last_error;
  std::optional<SuggestedHint> last_hint;

  [[nodiscard]] const ValidatedPayload* find(std::string_view stage) const noexcept;
};

[[nodiscard]] SessionSnapshot make_snapshot(const ImportSession& session);

}  // namespace shotimport::core
