#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace shotimport::core {

/// Pipeline states of one import session.
enum class ImportState : std::uint8_t {
  Idle,
  AnalyzingRoi,
  AwaitingManualCrop,
  MappingGrid,
  ExtractingRegions,
  Recognizing,
  Reviewing,
  Complete,
  Error,
};

/// Pipeline stages; each automatic stage has its own threshold, timeout and contract.
enum class PipelineStage : std::uint8_t {
  RoiDetection,
  GridMapping,
  RegionExtraction,
  Recognition,
};

[[nodiscard]] std::string_view to_string(ImportState state) noexcept;
[[nodiscard]] std::string_view to_string(PipelineStage stage) noexcept;

/// Explicit successor table; the only source of truth for legal transitions.
[[nodiscard]] std::span<const ImportState> allowed_successors(ImportState from) noexcept;
[[nodiscard]] bool is_allowed_transition(ImportState from, ImportState to) noexcept;

/// Complete and Error end a session; only reset (-> Idle) leaves them.
[[nodiscard]] constexpr bool is_terminal(ImportState state) noexcept {
  return state == ImportState::Complete || state == ImportState::Error;
}

/// States in which the session waits for the manual-intervention UI.
[[nodiscard]] constexpr bool is_manual(ImportState state) noexcept {
  return state == ImportState::AwaitingManualCrop || state == ImportState::Reviewing;
}

/// State the session is in while `stage` runs.
[[nodiscard]] ImportState state_for(PipelineStage stage) noexcept;

}  // namespace shotimport::core
