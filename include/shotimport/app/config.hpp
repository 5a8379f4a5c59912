#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/fallback_resolver.hpp>
#include <shotimport/core/import_orchestrator.hpp>
#include <shotimport/core/task_scheduler.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace shotimport::app {

/// Import configuration: worker pool, budgets, thresholds, recovery policy and the reference
/// heuristics' knobs.
struct ImportConfig {
  std::size_t worker_count{1};  // "auto" resolves to hardware concurrency; 0 = no heavy stages
  std::chrono::milliseconds session_timeout{30000};
  std::chrono::milliseconds roi_timeout{4000};
  std::chrono::milliseconds extraction_timeout{8000};
  std::chrono::milliseconds recognition_timeout{10000};
  double roi_threshold{0.70};
  double grid_threshold{0.50};
  double extraction_threshold{0.50};
  double recognition_threshold{0.60};
  double item_review_threshold{0.70};
  std::uint32_t max_execution_retries{2};
  std::uint32_t max_degrade_steps{1};
  double degrade_scale{0.5};
  std::chrono::milliseconds retry_backoff{50};
  std::size_t max_queue_depth{32};
  std::uint32_t grid_rows{6};
  std::uint32_t grid_cols{8};
  bool grid_hex_offset{false};
  double brightness_threshold{0.5};
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line, '#' comments). A missing file yields
/// defaults; a malformed or out-of-range value is ErrorCode::InvalidConfig.
[[nodiscard]] std::expected<ImportConfig, core::ImportError> load_config(const std::string& path);

/// Default config when no file is provided.
[[nodiscard]] ImportConfig default_config();

[[nodiscard]] core::OrchestratorOptions to_orchestrator_options(const ImportConfig& config);
[[nodiscard]] core::FallbackPolicy to_fallback_policy(const ImportConfig& config);
[[nodiscard]] core::SchedulerOptions to_scheduler_options(const ImportConfig& config);

}  // namespace shotimport::app
