#include <shotimport/app/config.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>
#include <thread>

namespace shotimport::app {

namespace {

using core::ErrorCode;
using core::ImportError;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

ImportError invalid(const std::string& key, const std::string& value, std::string_view why) {
  return core::make_error(ErrorCode::InvalidConfig,
                          fmt::format("{} = '{}': {}", key, value, why));
}

std::size_t hardware_workers() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

template <typename T>
std::expected<T, ImportError> parse_number(const std::string& key, const std::string& value) {
  T out{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) return std::unexpected(invalid(key, value, "not a number"));
  return out;
}

std::expected<double, ImportError> parse_unit(const std::string& key, const std::string& value) {
  auto v = parse_number<double>(key, value);
  if (!v) return v;
  if (!std::isfinite(*v) || *v < 0.0 || *v > 1.0) {
    return std::unexpected(invalid(key, value, "must be within [0, 1]"));
  }
  return v;
}

std::expected<std::chrono::milliseconds, ImportError> parse_ms(const std::string& key,
                                                                const std::string& value) {
  auto v = parse_number<std::int64_t>(key, value);
  if (!v) return std::unexpected(v.error());
  if (*v <= 0) return std::unexpected(invalid(key, value, "must be positive"));
  return std::chrono::milliseconds{*v};
}

template <typename T>
std::expected<T, ImportError> parse_count(const std::string& key,
                                          const std::string& value,
                                          std::uint64_t min) {
  auto v = parse_number<std::uint64_t>(key, value);
  if (!v) return std::unexpected(v.error());
  if (*v < min) return std::unexpected(invalid(key, value, fmt::format("must be >= {}", min)));
  if (*v > std::numeric_limits<T>::max()) {
    return std::unexpected(
        invalid(key, value, fmt::format("must be <= {}", std::numeric_limits<T>::max())));
  }
  return static_cast<T>(*v);
}

std::expected<bool, ImportError> parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return std::unexpected(invalid(key, value, "expected true or false"));
}

/// Stores a successfully parsed value.
template <typename T, typename U>
std::expected<void, ImportError> assign(T& target, std::expected<U, ImportError> parsed) {
  if (!parsed) return std::unexpected(parsed.error());
  target = *parsed;
  return {};
}

std::expected<void, ImportError> apply(ImportConfig& c,
                                       const std::string& key,
                                       const std::string& value) {
  if (key == "worker_count") {
    if (value == "auto") {
      c.worker_count = hardware_workers();
      return {};
    }
    return assign(c.worker_count, parse_count<std::size_t>(key, value, 0));
  }
  if (key == "session_timeout_ms") return assign(c.session_timeout, parse_ms(key, value));
  if (key == "roi_timeout_ms") return assign(c.roi_timeout, parse_ms(key, value));
  if (key == "extraction_timeout_ms") return assign(c.extraction_timeout, parse_ms(key, value));
  if (key == "recognition_timeout_ms") return assign(c.recognition_timeout, parse_ms(key, value));
  if (key == "roi_threshold") return assign(c.roi_threshold, parse_unit(key, value));
  if (key == "grid_threshold") return assign(c.grid_threshold, parse_unit(key, value));
  if (key == "extraction_threshold") return assign(c.extraction_threshold, parse_unit(key, value));
  if (key == "recognition_threshold") {
    return assign(c.recognition_threshold, parse_unit(key, value));
  }
  if (key == "item_review_threshold") {
    return assign(c.item_review_threshold, parse_unit(key, value));
  }
  if (key == "max_execution_retries") {
    return assign(c.max_execution_retries, parse_count<std::uint32_t>(key, value, 0));
  }
  if (key == "max_degrade_steps") {
    return assign(c.max_degrade_steps, parse_count<std::uint32_t>(key, value, 0));
  }
  if (key == "degrade_scale") {
    auto v = parse_unit(key, value);
    if (!v) return std::unexpected(v.error());
    if (*v <= 0.0) return std::unexpected(invalid(key, value, "must be above 0"));
    c.degrade_scale = *v;
    return {};
  }
  if (key == "retry_backoff_ms") {
    auto v = parse_number<std::int64_t>(key, value);
    if (!v) return std::unexpected(v.error());
    if (*v < 0) return std::unexpected(invalid(key, value, "must not be negative"));
    c.retry_backoff = std::chrono::milliseconds{*v};
    return {};
  }
  if (key == "max_queue_depth") {
    return assign(c.max_queue_depth, parse_count<std::size_t>(key, value, 0));
  }
  if (key == "grid_rows") return assign(c.grid_rows, parse_count<std::uint32_t>(key, value, 1));
  if (key == "grid_cols") return assign(c.grid_cols, parse_count<std::uint32_t>(key, value, 1));
  if (key == "grid_hex_offset") return assign(c.grid_hex_offset, parse_bool(key, value));
  if (key == "brightness_threshold") {
    return assign(c.brightness_threshold, parse_unit(key, value));
  }
  if (key == "log_level") {
    c.log_level = value;
    return {};
  }
  spdlog::warn("[config] ignoring unknown key '{}'", key);
  return {};
}

}  // namespace

ImportConfig default_config() {
  ImportConfig c;
  c.worker_count = hardware_workers();
  return c;
}

std::expected<ImportConfig, ImportError> load_config(const std::string& path) {
  ImportConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      return std::unexpected(core::make_error(
          ErrorCode::InvalidConfig, fmt::format("{}:{}: expected key=value", path, line_no)));
    }
    auto applied = apply(c, key, value);
    if (!applied) {
      ImportError err = applied.error();
      err.message = fmt::format("{}:{}: {}", path, line_no, err.message);
      return std::unexpected(std::move(err));
    }
  }
  return c;
}

core::OrchestratorOptions to_orchestrator_options(const ImportConfig& config) {
  core::OrchestratorOptions o;
  o.session_timeout = config.session_timeout;
  o.roi_timeout = config.roi_timeout;
  o.extraction_timeout = config.extraction_timeout;
  o.recognition_timeout = config.recognition_timeout;
  o.roi_threshold = config.roi_threshold;
  o.grid_threshold = config.grid_threshold;
  o.extraction_threshold = config.extraction_threshold;
  o.recognition_threshold = config.recognition_threshold;
  o.item_review_threshold = config.item_review_threshold;
  o.max_queue_depth = config.max_queue_depth;
  return o;
}

core::FallbackPolicy to_fallback_policy(const ImportConfig& config) {
  core::FallbackPolicy p;
  p.max_execution_retries = config.max_execution_retries;
  p.max_degrade_steps = config.max_degrade_steps;
  p.degrade_scale = config.degrade_scale;
  p.retry_backoff = config.retry_backoff;
  return p;
}

core::SchedulerOptions to_scheduler_options(const ImportConfig& config) {
  core::SchedulerOptions s;
  s.concurrency = config.worker_count;
  return s;
}

}  // namespace shotimport::app
