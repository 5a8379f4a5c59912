#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/stage_heuristics.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace shotimport::core {

enum class TaskKind : std::uint8_t { RoiDetection, RegionExtraction, Recognition };

/// Forward-only: Queued -> Running -> {Done | Failed | TimedOut | Cancelled}, or Queued -> Cancelled.
enum class TaskStatus : std::uint8_t { Queued, Running, Done, Failed, TimedOut, Cancelled };

[[nodiscard]] std::string_view to_string(TaskKind kind) noexcept;
[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

[[nodiscard]] constexpr bool is_final(TaskStatus status) noexcept {
  return status != TaskStatus::Queued && status != TaskStatus::Running;
}

using TaskResult = HeuristicResult;

/// Work closure; carries the stage input it captured. Runs on a worker thread and should
/// return early once `stop` is requested.
using TaskWork = std::function<TaskResult(std::stop_token stop)>;

/// Unit of work submitted to the scheduler.
struct WorkerTask {
  std::string session_id;
  TaskKind kind{TaskKind::RoiDetection};
  std::chrono::milliseconds timeout{0};  // 0 = no per-task timeout
  TaskWork work;
};

namespace detail {
struct TaskRecord;
struct SchedulerCore;
}  // namespace detail

/// Caller's handle on a submitted task: id, live status, and the result future.
class TaskTicket {
 public:
  TaskTicket() = default;

  [[nodiscard]] std::uint64_t id() const noexcept;
  [[nodiscard]] TaskStatus status() const noexcept;
  /// Worker that ran (or is running) the task; 0 while queued.
  [[nodiscard]] std::uint64_t worker_id() const noexcept;
  [[nodiscard]] bool valid() const noexcept { return record_ != nullptr && result_.valid(); }

  /// Blocks until the task settles (done, failed, timed out or cancelled).
  [[nodiscard]] TaskResult get();

  template <typename Clock, typename Duration>
  [[nodiscard]] bool wait_until(const std::chrono::time_point<Clock, Duration>& tp) const {
    return result_.wait_until(tp) == std::future_status::ready;
  }

 private:
  friend class TaskScheduler;

  TaskTicket(std::shared_ptr<const detail::TaskRecord> record, std::future<TaskResult> result)
      : record_(std::move(record)), result_(std::move(result)) {}

  std::shared_ptr<const detail::TaskRecord> record_;
  std::future<TaskResult> result_;
};

struct SchedulerOptions {
  std::size_t concurrency{4};
  /// How long shutdown() waits for running tasks before abandoning their workers.
  std::chrono::milliseconds shutdown_grace{2000};
};

struct SchedulerStats {
  std::uint64_t submitted{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t timed_out{0};
  std::uint64_t cancelled{0};
  std::uint64_t workers_replaced{0};
  double average_task_ms{0.0};
};

/// Fixed pool of N worker threads with an unbounded FIFO overflow queue.
///
/// A task that outlives its timeout is rejected with TaskTimeout and its worker is discarded
/// (detached, never given another task) and replaced by a fresh one, so the pool stays at N.
/// Cancelled running tasks are asked to stop through their stop token; their worker returns to
/// the pool only after the work returns, or is discarded if the timeout passes first.
///
/// Thread-safety: all public members may be called concurrently. Internals live in a shared
/// core so discarded workers never touch a destroyed scheduler.
class TaskScheduler {
 public:
  explicit TaskScheduler(SchedulerOptions options);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;
  TaskScheduler(TaskScheduler&&) = delete;
  TaskScheduler& operator=(TaskScheduler&&) = delete;

  /// Never blocks on work. With no workers, or after shutdown, the ticket is already settled with
  /// SchedulerUnavailable.
  [[nodiscard]] TaskTicket submit(WorkerTask task);

  /// Cancels queued and running tasks of a session; returns how many were cancelled.
  std::size_t cancel_session(std::string_view session_id);

  /// Whether heavy stages can run at all.
  [[nodiscard]] bool available() const noexcept;

  [[nodiscard]] std::size_t queue_depth() const;
  [[nodiscard]] std::size_t pool_size() const;
  [[nodiscard]] std::size_t concurrency() const noexcept { return concurrency_; }
  /// Ids of the workers currently in the pool.
  [[nodiscard]] std::vector<std::uint64_t> worker_ids() const;
  [[nodiscard]] SchedulerStats stats() const;

  /// Rejects queued tasks, asks running ones to stop, waits up to the grace period, joins.
  void shutdown();

 private:
  std::size_t concurrency_;
  std::chrono::milliseconds shutdown_grace_;
  std::shared_ptr<detail::SchedulerCore> core_;
  std::thread watchdog_;
  std::atomic<bool> stopped_{false};
};

}  // namespace shotimport::core
