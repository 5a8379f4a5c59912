#include <shotimport/core/task_scheduler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

namespace shotimport::core {

namespace detail {

using Clock = std::chrono::steady_clock;

struct TaskRecord {
  std::uint64_t id{0};
  WorkerTask task;
  std::atomic<TaskStatus> status{TaskStatus::Queued};
  std::atomic<std::uint64_t> worker_id{0};
  std::promise<TaskResult> promise;
  std::stop_source stop;
  Clock::time_point started{};
  Clock::time_point deadline{Clock::time_point::max()};

  bool begin() {
    TaskStatus expected = TaskStatus::Queued;
    return status.compare_exchange_strong(expected, TaskStatus::Running);
  }

  /// Moves to a final status and fulfils the promise; only the first caller wins.
  bool settle(TaskStatus to, TaskResult result) {
    TaskStatus from = status.load();
    while (!is_final(from)) {
      if (status.compare_exchange_weak(from, to)) {
        promise.set_value(std::move(result));
        return true;
      }
    }
    return false;
  }
};

struct Worker {
  std::uint64_t id{0};
  std::thread thread;
  std::condition_variable wake;
  std::shared_ptr<TaskRecord> current;
  bool retired{false};
};

void worker_loop(std::shared_ptr<SchedulerCore> core, std::shared_ptr<Worker> self);

/// Shared by the scheduler, its watchdog and every worker thread (including discarded ones).
/// Members are guarded by `mutex`; functions marked "locked" expect it held.
struct SchedulerCore : std::enable_shared_from_this<SchedulerCore> {
  mutable std::mutex mutex;
  std::condition_variable watchdog_cv;
  std::condition_variable idle_cv;
  std::deque<std::shared_ptr<TaskRecord>> queue;
  std::vector<std::shared_ptr<Worker>> workers;
  bool accepting{true};
  bool watchdog_stop{false};
  std::uint64_t next_task_id{1};
  std::uint64_t next_worker_id{1};
  SchedulerStats stats;
  double total_task_ms{0.0};

  // locked
  std::shared_ptr<Worker> spawn_worker() {
    auto w = std::make_shared<Worker>();
    w->id = next_worker_id++;
    w->thread = std::thread(worker_loop, shared_from_this(), w);
    return w;
  }

  // locked; record must already be Running
  void assign(Worker& w, std::shared_ptr<TaskRecord> record) {
    record->worker_id.store(w.id);
    record->started = Clock::now();
    if (record->task.timeout.count() > 0) {
      record->deadline = record->started + record->task.timeout;
    }
    spdlog::debug("[scheduler] task {} ({}) -> worker {}", record->id, to_string(record->task.kind),
                  w.id);
    w.current = std::move(record);
    w.wake.notify_one();
    watchdog_cv.notify_one();
  }

  // locked; strict FIFO
  void dispatch_next(Worker& w) {
    while (!queue.empty()) {
      auto record = std::move(queue.front());
      queue.pop_front();
      if (record->begin()) {
        assign(w, std::move(record));
        return;
      }
    }
  }

  // locked
  void record_finish(const TaskRecord& record, bool ok, Clock::time_point finished) {
    ok ? ++stats.completed : ++stats.failed;
    total_task_ms +=
        std::chrono::duration<double, std::milli>(finished - record.started).count();
    const auto n = stats.completed + stats.failed;
    stats.average_task_ms = n > 0 ? total_task_ms / static_cast<double>(n) : 0.0;
  }

  // locked; worker at index i overran its task's timeout
  void replace_hung(std::size_t i) {
    auto hung = workers[i];
    auto record = std::move(hung->current);
    record->stop.request_stop();
    if (record->settle(TaskStatus::TimedOut,
                       std::unexpected(make_error(
                           ErrorCode::TaskTimeout,
                           "task " + std::to_string(record->id) + " exceeded " +
                               std::to_string(record->task.timeout.count()) + " ms")))) {
      ++stats.timed_out;
    }
    hung->retired = true;
    hung->wake.notify_one();
    if (hung->thread.joinable()) hung->thread.detach();

    workers[i] = spawn_worker();
    ++stats.workers_replaced;
    spdlog::warn("[scheduler] task {} ({}) timed out on worker {}; replaced by worker {}",
                 record->id, to_string(record->task.kind), hung->id, workers[i]->id);
    dispatch_next(*workers[i]);
  }

  // locked
  [[nodiscard]] bool any_running() const {
    return std::any_of(workers.begin(), workers.end(),
                       [](const std::shared_ptr<Worker>& w) { return w->current != nullptr; });
  }
};

namespace {

TaskResult run_guarded(TaskRecord& record) {
  if (!record.task.work) {
    return std::unexpected(make_error(ErrorCode::TaskExecution, "task has no work"));
  }
  try {
    return record.task.work(record.stop.get_token());
  } catch (const std::exception& e) {
    return std::unexpected(make_error(ErrorCode::TaskExecution, e.what()));
  } catch (...) {
    return std::unexpected(make_error(ErrorCode::TaskExecution, "unknown exception"));
  }
}

void watchdog_loop(std::shared_ptr<SchedulerCore> core) {
  std::unique_lock lock(core->mutex);
  while (!core->watchdog_stop) {
    const auto now = Clock::now();
    auto next = Clock::time_point::max();
    for (std::size_t i = 0; i < core->workers.size(); ++i) {
      if (core->workers[i]->current && core->workers[i]->current->deadline <= now) {
        core->replace_hung(i);
      }
      const auto& w = core->workers[i];
      if (w->current) next = std::min(next, w->current->deadline);
    }
    if (next == Clock::time_point::max()) {
      core->watchdog_cv.wait(lock);
    } else {
      core->watchdog_cv.wait_until(lock, next);
    }
  }
}

}  // namespace

void worker_loop(std::shared_ptr<SchedulerCore> core, std::shared_ptr<Worker> self) {
  std::unique_lock lock(core->mutex);
  for (;;) {
    self->wake.wait(lock, [&] {
      return self->retired || self->current != nullptr || !core->accepting;
    });
    if (self->retired || !self->current) return;

    std::shared_ptr<TaskRecord> record = self->current;
    lock.unlock();
    TaskResult result = run_guarded(*record);
    const auto finished = Clock::now();
    lock.lock();

    // Discarded while running: the task was already rejected, this thread just ends.
    if (self->retired) return;

    const bool ok = result.has_value();
    if (!ok) {
      spdlog::warn("[scheduler] task {} ({}) failed: {}", record->id, to_string(record->task.kind),
                   describe(result.error()));
    }
    if (record->settle(ok ? TaskStatus::Done : TaskStatus::Failed, std::move(result))) {
      core->record_finish(*record, ok, finished);
    }
    self->current.reset();
    core->dispatch_next(*self);
    core->idle_cv.notify_all();
    core->watchdog_cv.notify_one();
  }
}

}  // namespace detail

std::string_view to_string(TaskKind kind) noexcept {
  switch (kind) {
    case TaskKind::RoiDetection:
      return "roi-detection";
    case TaskKind::RegionExtraction:
      return "region-extraction";
    case TaskKind::Recognition:
      return "recognition";
  }
  return "unknown";
}

std::string_view to_string(TaskStatus status) noexcept {
  switch (status) {
    case TaskStatus::Queued:
      return "queued";
    case TaskStatus::Running:
      return "running";
    case TaskStatus::Done:
      return "done";
    case TaskStatus::Failed:
      return "failed";
    case TaskStatus::TimedOut:
      return "timed-out";
    case TaskStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::uint64_t TaskTicket::id() const noexcept { return record_ ? record_->id : 0; }

TaskStatus TaskTicket::status() const noexcept {
  return record_ ? record_->status.load() : TaskStatus::Cancelled;
}

std::uint64_t TaskTicket::worker_id() const noexcept {
  return record_ ? record_->worker_id.load() : 0;
}

TaskResult TaskTicket::get() {
  if (!result_.valid()) {
    return std::unexpected(make_error(ErrorCode::SchedulerUnavailable, "empty task ticket"));
  }
  return result_.get();
}

TaskScheduler::TaskScheduler(SchedulerOptions options)
    : concurrency_(options.concurrency),
      shutdown_grace_(options.shutdown_grace),
      core_(std::make_shared<detail::SchedulerCore>()) {
  {
    std::lock_guard lock(core_->mutex);
    core_->workers.reserve(concurrency_);
    for (std::size_t i = 0; i < concurrency_; ++i) {
      core_->workers.push_back(core_->spawn_worker());
    }
  }
  watchdog_ = std::thread(detail::watchdog_loop, core_);
  spdlog::debug("[scheduler] started with {} workers", concurrency_);
}

TaskScheduler::~TaskScheduler() { shutdown(); }

TaskTicket TaskScheduler::submit(WorkerTask task) {
  auto record = std::make_shared<detail::TaskRecord>();
  record->task = std::move(task);
  TaskTicket ticket(record, record->promise.get_future());

  std::lock_guard lock(core_->mutex);
  record->id = core_->next_task_id++;
  ++core_->stats.submitted;

  if (!core_->accepting || core_->workers.empty()) {
    record->settle(TaskStatus::Failed,
                   std::unexpected(make_error(ErrorCode::SchedulerUnavailable,
                                              "no workers available for heavy stages")));
    ++core_->stats.failed;
    return ticket;
  }

  for (auto& w : core_->workers) {
    if (!w->current) {
      record->begin();
      core_->assign(*w, std::move(record));
      return ticket;
    }
  }
  spdlog::debug("[scheduler] task {} queued (depth {})", record->id, core_->queue.size() + 1);
  core_->queue.push_back(std::move(record));
  return ticket;
}

std::size_t TaskScheduler::cancel_session(std::string_view session_id) {
  std::lock_guard lock(core_->mutex);
  std::size_t cancelled = 0;
  const auto make_cancelled = [] {
    return std::unexpected(make_error(ErrorCode::Cancelled, "task cancelled"));
  };

  auto& queue = core_->queue;
  for (auto it = queue.begin(); it != queue.end();) {
    if ((*it)->task.session_id == session_id) {
      if ((*it)->settle(TaskStatus::Cancelled, make_cancelled())) ++cancelled;
      it = queue.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& w : core_->workers) {
    if (w->current && w->current->task.session_id == session_id) {
      w->current->stop.request_stop();
      if (w->current->settle(TaskStatus::Cancelled, make_cancelled())) ++cancelled;
    }
  }
  core_->stats.cancelled += cancelled;
  if (cancelled > 0) {
    spdlog::debug("[scheduler] cancelled {} task(s) of session {}", cancelled, session_id);
  }
  return cancelled;
}

bool TaskScheduler::available() const noexcept {
  return concurrency_ > 0 && !stopped_.load();
}

std::size_t TaskScheduler::queue_depth() const {
  std::lock_guard lock(core_->mutex);
  return core_->queue.size();
}

std::size_t TaskScheduler::pool_size() const {
  std::lock_guard lock(core_->mutex);
  return core_->workers.size();
}

std::vector<std::uint64_t> TaskScheduler::worker_ids() const {
  std::lock_guard lock(core_->mutex);
  std::vector<std::uint64_t> ids;
  ids.reserve(core_->workers.size());
  for (const auto& w : core_->workers) ids.push_back(w->id);
  return ids;
}

SchedulerStats TaskScheduler::stats() const {
  std::lock_guard lock(core_->mutex);
  return core_->stats;
}

void TaskScheduler::shutdown() {
  if (stopped_.exchange(true)) return;

  std::vector<std::shared_ptr<detail::Worker>> workers;
  {
    std::unique_lock lock(core_->mutex);
    core_->accepting = false;
    for (auto& record : core_->queue) {
      if (record->settle(TaskStatus::Cancelled,
                         std::unexpected(make_error(ErrorCode::SchedulerUnavailable,
                                                    "scheduler shut down")))) {
        ++core_->stats.cancelled;
      }
    }
    core_->queue.clear();
    for (auto& w : core_->workers) {
      if (w->current) w->current->stop.request_stop();
      w->wake.notify_one();
    }

    core_->idle_cv.wait_for(lock, shutdown_grace_, [&] { return !core_->any_running(); });

    for (auto& w : core_->workers) {
      if (!w->current) continue;
      spdlog::warn("[scheduler] abandoning worker {} still running task {}", w->id,
                   w->current->id);
      if (w->current->settle(TaskStatus::Cancelled,
                             std::unexpected(make_error(ErrorCode::SchedulerUnavailable,
                                                        "scheduler shut down")))) {
        ++core_->stats.cancelled;
      }
      w->retired = true;
      w->current.reset();
      w->wake.notify_one();
      if (w->thread.joinable()) w->thread.detach();
    }
    core_->watchdog_stop = true;
    core_->watchdog_cv.notify_all();
    workers.swap(core_->workers);
  }

  if (watchdog_.joinable()) watchdog_.join();
  for (auto& w : workers) {
    if (w->thread.joinable()) w->thread.join();
  }
  spdlog::debug("[scheduler] stopped");
}

}  // namespace shotimport::core
