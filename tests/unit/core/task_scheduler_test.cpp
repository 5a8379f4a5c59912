#include <shotimport/core/task_scheduler.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace nc = shotimport::core;
using namespace std::chrono_literals;

namespace {

nc::TaskResult ok_result(double confidence = 1.0) {
  return nc::HeuristicOutput{nc::Record{}, confidence};
}

nc::WorkerTask make_task(std::string session, nc::TaskWork work,
                         std::chrono::milliseconds timeout = 0ms) {
  return nc::WorkerTask{std::move(session), nc::TaskKind::RoiDetection, timeout, std::move(work)};
}

/// Blocks tasks until released; lets tests hold workers busy deterministically.
class Gate {
 public:
  void open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }
  void wait(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, stop, [&] { return open_; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable_any cv_;
  bool open_{false};
};

}  // namespace

TEST(TaskScheduler, RunsTaskAndReturnsResult) {
  nc::TaskScheduler scheduler({2, 500ms});
  auto ticket = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(0.75); }));
  auto result = ticket.get();
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->confidence, 0.75);
  EXPECT_EQ(ticket.status(), nc::TaskStatus::Done);
  EXPECT_NE(ticket.worker_id(), 0u);
}

TEST(TaskScheduler, QueuedTasksRunInSubmissionOrder) {
  nc::TaskScheduler scheduler({1, 500ms});
  Gate gate;
  std::mutex order_mutex;
  std::vector<int> order;

  auto blocker = scheduler.submit(make_task("s", [&](std::stop_token stop) {
    gate.wait(stop);
    return ok_result();
  }));
  std::vector<nc::TaskTicket> tickets;
  for (int i = 0; i < 5; ++i) {
    tickets.push_back(scheduler.submit(make_task("s", [&, i](std::stop_token) {
      std::lock_guard lock(order_mutex);
      order.push_back(i);
      return ok_result();
    })));
  }
  EXPECT_EQ(scheduler.queue_depth(), 5u);
  EXPECT_EQ(tickets[0].status(), nc::TaskStatus::Queued);
  gate.open();
  ASSERT_TRUE(blocker.get().has_value());
  for (auto& t : tickets) ASSERT_TRUE(t.get().has_value());
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(TaskScheduler, TimedOutWorkerIsReplacedAndPoolSizeKept) {
  nc::TaskScheduler scheduler({2, 200ms});
  const auto before = scheduler.worker_ids();
  ASSERT_EQ(before.size(), 2u);

  auto hung = scheduler.submit(make_task(
      "s",
      [](std::stop_token) {
        std::this_thread::sleep_for(400ms);  // ignores stop on purpose
        return ok_result();
      },
      50ms));
  auto result = hung.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::ErrorCode::TaskTimeout);
  EXPECT_EQ(hung.status(), nc::TaskStatus::TimedOut);

  const auto hung_worker = hung.worker_id();
  const auto after = scheduler.worker_ids();
  EXPECT_EQ(after.size(), 2u);
  EXPECT_EQ(std::count(after.begin(), after.end(), hung_worker), 0);
  EXPECT_EQ(scheduler.stats().workers_replaced, 1u);
  EXPECT_EQ(scheduler.stats().timed_out, 1u);

  // The replacement worker takes new work right away.
  auto next = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(); }));
  EXPECT_TRUE(next.get().has_value());
}

TEST(TaskScheduler, ThrowingWorkBecomesTaskExecution) {
  nc::TaskScheduler scheduler({1, 500ms});
  auto ticket = scheduler.submit(make_task("s", [](std::stop_token) -> nc::TaskResult {
    throw std::runtime_error("detector exploded");
  }));
  auto result = ticket.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::ErrorCode::TaskExecution);
  EXPECT_EQ(result.error().message, "detector exploded");
  EXPECT_EQ(ticket.status(), nc::TaskStatus::Failed);

  auto next = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(); }));
  EXPECT_TRUE(next.get().has_value());
}

TEST(TaskScheduler, ErrorResultIsFailed) {
  nc::TaskScheduler scheduler({1, 500ms});
  auto ticket = scheduler.submit(make_task("s", [](std::stop_token) -> nc::TaskResult {
    return std::unexpected(nc::make_error(nc::ErrorCode::TaskExecution, "no grid"));
  }));
  EXPECT_FALSE(ticket.get().has_value());
  EXPECT_EQ(ticket.status(), nc::TaskStatus::Failed);
  EXPECT_EQ(scheduler.stats().failed, 1u);
}

TEST(TaskScheduler, CancelSessionCancelsQueuedAndRunning) {
  nc::TaskScheduler scheduler({1, 500ms});
  Gate never;
  std::atomic<bool> stopped{false};
  auto running = scheduler.submit(make_task("a", [&](std::stop_token stop) -> nc::TaskResult {
    never.wait(stop);
    stopped = stop.stop_requested();
    return std::unexpected(nc::make_error(nc::ErrorCode::Cancelled, "stopped"));
  }));
  auto queued = scheduler.submit(make_task("a", [](std::stop_token) { return ok_result(); }));
  auto other = scheduler.submit(make_task("b", [](std::stop_token) { return ok_result(); }));

  EXPECT_EQ(scheduler.cancel_session("a"), 2u);
  EXPECT_EQ(running.get().error().code, nc::ErrorCode::Cancelled);
  EXPECT_EQ(queued.get().error().code, nc::ErrorCode::Cancelled);
  EXPECT_EQ(queued.status(), nc::TaskStatus::Cancelled);
  EXPECT_TRUE(other.get().has_value());
  EXPECT_TRUE(stopped.load());
}

TEST(TaskScheduler, NoWorkersMeansUnavailable) {
  nc::TaskScheduler scheduler({0, 100ms});
  EXPECT_FALSE(scheduler.available());
  auto ticket = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(); }));
  auto result = ticket.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::ErrorCode::SchedulerUnavailable);
}

TEST(TaskScheduler, ShutdownRejectsQueuedAndLaterTasks) {
  nc::TaskScheduler scheduler({1, 200ms});
  Gate gate;
  auto running = scheduler.submit(make_task("s", [&](std::stop_token stop) -> nc::TaskResult {
    gate.wait(stop);
    return std::unexpected(nc::make_error(nc::ErrorCode::Cancelled, "stopped"));
  }));
  auto queued = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(); }));

  scheduler.shutdown();
  EXPECT_FALSE(scheduler.available());
  EXPECT_EQ(queued.get().error().code, nc::ErrorCode::SchedulerUnavailable);
  EXPECT_FALSE(running.get().has_value());

  auto late = scheduler.submit(make_task("s", [](std::stop_token) { return ok_result(); }));
  EXPECT_EQ(late.get().error().code, nc::ErrorCode::SchedulerUnavailable);
  scheduler.shutdown();
}

TEST(TaskScheduler, StatusNames) {
  EXPECT_EQ(nc::to_string(nc::TaskStatus::TimedOut), "timed-out");
  EXPECT_EQ(nc::to_string(nc::TaskKind::RegionExtraction), "region-extraction");
  EXPECT_TRUE(nc::is_final(nc::TaskStatus::Cancelled));
  EXPECT_FALSE(nc::is_final(nc::TaskStatus::Running));
}
