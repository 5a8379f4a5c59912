#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace shotimport::core {

/// Single-shot timer on its own thread. Re-arming replaces the pending expiry.
class DeadlineTimer {
 public:
  using Callback = std::function<void()>;

  DeadlineTimer() = default;
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer&) = delete;
  DeadlineTimer& operator=(const DeadlineTimer&) = delete;

  /// Runs `on_expiry` on the timer thread at `deadline` unless cancelled first. Blocks until a
  /// previously armed timer has finished.
  void arm(std::chrono::steady_clock::time_point deadline, Callback on_expiry);

  /// Non-blocking: the pending expiry will not fire. Safe from any thread, including from
  /// inside the callback.
  void cancel() noexcept;

  /// Cancels and waits for the timer thread. From inside the callback it only cancels.
  void disarm();

 private:
  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::jthread thread_;
};

}  // namespace shotimport::core
