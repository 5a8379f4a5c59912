#include <shotimport/core/deadline_timer.hpp>

namespace shotimport::core {

DeadlineTimer::~DeadlineTimer() { disarm(); }

void DeadlineTimer::arm(std::chrono::steady_clock::time_point deadline, Callback on_expiry) {
  disarm();
  thread_ = std::jthread([this, deadline, cb = std::move(on_expiry)](std::stop_token stop) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_until(lock, stop, deadline, [] { return false; });
    }
    if (stop.stop_requested()) return;
    if (cb) cb();
  });
}

void DeadlineTimer::cancel() noexcept { thread_.request_stop(); }

void DeadlineTimer::disarm() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  if (thread_.get_id() == std::this_thread::get_id()) return;
  thread_.join();
}

}  // namespace shotimport::core
