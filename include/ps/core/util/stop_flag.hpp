// File: include/ps/core/util/stop_flag.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ps {

// Cooperative cancellation for the tick loop.
// request_stop() may be called from any thread (not from a signal handler; see ps_node's
// signal thread). Waiters wake immediately.
class StopFlag {
 public:
  using Clock = std::chrono::steady_clock;

  void request_stop();
  bool stop_requested() const;

  // Sleep until `deadline` or a stop request, whichever comes first.
  // Returns true if a stop has been requested.
  bool wait_until(Clock::time_point deadline) const;

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool stopped_{false};
};

}  // namespace ps
