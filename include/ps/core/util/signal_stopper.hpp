// File: include/ps/core/util/signal_stopper.hpp
#pragma once

#include <signal.h>

#include <atomic>
#include <thread>

#include "ps/core/status.hpp"
#include "ps/core/util/stop_flag.hpp"

namespace ps {

// Turns SIGINT/SIGTERM into a StopFlag request.
// Both signals are blocked in the constructing thread (and every thread it starts afterwards)
// and consumed by a dedicated sigwait thread, so request_stop() runs in normal thread context.
// Construct before any other thread, and destroy on the same thread: the previous signal mask
// of that thread is restored on destruction.
class SignalStopper {
 public:
  explicit SignalStopper(StopFlag& stop);
  ~SignalStopper();

  SignalStopper(const SignalStopper&) = delete;
  SignalStopper& operator=(const SignalStopper&) = delete;

  // Non-OK if the signals could not be blocked; no waiter thread runs in that case.
  const Status& status() const { return status_; }

 private:
  sigset_t set_{};
  sigset_t old_set_{};
  Status status_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

}  // namespace ps
