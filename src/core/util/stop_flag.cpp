// File: src/core/util/stop_flag.cpp
#include "ps/core/util/stop_flag.hpp"

namespace ps {

void StopFlag::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool StopFlag::stop_requested() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stopped_;
}

bool StopFlag::wait_until(Clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_until(lock, deadline, [this] { return stopped_; });
}

}  // namespace ps
