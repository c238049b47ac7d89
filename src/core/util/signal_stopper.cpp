// File: src/core/util/signal_stopper.cpp
#include "ps/core/util/signal_stopper.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

namespace ps {

SignalStopper::SignalStopper(StopFlag& stop) {
  sigemptyset(&set_);
  sigaddset(&set_, SIGINT);
  sigaddset(&set_, SIGTERM);

  const int rc = pthread_sigmask(SIG_BLOCK, &set_, &old_set_);
  if (rc != 0) {
    status_ = Status::io_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    return;
  }

  thread_ = std::thread([this, &stop] {
    int sig = 0;
    if (sigwait(&set_, &sig) == 0 && !done_) {
      std::cout << "\nsignal " << sig << " received, stopping after this tick\n";
      stop.request_stop();
    }
  });
}

SignalStopper::~SignalStopper() {
  if (!thread_.joinable()) return;  // signals were never blocked

  done_ = true;
  // SIGTERM is blocked in this process, so this only wakes the waiter. ESRCH means it already
  // consumed a signal and returned.
  const int rc = pthread_kill(thread_.native_handle(), SIGTERM);
  if (rc != 0 && rc != ESRCH) std::cerr << "pthread_kill failed: " << std::strerror(rc) << "\n";
  thread_.join();

  const int rc_mask = pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
  if (rc_mask != 0) std::cerr << "restoring signal mask failed: " << std::strerror(rc_mask) << "\n";
}

}  // namespace ps
