// File: tests/signal_stopper_test.cpp
#include <gtest/gtest.h>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>

#include "ps/core/util/signal_stopper.hpp"
#include "ps/core/util/stop_flag.hpp"

namespace {

bool sigterm_blocked() {
  sigset_t cur;
  sigemptyset(&cur);
  if (pthread_sigmask(SIG_BLOCK, nullptr, &cur) != 0) return false;
  return sigismember(&cur, SIGTERM) == 1;
}

TEST(SignalStopper, SigtermRequestsStop) {
  ps::StopFlag stop;
  ps::SignalStopper signals(stop);
  ASSERT_TRUE(signals.status().ok()) << signals.status().message();

  ASSERT_EQ(kill(getpid(), SIGTERM), 0);
  EXPECT_TRUE(stop.wait_until(ps::StopFlag::Clock::now() + std::chrono::seconds(5)));
}

TEST(SignalStopper, ShutdownWithoutSignalKeepsProcessAlive) {
  ps::StopFlag stop;
  {
    ps::SignalStopper signals(stop);
    ASSERT_TRUE(signals.status().ok());
    EXPECT_TRUE(sigterm_blocked());
  }
  // Reaching this line means the waiter was woken without the process being terminated.
  EXPECT_FALSE(stop.stop_requested());
}

TEST(SignalStopper, RestoresPreviousMask) {
  ASSERT_FALSE(sigterm_blocked());
  ps::StopFlag stop;
  { ps::SignalStopper signals(stop); }
  EXPECT_FALSE(sigterm_blocked());
}

}  // namespace
