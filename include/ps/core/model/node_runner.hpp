// File: include/ps/core/model/node_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "ps/core/config.hpp"
#include "ps/core/events/status_sink.hpp"
#include "ps/core/model/publisher_loop.hpp"
#include "ps/core/status.hpp"
#include "ps/core/types.hpp"
#include "ps/core/util/stop_flag.hpp"

namespace ps {

enum class StopReason {
  kStopRequested,
  kMaxTicks,
  kMaxRunTime,
};

const char* to_string(StopReason r);

// NodeRunner owns lifecycle: open the sink, drive the loop on its cadence, close the sink.
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns (system clock), used for payload timestamps
class NodeRunner {
 public:
  NodeRunner(Config cfg, std::string config_path);

  // Prunes old bus files (jsonl output only), anchors the clocks and opens the sink.
  // RunInfo carries cfg.world.seed as given, so resolve a 0 seed before constructing the runner
  // if the run should be reproducible from its header.
  Status start(StatusSink& sink);

  // Sweeps every loop.interval_s until a stop is requested or a run limit is hit.
  // A sweep in progress always completes; the stop is observed at the tick boundary.
  Result<StopReason> run(PublisherLoop& loop, StatusSink& sink, const StopFlag& stop);

  Status emit_heartbeat(StatusSink& sink, const std::string& message);

  // Flushes and closes the sink. Only the first call after start() has any effect.
  void stop(StatusSink& sink);

  bool started() const { return started_; }
  TimestampNs since_start_ns() const;

 private:
  static TimestampNs wall_now_epoch_ns();
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

  Config cfg_;
  std::string config_path_;

  std::chrono::steady_clock::time_point t0_steady_{};
  TimestampNs t0_wall_ns_{0};
  bool started_{false};
};

}  // namespace ps
