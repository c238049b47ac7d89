// File: include/ps/core/events/status_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "ps/core/status.hpp"
#include "ps/core/types.hpp"

namespace ps {

struct RunInfo {
  ClientId client_id;
  std::string config_path;
  std::string out_dir;

  std::string config_hash;
  std::size_t spot_count = 0;
  std::uint32_t seed = 0;  // effective simulation seed (never 0 once resolved)

  TimestampNs wall_start_time_ns;
};

// Message-bus publish capability consumed by the loop.
// publish() is fire-and-forget from the caller's side: a non-OK status is reported, never
// retried. Delivery guarantees beyond that belong to the implementation.
class StatusSink {
 public:
  virtual ~StatusSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status publish(const std::string& topic, const std::string& payload, int qos,
                         bool retain) = 0;
  virtual Status flush() = 0;

  // Must be safe to call more than once.
  virtual void close() = 0;
};

}  // namespace ps
