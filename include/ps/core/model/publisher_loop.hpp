// File: include/ps/core/model/publisher_loop.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "ps/core/config.hpp"
#include "ps/core/events/status_sink.hpp"
#include "ps/core/io/distance_source.hpp"
#include "ps/core/model/debounce_filter.hpp"
#include "ps/core/status.hpp"
#include "ps/core/types.hpp"

namespace ps {

// Per-spot state owned by the loop. The latent world lives in the DistanceSource.
struct SpotState {
  SpotId id;
  DebounceState debounce;
  std::optional<SpotStatus> last_published;  // empty until first publish
};

struct LoopStats {
  std::int64_t ticks = 0;
  std::int64_t events = 0;            // change events handed to the sink
  std::int64_t publish_failures = 0;  // sink returned non-OK (not retried)
};

// Change-gated sweep over all spots:
//   distance -> detect -> debounce -> publish iff status != last published.
// One tick processes every spot once, in configured order.
class PublisherLoop {
 public:
  // `source` and `sink` must outlive the loop. Fails if the source does not report exactly
  // one spot per configured id.
  // `echo` (optional) receives one human-readable line per published change.
  static Result<PublisherLoop> create(const Config& cfg, DistanceSource& source,
                                      StatusSink& sink, std::ostream* echo = nullptr);

  // Returns the number of change events published during this sweep.
  std::size_t tick(TimestampNs t_ns, TimestampNs t_wall_ns);

  const std::vector<SpotState>& spots() const { return spots_; }
  const LoopStats& stats() const { return stats_; }

 private:
  PublisherLoop(const Config& cfg, std::vector<SpotId> ids, DistanceSource& source,
                StatusSink& sink, std::ostream* echo);

  void publish_change_(SpotState& spot, double distance_cm, TimestampNs t_wall_ns);

  DetectionConfig detection_;
  PublishConfig publish_;
  std::string topic_namespace_;

  DistanceSource& source_;
  StatusSink& sink_;
  std::ostream* echo_;

  std::vector<SpotState> spots_;
  LoopStats stats_;
};

}  // namespace ps
