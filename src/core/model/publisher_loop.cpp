// File: src/core/model/publisher_loop.cpp
#include "ps/core/model/publisher_loop.hpp"

#include <iostream>
#include <utility>

#include "ps/core/events/status_event.hpp"
#include "ps/core/model/distance_sensor.hpp"

namespace ps {

Result<PublisherLoop> PublisherLoop::create(const Config& cfg, DistanceSource& source,
                                            StatusSink& sink, std::ostream* echo) {
  std::vector<SpotId> ids = resolve_spot_ids(cfg.spots);
  if (ids.empty()) {
    return Result<PublisherLoop>::err(Status::invalid_argument("PublisherLoop: no spots configured"));
  }
  if (source.spot_count() != ids.size()) {
    return Result<PublisherLoop>::err(Status::invalid_argument(
        "PublisherLoop: source '" + source.name() + "' reports " +
        std::to_string(source.spot_count()) + " spots, config has " + std::to_string(ids.size())));
  }
  return Result<PublisherLoop>::ok(PublisherLoop(cfg, std::move(ids), source, sink, echo));
}

PublisherLoop::PublisherLoop(const Config& cfg, std::vector<SpotId> ids, DistanceSource& source,
                             StatusSink& sink, std::ostream* echo)
    : detection_(cfg.detection),
      publish_(cfg.publish),
      topic_namespace_(cfg.topic_namespace),
      source_(source),
      sink_(sink),
      echo_(echo) {
  spots_.reserve(ids.size());
  for (auto& id : ids) {
    SpotState s;
    s.id = std::move(id);
    if (!publish_.announce_initial) s.last_published = s.debounce.status;
    spots_.push_back(std::move(s));
  }
}

std::size_t PublisherLoop::tick(TimestampNs t_ns, TimestampNs t_wall_ns) {
  std::size_t published = 0;

  for (std::size_t i = 0; i < spots_.size(); ++i) {
    SpotState& spot = spots_[i];

    const double distance_cm = source_.read_cm(i, t_ns);
    const bool detected = detect_occupied(distance_cm, detection_.threshold_cm);
    spot.debounce = step(spot.debounce, detected, detection_.debounce_n);

    if (spot.last_published != spot.debounce.status) {
      publish_change_(spot, distance_cm, t_wall_ns);
      ++published;
    }
  }

  ++stats_.ticks;
  return published;
}

void PublisherLoop::publish_change_(SpotState& spot, double distance_cm, TimestampNs t_wall_ns) {
  StatusEvent e;
  e.spot_id = spot.id;
  e.status = spot.debounce.status;
  e.distance_cm = distance_cm;
  e.threshold_cm = detection_.threshold_cm;
  e.debounce_n = detection_.debounce_n;
  e.t_wall_ns = t_wall_ns;

  // Recorded before the outcome is known: a failed publish is lost, not replayed.
  spot.last_published = e.status;
  ++stats_.events;

  const Status st = sink_.publish(status_topic(topic_namespace_, spot.id), to_json(e),
                                  publish_.qos, publish_.retain);

  // The change is echoed whatever the transport did with it.
  if (echo_) {
    *echo_ << format_local_iso8601(t_wall_ns) << " | " << spot.id << " => " << to_string(e.status)
           << " (distance=" << format_tenth(distance_cm) << "cm)\n";
  }

  if (!st.ok()) {
    ++stats_.publish_failures;
    std::cerr << "publish failed for " << spot.id << ": " << st.message() << "\n";
  }
}

}  // namespace ps
