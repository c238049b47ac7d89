// File: src/core/model/world_model.cpp
#include "ps/core/model/world_model.hpp"

namespace ps {

DurationNs draw_dwell_ns(bool occupied, double activity, const WorldConfig& cfg, Rng& rng) {
  const double base_s = rng.uniform(occupied ? cfg.occupied_dwell_s : cfg.free_dwell_s);
  return seconds_to_ns(base_s / activity);
}

WorldState make_world_state(TimestampNs now, const WorldConfig& cfg, Rng& rng) {
  WorldState s;
  s.occupied = false;
  s.activity = rng.uniform(cfg.activity);
  s.next_transition = TimestampNs{now.ns + draw_dwell_ns(false, s.activity, cfg, rng)};
  return s;
}

WorldState advance(WorldState s, TimestampNs now, const WorldConfig& cfg, Rng& rng) {
  if (now < s.next_transition) return s;

  s.occupied = !s.occupied;
  s.next_transition = TimestampNs{now.ns + draw_dwell_ns(s.occupied, s.activity, cfg, rng)};
  return s;
}

}  // namespace ps
