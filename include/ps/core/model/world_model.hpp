// File: include/ps/core/model/world_model.hpp
#pragma once

#include "ps/core/config.hpp"
#include "ps/core/types.hpp"
#include "ps/core/util/rng.hpp"

namespace ps {

// Latent ground truth for one spot: is a car physically there, and when may that change.
struct WorldState {
  bool occupied = false;
  double activity = 1.0;  // fixed at creation; higher = shorter dwells
  TimestampNs next_transition;
};

// Dwell duration for a spot that has just become `occupied` (or free): a uniform base from the
// matching band divided by the activity factor.
DurationNs draw_dwell_ns(bool occupied, double activity, const WorldConfig& cfg, Rng& rng);

// New spot at `now`: empty, activity drawn from cfg.activity, armed with a free dwell.
WorldState make_world_state(TimestampNs now, const WorldConfig& cfg, Rng& rng);

// Flip the ground truth when `now` has reached next_transition and re-arm immediately.
// Otherwise the state is returned unchanged.
WorldState advance(WorldState s, TimestampNs now, const WorldConfig& cfg, Rng& rng);

}  // namespace ps
