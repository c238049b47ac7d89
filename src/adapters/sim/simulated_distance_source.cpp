// File: src/adapters/sim/simulated_distance_source.cpp
#include "ps/adapters/sim/simulated_distance_source.hpp"

#include <utility>

#include "ps/core/model/distance_sensor.hpp"

namespace ps {

SimulatedDistanceSource::SimulatedDistanceSource(SimSourceConfig cfg, Rng rng, TimestampNs start)
    : cfg_(std::move(cfg)), rng_(std::move(rng)) {
  worlds_.reserve(cfg_.spot_count);
  for (std::size_t i = 0; i < cfg_.spot_count; ++i) {
    worlds_.push_back(make_world_state(start, cfg_.world, rng_));
  }
}

double SimulatedDistanceSource::read_cm(std::size_t index, TimestampNs now) {
  WorldState& w = worlds_.at(index);
  w = advance(w, now, cfg_.world, rng_);
  return measure_distance_cm(w.occupied, cfg_.sensor, rng_);
}

}  // namespace ps
