// File: src/core/model/distance_sensor.cpp
#include "ps/core/model/distance_sensor.hpp"

#include <algorithm>

namespace ps {

double measure_distance_cm(bool occupied, const SensorConfig& cfg, Rng& rng) {
  const double base = rng.uniform(occupied ? cfg.occupied_range_cm : cfg.free_range_cm);
  const double noise = rng.uniform(-cfg.noise_cm, cfg.noise_cm);
  return std::max(0.0, base + noise);
}

}  // namespace ps
