// File: include/ps/core/model/distance_sensor.hpp
#pragma once

#include "ps/core/config.hpp"
#include "ps/core/util/rng.hpp"

namespace ps {

// Simulated ultrasonic reading for the given ground truth:
//   base ~ U(occupied_range | free_range), noise ~ U(-noise_cm, +noise_cm), clamped at 0.
double measure_distance_cm(bool occupied, const SensorConfig& cfg, Rng& rng);

// Instantaneous detection. Strict: a reading exactly at the threshold counts as free.
constexpr bool detect_occupied(double distance_cm, double threshold_cm) noexcept {
  return distance_cm < threshold_cm;
}

}  // namespace ps
