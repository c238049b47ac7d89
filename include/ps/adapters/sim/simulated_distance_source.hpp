// File: include/ps/adapters/sim/simulated_distance_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ps/core/config.hpp"
#include "ps/core/io/distance_source.hpp"
#include "ps/core/model/world_model.hpp"
#include "ps/core/util/rng.hpp"

namespace ps {

struct SimSourceConfig {
  std::size_t spot_count{1};
  WorldConfig world;
  SensorConfig sensor;
};

// Synthetic fleet: one latent world per spot, advanced lazily on read, plus a noisy reading.
// All draws (activity, dwell, distance, noise) come from the single Rng, in sweep order.
class SimulatedDistanceSource final : public DistanceSource {
 public:
  SimulatedDistanceSource(SimSourceConfig cfg, Rng rng, TimestampNs start);

  double read_cm(std::size_t index, TimestampNs now) override;
  std::size_t spot_count() const override { return worlds_.size(); }
  std::string name() const override { return "sim"; }

  const WorldState& world(std::size_t index) const { return worlds_.at(index); }

 private:
  SimSourceConfig cfg_;
  Rng rng_;
  std::vector<WorldState> worlds_;
};

}  // namespace ps
