// File: include/ps/core/io/distance_source.hpp
#pragma once

#include <cstddef>
#include <string>

#include "ps/core/types.hpp"

namespace ps {

// Where the loop gets one raw distance per spot per tick.
class DistanceSource {
 public:
  virtual ~DistanceSource() = default;

  // Reading for spot `index` (sweep order) at simulation time `now`.
  // Called exactly once per spot per tick, in increasing `index` order.
  virtual double read_cm(std::size_t index, TimestampNs now) = 0;

  virtual std::size_t spot_count() const = 0;

  virtual std::string name() const = 0;
};

}  // namespace ps
