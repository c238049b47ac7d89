// File: src/core/util/rng.cpp
#include "ps/core/util/rng.hpp"

namespace ps {

Rng Rng::from_config_seed(std::uint32_t seed) {
  if (seed != 0) return Rng(seed);

  std::random_device rd;
  std::uint32_t s = rd();
  if (s == 0) s = 1;  // keep 0 reserved for "pick one"
  return Rng(s);
}

double Rng::uniform(double lo, double hi) {
  if (lo == hi) return lo;
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

}  // namespace ps
