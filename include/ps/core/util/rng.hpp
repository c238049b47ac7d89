// File: include/ps/core/util/rng.hpp
#pragma once

#include <cstdint>
#include <random>

#include "ps/core/types.hpp"

namespace ps {

// Explicit, seedable random source. Everything random in the simulation draws from one of
// these, so a fixed seed reproduces a run exactly (on the same standard library).
class Rng {
 public:
  explicit Rng(std::uint32_t seed) : seed_(seed), engine_(seed) {}

  // seed == 0 picks a nondeterministic seed.
  static Rng from_config_seed(std::uint32_t seed);

  // Uniform real in [lo, hi).
  double uniform(double lo, double hi);
  double uniform(const RangeD& r) { return uniform(r.lo, r.hi); }

  std::uint32_t seed() const { return seed_; }

 private:
  std::uint32_t seed_;
  std::mt19937 engine_;
};

}  // namespace ps
