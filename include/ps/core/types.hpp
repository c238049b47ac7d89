// include/ps/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace ps {

// -----------------------------
// Basic identifiers
// -----------------------------

using SpotId = std::string;    // e.g. "P01"
using ClientId = std::string;  // e.g. "SmartPark2026_P1"

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds. Simulation time (t_ns) is relative to run start on a
// steady clock; wall time (t_wall_ns) is epoch-based and only used for display/payloads.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

using DurationNs = std::int64_t;

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

constexpr double ns_to_seconds(DurationNs ns) { return static_cast<double>(ns) * 1e-9; }

// -----------------------------
// Occupancy
// -----------------------------

enum class SpotStatus {
  kFree,
  kOccupied,
};

constexpr const char* to_string(SpotStatus s) noexcept {
  return s == SpotStatus::kOccupied ? "OCCUPIED" : "FREE";
}

// Closed real interval [lo, hi]. Used for distance bands, dwell bases, activity factors.
struct RangeD {
  double lo = 0.0;
  double hi = 0.0;

  [[nodiscard]] bool is_valid() const noexcept { return lo <= hi; }
  [[nodiscard]] bool contains(double v) const noexcept { return v >= lo && v <= hi; }
};

}  // namespace ps
