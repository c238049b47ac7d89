// File: include/ps/core/model/debounce_filter.hpp
#pragma once

#include "ps/core/types.hpp"

namespace ps {

// Hysteresis state for one spot.
// Invariant: after every step at most one of the two counters is non-zero, and neither
// exceeds debounce_n.
struct DebounceState {
  SpotStatus status = SpotStatus::kFree;
  int occupied_run = 0;  // consecutive occupied detections since last reset
  int free_run = 0;      // consecutive free detections since last reset
};

// Feed one instantaneous detection.
//  - The detection extends its own run (capped at `debounce_n`) and zeroes the opposite one.
//  - A run reaching `debounce_n` against the current status commits the change and zeroes
//    both runs, so the new status must be contradicted by a full run before it reverts.
DebounceState step(DebounceState s, bool detected_occupied, int debounce_n);

}  // namespace ps
