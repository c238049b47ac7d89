// File: src/core/model/debounce_filter.cpp
#include "ps/core/model/debounce_filter.hpp"

namespace ps {

DebounceState step(DebounceState s, bool detected_occupied, int debounce_n) {
  // Runs saturate at debounce_n; a longer run commits nothing more.
  if (detected_occupied) {
    if (s.occupied_run < debounce_n) ++s.occupied_run;
    s.free_run = 0;
  } else {
    if (s.free_run < debounce_n) ++s.free_run;
    s.occupied_run = 0;
  }

  if (s.status != SpotStatus::kOccupied && s.occupied_run >= debounce_n) {
    s.status = SpotStatus::kOccupied;
    s.occupied_run = 0;
    s.free_run = 0;
  } else if (s.status != SpotStatus::kFree && s.free_run >= debounce_n) {
    s.status = SpotStatus::kFree;
    s.occupied_run = 0;
    s.free_run = 0;
  }

  return s;
}

}  // namespace ps
