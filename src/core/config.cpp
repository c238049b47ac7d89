// src/core/config.cpp
#include "ps/core/config.hpp"

#include <iomanip>
#include <sstream>

namespace ps {

std::vector<SpotId> resolve_spot_ids(const SpotsConfig& spots) {
  if (!spots.ids.empty()) return spots.ids;

  std::vector<SpotId> ids;
  ids.reserve(static_cast<std::size_t>(spots.count > 0 ? spots.count : 0));
  for (int i = 1; i <= spots.count; ++i) {
    std::ostringstream ss;
    ss << spots.prefix << std::setw(2) << std::setfill('0') << i;
    ids.push_back(ss.str());
  }
  return ids;
}

}  // namespace ps
