// File: include/ps/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "ps/core/config.hpp"

namespace ps {

// Hash the full runtime config (fleet, detection, simulation, cadence, publish, output).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace ps
