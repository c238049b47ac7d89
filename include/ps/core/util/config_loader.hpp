// include/ps/core/util/config_loader.hpp
#pragma once

#include <string>

#include "ps/core/config.hpp"
#include "ps/core/status.hpp"

namespace ps {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied. Validation is left to the caller
// so command-line overrides can be applied first (see validate_config).
Result<Config> load_config(const std::string& path);

}  // namespace ps
