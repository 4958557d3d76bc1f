// include/compchat/core/util/config_loader.hpp
#pragma once

#include <string>

#include "compchat/core/config.hpp"
#include "compchat/core/status.hpp"

namespace compchat {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - Relative dataset/script/journal paths are resolved relative to the main file.
// - backend.api_key is read from the environment variable named by backend.api_key_env.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

}  // namespace compchat
