// File: include/compchat/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "compchat/core/config.hpp"

namespace compchat {

// Hash the full runtime config, minus the API key.
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace compchat
