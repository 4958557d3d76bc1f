// File: include/compchat/core/model/model_profile.hpp
#pragma once

#include <cstddef>
#include <string>

#include "compchat/core/config.hpp"

namespace compchat {

// What the selector needs to know about the backend model when sizing context.
struct ModelProfile {
  std::string model;
  bool chat = false;              // chat models accept longer inputs
  std::size_t context_chars = 0;  // table text allowed verbatim in a prompt
};

ModelProfile resolve_model_profile(const std::string& model, const ModelsConfig& models);

}  // namespace compchat
