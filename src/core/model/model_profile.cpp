// File: src/core/model/model_profile.cpp
#include "compchat/core/model/model_profile.hpp"

#include <algorithm>

namespace compchat {

ModelProfile resolve_model_profile(const std::string& model, const ModelsConfig& models) {
  ModelProfile p;
  p.model = model;
  p.chat = std::find(models.chat_models.begin(), models.chat_models.end(), model) !=
           models.chat_models.end();
  p.context_chars = p.chat ? models.chat_context_chars : models.completion_context_chars;
  return p;
}

}  // namespace compchat
