// File: include/compchat/core/model/prompt.hpp
#pragma once

#include <string>

namespace compchat {

// The reply a session gives when the backend cannot determine an answer.
inline constexpr const char* kUnknownAnswer = "Sorry!, I do not know.";

// Fixed instruction wrapper placed in front of every user query.
const std::string& instruction_template();

// A user query with the instruction wrapper applied. Only Prompt::wrap builds
// one, so every prompt reaching a session carries the wrapper exactly once.
class Prompt {
 public:
  static Prompt wrap(std::string query);

  const std::string& query() const noexcept { return query_; }
  const std::string& text() const noexcept { return text_; }

 private:
  Prompt(std::string query, std::string text);

  std::string query_;
  std::string text_;
};

}  // namespace compchat
