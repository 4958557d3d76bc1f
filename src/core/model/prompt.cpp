// File: src/core/model/prompt.cpp
#include "compchat/core/model/prompt.hpp"

#include <utility>

namespace compchat {

const std::string& instruction_template() {
  static const std::string kTemplate = std::string(
      "This is a table of data extracted from the ORKG that represents a comparison of several "
      "research papers.\n"
      "The rows are properties of the papers, and the columns are the papers (contributions) "
      "themselves.\n"
      "\n"
      "The questions will need you to look into the values, sometimes across multiple columns.\n"
      "The cells could contain multiple values and not just a single value.\n"
      "\n"
      "If there is a date in there you might need to parse it to find answers about the year or "
      "the month.\n"
      "\n"
      "If you do not know the answer, reply as follows:\n"
      "\"") + kUnknownAnswer + "\"\n"
      "\n"
      "Return all output as a string.\n"
      "\n"
      "Lets think step by step.\n"
      "\n"
      "Below is the query.\n"
      "Query:\n";
  return kTemplate;
}

Prompt::Prompt(std::string query, std::string text)
    : query_(std::move(query)), text_(std::move(text)) {}

Prompt Prompt::wrap(std::string query) {
  std::string text = instruction_template() + query;
  return Prompt(std::move(query), std::move(text));
}

}  // namespace compchat
