// File: src/core/types.cpp
#include "compchat/core/types.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace compchat {
namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

Result<StrategyTag> parse_strategy_tag(const std::string& s) {
  if (s == "TABULAR") return Result<StrategyTag>::ok(StrategyTag::kTabular);
  if (s == "STRUCTURED") return Result<StrategyTag>::ok(StrategyTag::kStructured);
  return Result<StrategyTag>::err(Status::unsupported_variant("unknown strategy tag: '" + s + "'"));
}

const char* strategy_tag_name(StrategyTag tag) noexcept {
  switch (tag) {
    case StrategyTag::kTabular: return "TABULAR";
    case StrategyTag::kStructured: return "STRUCTURED";
  }
  return "UNKNOWN";
}

bool is_supported(StrategyTag tag) noexcept {
  switch (tag) {
    case StrategyTag::kTabular:
    case StrategyTag::kStructured:
      return true;
  }
  return false;
}

Result<DeliveryMode> parse_delivery_mode(const std::string& s) {
  const auto m = to_lower(s);
  if (m == "none") return Result<DeliveryMode>::ok(DeliveryMode::kNone);
  if (m == "pull") return Result<DeliveryMode>::ok(DeliveryMode::kPull);
  if (m == "push") return Result<DeliveryMode>::ok(DeliveryMode::kPush);
  return Result<DeliveryMode>::err(Status::invalid_argument("unknown delivery mode: '" + s + "'"));
}

const char* delivery_mode_name(DeliveryMode mode) noexcept {
  switch (mode) {
    case DeliveryMode::kNone: return "none";
    case DeliveryMode::kPull: return "pull";
    case DeliveryMode::kPush: return "push";
  }
  return "unknown";
}

const char* event_kind_name(Event::Kind kind) noexcept {
  return kind == Event::Kind::kAnswer ? "answer" : "thought";
}

std::string to_frame(const Event& e) {
  nlohmann::json j;
  j["kind"] = event_kind_name(e.kind);
  j["text"] = e.text;
  // Backend text is not guaranteed to be valid UTF-8; never throw on the transport path.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace compchat
