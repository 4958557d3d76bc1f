// include/compchat/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "compchat/core/status.hpp"

namespace compchat {

// -----------------------------
// Basic identifiers
// -----------------------------

using DatasetId = std::string;  // e.g. "R44930" or "cmp-1"
using ChannelId = std::string;  // push transport channel
using QueryId = std::string;    // assigned by the Coordinator, e.g. "q-000001"

// -----------------------------
// Time
// -----------------------------
// Integer nanoseconds. Journal records carry both run-relative (steady) and wall epoch time.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
};

using DurationNs = std::int64_t;

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

// -----------------------------
// Query selectors
// -----------------------------

// Closed set. Adding a variant means adding a case to every switch over it.
enum class StrategyTag {
  kTabular,     // table reasoned over as rows/columns
  kStructured,  // table transposed into a nested key-value document
};

enum class DeliveryMode {
  kNone,  // blocking, thoughts discarded
  kPull,  // caller drains an EventStream
  kPush,  // thoughts pushed to a transport channel
};

// "TABULAR" / "STRUCTURED". Anything else -> kUnsupportedVariant.
Result<StrategyTag> parse_strategy_tag(const std::string& s);
const char* strategy_tag_name(StrategyTag tag) noexcept;
bool is_supported(StrategyTag tag) noexcept;

// "none" / "pull" / "push" (case-insensitive).
Result<DeliveryMode> parse_delivery_mode(const std::string& s);
const char* delivery_mode_name(DeliveryMode mode) noexcept;

// -----------------------------
// Reasoning events
// -----------------------------

struct Event {
  enum class Kind { kThought, kAnswer };

  Kind kind = Kind::kThought;
  std::string text;

  static Event thought(std::string t) { return Event{Kind::kThought, std::move(t)}; }
  static Event answer(std::string t) { return Event{Kind::kAnswer, std::move(t)}; }

  [[nodiscard]] bool is_answer() const noexcept { return kind == Kind::kAnswer; }
};

// "thought" / "answer"
const char* event_kind_name(Event::Kind kind) noexcept;

// Wire frame for push channels and pull printing: {"kind":"thought","text":"..."}
std::string to_frame(const Event& e);

}  // namespace compchat
