// File: include/compchat/core/events/event_sink.hpp
#pragma once

#include <cstddef>
#include <string>

#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Where a session's thoughts and answer go.
//
// Contract for every implementation:
//  - zero or more thoughts, then exactly one answer, or fail() instead of the answer
//  - nothing is accepted after the answer or fail(); emit returns invalid_argument
//  - a non-OK emit means delivery failed; it never fails the reasoning session
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status emit(const Event& e) = 0;

  // Producer failed before producing its answer. Terminates the sequence.
  virtual void fail(const Status& cause) = 0;

  // True once the answer has reached the point this sink hands it over.
  virtual bool answer_delivered() const = 0;

  virtual std::string name() const = 0;
};

// Discards thoughts. The caller gets the answer from the blocking call.
class NullSink final : public EventSink {
 public:
  Status emit(const Event& e) override;
  void fail(const Status& cause) override;
  bool answer_delivered() const override { return answered_; }
  std::string name() const override { return "null"; }

  [[nodiscard]] std::size_t discarded() const noexcept { return discarded_; }

 private:
  bool answered_{false};
  bool failed_{false};
  std::size_t discarded_{0};
};

}  // namespace compchat
