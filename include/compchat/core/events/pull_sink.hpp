// File: include/compchat/core/events/pull_sink.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

#include "compchat/core/events/event_sink.hpp"

namespace compchat {

// Queue between the background producer and a consumer draining a lazy,
// finite, non-restartable sequence. The queue is unbounded so the producer
// never waits on a slow (or vanished) consumer.
class PullSink final : public EventSink {
 public:
  PullSink() = default;
  PullSink(const PullSink&) = delete;
  PullSink& operator=(const PullSink&) = delete;

  // Producer side.
  Status emit(const Event& e) override;
  void fail(const Status& cause) override;
  bool answer_delivered() const override;
  std::string name() const override { return "pull"; }

  // Consumer side. Blocks until an event is queued or the producer terminated.
  // Returns:
  //  - OK and fills `out`
  //  - eof() once the answer was taken, or the producer failed and the queue is drained
  Status next(Event* out);

  // Same as next(), but returns out_of_range("timeout") if nothing arrives in time.
  Status next_for(Event* out, std::chrono::milliseconds timeout);

  // Consumer went away. Later events are dropped; the producer is not slowed down.
  void detach();

  [[nodiscard]] bool detached() const;
  [[nodiscard]] std::size_t pending() const;

 private:
  // Requires mu_ held and the wait predicate satisfied.
  Status pop_locked(Event* out);
  bool ready_locked() const { return !queue_.empty() || terminated_; }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> queue_;

  bool terminated_{false};  // answer queued, or fail()
  bool answer_taken_{false};
  bool detached_{false};
};

}  // namespace compchat
