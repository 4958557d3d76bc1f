// File: include/compchat/core/model/reasoning_session.hpp
#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <string>

#include "compchat/core/config.hpp"
#include "compchat/core/data/comparison_table.hpp"
#include "compchat/core/events/event_sink.hpp"
#include "compchat/core/io/reasoning_backend.hpp"
#include "compchat/core/model/prompt.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

struct SessionBudget {
  int max_iterations = 15;
  DurationNs max_execution_time_ns = 0;  // 0 = unbounded
};

// Completion handle of a streaming run. Owns the background unit of work:
// destroying a valid handle waits for it.
class SessionHandle {
 public:
  SessionHandle() = default;
  explicit SessionHandle(std::future<Result<std::string>> fut) : fut_(std::move(fut)) {}

  SessionHandle(SessionHandle&&) noexcept = default;
  SessionHandle& operator=(SessionHandle&&) noexcept = default;

  [[nodiscard]] bool valid() const noexcept { return fut_.valid(); }
  [[nodiscard]] bool ready() const;

  // Blocks until the unit of work finished; callable once. Anything the work
  // threw is translated to a status here instead of escaping.
  Result<std::string> await();

 private:
  std::future<Result<std::string>> fut_;
};

// One backend instance, one table, one bound sink, one run. Never reused.
//
// Thread safety: run_blocking / run_streaming are called once, from one
// thread. While a streaming run is in flight the session must stay alive;
// whoever owns the SessionHandle must outlive or join before destroying it.
class ReasoningSession {
 public:
  ReasoningSession(StrategyTag tag,
                   SessionBudget budget,
                   std::unique_ptr<IReasoningBackend> backend,
                   ComparisonTable table,
                   std::string table_text,
                   std::unique_ptr<DocumentView> document,
                   std::shared_ptr<EventSink> sink);

  ReasoningSession(const ReasoningSession&) = delete;
  ReasoningSession& operator=(const ReasoningSession&) = delete;

  // Runs on the calling thread. Thoughts are discarded, whatever sink is
  // bound. Returns the answer, or reasoning_failure / execution_timeout.
  Result<std::string> run_blocking(const Prompt& prompt);

  // Starts the run as a background unit of work and returns at once. Events
  // go to the bound sink as the backend produces them.
  Result<SessionHandle> run_streaming(const Prompt& prompt);

  StrategyTag tag() const noexcept { return tag_; }
  const SessionBudget& budget() const noexcept { return budget_; }
  const ComparisonTable& table() const noexcept { return table_; }
  const std::string& table_text() const noexcept { return table_text_; }
  const DocumentView* document() const noexcept { return document_.get(); }
  EventSink& sink() noexcept { return *sink_; }

  [[nodiscard]] int steps_taken() const noexcept { return steps_taken_.load(); }

 private:
  Result<std::string> drive(const Prompt& prompt, EventSink& sink);
  Result<std::string> drive_steps(const Prompt& prompt, EventSink& sink);

  const StrategyTag tag_;
  const SessionBudget budget_;
  std::unique_ptr<IReasoningBackend> backend_;
  const ComparisonTable table_;
  const std::string table_text_;
  std::unique_ptr<DocumentView> document_;
  std::shared_ptr<EventSink> sink_;

  bool started_{false};
  std::atomic<int> steps_taken_{0};
};

}  // namespace compchat
