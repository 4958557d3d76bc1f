// File: src/core/model/reasoning_session.cpp
#include "compchat/core/model/reasoning_session.hpp"

#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

namespace compchat {
namespace {

std::string trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  const std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

Status as_reasoning_failure(const std::string& backend, const Status& st) {
  if (st.code() == Status::Code::kReasoningFailure || st.code() == Status::Code::kExecutionTimeout) {
    return st;
  }
  return Status::reasoning_failure(backend + ": " + to_string(st));
}

}  // namespace

// -----------------------------
// SessionHandle
// -----------------------------

bool SessionHandle::ready() const {
  if (!fut_.valid()) return false;
  return fut_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

Result<std::string> SessionHandle::await() {
  if (!fut_.valid()) {
    return Result<std::string>::err(Status::invalid_argument("session handle already awaited"));
  }
  try {
    return fut_.get();
  } catch (const std::exception& e) {
    return Result<std::string>::err(Status::reasoning_failure(std::string("session aborted: ") + e.what()));
  }
}

// -----------------------------
// ReasoningSession
// -----------------------------

ReasoningSession::ReasoningSession(StrategyTag tag,
                                   SessionBudget budget,
                                   std::unique_ptr<IReasoningBackend> backend,
                                   ComparisonTable table,
                                   std::string table_text,
                                   std::unique_ptr<DocumentView> document,
                                   std::shared_ptr<EventSink> sink)
    : tag_(tag),
      budget_(budget),
      backend_(std::move(backend)),
      table_(std::move(table)),
      table_text_(std::move(table_text)),
      document_(std::move(document)),
      sink_(std::move(sink)) {}

Result<std::string> ReasoningSession::run_blocking(const Prompt& prompt) {
  if (started_) return Result<std::string>::err(Status::invalid_argument("session already ran"));
  started_ = true;

  NullSink discard;
  return drive(prompt, discard);
}

Result<SessionHandle> ReasoningSession::run_streaming(const Prompt& prompt) {
  if (started_) return Result<SessionHandle>::err(Status::invalid_argument("session already ran"));
  started_ = true;

  try {
    auto fut = std::async(std::launch::async, [this, prompt]() { return drive(prompt, *sink_); });
    return Result<SessionHandle>::ok(SessionHandle(std::move(fut)));
  } catch (const std::system_error& e) {
    const Status st = Status::internal(std::string("failed to start reasoning task: ") + e.what());
    sink_->fail(st);
    return Result<SessionHandle>::err(st);
  }
}

Result<std::string> ReasoningSession::drive(const Prompt& prompt, EventSink& sink) {
  Result<std::string> r = Result<std::string>::err(Status::internal("unreachable"));
  try {
    r = drive_steps(prompt, sink);
  } catch (const std::exception& e) {
    r = Result<std::string>::err(
        Status::reasoning_failure(backend_->name() + ": backend threw: " + e.what()));
  }
  // Exactly one terminal signal per session: the answer, or this.
  if (!r.ok()) sink.fail(r.status());
  return r;
}

Result<std::string> ReasoningSession::drive_steps(const Prompt& prompt, EventSink& sink) {
  ReasoningContext ctx;
  ctx.tag = tag_;
  ctx.prompt = prompt.text();
  ctx.query = prompt.query();
  ctx.table_text = table_text_;
  ctx.table = &table_;
  ctx.document = document_.get();

  const Status begun = backend_->begin(ctx);
  if (!begun.ok()) return Result<std::string>::err(as_reasoning_failure(backend_->name(), begun));

  using clock = std::chrono::steady_clock;
  const auto t_start = clock::now();
  const auto budget = std::chrono::nanoseconds(budget_.max_execution_time_ns);

  for (int i = 0;; ++i) {
    // Checked between steps; an answer produced by a step is accepted.
    if (i >= budget_.max_iterations) {
      return Result<std::string>::err(Status::execution_timeout(
          "iteration budget of " + std::to_string(budget_.max_iterations) + " steps exhausted"));
    }
    if (i > 0 && budget_.max_execution_time_ns > 0 && clock::now() - t_start >= budget) {
      return Result<std::string>::err(Status::execution_timeout(
          "execution budget of " + std::to_string(budget_.max_execution_time_ns / 1000000) +
          " ms exceeded after " + std::to_string(i) + " steps"));
    }

    auto step_r = backend_->step();
    ++steps_taken_;
    if (!step_r.ok()) {
      return Result<std::string>::err(as_reasoning_failure(backend_->name(), step_r.status()));
    }

    ReasoningStep step = step_r.take_value();
    switch (step.kind) {
      case ReasoningStep::Kind::kThought:
        // Delivery failures (closed channel, detached consumer) never stop the run.
        (void)sink.emit(Event::thought(std::move(step.text)));
        break;

      case ReasoningStep::Kind::kAnswer: {
        std::string answer = trim(step.text);
        (void)sink.emit(Event::answer(answer));
        return Result<std::string>::ok(std::move(answer));
      }

      case ReasoningStep::Kind::kNoAnswer: {
        std::string answer = kUnknownAnswer;
        (void)sink.emit(Event::answer(answer));
        return Result<std::string>::ok(std::move(answer));
      }
    }
  }
}

}  // namespace compchat
