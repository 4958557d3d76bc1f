// File: include/compchat/core/model/coordinator.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "compchat/core/events/journal_sink.hpp"
#include "compchat/core/events/pull_sink.hpp"
#include "compchat/core/events/push_sink.hpp"
#include "compchat/core/io/channel_registry.hpp"
#include "compchat/core/io/dataset_source.hpp"
#include "compchat/core/model/reasoning_session.hpp"
#include "compchat/core/model/variant_selector.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Per-query lifecycle:
//   FETCHING -> PROMPTING -> DISPATCHED -> {STREAMING | BLOCKED} -> {COMPLETED | FAILED}
// FAILED is reachable from any state.
enum class QueryState {
  kFetching,
  kPrompting,
  kDispatched,
  kStreaming,
  kBlocked,
  kCompleted,
  kFailed,
};

const char* query_state_name(QueryState s) noexcept;

// Tracks one query's state and writes every transition to the journal.
//
// COMPLETED needs two independent signals, in any order: the answer reached
// its consumer, and the background unit of work finished OK. Whichever comes
// last makes the transition. A work failure goes straight to FAILED.
class QueryTracker {
 public:
  using Clock = std::chrono::steady_clock;

  QueryTracker(QueryId id, JournalSink* journal, Clock::time_point run_start);

  const QueryId& id() const noexcept { return id_; }

  void enter(QueryState s, const std::string& message = "");
  void note(const std::string& type, const std::string& message);

  void answer_delivered();
  void work_finished(const Status& st);
  void fail(const Status& st);

  QueryState state() const;
  std::vector<QueryState> history() const;

 private:
  void enter_locked(QueryState s, const std::string& message);
  void note_locked(const std::string& type, const std::string& state, const std::string& message);
  void maybe_complete_locked();

  const QueryId id_;
  JournalSink* journal_;
  const Clock::time_point run_start_;

  mutable std::mutex mu_;
  QueryState state_{QueryState::kFetching};
  std::vector<QueryState> history_;
  bool answer_delivered_{false};
  bool work_finished_{false};
};

// Pull-mode result: a lazy, finite, non-restartable sequence of events.
//
// Owns the session and its background unit of work. Dropping the stream
// before exhaustion detaches the consumer and waits for the work to resolve;
// the session's own budget bounds that wait.
class EventStream {
 public:
  // Only the coordinator can mint one.
  class Key {
   private:
    friend class Coordinator;
    Key() {}
  };

  EventStream(Key,
              std::shared_ptr<QueryTracker> tracker,
              std::unique_ptr<ReasoningSession> session,
              std::shared_ptr<PullSink> sink,
              SessionHandle handle);
  ~EventStream();

  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;

  // Returns:
  //  - OK and fills `out` (thoughts in backend order, then the answer)
  //  - eof() after the answer, once the work confirmed completion
  //  - the session failure, after any thoughts produced before it
  // Every call after the end returns the same terminal status.
  Status next(Event* out);

  const QueryId& query_id() const noexcept { return tracker_->id(); }
  QueryState state() const { return tracker_->state(); }

 private:
  Status finish();

  std::shared_ptr<QueryTracker> tracker_;
  std::shared_ptr<PullSink> sink_;
  // Declared before handle_: the work must be joined before the session dies.
  std::unique_ptr<ReasoningSession> session_;
  SessionHandle handle_;

  bool finished_{false};
  Status terminal_;
};

struct QueryRequest {
  DatasetId dataset_id;
  std::string question;
  StrategyTag tag = StrategyTag::kTabular;
  DeliveryMode mode = DeliveryMode::kNone;
  ChannelId channel_id;  // kPush only
};

struct QueryOutcome {
  QueryId query_id;
  std::string answer;                   // kNone / kPush
  std::unique_ptr<EventStream> stream;  // kPull
};

// Runs queries end to end: fetch table, wrap prompt, pick sink, build session,
// run it, relay events, collect the answer. Never retries a failed session.
// Holds no mutable state shared between queries apart from the id counter.
class Coordinator {
 public:
  // `channels` may be null when push delivery is not offered; `journal` may be
  // null to disable the query journal.
  Coordinator(IDatasetSource& source,
              const AgentVariantSelector& selector,
              IChannelRegistry* channels = nullptr,
              JournalSink* journal = nullptr);

  Result<QueryOutcome> execute(const QueryRequest& req);

  // Blocking: the answer or the failure.
  Result<std::string> query(const DatasetId& dataset_id,
                            const std::string& question,
                            StrategyTag tag);

  // Pull: events the caller drains to exhaustion.
  Result<std::unique_ptr<EventStream>> query_stream_pull(const DatasetId& dataset_id,
                                                         const std::string& question,
                                                         StrategyTag tag);

  // Push: thoughts go out on `channel_id` as {kind, text} frames; the answer is
  // returned here even if the channel is gone.
  Result<std::string> query_stream_push(const DatasetId& dataset_id,
                                        const std::string& question,
                                        StrategyTag tag,
                                        const ChannelId& channel_id);

 private:
  QueryId next_query_id();
  Status check_request(const QueryRequest& req) const;
  Result<ComparisonTable> fetch_table(const DatasetId& id);

  Result<QueryOutcome> run_blocking(const std::shared_ptr<QueryTracker>& tracker,
                                    ReasoningSession& session,
                                    const Prompt& prompt);
  Result<QueryOutcome> run_pull(const std::shared_ptr<QueryTracker>& tracker,
                                std::unique_ptr<ReasoningSession> session,
                                std::shared_ptr<PullSink> sink,
                                const Prompt& prompt);
  Result<QueryOutcome> run_push(const std::shared_ptr<QueryTracker>& tracker,
                                ReasoningSession& session,
                                const PushSink& sink,
                                const Prompt& prompt);

  IDatasetSource& source_;
  const AgentVariantSelector& selector_;
  IChannelRegistry* channels_;
  JournalSink* journal_;

  const QueryTracker::Clock::time_point run_start_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace compchat
