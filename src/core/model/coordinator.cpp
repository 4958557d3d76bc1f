// File: src/core/model/coordinator.cpp
#include "compchat/core/model/coordinator.hpp"

#include <cstdio>
#include <utility>

#include "compchat/core/model/prompt.hpp"

namespace compchat {
namespace {

TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

bool is_terminal(QueryState s) {
  return s == QueryState::kCompleted || s == QueryState::kFailed;
}

}  // namespace

const char* query_state_name(QueryState s) noexcept {
  switch (s) {
    case QueryState::kFetching: return "FETCHING";
    case QueryState::kPrompting: return "PROMPTING";
    case QueryState::kDispatched: return "DISPATCHED";
    case QueryState::kStreaming: return "STREAMING";
    case QueryState::kBlocked: return "BLOCKED";
    case QueryState::kCompleted: return "COMPLETED";
    case QueryState::kFailed: return "FAILED";
  }
  return "UNKNOWN";
}

// -----------------------------
// QueryTracker
// -----------------------------

QueryTracker::QueryTracker(QueryId id, JournalSink* journal, Clock::time_point run_start)
    : id_(std::move(id)), journal_(journal), run_start_(run_start) {}

void QueryTracker::note_locked(const std::string& type,
                               const std::string& state,
                               const std::string& message) {
  if (!journal_) return;

  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - run_start_).count();

  JournalRecord r;
  r.type = type;
  r.query_id = id_;
  r.t_ns = TimestampNs{static_cast<std::int64_t>(ns)};
  r.t_wall_ns = wall_now_epoch_ns();
  r.state = state;
  r.message = message;
  // The journal is diagnostics; a write failure must not change the query outcome.
  (void)journal_->emit(r);
}

void QueryTracker::enter_locked(QueryState s, const std::string& message) {
  if (is_terminal(state_) && !history_.empty()) return;
  state_ = s;
  history_.push_back(s);
  note_locked("state", query_state_name(s), message);
}

void QueryTracker::enter(QueryState s, const std::string& message) {
  std::lock_guard<std::mutex> lk(mu_);
  enter_locked(s, message);
}

void QueryTracker::note(const std::string& type, const std::string& message) {
  std::lock_guard<std::mutex> lk(mu_);
  note_locked(type, "", message);
}

void QueryTracker::maybe_complete_locked() {
  if (answer_delivered_ && work_finished_) enter_locked(QueryState::kCompleted, "");
}

void QueryTracker::answer_delivered() {
  std::lock_guard<std::mutex> lk(mu_);
  answer_delivered_ = true;
  maybe_complete_locked();
}

void QueryTracker::work_finished(const Status& st) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!st.ok()) {
    note_locked("query_failed", "", to_string(st));
    enter_locked(QueryState::kFailed, to_string(st));
    return;
  }
  work_finished_ = true;
  maybe_complete_locked();
}

void QueryTracker::fail(const Status& st) {
  work_finished(st);
}

QueryState QueryTracker::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::vector<QueryState> QueryTracker::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_;
}

// -----------------------------
// EventStream
// -----------------------------

EventStream::EventStream(Key,
                         std::shared_ptr<QueryTracker> tracker,
                         std::unique_ptr<ReasoningSession> session,
                         std::shared_ptr<PullSink> sink,
                         SessionHandle handle)
    : tracker_(std::move(tracker)),
      sink_(std::move(sink)),
      session_(std::move(session)),
      handle_(std::move(handle)) {}

EventStream::~EventStream() {
  if (finished_) return;

  // Consumer stopped early. No cancel signal exists; let the work run out
  // (bounded by its budget) and record how it ended.
  sink_->detach();
  tracker_->note("consumer_detached", "stream dropped before exhaustion");

  auto r = handle_.await();
  if (!r.ok()) {
    tracker_->work_finished(r.status());
  } else if (!sink_->answer_delivered()) {
    tracker_->fail(Status::channel_closed("consumer detached before the answer was delivered"));
  } else {
    tracker_->work_finished(Status::ok_status());
  }
}

Status EventStream::finish() {
  auto r = handle_.await();
  finished_ = true;
  if (!r.ok()) {
    terminal_ = r.status();
    tracker_->work_finished(terminal_);
  } else {
    terminal_ = Status::eof();
    tracker_->work_finished(Status::ok_status());
  }
  return terminal_;
}

Status EventStream::next(Event* out) {
  if (!out) return Status::invalid_argument("EventStream::next: out is null");
  if (finished_) return terminal_;

  const Status st = sink_->next(out);
  if (st.ok()) {
    if (out->is_answer()) tracker_->answer_delivered();
    return st;
  }
  if (!st.is_eof()) return st;

  // Sequence ended (answer taken or producer failed): the work decides how.
  return finish();
}

// -----------------------------
// Coordinator
// -----------------------------

Coordinator::Coordinator(IDatasetSource& source,
                         const AgentVariantSelector& selector,
                         IChannelRegistry* channels,
                         JournalSink* journal)
    : source_(source),
      selector_(selector),
      channels_(channels),
      journal_(journal),
      run_start_(QueryTracker::Clock::now()) {}

QueryId Coordinator::next_query_id() {
  const std::uint64_t n = next_id_.fetch_add(1);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "q-%06llu", static_cast<unsigned long long>(n));
  return QueryId(buf);
}

Status Coordinator::check_request(const QueryRequest& req) const {
  if (!is_supported(req.tag)) {
    return Status::unsupported_variant("unknown strategy tag value " +
                                       std::to_string(static_cast<int>(req.tag)));
  }
  if (req.dataset_id.empty()) return Status::invalid_argument("dataset id must not be empty");
  if (req.question.empty()) return Status::invalid_argument("question must not be empty");
  if (req.mode == DeliveryMode::kPush) {
    if (!channels_) return Status::invalid_argument("push delivery needs a channel registry");
    if (req.channel_id.empty()) return Status::invalid_argument("push delivery needs a channel id");
  }
  return Status::ok_status();
}

Result<ComparisonTable> Coordinator::fetch_table(const DatasetId& id) {
  auto table_r = source_.fetch(id);
  if (!table_r.ok()) {
    const Status& st = table_r.status();
    if (st.code() == Status::Code::kDatasetUnavailable) return table_r;
    return Result<ComparisonTable>::err(
        Status::dataset_unavailable("dataset '" + id + "': " + to_string(st)));
  }
  if (table_r->empty()) {
    return Result<ComparisonTable>::err(
        Status::dataset_unavailable("dataset '" + id + "' is empty"));
  }
  return table_r;
}

Result<QueryOutcome> Coordinator::execute(const QueryRequest& req) {
  auto tracker = std::make_shared<QueryTracker>(next_query_id(), journal_, run_start_);
  tracker->note("query_started", "dataset=" + req.dataset_id + " strategy=" +
                                     strategy_tag_name(req.tag) + " mode=" +
                                     delivery_mode_name(req.mode));

  // Selection errors surface before any external call.
  const Status checked = check_request(req);
  if (!checked.ok()) {
    tracker->fail(checked);
    return Result<QueryOutcome>::err(checked);
  }

  tracker->enter(QueryState::kFetching);
  auto table_r = fetch_table(req.dataset_id);
  if (!table_r.ok()) {
    tracker->fail(table_r.status());
    return Result<QueryOutcome>::err(table_r.status());
  }

  tracker->enter(QueryState::kPrompting);
  const Prompt prompt = Prompt::wrap(req.question);

  std::shared_ptr<EventSink> sink;
  std::shared_ptr<PullSink> pull_sink;
  std::shared_ptr<PushSink> push_sink;
  switch (req.mode) {
    case DeliveryMode::kNone:
      sink = std::make_shared<NullSink>();
      break;
    case DeliveryMode::kPull:
      pull_sink = std::make_shared<PullSink>();
      sink = pull_sink;
      break;
    case DeliveryMode::kPush:
      push_sink = std::make_shared<PushSink>(*channels_, req.channel_id);
      sink = push_sink;
      break;
  }

  auto session_r = selector_.build(table_r.take_value(), req.tag, sink);
  if (!session_r.ok()) {
    tracker->fail(session_r.status());
    return Result<QueryOutcome>::err(session_r.status());
  }
  std::unique_ptr<ReasoningSession> session = session_r.take_value();

  tracker->enter(QueryState::kDispatched);
  switch (req.mode) {
    case DeliveryMode::kNone:
      return run_blocking(tracker, *session, prompt);
    case DeliveryMode::kPull:
      return run_pull(tracker, std::move(session), std::move(pull_sink), prompt);
    case DeliveryMode::kPush:
      return run_push(tracker, *session, *push_sink, prompt);
  }

  const Status st = Status::internal("unhandled delivery mode");
  tracker->fail(st);
  return Result<QueryOutcome>::err(st);
}

Result<QueryOutcome> Coordinator::run_blocking(const std::shared_ptr<QueryTracker>& tracker,
                                               ReasoningSession& session,
                                               const Prompt& prompt) {
  tracker->enter(QueryState::kBlocked);
  auto answer_r = session.run_blocking(prompt);
  if (!answer_r.ok()) {
    tracker->work_finished(answer_r.status());
    return Result<QueryOutcome>::err(answer_r.status());
  }

  tracker->answer_delivered();
  tracker->work_finished(Status::ok_status());

  QueryOutcome out;
  out.query_id = tracker->id();
  out.answer = answer_r.take_value();
  return Result<QueryOutcome>::ok(std::move(out));
}

Result<QueryOutcome> Coordinator::run_pull(const std::shared_ptr<QueryTracker>& tracker,
                                           std::unique_ptr<ReasoningSession> session,
                                           std::shared_ptr<PullSink> sink,
                                           const Prompt& prompt) {
  auto handle_r = session->run_streaming(prompt);
  if (!handle_r.ok()) {
    tracker->fail(handle_r.status());
    return Result<QueryOutcome>::err(handle_r.status());
  }
  tracker->enter(QueryState::kStreaming);

  QueryOutcome out;
  out.query_id = tracker->id();
  out.stream = std::make_unique<EventStream>(
      EventStream::Key{}, tracker, std::move(session), std::move(sink), handle_r.take_value());
  return Result<QueryOutcome>::ok(std::move(out));
}

Result<QueryOutcome> Coordinator::run_push(const std::shared_ptr<QueryTracker>& tracker,
                                           ReasoningSession& session,
                                           const PushSink& sink,
                                           const Prompt& prompt) {
  auto handle_r = session.run_streaming(prompt);
  if (!handle_r.ok()) {
    tracker->fail(handle_r.status());
    return Result<QueryOutcome>::err(handle_r.status());
  }
  tracker->enter(QueryState::kStreaming);

  SessionHandle handle = handle_r.take_value();
  auto answer_r = handle.await();

  // Transport trouble is logged, never raised.
  if (sink.abandoned()) tracker->note("push_abandoned", to_string(sink.abandon_reason()));

  if (!answer_r.ok()) {
    tracker->work_finished(answer_r.status());
    return Result<QueryOutcome>::err(answer_r.status());
  }

  if (sink.answer_delivered()) tracker->answer_delivered();
  tracker->work_finished(Status::ok_status());

  QueryOutcome out;
  out.query_id = tracker->id();
  out.answer = answer_r.take_value();
  return Result<QueryOutcome>::ok(std::move(out));
}

Result<std::string> Coordinator::query(const DatasetId& dataset_id,
                                       const std::string& question,
                                       StrategyTag tag) {
  QueryRequest req;
  req.dataset_id = dataset_id;
  req.question = question;
  req.tag = tag;
  req.mode = DeliveryMode::kNone;

  auto out_r = execute(req);
  if (!out_r.ok()) return Result<std::string>::err(out_r.status());
  return Result<std::string>::ok(std::move(out_r->answer));
}

Result<std::unique_ptr<EventStream>> Coordinator::query_stream_pull(const DatasetId& dataset_id,
                                                                    const std::string& question,
                                                                    StrategyTag tag) {
  QueryRequest req;
  req.dataset_id = dataset_id;
  req.question = question;
  req.tag = tag;
  req.mode = DeliveryMode::kPull;

  auto out_r = execute(req);
  if (!out_r.ok()) return Result<std::unique_ptr<EventStream>>::err(out_r.status());
  return Result<std::unique_ptr<EventStream>>::ok(std::move(out_r->stream));
}

Result<std::string> Coordinator::query_stream_push(const DatasetId& dataset_id,
                                                   const std::string& question,
                                                   StrategyTag tag,
                                                   const ChannelId& channel_id) {
  QueryRequest req;
  req.dataset_id = dataset_id;
  req.question = question;
  req.tag = tag;
  req.mode = DeliveryMode::kPush;
  req.channel_id = channel_id;

  auto out_r = execute(req);
  if (!out_r.ok()) return Result<std::string>::err(out_r.status());
  return Result<std::string>::ok(std::move(out_r->answer));
}

}  // namespace compchat
