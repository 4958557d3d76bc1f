// File: src/core/events/event_sinks.cpp
#include "compchat/core/events/event_sink.hpp"
#include "compchat/core/events/pull_sink.hpp"
#include "compchat/core/events/push_sink.hpp"

#include <utility>

namespace compchat {
namespace {

Status terminated_error(const char* sink) {
  return Status::invalid_argument(std::string(sink) + " sink: event after answer or failure");
}

}  // namespace

// -----------------------------
// NullSink
// -----------------------------

Status NullSink::emit(const Event& e) {
  if (answered_ || failed_) return terminated_error("null");
  if (e.is_answer()) {
    answered_ = true;
  } else {
    ++discarded_;
  }
  return Status::ok_status();
}

void NullSink::fail(const Status& /*cause*/) {
  if (!answered_) failed_ = true;
}

// -----------------------------
// PullSink
// -----------------------------

Status PullSink::emit(const Event& e) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (terminated_) return terminated_error("pull");
    if (e.is_answer()) terminated_ = true;
    if (!detached_) queue_.push_back(e);
  }
  cv_.notify_all();
  return Status::ok_status();
}

void PullSink::fail(const Status& /*cause*/) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (terminated_) return;
    terminated_ = true;
  }
  cv_.notify_all();
}

bool PullSink::answer_delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return answer_taken_;
}

Status PullSink::pop_locked(Event* out) {
  if (queue_.empty()) return Status::eof();  // terminated and drained

  *out = std::move(queue_.front());
  queue_.pop_front();
  if (out->is_answer()) answer_taken_ = true;
  return Status::ok_status();
}

Status PullSink::next(Event* out) {
  if (!out) return Status::invalid_argument("PullSink::next: out is null");

  std::unique_lock<std::mutex> lk(mu_);
  if (answer_taken_) return Status::eof();
  cv_.wait(lk, [this] { return ready_locked(); });
  return pop_locked(out);
}

Status PullSink::next_for(Event* out, std::chrono::milliseconds timeout) {
  if (!out) return Status::invalid_argument("PullSink::next_for: out is null");

  std::unique_lock<std::mutex> lk(mu_);
  if (answer_taken_) return Status::eof();
  if (!cv_.wait_for(lk, timeout, [this] { return ready_locked(); })) {
    return Status::timeout();
  }
  return pop_locked(out);
}

void PullSink::detach() {
  std::lock_guard<std::mutex> lk(mu_);
  detached_ = true;
  queue_.clear();
}

bool PullSink::detached() const {
  std::lock_guard<std::mutex> lk(mu_);
  return detached_;
}

std::size_t PullSink::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

// -----------------------------
// PushSink
// -----------------------------

PushSink::PushSink(IChannelRegistry& registry, ChannelId channel_id)
    : registry_(registry), channel_id_(std::move(channel_id)) {}

Status PushSink::send_locked(const Event& e) {
  if (abandoned_) return abandon_reason_;

  if (!channel_) {
    auto ch_r = registry_.lookup(channel_id_);
    if (!ch_r.ok()) {
      abandoned_ = true;
      abandon_reason_ = Status::channel_closed("channel '" + channel_id_ + "' unavailable: " +
                                               ch_r.status().message());
      return abandon_reason_;
    }
    channel_ = ch_r.take_value();
  }

  const Status st = channel_->send(to_frame(e));
  if (!st.ok()) {
    abandoned_ = true;
    abandon_reason_ = st.code() == Status::Code::kChannelClosed
                          ? st
                          : Status::channel_closed("channel '" + channel_id_ + "': " + st.message());
    channel_.reset();
    return abandon_reason_;
  }

  ++frames_sent_;
  return Status::ok_status();
}

Status PushSink::emit(const Event& e) {
  std::lock_guard<std::mutex> lk(mu_);
  if (terminated_) return terminated_error("push");
  if (e.is_answer()) {
    terminated_ = true;
    answered_ = true;
  }
  return send_locked(e);
}

void PushSink::fail(const Status& /*cause*/) {
  std::lock_guard<std::mutex> lk(mu_);
  terminated_ = true;
  channel_.reset();
}

bool PushSink::answer_delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return answered_;
}

bool PushSink::abandoned() const {
  std::lock_guard<std::mutex> lk(mu_);
  return abandoned_;
}

Status PushSink::abandon_reason() const {
  std::lock_guard<std::mutex> lk(mu_);
  return abandon_reason_;
}

std::size_t PushSink::frames_sent() const {
  std::lock_guard<std::mutex> lk(mu_);
  return frames_sent_;
}

}  // namespace compchat
