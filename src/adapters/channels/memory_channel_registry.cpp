// File: src/adapters/channels/memory_channel_registry.cpp
#include "compchat/adapters/channels/memory_channel_registry.hpp"

#include <utility>

namespace compchat {

// -----------------------------
// MemoryChannel
// -----------------------------
MemoryChannel::MemoryChannel(ChannelId id, std::size_t capacity, std::chrono::milliseconds send_timeout)
    : id_(std::move(id)), capacity_(capacity), send_timeout_(send_timeout) {}

Status MemoryChannel::send(const std::string& payload) {
  std::unique_lock<std::mutex> lk(mu_);
  const bool room = not_full_.wait_for(lk, send_timeout_, [this] {
    return closed_ || q_.size() < capacity_;
  });
  if (closed_) return Status::channel_closed("channel '" + id_ + "' is closed");
  if (!room) return Status::channel_closed("channel '" + id_ + "' stayed full for " +
                                           std::to_string(send_timeout_.count()) + " ms");
  q_.push_back(payload);
  lk.unlock();
  not_empty_.notify_one();
  return Status::ok_status();
}

Status MemoryChannel::receive(std::string* out, std::chrono::milliseconds timeout) {
  if (out == nullptr) return Status::invalid_argument("out is null");

  std::unique_lock<std::mutex> lk(mu_);
  if (!not_empty_.wait_for(lk, timeout, [this] { return closed_ || !q_.empty(); })) {
    return Status::timeout();
  }
  if (q_.empty()) return Status::eof();

  *out = std::move(q_.front());
  q_.pop_front();
  ++delivered_;
  lk.unlock();
  not_full_.notify_one();
  return Status::ok_status();
}

void MemoryChannel::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  not_full_.notify_all();
  not_empty_.notify_all();
}

bool MemoryChannel::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t MemoryChannel::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

std::size_t MemoryChannel::delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return delivered_;
}

// -----------------------------
// MemoryChannelRegistry
// -----------------------------
MemoryChannelRegistry::MemoryChannelRegistry(std::size_t capacity, std::chrono::milliseconds send_timeout)
    : capacity_(capacity), send_timeout_(send_timeout) {}

Result<std::shared_ptr<MemoryChannel>> MemoryChannelRegistry::open(const ChannelId& id) {
  if (id.empty()) {
    return Result<std::shared_ptr<MemoryChannel>>::err(Status::invalid_argument("channel id must not be empty"));
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (channels_.count(id) != 0) {
    return Result<std::shared_ptr<MemoryChannel>>::err(Status::invalid_argument("channel '" + id + "' already open"));
  }
  auto ch = std::make_shared<MemoryChannel>(id, capacity_, send_timeout_);
  channels_.emplace(id, ch);
  return Result<std::shared_ptr<MemoryChannel>>::ok(std::move(ch));
}

Result<std::shared_ptr<IChannel>> MemoryChannelRegistry::lookup(const ChannelId& id) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = channels_.find(id);
  if (it == channels_.end()) {
    return Result<std::shared_ptr<IChannel>>::err(Status::not_found("no channel '" + id + "'"));
  }
  return Result<std::shared_ptr<IChannel>>::ok(it->second);
}

Status MemoryChannelRegistry::close(const ChannelId& id) {
  std::shared_ptr<MemoryChannel> ch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = channels_.find(id);
    if (it == channels_.end()) return Status::not_found("no channel '" + id + "'");
    ch = std::move(it->second);
    channels_.erase(it);
  }
  ch->close();
  return Status::ok_status();
}

std::size_t MemoryChannelRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return channels_.size();
}

}  // namespace compchat
