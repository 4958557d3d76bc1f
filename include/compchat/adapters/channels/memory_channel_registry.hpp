// File: include/compchat/adapters/channels/memory_channel_registry.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "compchat/core/io/channel_registry.hpp"

namespace compchat {

// In-process channel: a bounded frame queue drained by the client side.
// send() backs off up to send_timeout while the queue is full, then gives up
// with channel_closed, so a stalled client never blocks a producer forever.
class MemoryChannel final : public IChannel {
 public:
  MemoryChannel(ChannelId id, std::size_t capacity, std::chrono::milliseconds send_timeout);

  Status send(const std::string& payload) override;
  const ChannelId& id() const override { return id_; }

  // Client side. eof once closed and drained; Status::timeout() if nothing
  // arrived within `timeout`.
  Status receive(std::string* out, std::chrono::milliseconds timeout);

  // Further sends fail; queued frames can still be received.
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t delivered() const;

 private:
  const ChannelId id_;
  const std::size_t capacity_;
  const std::chrono::milliseconds send_timeout_;

  mutable std::mutex mu_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<std::string> q_;
  bool closed_ = false;
  std::size_t delivered_ = 0;
};

class MemoryChannelRegistry final : public IChannelRegistry {
 public:
  MemoryChannelRegistry(std::size_t capacity, std::chrono::milliseconds send_timeout);

  // Registers a new channel. invalid_argument if the id is empty or taken.
  Result<std::shared_ptr<MemoryChannel>> open(const ChannelId& id);

  Result<std::shared_ptr<IChannel>> lookup(const ChannelId& id) override;

  // Closes and unregisters. Holders of the channel see channel_closed on send.
  Status close(const ChannelId& id);

  [[nodiscard]] std::size_t size() const;

 private:
  const std::size_t capacity_;
  const std::chrono::milliseconds send_timeout_;

  mutable std::mutex mu_;
  std::unordered_map<ChannelId, std::shared_ptr<MemoryChannel>> channels_;
};

}  // namespace compchat
