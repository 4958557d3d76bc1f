// File: include/compchat/core/events/push_sink.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "compchat/core/events/event_sink.hpp"
#include "compchat/core/io/channel_registry.hpp"

namespace compchat {

// Transmits every event as a frame on one channel, as soon as it is emitted.
//
// The channel is looked up on the first emit. A missing, closed or full
// channel abandons delivery for the rest of the session: the failing push and
// every later one return the channel_closed status, nothing is retried, and
// the answer still counts as delivered since the caller receives it from the
// blocking await.
class PushSink final : public EventSink {
 public:
  PushSink(IChannelRegistry& registry, ChannelId channel_id);

  Status emit(const Event& e) override;
  void fail(const Status& cause) override;
  bool answer_delivered() const override;
  std::string name() const override { return "push"; }

  const ChannelId& channel_id() const { return channel_id_; }

  [[nodiscard]] bool abandoned() const;
  [[nodiscard]] Status abandon_reason() const;
  [[nodiscard]] std::size_t frames_sent() const;

 private:
  Status send_locked(const Event& e);

  IChannelRegistry& registry_;
  const ChannelId channel_id_;

  mutable std::mutex mu_;
  std::shared_ptr<IChannel> channel_;
  Status abandon_reason_;
  bool abandoned_{false};
  bool terminated_{false};
  bool answered_{false};
  std::size_t frames_sent_{0};
};

}  // namespace compchat
