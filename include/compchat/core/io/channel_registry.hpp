// File: include/compchat/core/io/channel_registry.hpp
#pragma once

#include <memory>
#include <string>

#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// A persistent duplex channel to one client. Only the outbound half matters here.
class IChannel {
 public:
  virtual ~IChannel() = default;

  // Returns OK or channel_closed(...). May back off the caller for a bounded
  // time when the channel is full; never blocks indefinitely.
  virtual Status send(const std::string& payload) = 0;

  virtual const ChannelId& id() const = 0;
};

class IChannelRegistry {
 public:
  virtual ~IChannelRegistry() = default;

  // not_found(...) when no channel is registered under `id`.
  virtual Result<std::shared_ptr<IChannel>> lookup(const ChannelId& id) = 0;
};

}  // namespace compchat
