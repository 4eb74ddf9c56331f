#pragma once
/**
 * @file channel_provider.hpp
 * @brief Seams between the mesh core and the outside world.
 *
 * The core never touches hardware and never stores content. It talks to:
 *  - an IChannelProvider, which reports which mediums are reachable and puts
 *    packets on them,
 *  - an IContentStore, which receives every payload that passed CRC, dedup
 *    and reassembly.
 */

#include <cstdint>

#include "relaymesh/channel.hpp"
#include "relaymesh/content.hpp"
#include "relaymesh/packet.hpp"

namespace relaymesh::transport {

// Return codes kept simple; Busy and Error both send the packet back to the relay queue.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

inline const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

/**
 * @brief Capability detector and carrier for all channels.
 *
 * Contract:
 *  - detect_availability() reports reachability per channel; channels it
 *    leaves out are treated as unchanged.
 *  - send() transmits one packet on one channel. It must not block for long;
 *    return Busy instead of waiting.
 *  - name() is a short identifier for logs/diagnostics.
 */
class IChannelProvider {
public:
  virtual ~IChannelProvider() = default;
  virtual AvailabilityMap detect_availability() = 0;
  virtual TxResult        send(ChannelId channel, const MeshPacket& packet) = 0;
  virtual const char*     name() const = 0;
};

/**
 * @brief Sink for delivered content.
 */
class IContentStore {
public:
  virtual ~IContentStore() = default;
  virtual void on_receive(const Content& content, ChannelId source_channel) = 0;
};

} // namespace relaymesh::transport
