/**
 * @file packet.hpp
 * @brief Mesh packets — a content unit wrapped for one hop on one channel.
 *
 * @details
 * A `MeshPacket` is what the routing layer hands to a channel provider or
 * parks in the relay queue. It carries:
 *  - a 16-byte mesh header (source, destination, hash, seq/total, ttl, flags),
 *  - the payload and its full SHA-256 hex digest for self-verification,
 *  - fragment bookkeeping (transfer id, per-fragment hash) when split.
 *
 * Size accounting always adds `TOTAL_OVERHEAD` (16-byte mesh header +
 * 48-byte DTU header) to the payload; `total_bytes` is what a channel must carry.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_PACKET_HPP
#define RELAYMESH_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "relaymesh/channel.hpp"
#include "relaymesh/frame.hpp"
#include "relaymesh/hash.hpp"
#include "relaymesh/node_id.hpp"

namespace relaymesh {

static constexpr size_t MESH_HEADER_SIZE = 16;
static constexpr size_t DTU_HEADER_SIZE  = 48;
static constexpr size_t TOTAL_OVERHEAD   = MESH_HEADER_SIZE + DTU_HEADER_SIZE;

/// Mesh header flag bits.
namespace mesh_flags {
static constexpr uint8_t PRIORITY      = 0x01;
static constexpr uint8_t STORE_FORWARD = 0x02;
static constexpr uint8_t FRAGMENTED    = 0x04;
} // namespace mesh_flags

struct MeshHeader {
  std::string source;        ///< short id of the sender
  std::string destination;   ///< short id of the target (last 8 chars, so "roadcast" for broadcast)
  std::string hash;          ///< first 8 hex chars of the payload hash
  uint16_t    sequence = 0;
  uint16_t    total    = 1;
  uint8_t     ttl      = DEFAULT_TTL;
  uint8_t     flags    = 0;

  bool is_fragmented() const { return (flags & mesh_flags::FRAGMENTED) != 0; }
};

struct PacketOptions {
  uint16_t sequence      = 0;
  uint16_t total         = 1;
  uint8_t  ttl           = DEFAULT_TTL;
  bool     priority      = false;
  bool     store_forward = false;
  bool     fragmented    = false;
  std::optional<ChannelId> channel;
};

struct MeshPacket {
  std::string              id;
  MeshHeader               header;
  Bytes                    payload;
  std::string              payload_hash;     ///< SHA-256 hex of payload
  size_t                   payload_bytes = 0;
  size_t                   total_bytes   = 0;
  uint64_t                 created_ms    = 0;
  std::optional<ChannelId> channel;
  std::string              destination;      ///< full destination id
  std::string              transfer_id;      ///< shared by all fragments of one split
  std::string              fragment_hash;    ///< SHA-256 hex of this slice (fragments only)

  /// True when payload_hash is empty or matches the payload.
  bool verify() const;
};

/**
 * @class PacketFactory
 * @brief Builds packets stamped with the local node id.
 */
class PacketFactory {
public:
  PacketFactory(std::string node_id, IdSource& ids);

  void set_node_id(std::string node_id) { node_id_ = std::move(node_id); }
  const std::string& node_id() const { return node_id_; }
  IdSource& ids() { return ids_; }

  /**
   * @brief Wrap @p payload into a packet.
   * @param destination node id, or empty for "broadcast"
   */
  MeshPacket make(const Bytes& payload, const std::string& destination,
                  const PacketOptions& opts, uint64_t now_ms);

private:
  std::string node_id_;
  IdSource&   ids_;
};

} // namespace relaymesh

#endif // RELAYMESH_PACKET_HPP
