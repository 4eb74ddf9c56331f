// -----------------------------------------------------------------------------
// packet.cpp — MeshPacket construction and verification.
// -----------------------------------------------------------------------------
#include "relaymesh/packet.hpp"

#include <algorithm>

namespace relaymesh {

bool MeshPacket::verify() const {
  if (payload_hash.empty()) return true;
  return sha256_hex(payload) == payload_hash;
}

PacketFactory::PacketFactory(std::string node_id, IdSource& ids)
: node_id_(std::move(node_id)), ids_(ids) {}

// make()
// POLICY:
//   - total is raised to at least 1; a total above 1 always sets FRAGMENTED.
//   - ids in the header are shortened to their last 8 characters.
MeshPacket PacketFactory::make(const Bytes& payload, const std::string& destination,
                               const PacketOptions& opts, uint64_t now_ms) {
  MeshPacket p;
  p.id           = ids_.next("pkt");
  p.payload      = payload;
  p.payload_hash = sha256_hex(payload);
  p.payload_bytes = payload.size();
  p.total_bytes  = payload.size() + TOTAL_OVERHEAD;
  p.created_ms   = now_ms;
  p.channel      = opts.channel;
  p.destination  = destination.empty() ? std::string(BROADCAST) : destination;

  MeshHeader& h = p.header;
  h.source      = short_id(node_id_);
  h.destination = short_id(p.destination);
  h.hash        = p.payload_hash.substr(0, 8);
  h.sequence    = opts.sequence;
  h.total       = std::max<uint16_t>(opts.total, 1);
  h.ttl         = opts.ttl;

  uint8_t flags = 0;
  if (opts.priority)      flags |= mesh_flags::PRIORITY;
  if (opts.store_forward) flags |= mesh_flags::STORE_FORWARD;
  if (opts.fragmented || h.total > 1) flags |= mesh_flags::FRAGMENTED;
  h.flags = flags;

  return p;
}

} // namespace relaymesh
