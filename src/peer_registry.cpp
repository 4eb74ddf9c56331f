/*
 * peer_registry.cpp
 * -----------------
 * Roster maintenance for discovered mesh peers.
 * Contract and field meanings: include/relaymesh/peer_registry.hpp
 */
#include "relaymesh/peer_registry.hpp"

#include <algorithm>

namespace relaymesh {

PeerRegistry::PeerRegistry(std::string self_id)
: self_id_(std::move(self_id)) {}

/*
 * register_peer()
 * ---------------
 * Upsert by id. Identity fields that describe history (first_seen,
 * transmissions) survive an update; everything the peer advertises is
 * replaced by the newest report.
 */
const Peer* PeerRegistry::register_peer(const PeerInfo& info, uint64_t now_ms) {
  if (info.node_id.empty()) return nullptr;
  if (info.node_id == self_id_) return nullptr;   // never list ourselves

  auto it = peers_.find(info.node_id);
  const bool existing = it != peers_.end();

  Peer peer;
  peer.node_id        = info.node_id;
  peer.channels       = info.channels;
  peer.relay          = info.relay.value_or(true);
  peer.first_seen_ms  = existing ? it->second.first_seen_ms : now_ms;
  peer.last_seen_ms   = now_ms;
  peer.version        = info.version.empty() ? std::string("unknown") : info.version;
  peer.latency_ms     = info.latency_ms;
  peer.transmissions  = existing ? it->second.transmissions : 0;
  peer.discovered_via = info.discovered_via.empty() ? std::string("unknown") : info.discovered_via;

  if (!existing) ++peers_discovered_;
  Peer& stored = peers_[info.node_id];
  stored = std::move(peer);
  return &stored;
}

bool PeerRegistry::remove_peer(const std::string& node_id) {
  return peers_.erase(node_id) != 0;
}

const Peer* PeerRegistry::find(const std::string& node_id) const {
  auto it = peers_.find(node_id);
  return it == peers_.end() ? nullptr : &it->second;
}

bool PeerRegistry::note_transmission(const std::string& node_id) {
  auto it = peers_.find(node_id);
  if (it == peers_.end()) return false;
  ++it->second.transmissions;
  return true;
}

std::vector<Peer> PeerRegistry::peers(size_t limit) const {
  std::vector<Peer> out;
  out.reserve(peers_.size());
  for (const auto& kv : peers_) out.push_back(kv.second);
  std::stable_sort(out.begin(), out.end(), [](const Peer& a, const Peer& b) {
    return a.last_seen_ms > b.last_seen_ms;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Topology PeerRegistry::topology(const ChannelList& active_channels) const {
  Topology t;
  t.self_node_id = self_id_;
  for (const auto& kv : peers_) {
    t.nodes.push_back({kv.first, kv.second.channels, kv.second.last_seen_ms, kv.second.relay});
  }
  t.total_nodes     = t.nodes.size() + 1;
  t.active_channels = active_channels;
  return t;
}

/*
 * sweep_stale()
 * -------------
 * Strictly older than the threshold is stale; a peer seen exactly
 * threshold_ms ago survives this sweep.
 */
size_t PeerRegistry::sweep_stale(uint64_t now_ms, uint64_t threshold_ms) {
  if (now_ms < threshold_ms) return 0;
  const uint64_t cutoff = now_ms - threshold_ms;
  size_t removed = 0;
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (it->second.last_seen_ms < cutoff) {
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void PeerRegistry::clear() {
  peers_.clear();
  peers_discovered_ = 0;
}

} // namespace relaymesh
