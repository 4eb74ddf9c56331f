#pragma once
/**
 * @page rm-peer-registry relaymesh Peer Registry
 * @file peer_registry.hpp
 * @brief Discovered peers, their channels and relay willingness, plus the topology view.
 *
 * @details
 * PURPOSE
 * -------
 * The roster of other nodes this node has heard from. Routing uses it to know
 * whether a relay destination is reachable; the heartbeat uses it to age out
 * nodes that went quiet.
 *
 * WHAT THIS DOES
 * --------------
 * - `register_peer()` upserts by node id:
 *     * never registers the local node,
 *     * keeps `first_seen_ms` and `transmissions` across updates,
 *     * refreshes `last_seen_ms`, channels, relay flag (default true), version,
 *       latency and discovery source.
 * - `sweep_stale()` drops peers silent for longer than `STALE_MS` (2 hours).
 *   It is only called from the periodic heartbeat, so a short silence does
 *   not cause churn.
 * - `topology()` is the self + peers view handed to diagnostics.
 *
 * PERSISTENCE
 * -----------
 * The registry itself does no I/O. `to_json()/from_json()` in state_json.hpp
 * turn a roster into JSON; hosts decide where to keep it (the CLI stores it
 * next to its node state). Restored peers come back with
 * `discovered_via = "state_restore"`.
 *
 * @author Leo
 * @author ChatGPT
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "relaymesh/channel.hpp"

namespace relaymesh {

/// What a beacon or contact tells us about a peer.
struct PeerInfo {
  std::string             node_id;
  ChannelList             channels;
  std::optional<bool>     relay;            ///< absent -> true
  std::string             version;          ///< empty -> "unknown"
  std::optional<uint32_t> latency_ms;
  std::string             discovered_via;   ///< empty -> "unknown"
};

/// Registry record for one peer.
struct Peer {
  std::string             node_id;
  ChannelList             channels;
  bool                    relay = true;
  uint64_t                first_seen_ms = 0;
  uint64_t                last_seen_ms  = 0;
  std::string             version;
  std::optional<uint32_t> latency_ms;
  uint64_t                transmissions = 0;
  std::string             discovered_via;
};

struct TopologyEntry {
  std::string node_id;
  ChannelList channels;
  uint64_t    last_seen_ms = 0;
  bool        relay = true;
};

struct Topology {
  std::string                self_node_id;
  std::vector<TopologyEntry> nodes;
  size_t                     total_nodes = 1;   ///< peers + self
  ChannelList                active_channels;
};

class PeerRegistry {
public:
  static constexpr uint64_t STALE_MS = 2ull * 60ull * 60ull * 1000ull; // 2 hours

  explicit PeerRegistry(std::string self_id = std::string());

  void set_self_id(std::string self_id) { self_id_ = std::move(self_id); }
  const std::string& self_id() const { return self_id_; }

  /**
   * @brief Insert or refresh a peer.
   * @return the stored record, or nullptr for an empty id or the local node.
   * @note The pointer is valid until the next mutating call.
   */
  const Peer* register_peer(const PeerInfo& info, uint64_t now_ms);

  bool remove_peer(const std::string& node_id);

  const Peer* find(const std::string& node_id) const;
  bool contains(const std::string& node_id) const { return peers_.count(node_id) != 0; }

  /// Count one transmission toward @p node_id; false if unknown.
  bool note_transmission(const std::string& node_id);

  /// Up to @p limit peers, most recently seen first.
  std::vector<Peer> peers(size_t limit = 100) const;

  Topology topology(const ChannelList& active_channels) const;

  /// Remove peers with last_seen older than now - threshold. Returns count removed.
  size_t sweep_stale(uint64_t now_ms, uint64_t threshold_ms = STALE_MS);

  size_t size() const { return peers_.size(); }
  uint64_t peers_discovered() const { return peers_discovered_; }

  void clear();

private:
  std::string                 self_id_;
  std::map<std::string, Peer> peers_;
  uint64_t                    peers_discovered_ = 0;
};

} // namespace relaymesh
