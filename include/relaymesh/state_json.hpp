/**
 * @file state_json.hpp
 * @brief JSON views of relaymesh results and the persisted node state.
 *
 * @details
 *   The mesh core is JSON-free apart from the structured view of delivered
 *   content and the presence beacon, whose payload is `to_json(PresenceBeacon)`.
 *   Everything a host wants to print, log or persist goes through this layer, which uses [nlohmann::json](https://github.com/nlohmann/json).
 *
 *   ## Output
 *   One `to_json()` overload per result type. Enum fields are written with
 *   their stable snake_case names (`"store_forward"`, `"crc_mismatch"`, ...),
 *   channels by name (`"bluetooth"`), byte strings as lowercase hex.
 *
 *   ## Input
 *   The readers (`peers_from_json`, `relay_update_from_json`,
 *   `channels_from_json`) never throw. Missing or mistyped fields fall back to
 *   defaults and unknown channel names are skipped, so a damaged state file
 *   degrades to "fewer peers" rather than a failure.
 *
 *   ## Persisted state shape
 *   @code{.json}
 *   {
 *     "node_id": "node_0123456789abcdef0123",
 *     "peers": [
 *       { "node_id": "node_...", "channels": ["bluetooth"], "relay": true,
 *         "version": "1.0.0", "latency_ms": 40, "last_seen_ms": 1700000000000 }
 *     ]
 *   }
 *   @endcode
 *
 *   @author Leo
 *   @author ChatGPT
 */
#ifndef RELAYMESH_STATE_JSON_HPP
#define RELAYMESH_STATE_JSON_HPP

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "relaymesh/node.hpp"

namespace relaymesh {
namespace state {

using json = nlohmann::json;

/// Value of `discovered_via` for peers read back from a state file.
static constexpr const char* RESTORED_VIA = "state_restore";

json channels_to_json(const ChannelList& channels);
json channel_table_to_json(const ChannelRegistry& registry);

json to_json(const InitResult& r);
json to_json(const RouteDecision& d);
json to_json(const MultiPathPlan& p);
json to_json(const SendResult& r);
json to_json(const ReceiveResult& r);
json to_json(const TransferRecord& t);
json to_json(const TransferResult& r);
json to_json(const TransmissionRecord& rec);
json to_json(const PresenceBeacon& b);
json to_json(const SweepResult& s);
json to_json(const HeartbeatReport& h);
json to_json(const RelayConfig& c);
json to_json(const PendingView& p);
json to_json(const Peer& p);
json to_json(const Topology& t);
json to_json(const MeshStats& s);
json to_json(const MeshMetrics& m);
json to_json(const TransmissionStats& s);
json to_json(const OfflineSyncPlan& p);
json to_json(const FrameHeader& h);
json to_json(const DecodeResult& d);

json pending_to_json(const std::vector<PendingView>& pending);

/// Persisted form of the peer roster.
json peers_to_json(const std::vector<Peer>& peers);

/// Unknown channel names and non-string entries are skipped.
ChannelList channels_from_json(const json& j);

/// Peers from a `"peers"` array; entries without a node id are skipped.
std::vector<PeerInfo> peers_from_json(const json& j);

/**
 * @brief Relay settings from a config object.
 * @details Reads `relay.enabled`, `relay.max_queue_size`, `relay.max_hold_ms`.
 *          Absent or mistyped fields stay unset, so the queue keeps its value.
 */
RelayConfigUpdate relay_update_from_json(const json& j);

} // namespace state
} // namespace relaymesh

#endif // RELAYMESH_STATE_JSON_HPP
