/**
 * @file node.hpp
 * @brief relaymesh MeshNode — one node's complete mesh state and its entry points.
 *
 * @details
 * ## Field Brief
 * A MeshNode is the transport layer of one host. It decides which medium a
 * content unit rides, splits it when the medium is narrow, parks it when
 * nothing is reachable, verifies what comes in, and keeps a roster of who is
 * around. It does not know radios or files: an `IChannelProvider` carries
 * packets and an `IContentStore` receives what arrives.
 *
 * ---
 *
 * @par What This File Provides
 * - `relaymesh::MeshNode` — owner of every piece of per-node state:
 *   channel registry, dedup cache, gossip controller, frame codec, peer
 *   registry, relay queue, transfers, transmission log, stats.
 * - Result structs for every operation. Nothing here throws; every outcome,
 *   including recoverable failures, is a value.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [host/CLI]                          [MeshNode]
 *      │  init(provider, store, now) ──► detect availability
 *      │
 *      │  send_dtu(content, dest) ─────► select_route ─┬─ none ──► relay queue
 *      │                                               └─ channel ─► fragment? ─► provider.send()
 *      │                                                                  │ Busy/Error
 *      │                                                                  └──► relay queue
 *      │
 *      │  receive_frame(bytes) ────────► decode (magic, CRC) ─► dedup ─► gossip? ─► reassembly ─► store
 *      │  receive_dtu(packet)  ────────► verify hash ─► dedup ─► reassembly ─► store
 *      │
 *      │  tick(n, now) ────────────────► relay sweep + forward (every tick)
 *      │                                 beacon broadcast (n % 10 == 0)
 *      │                                 prune       (n % 50 == 0)
 * ```
 *
 * ---
 *
 * @par Lifecycle
 * - Construction builds empty state and a node id (`node_<20 hex>`, fresh per
 *   construction unless `NodeConfig::node_id` pins it).
 * - `init()` attaches the provider/store and runs one availability detection.
 *   Calling it again is harmless and reports `already_initialized`.
 * - `reset()` returns to the just-constructed state. Tests use it to reuse a
 *   node; two nodes never share state.
 *
 * ---
 *
 * @par Time
 * Every operation takes `now_ms` from the caller. The node owns no clock and no
 * timers; the heartbeat runs only when the host calls `tick()`.
 *
 * ---
 *
 * @par Failure Model
 * - No route: the packet is queued (store-and-forward); `send_dtu` still succeeds.
 * - Provider refuses a packet (Busy/Error): the packet is queued, the channel's
 *   error counter and the failover counter go up.
 * - Bad frame: `invalid_magic` / `crc_mismatch`, counted, never fatal.
 * - Duplicate: dropped with `ReceiveError::Duplicate`.
 * - Missing fragments: the receive succeeds with `complete == false`.
 * - A slice numbered at or past its total: `invalid_fragment`. Joined slices
 *   that do not hash to the message hash: `fragment_hash_mismatch`.
 * - A relay entry the provider refuses during the sweep goes back into the
 *   queue until its attempts run out.
 * - Heartbeat re-entered from a callback: the inner call is skipped.
 *
 * @authors
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_NODE_HPP
#define RELAYMESH_NODE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "etl/vector.h"
#include "relaymesh/channel.hpp"
#include "relaymesh/content.hpp"
#include "relaymesh/dedup.hpp"
#include "relaymesh/frame.hpp"
#include "relaymesh/node_id.hpp"
#include "relaymesh/packet.hpp"
#include "relaymesh/peer_registry.hpp"
#include "relaymesh/relay_queue.hpp"
#include "relaymesh/routing.hpp"
#include "relaymesh/transport/channel_provider.hpp"

namespace relaymesh {

/// Construction-time settings.
struct NodeConfig {
  std::string node_id;   ///< empty -> generated; otherwise must pass is_valid_node_id()
  uint32_t    seed = 0;  ///< 0 -> std::random_device; otherwise replayable ids and gossip
  RelayConfigUpdate relay;
};

enum class InitError : uint8_t { None, InvalidNodeId };

const char* to_string(InitError e);

struct InitResult {
  bool            ok = false;
  InitError       error = InitError::None;
  bool            already_initialized = false;
  std::string     node_id;
  AvailabilityMap channels;
  ChannelList     active_channels;
};

// ---------- send ----------

struct SendOptions {
  Proximity               proximity = Proximity::Unknown;
  std::optional<uint8_t>  priority_class;   ///< routing uses GENERAL, relay classifies content
  uint8_t                 ttl = DEFAULT_TTL;
  std::optional<uint64_t> hold_ms;          ///< relay hold override
};

enum class SendMode : uint8_t { Direct, Fragmented, StoreForward };
enum class SendError : uint8_t { None, NoDtuProvided, TooManyFragments };

const char* to_string(SendMode m);
const char* to_string(SendError e);

struct SendResult {
  bool                      ok = false;
  SendError                 error = SendError::None;
  SendMode                  mode = SendMode::StoreForward;
  std::optional<ChannelId>  channel;
  std::string               transmission_id;
  std::string               relay_id;          ///< store-forward only
  size_t                    packets = 0;
  size_t                    total_bytes = 0;
  size_t                    requeued = 0;      ///< packets the provider refused
  etl::vector<ChannelId, 2> alternates;
  std::string               reason;
};

struct TransmissionRecord {
  std::string               id;
  std::string               content_hash;
  ChannelId                 channel = ChannelId::Internet;
  std::string               destination;
  size_t                    packet_count = 0;
  size_t                    total_bytes  = 0;
  bool                      fragmented   = false;
  uint64_t                  sent_at_ms   = 0;
  const char*               status       = "sent";   ///< "sent" | "partial" | "requeued"
  etl::vector<ChannelId, 2> alternates;
};

// ---------- receive ----------

enum class ReceiveError : uint8_t {
  None,
  IntegrityCheckFailed,
  Duplicate,
  FragmentHashMismatch,
  InvalidMagic,
  CrcMismatch,
  Truncated,
  InvalidFragment    ///< sequence at or past the declared total
};

const char* to_string(ReceiveError e);

struct ReceiveResult {
  bool                   ok = false;
  ReceiveError           error = ReceiveError::None;
  bool                   complete = false;     ///< content delivered to the store
  std::optional<Content> content;
  ChannelId              channel = ChannelId::Internet;
  std::string            expected_hash;        ///< integrity failures only
  std::string            actual_hash;
  bool                   rebroadcast = false;  ///< frames only: gossip said yes
  Bytes                  relay_frame;          ///< frames only: ttl-1 copy to forward
};

// ---------- transfers ----------

enum class TransferState : uint8_t { InProgress, Completed, Partial, Failed };
enum class TransferError : uint8_t { None, NoComponents };

const char* to_string(TransferState s);
const char* to_string(TransferError e);

struct TransferRecord {
  std::string             id;
  std::string             destination;
  size_t                  total_components = 0;
  MultiPathPlan           plan;
  size_t                  sent_components   = 0;
  size_t                  failed_components = 0;
  uint64_t                started_ms = 0;
  std::optional<uint64_t> finished_ms;
  TransferState           state = TransferState::InProgress;
  ChannelList             channels;
};

struct TransferResult {
  bool           ok = false;
  TransferError  error = TransferError::None;
  TransferRecord transfer;
};

// ---------- heartbeat & reporting ----------

struct PresenceBeacon {
  std::string node_id;
  uint64_t    timestamp_ms = 0;
  ChannelList channels;
  bool        relay = true;
  size_t      pending_count = 0;
  std::string version;
};

struct HeartbeatReport {
  bool                          skipped = false;
  uint32_t                      tick = 0;
  SweepResult                   relay;
  size_t                        forwarded = 0;   ///< released relay packets the provider took
  std::optional<PresenceBeacon> beacon;
  size_t                        beacon_sent = 0; ///< channels that took the beacon broadcast
  size_t                        peers_pruned = 0;
  size_t                        transfers_pruned = 0;
  size_t                        partials_pruned = 0;
};

struct MeshStats {
  uint64_t                total_transmissions = 0;
  uint64_t                total_received      = 0;
  uint64_t                bytes_sent          = 0;
  uint64_t                bytes_received      = 0;
  uint64_t                failovers           = 0;
  uint64_t                transfers_completed = 0;
  uint64_t                transfers_failed    = 0;
  std::optional<uint64_t> last_transmission_ms;
  std::optional<uint64_t> last_received_ms;
};

struct MeshMetrics {
  bool        initialized = false;
  std::string node_id;
  ChannelList active_channels;
  size_t      total_channels = CHANNEL_COUNT;
  size_t      peer_count = 0;
  uint64_t    peers_discovered = 0;
  size_t      pending_queue_size = 0;
  size_t      active_transfers = 0;
  MeshStats   stats;
  uint64_t    total_relayed = 0;
  uint64_t    total_store_forward = 0;
  uint64_t    total_evicted = 0;
  uint64_t    total_dropped = 0;   ///< relay entries refused until out of attempts
  RelayConfig relay_config;
  FrameStats  protocol;
  size_t      recent_hash_count = 0;
  uint64_t    total_deduplicated = 0;
  uint64_t    gossip_broadcasts = 0;
  uint64_t    gossip_suppressed = 0;
  uint64_t    uptime_ms = 0;
};

struct TransmissionStats {
  MeshStats                                 totals;
  uint64_t                                  relayed = 0;
  uint64_t                                  store_forward = 0;
  std::array<ChannelCounters, CHANNEL_COUNT> by_channel{};
  size_t                                    active_transfers = 0;
  std::vector<TransmissionRecord>           recent;
};

struct OfflineSyncPlan {
  bool                     ok = true;
  size_t                   outbound = 0;
  std::vector<std::string> outbound_ids;
  size_t                   pending_relay = 0;
  ChannelList              channels_available;
};

/**
 * @class MeshNode
 * @brief Single-owner state and operations of one mesh node.
 *
 * @details
 * Single-threaded by contract: one task owns a MeshNode and serializes every
 * call into it. Other workers hand work to that task rather than calling in.
 *
 * Typical loop:
 * @code
 * relaymesh::MeshNode node;
 * node.init(provider, &store, now_ms());
 * node.send_dtu(relaymesh::to_bytes("{\"type\":\"KNOWLEDGE\"}"), "", {}, now_ms());
 * for (uint32_t n = 1;; ++n) {
 *   node.tick(n, now_ms());
 * }
 * @endcode
 */
class MeshNode {
public:
  /// @name Caps & cadence
  ///@{
  static constexpr size_t   TX_LOG_CAP            = 500;  ///< transmission log size
  static constexpr size_t   TX_LOG_TRIM_TO        = 400;  ///< kept after overflow
  static constexpr size_t   RECENT_TX_LIMIT       = 20;   ///< records in transmission_stats()
  static constexpr uint32_t BEACON_EVERY          = 10;   ///< ticks between beacons
  static constexpr uint32_t PRUNE_EVERY           = 50;   ///< ticks between prunes
  static constexpr uint64_t TRANSFER_RETENTION_MS = 60ull * 60ull * 1000ull; ///< finished transfers kept 1 h
  static constexpr size_t   PARTIAL_CAP           = 64;   ///< incomplete reassemblies held at once
  static constexpr size_t   OFFLINE_SYNC_LIMIT    = 100;  ///< ids listed in a sync plan
  static constexpr const char* VERSION            = "1.0.0";
  ///@}

  explicit MeshNode(NodeConfig config = NodeConfig());

  MeshNode(const MeshNode&) = delete;
  MeshNode& operator=(const MeshNode&) = delete;

  /**
   * @brief Attach collaborators and detect channel availability.
   * @param provider carrier and detector; must outlive the node (or the next reset)
   * @param store    content sink, may be null
   */
  InitResult init(transport::IChannelProvider& provider, transport::IContentStore* store,
                  uint64_t now_ms);

  /// Re-run availability detection on the attached provider.
  AvailabilityMap refresh_channels(uint64_t now_ms);

  /// Drop all state and collaborators; back to the constructed state.
  void reset();

  bool initialized() const { return initialized_; }
  std::string node_id() const { return node_id_.c_str(); }

  /**
   * @brief Route and transmit one content unit.
   * @param destination node id; empty -> broadcast
   */
  SendResult send_dtu(const Bytes& content, const std::string& destination,
                      const SendOptions& opts, uint64_t now_ms);

  /// Accept one mesh packet from @p channel.
  ReceiveResult receive_dtu(const MeshPacket& packet, ChannelId channel, uint64_t now_ms);

  /**
   * @brief Accept one wire frame from @p channel.
   * @param novelty gossip novelty score of the content, 0..1
   */
  ReceiveResult receive_frame(const Bytes& frame, ChannelId channel, double novelty,
                              uint64_t now_ms);

  /// Build a wire frame stamped with this node's id.
  EncodeResult build_frame(const Bytes& payload, FrameOptions opts, uint64_t now_ms);

  /// Build the frame series for a message that may exceed @p slice_bytes.
  FragmentFrames build_frames(const Bytes& message, size_t slice_bytes, FrameOptions opts,
                              uint64_t now_ms);

  const Peer* register_peer(const PeerInfo& info, uint64_t now_ms);

  /**
   * @brief Send a decomposable transfer over a multi-path plan.
   * @note Not resumable: a partial or failed transfer is retried by starting a new one.
   */
  TransferResult initiate_transfer(const std::vector<Bytes>& components,
                                   const std::string& destination, Proximity proximity,
                                   uint64_t now_ms);

  const TransferRecord* transfer_status(const std::string& transfer_id) const;

  /// Heartbeat entry point; @p n is the scheduler's tick number.
  HeartbeatReport tick(uint32_t n, uint64_t now_ms);

  PresenceBeacon presence_beacon(uint64_t now_ms) const;
  const std::optional<PresenceBeacon>& last_beacon() const { return last_beacon_; }

  MeshMetrics       metrics(uint64_t now_ms) const;
  TransmissionStats transmission_stats() const;

  const RelayConfig& configure_relay(const RelayConfigUpdate& update);

  /// Plan an outbound push of locally created, not yet synced content ids.
  OfflineSyncPlan plan_offline_sync(const std::vector<std::string>& unsynced_local_ids) const;

  std::vector<PendingView> pending_queue(size_t limit = 50) const { return relay_.pending(limit); }
  Topology topology() const { return peers_.topology(channels_.available_channels()); }

  ChannelRegistry&        channels()       { return channels_; }
  const ChannelRegistry&  channels() const { return channels_; }
  const PeerRegistry&     peers()    const { return peers_; }
  const RelayQueue&       relay_queue() const { return relay_; }
  const DedupCache&       dedup()    const { return dedup_; }
  const GossipController& gossip()   const { return gossip_; }
  const FrameCodec&       codec()    const { return codec_; }

  uint32_t tick_count() const { return tick_count_; }

private:
  using TxLog = etl::deque<TransmissionRecord, TX_LOG_CAP>;

  /// Fragments of one packet transfer waiting for the rest.
  struct PartialPackets {
    uint64_t                first_seen_ms = 0;
    std::vector<MeshPacket> parts;
  };

  /// Fragments of one framed message, keyed by source id + message hash.
  struct PartialFrames {
    uint64_t                  first_seen_ms = 0;
    uint16_t                  total = 1;
    std::map<uint16_t, Bytes> parts;
  };

  void assign_identity();
  size_t transmit(std::vector<MeshPacket>& packets, ChannelId channel,
                  const std::string& destination, const EnqueueOptions& requeue,
                  uint64_t now_ms, size_t& bytes_sent);
  bool forward_relayed(const RelayEntry& entry);
  size_t broadcast_beacon(const PresenceBeacon& beacon, uint64_t now_ms);
  void deliver(const Content& content, ChannelId channel, uint64_t now_ms);
  void record_transmission(TransmissionRecord rec);
  size_t prune_transfers(uint64_t now_ms);
  size_t prune_partials(uint64_t now_ms);

  NodeConfig                     config_;
  IdSource                       ids_;
  NodeIdStr                      node_id_;
  PacketFactory                  factory_;
  ChannelRegistry                channels_;
  DedupCache                     dedup_;
  GossipController               gossip_;
  FrameCodec                     codec_;
  PeerRegistry                   peers_;
  RelayQueue                     relay_;
  std::map<std::string, TransferRecord> transfers_;
  std::map<std::string, PartialPackets> partial_packets_;
  std::map<std::string, PartialFrames>  partial_frames_;
  TxLog                          tx_log_;
  MeshStats                      stats_;
  std::optional<PresenceBeacon>  last_beacon_;

  transport::IChannelProvider*   provider_ = nullptr;
  transport::IContentStore*      store_    = nullptr;

  bool     initialized_ = false;
  bool     in_tick_     = false;
  uint32_t tick_count_  = 0;
  uint64_t started_ms_  = 0;
};

} // namespace relaymesh

#endif // RELAYMESH_NODE_HPP
