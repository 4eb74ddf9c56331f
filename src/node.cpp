// -----------------------------------------------------------------------------
// node.cpp — Implementation of the relaymesh MeshNode
//
// API & field descriptions:
//   see include/relaymesh/node.hpp
//
// Usage tests:
//   see tests/test_node.cpp
//
// NOTE: This file covers how the node wires codec, dedup, routing, fragments,
// relay queue and peers together, and the guard conditions between them.
// External-facing contracts live in the header.
// -----------------------------------------------------------------------------
#include "relaymesh/node.hpp"

#include <algorithm>
#include <utility>

#include "relaymesh/fragments.hpp"
#include "relaymesh/hash.hpp"
#include "relaymesh/state_json.hpp"

namespace relaymesh {

namespace {

// Clears the re-entrancy flag on every exit path of tick().
struct TickGuard {
  explicit TickGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~TickGuard() { flag_ = false; }
  bool& flag_;
};

ReceiveError from_frame_error(FrameError e) {
  switch (e) {
    case FrameError::InvalidMagic: return ReceiveError::InvalidMagic;
    case FrameError::CrcMismatch:  return ReceiveError::CrcMismatch;
    default:                       return ReceiveError::Truncated;
  }
}

} // namespace

// ---------- names ----------

const char* to_string(SendMode m) {
  switch (m) {
    case SendMode::Direct:       return "direct";
    case SendMode::Fragmented:   return "fragmented";
    case SendMode::StoreForward: return "store_forward";
  }
  return "unknown";
}

const char* to_string(InitError e) {
  return e == InitError::InvalidNodeId ? "invalid_node_id" : "none";
}

const char* to_string(SendError e) {
  switch (e) {
    case SendError::None:             return "none";
    case SendError::NoDtuProvided:    return "no_dtu_provided";
    case SendError::TooManyFragments: return "too_many_fragments";
  }
  return "unknown";
}

const char* to_string(ReceiveError e) {
  switch (e) {
    case ReceiveError::None:                 return "none";
    case ReceiveError::IntegrityCheckFailed: return "integrity_check_failed";
    case ReceiveError::Duplicate:            return "duplicate";
    case ReceiveError::FragmentHashMismatch: return "fragment_hash_mismatch";
    case ReceiveError::InvalidMagic:         return "invalid_magic";
    case ReceiveError::CrcMismatch:          return "crc_mismatch";
    case ReceiveError::Truncated:            return "truncated";
    case ReceiveError::InvalidFragment:      return "invalid_fragment";
  }
  return "unknown";
}

const char* to_string(TransferState s) {
  switch (s) {
    case TransferState::InProgress: return "in_progress";
    case TransferState::Completed:  return "completed";
    case TransferState::Partial:    return "partial";
    case TransferState::Failed:     return "failed";
  }
  return "unknown";
}

const char* to_string(TransferError e) {
  return e == TransferError::NoComponents ? "no_components" : "none";
}

// ---------- lifecycle ----------

MeshNode::MeshNode(NodeConfig config)
: config_(std::move(config)),
  ids_(config_.seed),
  factory_(std::string(), ids_),
  gossip_(config_.seed == 0 ? 0 : config_.seed + 1),
  relay_(ids_) {
  assign_identity();
  relay_.configure(config_.relay);
}

// assign_identity()
// POLICY: a valid configured id wins; otherwise a fresh "node_<20 hex>" from
//         the seeded id source (an invalid configured id is refused by init()).
//         Every component that stamps the id is updated here.
void MeshNode::assign_identity() {
  const std::string id = is_valid_node_id(config_.node_id) ? config_.node_id
                                                           : generate_node_id(ids_);
  node_id_.assign(id.c_str());
  factory_.set_node_id(node_id_.c_str());
  peers_.set_self_id(node_id_.c_str());
}

InitResult MeshNode::init(transport::IChannelProvider& provider,
                          transport::IContentStore* store, uint64_t now_ms) {
  InitResult r;
  r.node_id = node_id();
  if (!config_.node_id.empty() && !is_valid_node_id(config_.node_id)) {
    r.error = InitError::InvalidNodeId;
    return r;
  }
  r.ok = true;

  if (initialized_) {
    r.already_initialized = true;
    for (const auto& spec : channel_table()) r.channels[spec.id] = channels_.is_available(spec.id);
    r.active_channels = channels_.available_channels();
    return r;
  }

  provider_   = &provider;
  store_      = store;
  started_ms_ = now_ms;
  r.channels  = refresh_channels(now_ms);
  r.active_channels = channels_.available_channels();
  initialized_ = true;
  return r;
}

AvailabilityMap MeshNode::refresh_channels(uint64_t now_ms) {
  if (!provider_) return AvailabilityMap();
  AvailabilityMap report = provider_->detect_availability();
  channels_.apply_availability(report, now_ms);
  return report;
}

// reset()
// POLICY: seeded nodes replay the same ids and gossip draws after a reset.
void MeshNode::reset() {
  ids_.reseed(config_.seed);
  gossip_.reseed(config_.seed == 0 ? 0 : config_.seed + 1);
  assign_identity();

  channels_.reset();
  dedup_.clear();
  gossip_.clear();
  codec_.reset();
  peers_.clear();
  relay_.reset();
  relay_.configure(config_.relay);
  transfers_.clear();
  partial_packets_.clear();
  partial_frames_.clear();
  tx_log_.clear();
  stats_ = MeshStats();
  last_beacon_.reset();

  provider_    = nullptr;
  store_       = nullptr;
  initialized_ = false;
  in_tick_     = false;
  tick_count_  = 0;
  started_ms_  = 0;
}

// ---------- outbound ----------

// transmit()
// PRE:    every packet already carries its channel.
// POLICY: a refused packet (Busy or Error) is not retried inline. It goes to the
//         relay queue with one attempt already spent, and counts as a channel
//         error plus a failover.
// OUT:    number of packets re-queued; @p bytes_sent grows by what went out.
size_t MeshNode::transmit(std::vector<MeshPacket>& packets, ChannelId channel,
                          const std::string& destination, const EnqueueOptions& requeue,
                          uint64_t now_ms, size_t& bytes_sent) {
  size_t requeued = 0;
  for (auto& p : packets) {
    const transport::TxResult tx = provider_ ? provider_->send(channel, p)
                                             : transport::TxResult::Error;
    if (tx == transport::TxResult::Ok) {
      bytes_sent += p.total_bytes;
      continue;
    }
    ++channels_.counters(channel).errors;
    ++stats_.failovers;
    relay_.enqueue(p, destination, requeue, now_ms);
    ++requeued;
  }
  return requeued;
}

SendResult MeshNode::send_dtu(const Bytes& content, const std::string& destination,
                              const SendOptions& opts, uint64_t now_ms) {
  SendResult r;
  if (content.empty()) {
    r.error = SendError::NoDtuProvided;
    return r;
  }

  const RouteDecision route = select_route(
      channels_, content.size(), opts.proximity,
      opts.priority_class.value_or(relay_priority::GENERAL));
  r.alternates = route.alternates;
  r.reason     = route.reason;

  EnqueueOptions queue_opts;
  queue_opts.priority_class = opts.priority_class;
  queue_opts.hold_ms        = opts.hold_ms;

  // No reachable medium: park it and report success.
  if (!route.channel) {
    PacketOptions popts;
    popts.ttl           = opts.ttl;
    popts.store_forward = true;
    MeshPacket packet = factory_.make(content, destination, popts, now_ms);
    r.ok          = true;
    r.mode        = SendMode::StoreForward;
    r.packets     = 1;
    r.total_bytes = packet.total_bytes;
    r.relay_id    = relay_.enqueue(std::move(packet), destination, queue_opts, now_ms);
    return r;
  }

  const ChannelId channel = *route.channel;
  std::vector<MeshPacket> packets;
  if (route.needs_fragmentation) {
    FragmentResult fr = fragment(content, channel_spec(channel).max_payload_bytes, factory_,
                                 now_ms, destination);
    if (!fr.ok()) {
      r.error   = SendError::TooManyFragments;
      r.channel = channel;
      return r;
    }
    packets = std::move(fr.packets);
  } else {
    PacketOptions popts;
    popts.ttl     = opts.ttl;
    popts.channel = channel;
    packets.push_back(factory_.make(content, destination, popts, now_ms));
  }
  for (auto& p : packets) {
    p.channel    = channel;
    p.header.ttl = opts.ttl;
  }

  size_t total_bytes = 0;
  for (const auto& p : packets) total_bytes += p.total_bytes;

  queue_opts.attempts = 1;
  size_t bytes_sent = 0;
  const size_t requeued = transmit(packets, channel, destination, queue_opts, now_ms, bytes_sent);

  TransmissionRecord rec;
  rec.id           = ids_.next("tx");
  rec.content_hash = sha256_hex(content);
  rec.channel      = channel;
  rec.destination  = destination.empty() ? std::string(BROADCAST) : destination;
  rec.packet_count = packets.size();
  rec.total_bytes  = total_bytes;
  rec.fragmented   = route.needs_fragmentation;
  rec.sent_at_ms   = now_ms;
  rec.alternates   = route.alternates;
  rec.status       = requeued == 0               ? "sent"
                   : requeued == packets.size()  ? "requeued"
                                                 : "partial";
  r.transmission_id = rec.id;
  record_transmission(std::move(rec));

  ChannelCounters& c = channels_.counters(channel);
  ++c.sent;
  c.bytes += bytes_sent;
  ++stats_.total_transmissions;
  stats_.bytes_sent += bytes_sent;
  stats_.last_transmission_ms = now_ms;
  if (!destination.empty()) peers_.note_transmission(destination);

  r.ok          = true;
  r.mode        = route.needs_fragmentation ? SendMode::Fragmented : SendMode::Direct;
  r.channel     = channel;
  r.packets     = packets.size();
  r.total_bytes = total_bytes;
  r.requeued    = requeued;
  return r;
}

// record_transmission()
// POLICY: when the log is full, drop the oldest so TX_LOG_TRIM_TO remain.
void MeshNode::record_transmission(TransmissionRecord rec) {
  if (tx_log_.full()) {
    while (tx_log_.size() > TX_LOG_TRIM_TO) tx_log_.pop_front();
  }
  tx_log_.push_back(std::move(rec));
}

EncodeResult MeshNode::build_frame(const Bytes& payload, FrameOptions opts, uint64_t now_ms) {
  if (opts.source_node_id.empty()) opts.source_node_id = node_id();
  return codec_.encode(payload, opts, now_ms);
}

FragmentFrames MeshNode::build_frames(const Bytes& message, size_t slice_bytes,
                                      FrameOptions opts, uint64_t now_ms) {
  if (opts.source_node_id.empty()) opts.source_node_id = node_id();
  return codec_.encode_fragments(message, slice_bytes, opts, now_ms);
}

// ---------- inbound ----------

// deliver()
// POLICY: a presence beacon from another node also registers (or refreshes)
//         that node as a peer reachable on the arrival channel.
void MeshNode::deliver(const Content& content, ChannelId channel, uint64_t now_ms) {
  if (store_) store_->on_receive(content, channel);
  ++channels_.counters(channel).received;
  ++stats_.total_received;
  stats_.last_received_ms = now_ms;

  if (!content.is_structured || !content.structured.is_object()) return;
  const nlohmann::json& j = content.structured;
  auto type = j.find("type");
  auto id   = j.find("node_id");
  if (type == j.end() || *type != "PRESENCE" || id == j.end() || !id->is_string()) return;

  PeerInfo info;
  info.node_id = id->get<std::string>();
  if (!is_valid_node_id(info.node_id)) return;
  info.channels.push_back(channel);
  auto channels = j.find("channels");
  if (channels != j.end() && channels->is_array()) {
    for (const auto& name : *channels) {
      if (!name.is_string() || info.channels.full()) continue;
      auto cid = channel_from_name(name.get<std::string>());
      if (cid && std::find(info.channels.begin(), info.channels.end(), *cid) == info.channels.end()) {
        info.channels.push_back(*cid);
      }
    }
  }
  auto relay = j.find("relay");
  if (relay != j.end() && relay->is_boolean()) info.relay = relay->get<bool>();
  auto version = j.find("version");
  if (version != j.end() && version->is_string()) info.version = version->get<std::string>();
  info.discovered_via = channel_name(channel);
  peers_.register_peer(info, now_ms);
}

// receive_dtu()
// PRE:    integrity first; a packet whose payload does not match its hash is
//         never marked as seen, so a clean copy can still arrive later.
// POLICY:
//   - whole packets dedup on the payload hash
//   - fragments dedup on transfer id + sequence, then buffer per transfer id
//   - incomplete buffers answer ok with complete == false
// OUT:    content is handed to the store once per unit.
ReceiveResult MeshNode::receive_dtu(const MeshPacket& packet, ChannelId channel,
                                    uint64_t now_ms) {
  ReceiveResult r;
  r.channel = channel;

  if (!packet.verify()) {
    ++channels_.counters(channel).errors;
    r.error         = ReceiveError::IntegrityCheckFailed;
    r.expected_hash = packet.payload_hash;
    r.actual_hash   = sha256_hex(packet.payload);
    return r;
  }

  const bool is_fragment = packet.header.is_fragmented() || packet.header.total > 1;
  if (is_fragment && packet.header.sequence >= std::max<uint16_t>(packet.header.total, 1)) {
    ++channels_.counters(channel).errors;
    r.error = ReceiveError::InvalidFragment;
    return r;
  }
  const std::string key = is_fragment
      ? packet.transfer_id + ":" + std::to_string(packet.header.sequence)
      : packet.payload_hash;
  if (dedup_.check_and_mark(key, now_ms)) {
    r.error = ReceiveError::Duplicate;
    return r;
  }

  stats_.bytes_received += packet.total_bytes;
  channels_.counters(channel).bytes += packet.total_bytes;

  if (!is_fragment) {
    Content content = make_content(packet.payload);
    deliver(content, channel, now_ms);
    r.ok       = true;
    r.complete = true;
    r.content  = std::move(content);
    return r;
  }

  const std::string buffer_key = packet.transfer_id.empty() ? packet.header.hash
                                                            : packet.transfer_id;
  auto it = partial_packets_.find(buffer_key);
  if (it == partial_packets_.end()) {
    if (partial_packets_.size() >= PARTIAL_CAP) {
      auto oldest = std::min_element(partial_packets_.begin(), partial_packets_.end(),
                                     [](const auto& a, const auto& b) {
                                       return a.second.first_seen_ms < b.second.first_seen_ms;
                                     });
      partial_packets_.erase(oldest);
    }
    it = partial_packets_.emplace(buffer_key, PartialPackets{now_ms, {}}).first;
  }
  it->second.parts.push_back(packet);

  ReassemblyResult rr = reassemble(it->second.parts);
  switch (rr.status) {
    case ReassemblyStatus::Incomplete:
    case ReassemblyStatus::Empty:
      r.ok = true;
      return r;
    case ReassemblyStatus::HashMismatch:
      partial_packets_.erase(it);
      ++channels_.counters(channel).errors;
      r.error = ReceiveError::FragmentHashMismatch;
      return r;
    case ReassemblyStatus::BadSequence:
      partial_packets_.erase(it);
      ++channels_.counters(channel).errors;
      r.error = ReceiveError::InvalidFragment;
      return r;
    case ReassemblyStatus::Ok:
      break;
  }

  partial_packets_.erase(it);
  deliver(*rr.content, channel, now_ms);
  r.ok       = true;
  r.complete = true;
  r.content  = std::move(rr.content);
  return r;
}

// receive_frame()
// PRE:    decode rejects bad magic, bad CRC and short buffers (counted by the codec).
//         A fragment frame whose sequence is not below its total is refused.
// POLICY:
//   - dedup key is hash prefix + source id (+ sequence for a fragment), so the
//     same frame from the same sender is accepted once, whichever neighbour
//     relayed it
//   - gossip is asked only while ttl > 0; a yes yields a re-encoded copy with
//     ttl - 1 and the relay flag, which the caller forwards
//   - fragment frames are buffered per source id + message hash until every
//     slice is in; the joined bytes must hash to that prefix
// OUT:    complete content goes to the store.
ReceiveResult MeshNode::receive_frame(const Bytes& frame, ChannelId channel, double novelty,
                                      uint64_t now_ms) {
  ReceiveResult r;
  r.channel = channel;

  DecodeResult d = codec_.decode(frame);
  if (!d.ok) {
    ++channels_.counters(channel).errors;
    r.error = from_frame_error(d.error);
    return r;
  }

  const FrameHeader& h = d.header;
  const bool is_fragment = h.is_fragment() && h.fragment_total > 1;
  if (h.is_fragment() && h.fragment_seq >= std::max<uint16_t>(h.fragment_total, 1)) {
    ++channels_.counters(channel).errors;
    r.error = ReceiveError::InvalidFragment;
    return r;
  }

  std::string key = h.hash_hex() + h.source_hex();
  if (is_fragment) key += ":" + std::to_string(h.fragment_seq);
  if (dedup_.check_and_mark(key, now_ms)) {
    r.error = ReceiveError::Duplicate;
    return r;
  }

  stats_.bytes_received += frame.size();
  channels_.counters(channel).bytes += frame.size();

  if (h.ttl > 0 && gossip_.should_gossip(h, novelty, now_ms)) {
    FrameOptions fwd;
    fwd.priority       = h.priority;
    fwd.ttl            = static_cast<uint8_t>(h.ttl - 1);
    fwd.fragment       = h.is_fragment();
    fwd.relay          = true;
    fwd.emergency      = h.is_emergency();
    fwd.encrypted      = h.is_encrypted();
    fwd.source_node_id = h.source_hex();
    fwd.fragment_seq   = h.fragment_seq;
    fwd.fragment_total = h.fragment_total;
    fwd.message_hash   = h.hash_prefix;
    EncodeResult e = codec_.encode(d.payload, fwd, now_ms);
    if (e.ok) {
      r.rebroadcast = true;
      r.relay_frame = std::move(e.bytes);
      ++channels_.counters(channel).relayed;
    }
  }

  if (!is_fragment) {
    Content content = make_content(std::move(d.payload));
    deliver(content, channel, now_ms);
    r.ok       = true;
    r.complete = true;
    r.content  = std::move(content);
    return r;
  }

  const std::string buffer_key = h.source_hex() + h.hash_hex();
  auto it = partial_frames_.find(buffer_key);
  if (it == partial_frames_.end()) {
    if (partial_frames_.size() >= PARTIAL_CAP) {
      auto oldest = std::min_element(partial_frames_.begin(), partial_frames_.end(),
                                     [](const auto& a, const auto& b) {
                                       return a.second.first_seen_ms < b.second.first_seen_ms;
                                     });
      partial_frames_.erase(oldest);
    }
    it = partial_frames_.emplace(buffer_key, PartialFrames{}).first;
  }
  PartialFrames& pf = it->second;
  if (pf.parts.empty() || pf.total != h.fragment_total) {
    pf.parts.clear();
    pf.total         = h.fragment_total;
    pf.first_seen_ms = now_ms;
  }
  pf.parts.emplace(h.fragment_seq, std::move(d.payload));

  r.ok = true;
  if (pf.parts.size() < pf.total) return r;

  Bytes joined;
  for (auto& kv : pf.parts) joined.insert(joined.end(), kv.second.begin(), kv.second.end());
  partial_frames_.erase(it);

  if (hash_prefix_of(joined) != h.hash_prefix) {
    ++channels_.counters(channel).errors;
    r.ok    = false;
    r.error = ReceiveError::FragmentHashMismatch;
    return r;
  }

  Content content = make_content(std::move(joined));
  deliver(content, channel, now_ms);
  r.complete = true;
  r.content  = std::move(content);
  return r;
}

const Peer* MeshNode::register_peer(const PeerInfo& info, uint64_t now_ms) {
  return peers_.register_peer(info, now_ms);
}

// ---------- transfers ----------

// initiate_transfer()
// PRE:    at least one component.
// POLICY:
//   - components ride the channel the multi-path plan assigns, fragmented to
//     that channel's capacity, at CONSCIOUSNESS relay priority
//   - a component with any refused packet counts as failed (its packets are
//     already in the relay queue)
//   - no channel at all: every component is queued and the transfer fails
//   - terminal on return; there is no resume
TransferResult MeshNode::initiate_transfer(const std::vector<Bytes>& components,
                                           const std::string& destination,
                                           Proximity proximity, uint64_t now_ms) {
  TransferResult r;
  if (components.empty()) {
    r.error = TransferError::NoComponents;
    return r;
  }

  TransferRecord t;
  t.id               = ids_.next("transfer");
  t.destination      = destination.empty() ? std::string(BROADCAST) : destination;
  t.total_components = components.size();
  t.started_ms       = now_ms;
  t.plan             = plan_multi_path(channels_, components.size(), proximity);

  EnqueueOptions queue_opts;
  queue_opts.priority_class = relay_priority::CONSCIOUSNESS;

  if (!t.plan.ok) {
    for (const auto& c : components) {
      if (c.empty()) continue;
      PacketOptions popts;
      popts.store_forward = true;
      relay_.enqueue(factory_.make(c, destination, popts, now_ms), destination, queue_opts,
                     now_ms);
    }
    t.failed_components = components.size();
  } else {
    queue_opts.attempts = 1;
    for (const auto& path : t.plan.paths) {
      t.channels.push_back(path.channel);
      const uint32_t cap = channel_spec(path.channel).max_payload_bytes;
      for (size_t idx : path.components) {
        if (idx >= components.size() || components[idx].empty()) {
          ++t.failed_components;
          continue;
        }
        FragmentResult fr = fragment(components[idx], cap, factory_, now_ms, destination);
        if (!fr.ok()) {
          ++t.failed_components;
          continue;
        }
        std::vector<MeshPacket>& packets = fr.packets;
        for (auto& p : packets) p.channel = path.channel;

        size_t bytes_sent = 0;
        const size_t requeued =
            transmit(packets, path.channel, destination, queue_opts, now_ms, bytes_sent);
        ChannelCounters& c = channels_.counters(path.channel);
        ++c.sent;
        c.bytes += bytes_sent;
        stats_.bytes_sent += bytes_sent;
        if (requeued == 0) ++t.sent_components;
        else ++t.failed_components;
      }
    }
    ++stats_.total_transmissions;
    stats_.last_transmission_ms = now_ms;
    if (!destination.empty()) peers_.note_transmission(destination);
  }

  if (t.sent_components == t.total_components) {
    t.state = TransferState::Completed;
    ++stats_.transfers_completed;
  } else if (t.sent_components == 0) {
    t.state = TransferState::Failed;
    ++stats_.transfers_failed;
  } else {
    t.state = TransferState::Partial;
    ++stats_.transfers_failed;
  }
  t.finished_ms = now_ms;

  r.ok       = true;
  r.transfer = t;
  transfers_[t.id] = std::move(t);
  return r;
}

const TransferRecord* MeshNode::transfer_status(const std::string& transfer_id) const {
  auto it = transfers_.find(transfer_id);
  return it == transfers_.end() ? nullptr : &it->second;
}

size_t MeshNode::prune_transfers(uint64_t now_ms) {
  size_t removed = 0;
  for (auto it = transfers_.begin(); it != transfers_.end();) {
    const TransferRecord& t = it->second;
    if (t.state != TransferState::InProgress && t.finished_ms &&
        now_ms > *t.finished_ms + TRANSFER_RETENTION_MS) {
      it = transfers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

// prune_partials()
// POLICY: reassembly buffers share the dedup retention window; past it a
//         missing slice is not coming.
size_t MeshNode::prune_partials(uint64_t now_ms) {
  if (now_ms < DedupCache::RETENTION_MS) return 0;
  const uint64_t cutoff = now_ms - DedupCache::RETENTION_MS;
  size_t removed = 0;
  for (auto it = partial_packets_.begin(); it != partial_packets_.end();) {
    if (it->second.first_seen_ms < cutoff) { it = partial_packets_.erase(it); ++removed; }
    else ++it;
  }
  for (auto it = partial_frames_.begin(); it != partial_frames_.end();) {
    if (it->second.first_seen_ms < cutoff) { it = partial_frames_.erase(it); ++removed; }
    else ++it;
  }
  return removed;
}

// ---------- heartbeat ----------

// forward_relayed()
// POLICY: a refused send is counted on the channel and reported back to the
//         sweep, which keeps the entry until its attempts run out.
bool MeshNode::forward_relayed(const RelayEntry& entry) {
  if (!provider_) return false;
  const RouteDecision route = select_route(channels_, entry.packet.payload_bytes,
                                           Proximity::Unknown, entry.priority_class);
  if (!route.channel) return false;

  MeshPacket packet = entry.packet;
  packet.channel = route.channel;
  ChannelCounters& c = channels_.counters(*route.channel);
  if (provider_->send(*route.channel, packet) != transport::TxResult::Ok) {
    ++c.errors;
    ++stats_.failovers;
    return false;
  }
  ++c.relayed;
  c.bytes += packet.total_bytes;
  return true;
}

// tick()
// PRE:    not already inside tick() (a provider callback may call back in).
// POLICY:
//   - relay sweep every tick; a destination is reachable when it is a known
//     peer; the sweep hands each released entry to forward_relayed() and
//     requeues the ones the carrier refused
//   - beacon built and broadcast on n % BEACON_EVERY == 0
//   - peers, transfers and reassembly buffers pruned on n % PRUNE_EVERY == 0
HeartbeatReport MeshNode::tick(uint32_t n, uint64_t now_ms) {
  HeartbeatReport report;
  report.tick = n;
  if (in_tick_) {
    report.skipped = true;
    return report;
  }
  TickGuard guard(in_tick_);

  report.relay = relay_.sweep(
      now_ms,
      [this](const std::string& id) { return peers_.contains(id); },
      [this](const RelayEntry& e) { return forward_relayed(e); });
  report.forwarded = report.relay.delivered;

  if (n % BEACON_EVERY == 0) {
    last_beacon_       = presence_beacon(now_ms);
    report.beacon      = last_beacon_;
    report.beacon_sent = broadcast_beacon(*last_beacon_, now_ms);
  }

  if (n % PRUNE_EVERY == 0) {
    report.peers_pruned     = peers_.sweep_stale(now_ms);
    report.transfers_pruned = prune_transfers(now_ms);
    report.partials_pruned  = prune_partials(now_ms);
  }

  ++tick_count_;
  return report;
}

// broadcast_beacon()
// POLICY: one broadcast copy per available channel, fragmented to that
//         channel's capacity, ttl 1 so neighbours do not carry it further.
//         A refused copy is counted as a channel error and dropped.
// OUT:    number of channels that accepted every packet of the beacon.
size_t MeshNode::broadcast_beacon(const PresenceBeacon& beacon, uint64_t now_ms) {
  if (!provider_) return 0;
  const std::string text = state::to_json(beacon).dump();
  const Bytes payload(text.begin(), text.end());

  size_t accepted = 0;
  for (ChannelId channel : channels_.available_channels()) {
    PacketOptions popts;
    popts.ttl     = 1;
    popts.channel = channel;
    std::vector<MeshPacket> packets;
    const uint32_t cap = channel_spec(channel).max_payload_bytes;
    if (payload.size() > cap) {
      FragmentResult fr = fragment(payload, cap, factory_, now_ms);
      if (!fr.ok()) continue;
      packets = std::move(fr.packets);
    } else {
      packets.push_back(factory_.make(payload, std::string(), popts, now_ms));
    }

    ChannelCounters& c = channels_.counters(channel);
    bool all_sent = true;
    for (auto& p : packets) {
      p.channel    = channel;
      p.header.ttl = 1;
      if (provider_->send(channel, p) != transport::TxResult::Ok) {
        ++c.errors;
        all_sent = false;
        break;
      }
      c.bytes += p.total_bytes;
      stats_.bytes_sent += p.total_bytes;
    }
    if (all_sent) ++accepted;
  }
  return accepted;
}

PresenceBeacon MeshNode::presence_beacon(uint64_t now_ms) const {
  PresenceBeacon b;
  b.node_id       = node_id();
  b.timestamp_ms  = now_ms;
  b.channels      = channels_.available_channels();
  b.relay         = relay_.config().enabled;
  b.pending_count = relay_.size();
  b.version       = VERSION;
  return b;
}

// ---------- reporting ----------

MeshMetrics MeshNode::metrics(uint64_t now_ms) const {
  MeshMetrics m;
  m.initialized         = initialized_;
  m.node_id             = node_id();
  m.active_channels     = channels_.available_channels();
  m.peer_count          = peers_.size();
  m.peers_discovered    = peers_.peers_discovered();
  m.pending_queue_size  = relay_.size();
  m.active_transfers    = static_cast<size_t>(std::count_if(
      transfers_.begin(), transfers_.end(),
      [](const auto& kv) { return kv.second.state == TransferState::InProgress; }));
  m.stats               = stats_;
  m.total_relayed       = relay_.total_relayed();
  m.total_store_forward = relay_.total_store_forward();
  m.total_evicted       = relay_.total_evicted();
  m.total_dropped       = relay_.total_dropped();
  m.relay_config        = relay_.config();
  m.protocol            = codec_.stats();
  m.recent_hash_count   = dedup_.size();
  m.total_deduplicated  = dedup_.total_deduplicated();
  m.gossip_broadcasts   = gossip_.broadcasts();
  m.gossip_suppressed   = gossip_.suppressed();
  m.uptime_ms           = (initialized_ && now_ms > started_ms_) ? now_ms - started_ms_ : 0;
  return m;
}

TransmissionStats MeshNode::transmission_stats() const {
  TransmissionStats s;
  s.totals        = stats_;
  s.relayed       = relay_.total_relayed();
  s.store_forward = relay_.total_store_forward();
  for (const auto& spec : channel_table()) {
    s.by_channel[static_cast<size_t>(spec.id)] = channels_.state(spec.id).counters;
  }
  s.active_transfers = static_cast<size_t>(std::count_if(
      transfers_.begin(), transfers_.end(),
      [](const auto& kv) { return kv.second.state == TransferState::InProgress; }));

  const size_t n     = std::min(RECENT_TX_LIMIT, tx_log_.size());
  const size_t first = tx_log_.size() - n;
  s.recent.reserve(n);
  for (size_t i = first; i < tx_log_.size(); ++i) s.recent.push_back(tx_log_[i]);
  return s;
}

const RelayConfig& MeshNode::configure_relay(const RelayConfigUpdate& update) {
  return relay_.configure(update);
}

OfflineSyncPlan MeshNode::plan_offline_sync(
    const std::vector<std::string>& unsynced_local_ids) const {
  OfflineSyncPlan p;
  p.outbound = unsynced_local_ids.size();
  const size_t n = std::min(OFFLINE_SYNC_LIMIT, unsynced_local_ids.size());
  p.outbound_ids.assign(unsynced_local_ids.begin(), unsynced_local_ids.begin() + n);
  p.pending_relay      = relay_.size();
  p.channels_available = channels_.available_channels();
  return p;
}

} // namespace relaymesh
