// -----------------------------------------------------------------------------
// state_json.cpp — nlohmann::json views of relaymesh state
//
// Contract: include/relaymesh/state_json.hpp
// -----------------------------------------------------------------------------
#include "relaymesh/state_json.hpp"

#include <algorithm>
#include <optional>

namespace relaymesh {
namespace state {

namespace {

template <typename T>
json opt(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

json opt_channel(const std::optional<ChannelId>& c) {
  return c ? json(channel_name(*c)) : json(nullptr);
}

json alternates_to_json(const etl::vector<ChannelId, 2>& alts) {
  json a = json::array();
  for (ChannelId id : alts) a.push_back(channel_name(id));
  return a;
}

// Typed readers: a missing or mistyped field yields nullopt instead of throwing.
std::optional<std::string> read_string(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

std::optional<bool> read_bool(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) return std::nullopt;
  return it->get<bool>();
}

std::optional<uint64_t> read_uint(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) return std::nullopt;
  if (it->is_number_unsigned()) return it->get<uint64_t>();
  const int64_t v = it->get<int64_t>();
  if (v < 0) return std::nullopt;
  return static_cast<uint64_t>(v);
}

} // namespace

// ---------- channels ----------

json channels_to_json(const ChannelList& channels) {
  json a = json::array();
  for (ChannelId id : channels) a.push_back(channel_name(id));
  return a;
}

json channel_table_to_json(const ChannelRegistry& registry) {
  json out = json::object();
  for (const auto& spec : channel_table()) {
    const ChannelState& st = registry.state(spec.id);
    json c;
    c["name"]              = spec.name;
    c["protocol"]          = spec.protocol;
    c["range"]             = spec.range;
    c["speed"]             = to_string(spec.speed);
    c["bandwidth"]         = to_string(spec.bandwidth);
    c["priority"]          = spec.priority;
    c["max_payload_bytes"] = spec.max_payload_bytes;
    c["status"]            = st.status();
    c["last_seen_ms"]      = opt(st.last_seen_ms);
    c["latency_ms"]        = opt(st.latency_ms);
    c["stats"] = {
      {"sent", st.counters.sent},         {"received", st.counters.received},
      {"relayed", st.counters.relayed},   {"bytes", st.counters.bytes},
      {"errors", st.counters.errors}
    };
    out[spec.name] = c;
  }
  return out;
}

// ---------- results ----------

json to_json(const InitResult& r) {
  json avail = json::object();
  for (const auto& kv : r.channels) avail[channel_name(kv.first)] = kv.second;
  return {
    {"ok", r.ok},
    {"error", r.error == InitError::None ? json(nullptr) : json(to_string(r.error))},
    {"already_initialized", r.already_initialized},
    {"node_id", r.node_id},
    {"channels", avail},
    {"active_channels", channels_to_json(r.active_channels)}
  };
}

json to_json(const RouteDecision& d) {
  return {
    {"mode", to_string(d.mode)},
    {"channel", opt_channel(d.channel)},
    {"score", d.score},
    {"needs_fragmentation", d.needs_fragmentation},
    {"fragment_count", d.fragment_count},
    {"alternates", alternates_to_json(d.alternates)},
    {"reason", d.reason}
  };
}

json to_json(const MultiPathPlan& p) {
  json paths = json::array();
  for (const auto& a : p.paths) {
    paths.push_back({
      {"channel", channel_name(a.channel)},
      {"components", a.components},
      {"estimated_latency", a.estimated_latency}
    });
  }
  return {
    {"ok", p.ok},
    {"paths", paths},
    {"total_components", p.total_components},
    {"channels_used", p.channels_used()},
    {"reason", p.reason}
  };
}

json to_json(const SendResult& r) {
  json j;
  j["ok"] = r.ok;
  if (!r.ok) {
    j["error"] = to_string(r.error);
    return j;
  }
  j["mode"]            = to_string(r.mode);
  j["channel"]         = opt_channel(r.channel);
  j["transmission_id"] = r.transmission_id.empty() ? json(nullptr) : json(r.transmission_id);
  j["relay_id"]        = r.relay_id.empty() ? json(nullptr) : json(r.relay_id);
  j["packets"]         = r.packets;
  j["total_bytes"]     = r.total_bytes;
  j["requeued"]        = r.requeued;
  j["alternates"]      = alternates_to_json(r.alternates);
  j["reason"]          = r.reason;
  return j;
}

json to_json(const ReceiveResult& r) {
  json j;
  j["ok"]       = r.ok;
  j["channel"]  = channel_name(r.channel);
  if (!r.ok) {
    j["error"] = to_string(r.error);
    if (r.error == ReceiveError::IntegrityCheckFailed) {
      j["expected_hash"] = r.expected_hash;
      j["actual_hash"]   = r.actual_hash;
    }
    return j;
  }
  j["complete"] = r.complete;
  if (r.content) {
    j["bytes"]   = r.content->raw.size();
    j["content"] = r.content->is_structured ? r.content->structured : json(r.content->text());
  }
  j["rebroadcast"] = r.rebroadcast;
  if (r.rebroadcast) j["relay_frame"] = to_hex(r.relay_frame.data(), r.relay_frame.size());
  return j;
}

json to_json(const TransferRecord& t) {
  return {
    {"id", t.id},
    {"destination", t.destination},
    {"state", to_string(t.state)},
    {"total_components", t.total_components},
    {"sent_components", t.sent_components},
    {"failed_components", t.failed_components},
    {"started_ms", t.started_ms},
    {"finished_ms", opt(t.finished_ms)},
    {"channels", channels_to_json(t.channels)},
    {"plan", to_json(t.plan)}
  };
}

json to_json(const TransferResult& r) {
  if (!r.ok) return {{"ok", false}, {"error", to_string(r.error)}};
  return {{"ok", true}, {"transfer", to_json(r.transfer)}};
}

json to_json(const TransmissionRecord& rec) {
  return {
    {"id", rec.id},
    {"content_hash", rec.content_hash},
    {"channel", channel_name(rec.channel)},
    {"destination", rec.destination},
    {"packet_count", rec.packet_count},
    {"total_bytes", rec.total_bytes},
    {"fragmented", rec.fragmented},
    {"sent_at_ms", rec.sent_at_ms},
    {"status", rec.status},
    {"alternates", alternates_to_json(rec.alternates)}
  };
}

json to_json(const PresenceBeacon& b) {
  return {
    {"type", "PRESENCE"},
    {"node_id", b.node_id},
    {"timestamp_ms", b.timestamp_ms},
    {"channels", channels_to_json(b.channels)},
    {"relay", b.relay},
    {"pending_count", b.pending_count},
    {"version", b.version}
  };
}

json to_json(const SweepResult& s) {
  return {
    {"delivered", s.delivered},
    {"requeued", s.requeued},
    {"dropped", s.dropped},
    {"expired", s.expired},
    {"remaining", s.remaining}
  };
}

json to_json(const HeartbeatReport& h) {
  json j;
  j["tick"]    = h.tick;
  j["skipped"] = h.skipped;
  if (h.skipped) return j;
  j["relay"]            = to_json(h.relay);
  j["forwarded"]        = h.forwarded;
  j["beacon"]           = h.beacon ? to_json(*h.beacon) : json(nullptr);
  j["beacon_sent"]      = h.beacon_sent;
  j["peers_pruned"]     = h.peers_pruned;
  j["transfers_pruned"] = h.transfers_pruned;
  j["partials_pruned"]  = h.partials_pruned;
  return j;
}

json to_json(const RelayConfig& c) {
  return {
    {"enabled", c.enabled},
    {"max_queue_size", c.max_queue_size},
    {"max_hold_ms", c.max_hold_ms}
  };
}

json to_json(const PendingView& p) {
  return {
    {"id", p.id},
    {"destination", p.destination},
    {"priority_class", p.priority_class},
    {"queued_at_ms", p.queued_at_ms},
    {"expires_at_ms", p.expires_at_ms},
    {"attempts", p.attempts},
    {"status", to_string(p.status)},
    {"packet_bytes", p.packet_bytes}
  };
}

json pending_to_json(const std::vector<PendingView>& pending) {
  json a = json::array();
  for (const auto& p : pending) a.push_back(to_json(p));
  return a;
}

json to_json(const Peer& p) {
  return {
    {"node_id", p.node_id},
    {"channels", channels_to_json(p.channels)},
    {"relay", p.relay},
    {"first_seen_ms", p.first_seen_ms},
    {"last_seen_ms", p.last_seen_ms},
    {"version", p.version},
    {"latency_ms", opt(p.latency_ms)},
    {"transmissions", p.transmissions},
    {"discovered_via", p.discovered_via}
  };
}

json to_json(const Topology& t) {
  json nodes = json::array();
  for (const auto& n : t.nodes) {
    nodes.push_back({
      {"node_id", n.node_id},
      {"channels", channels_to_json(n.channels)},
      {"last_seen_ms", n.last_seen_ms},
      {"relay", n.relay}
    });
  }
  return {
    {"self", t.self_node_id},
    {"nodes", nodes},
    {"total_nodes", t.total_nodes},
    {"active_channels", channels_to_json(t.active_channels)}
  };
}

json to_json(const MeshStats& s) {
  return {
    {"total_transmissions", s.total_transmissions},
    {"total_received", s.total_received},
    {"bytes_sent", s.bytes_sent},
    {"bytes_received", s.bytes_received},
    {"failovers", s.failovers},
    {"transfers_completed", s.transfers_completed},
    {"transfers_failed", s.transfers_failed},
    {"last_transmission_ms", opt(s.last_transmission_ms)},
    {"last_received_ms", opt(s.last_received_ms)}
  };
}

json to_json(const MeshMetrics& m) {
  json j;
  j["initialized"]         = m.initialized;
  j["node_id"]             = m.node_id;
  j["active_channels"]     = channels_to_json(m.active_channels);
  j["active_channel_count"] = m.active_channels.size();
  j["total_channels"]      = m.total_channels;
  j["peer_count"]          = m.peer_count;
  j["peers_discovered"]    = m.peers_discovered;
  j["pending_queue_size"]  = m.pending_queue_size;
  j["active_transfers"]    = m.active_transfers;
  j["stats"]               = to_json(m.stats);
  j["relay"] = {
    {"total_relayed", m.total_relayed},
    {"total_store_forward", m.total_store_forward},
    {"total_evicted", m.total_evicted},
    {"total_dropped", m.total_dropped},
    {"config", to_json(m.relay_config)}
  };
  j["protocol"] = {
    {"frames_created", m.protocol.frames_created},
    {"frames_parsed", m.protocol.frames_parsed},
    {"crc_errors", m.protocol.crc_errors},
    {"last_frame_ms", m.protocol.last_frame_ms}
  };
  j["dedup"] = {
    {"recent_hash_count", m.recent_hash_count},
    {"total_deduplicated", m.total_deduplicated}
  };
  j["gossip"] = {
    {"broadcasts", m.gossip_broadcasts},
    {"suppressed", m.gossip_suppressed}
  };
  j["uptime_ms"] = m.uptime_ms;
  return j;
}

json to_json(const TransmissionStats& s) {
  json by_channel = json::object();
  for (const auto& spec : channel_table()) {
    const ChannelCounters& c = s.by_channel[static_cast<size_t>(spec.id)];
    by_channel[spec.name] = {
      {"sent", c.sent}, {"received", c.received}, {"relayed", c.relayed},
      {"bytes", c.bytes}, {"errors", c.errors}
    };
  }
  json recent = json::array();
  for (const auto& rec : s.recent) recent.push_back(to_json(rec));
  return {
    {"totals", to_json(s.totals)},
    {"relayed", s.relayed},
    {"store_forward", s.store_forward},
    {"by_channel", by_channel},
    {"active_transfers", s.active_transfers},
    {"recent", recent}
  };
}

json to_json(const OfflineSyncPlan& p) {
  return {
    {"ok", p.ok},
    {"outbound", p.outbound},
    {"outbound_ids", p.outbound_ids},
    {"pending_relay", p.pending_relay},
    {"channels_available", channels_to_json(p.channels_available)}
  };
}

json to_json(const FrameHeader& h) {
  return {
    {"version", h.version},
    {"priority", h.priority},
    {"ttl", h.ttl},
    {"fragment", h.is_fragment()},
    {"relay", h.is_relay()},
    {"emergency", h.is_emergency()},
    {"encrypted", h.is_encrypted()},
    {"hash", h.hash_hex()},
    {"source", h.source_hex()},
    {"fragment_seq", h.fragment_seq},
    {"fragment_total", h.fragment_total},
    {"payload_length", h.payload_length}
  };
}

json to_json(const DecodeResult& d) {
  json j;
  j["ok"] = d.ok;
  if (!d.ok) {
    j["error"] = to_string(d.error);
    if (d.error == FrameError::CrcMismatch) {
      j["expected_crc"] = d.expected_crc;
      j["received_crc"] = d.received_crc;
    }
    return j;
  }
  j["header"]  = to_json(d.header);
  j["payload"] = to_text(d.payload);
  return j;
}

// ---------- persisted state ----------

json peers_to_json(const std::vector<Peer>& peers) {
  json a = json::array();
  for (const auto& p : peers) {
    a.push_back({
      {"node_id", p.node_id},
      {"channels", channels_to_json(p.channels)},
      {"relay", p.relay},
      {"version", p.version},
      {"latency_ms", opt(p.latency_ms)},
      {"last_seen_ms", p.last_seen_ms}
    });
  }
  return a;
}

ChannelList channels_from_json(const json& j) {
  ChannelList out;
  if (!j.is_array()) return out;
  for (const auto& e : j) {
    if (!e.is_string()) continue;
    auto id = channel_from_name(e.get<std::string>());
    if (!id || out.full()) continue;
    if (std::find(out.begin(), out.end(), *id) == out.end()) out.push_back(*id);
  }
  return out;
}

std::vector<PeerInfo> peers_from_json(const json& j) {
  std::vector<PeerInfo> out;
  if (!j.is_array()) return out;
  for (const auto& e : j) {
    if (!e.is_object()) continue;
    auto id = read_string(e, "node_id");
    if (!id || id->empty()) continue;

    PeerInfo info;
    info.node_id        = *id;
    info.relay          = read_bool(e, "relay");
    info.version        = read_string(e, "version").value_or(std::string());
    info.discovered_via = RESTORED_VIA;
    auto ch = e.find("channels");
    if (ch != e.end()) info.channels = channels_from_json(*ch);
    if (auto lat = read_uint(e, "latency_ms")) info.latency_ms = static_cast<uint32_t>(*lat);
    out.push_back(std::move(info));
  }
  return out;
}

RelayConfigUpdate relay_update_from_json(const json& j) {
  RelayConfigUpdate u;
  if (!j.is_object()) return u;
  auto it = j.find("relay");
  if (it == j.end() || !it->is_object()) return u;
  u.enabled = read_bool(*it, "enabled");
  if (auto n = read_uint(*it, "max_queue_size")) u.max_queue_size = static_cast<size_t>(*n);
  u.max_hold_ms = read_uint(*it, "max_hold_ms");
  return u;
}

} // namespace state
} // namespace relaymesh
