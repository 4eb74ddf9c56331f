// -----------------------------------------------------------------------------
// channel.cpp — Channel capability table and live registry.
// -----------------------------------------------------------------------------
#include "relaymesh/channel.hpp"

namespace relaymesh {

namespace {

constexpr uint32_t KiB = 1024;
constexpr uint32_t MiB = 1024 * 1024;

const std::array<ChannelSpec, CHANNEL_COUNT> TABLE = {{
  { ChannelId::Internet,   "internet",    "tcp_ip",    "global",             Speed::High,    Bandwidth::High,      3, 10 * MiB,  false, true  },
  { ChannelId::WifiDirect, "wifi_direct", "wifi_p2p",  "~100m",              Speed::High,    Bandwidth::High,      2, 10 * MiB,  false, false },
  { ChannelId::Bluetooth,  "bluetooth",   "ble",       "~10-30m",            Speed::Medium,  Bandwidth::LowMedium, 1, 512 * KiB, false, false },
  { ChannelId::Lora,       "lora",        "lora_mesh", "2-15km per hop",     Speed::Low,     Bandwidth::VeryLow,   4, 242,       true,  false },
  { ChannelId::RfPacket,   "rf_packet",   "ax25",      "regional to global", Speed::VeryLow, Bandwidth::VeryLow,   5, 256,       true,  false },
  { ChannelId::Telephone,  "telephone",   "modem",     "global",             Speed::Low,     Bandwidth::Low,       6, 64 * KiB,  true,  true  },
  { ChannelId::Nfc,        "nfc",         "nfc",       "~4cm",               Speed::Instant, Bandwidth::VeryLow,   7, 8 * KiB,   false, false },
}};

} // namespace

// ---------- reference data ----------

const std::array<ChannelSpec, CHANNEL_COUNT>& channel_table() {
  return TABLE;
}

const ChannelSpec& channel_spec(ChannelId id) {
  return TABLE[static_cast<size_t>(id)];
}

const char* channel_name(ChannelId id) {
  return channel_spec(id).name;
}

std::optional<ChannelId> channel_from_name(const std::string& name) {
  for (const auto& spec : TABLE) {
    if (name == spec.name) return spec.id;
  }
  return std::nullopt;
}

const char* to_string(Speed s) {
  switch (s) {
    case Speed::Instant: return "instant";
    case Speed::High:    return "high";
    case Speed::Medium:  return "medium";
    case Speed::Low:     return "low";
    case Speed::VeryLow: return "very_low";
  }
  return "unknown";
}

const char* to_string(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return "high";
    case Bandwidth::LowMedium: return "low_medium";
    case Bandwidth::Low:       return "low";
    case Bandwidth::VeryLow:   return "very_low";
  }
  return "unknown";
}

// ---------- live registry ----------

void ChannelRegistry::apply_availability(const AvailabilityMap& report, uint64_t now_ms) {
  for (const auto& kv : report) {
    set_available(kv.first, kv.second, now_ms);
  }
}

void ChannelRegistry::set_available(ChannelId id, bool available, uint64_t now_ms) {
  ChannelState& st = states_[index(id)];
  st.available = available;
  if (available) st.last_seen_ms = now_ms;   // last_seen only moves while reachable
}

void ChannelRegistry::set_latency(ChannelId id, std::optional<uint32_t> latency_ms) {
  states_[index(id)].latency_ms = latency_ms;
}

ChannelList ChannelRegistry::available_channels() const {
  ChannelList out;
  for (const auto& spec : TABLE) {
    if (states_[index(spec.id)].available) out.push_back(spec.id);
  }
  return out;
}

void ChannelRegistry::reset() {
  states_.fill(ChannelState{});
}

} // namespace relaymesh
