/**
 * @file channel.hpp
 * @brief Channel Registry — the seven transport mediums and their live state.
 *
 * @details
 * PURPOSE
 * -------
 * The mesh never assumes one medium. Each transport is described by an
 * immutable `ChannelSpec` (range, speed, bandwidth class, preference, payload
 * ceiling, hardware/infrastructure needs) and a mutable `ChannelState` whose
 * `available` flag is written only by an external detector through
 * `apply_availability()`. Nothing in this registry touches hardware.
 *
 * TABLE (registry order = tie-break order for routing)
 * -----
 * | id         | prio | max payload | speed    | bandwidth  | hw | infra |
 * |------------|------|-------------|----------|------------|----|-------|
 * | internet   | 3    | 10 MiB      | high     | high       | no | yes   |
 * | wifi_direct| 2    | 10 MiB      | high     | high       | no | no    |
 * | bluetooth  | 1    | 512 KiB     | medium   | low_medium | no | no    |
 * | lora       | 4    | 242         | low      | very_low   | yes| no    |
 * | rf_packet  | 5    | 256         | very_low | very_low   | yes| no    |
 * | telephone  | 6    | 64 KiB      | low      | low        | yes| yes   |
 * | nfc        | 7    | 8 KiB       | instant  | very_low   | no | no    |
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_CHANNEL_HPP
#define RELAYMESH_CHANNEL_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "etl/vector.h"

namespace relaymesh {

enum class ChannelId : uint8_t {
  Internet = 0,
  WifiDirect,
  Bluetooth,
  Lora,
  RfPacket,
  Telephone,
  Nfc
};

static constexpr size_t CHANNEL_COUNT = 7;

enum class Speed : uint8_t { Instant, High, Medium, Low, VeryLow };
enum class Bandwidth : uint8_t { High, LowMedium, Low, VeryLow };

/// Immutable reference data for one medium.
struct ChannelSpec {
  ChannelId   id;
  const char* name;
  const char* protocol;
  const char* range;
  Speed       speed;
  Bandwidth   bandwidth;
  uint8_t     priority;              ///< lower = preferred
  uint32_t    max_payload_bytes;
  bool        requires_hardware;
  bool        requires_infrastructure;
};

/// Per-channel traffic counters.
struct ChannelCounters {
  uint64_t sent     = 0;
  uint64_t received = 0;
  uint64_t relayed  = 0;
  uint64_t bytes    = 0;
  uint64_t errors   = 0;
};

/// Live, mutable state of one medium.
struct ChannelState {
  bool                    available = false;
  std::optional<uint64_t> last_seen_ms;
  std::optional<uint32_t> latency_ms;
  ChannelCounters         counters;

  const char* status() const { return available ? "active" : "inactive"; }
};

/// Set of channels; fixed capacity, never allocates.
using ChannelList = etl::vector<ChannelId, CHANNEL_COUNT>;

/// What an external detector reports: channel -> reachable.
using AvailabilityMap = std::map<ChannelId, bool>;

const std::array<ChannelSpec, CHANNEL_COUNT>& channel_table();
const ChannelSpec& channel_spec(ChannelId id);
const char* channel_name(ChannelId id);
std::optional<ChannelId> channel_from_name(const std::string& name);

const char* to_string(Speed s);
const char* to_string(Bandwidth b);

/**
 * @class ChannelRegistry
 * @brief Live availability, latency and counters for the seven channels.
 */
class ChannelRegistry {
public:
  /// Apply a detector report; channels absent from @p report are left as they are.
  void apply_availability(const AvailabilityMap& report, uint64_t now_ms);

  void set_available(ChannelId id, bool available, uint64_t now_ms);
  void set_latency(ChannelId id, std::optional<uint32_t> latency_ms);

  bool is_available(ChannelId id) const { return state(id).available; }

  /// Available channels in registry order.
  ChannelList available_channels() const;

  const ChannelState& state(ChannelId id) const { return states_[index(id)]; }
  ChannelCounters& counters(ChannelId id) { return states_[index(id)].counters; }

  /// All channels back to inactive with zeroed counters.
  void reset();

private:
  static size_t index(ChannelId id) { return static_cast<size_t>(id); }

  std::array<ChannelState, CHANNEL_COUNT> states_{};
};

} // namespace relaymesh

#endif // RELAYMESH_CHANNEL_HPP
