/**
 * @file routing.hpp
 * @brief Routing Engine — channel scoring and multi-path distribution.
 *
 * @details
 * ## select_route()
 * Scores every available channel and picks the best one:
 *
 * ```
 * score  = 100 - channel.priority * 10
 *        + 50  proximity == local  and channel in {bluetooth, nfc}
 *        + 30  proximity == nearby and channel == wifi_direct
 *        - 20  payload > channel.max_payload        (fragmentation needed)
 *        + 20 / +10  high / medium speed, only for the THREAT class
 *        + 15  known latency < 50 ms
 * ```
 * Ties keep registry order. No available channel -> StoreForward with reason
 * `no_channels_available`, which is a routing outcome, not an error.
 *
 * ## plan_multi_path()
 * For decomposable transfers only. Channels are ordered by bandwidth class
 * (high, low_medium, low, very_low) and take 4 / 2 / 1 / 1 components each in
 * turn; anything left over goes to the first (highest bandwidth) path.
 * Within one class a proximity hint moves the channels it favours to the
 * front (nearby: wifi_direct ahead of internet; local: nfc ahead of lora).
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_ROUTING_HPP
#define RELAYMESH_ROUTING_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "relaymesh/channel.hpp"
#include "relaymesh/priority.hpp"

namespace relaymesh {

enum class Proximity : uint8_t { Local, Nearby, Remote, Unknown };

const char* to_string(Proximity p);
/// Unknown names map to Proximity::Unknown.
Proximity proximity_from_name(const std::string& name);

enum class RouteMode : uint8_t { Direct, StoreForward };

const char* to_string(RouteMode m);

struct RouteDecision {
  RouteMode                 mode = RouteMode::StoreForward;
  std::optional<ChannelId>  channel;
  int                       score = 0;
  bool                      needs_fragmentation = false;
  uint32_t                  fragment_count = 0;
  etl::vector<ChannelId, 2> alternates;
  std::string               reason;
};

/// Score added for a channel the proximity hint favours (+50 local, +30 nearby).
int proximity_bonus(ChannelId id, Proximity proximity);

/// Score for one channel under the given request.
int score_channel(const ChannelRegistry& registry, ChannelId id, size_t payload_bytes,
                  Proximity proximity, uint8_t priority_class);

RouteDecision select_route(const ChannelRegistry& registry, size_t payload_bytes,
                           Proximity proximity = Proximity::Unknown,
                           uint8_t priority_class = relay_priority::GENERAL);

/// Rank used to order channels for multi-path plans (high = 4 ... very_low = 0).
int bandwidth_rank(Bandwidth b);
/// Components a path of this class takes per round.
size_t bandwidth_share(Bandwidth b);

struct PathAssignment {
  ChannelId           channel;
  std::vector<size_t> components;          ///< indices into the caller's list
  const char*         estimated_latency;   ///< "low" | "medium" | "high"
};

struct MultiPathPlan {
  bool                        ok = false;
  std::vector<PathAssignment> paths;
  size_t                      total_components = 0;
  std::string                 reason;

  size_t channels_used() const { return paths.size(); }
};

MultiPathPlan plan_multi_path(const ChannelRegistry& registry, size_t component_count,
                              Proximity proximity = Proximity::Unknown);

} // namespace relaymesh

#endif // RELAYMESH_ROUTING_HPP
