// -----------------------------------------------------------------------------
// routing.cpp — Routing Engine
//
// Scoring table and plan rules: include/relaymesh/routing.hpp
// -----------------------------------------------------------------------------
#include "relaymesh/routing.hpp"
#include "relaymesh/fragments.hpp"

#include <algorithm>

namespace relaymesh {

// ---------- names ----------

const char* to_string(Proximity p) {
  switch (p) {
    case Proximity::Local:   return "local";
    case Proximity::Nearby:  return "nearby";
    case Proximity::Remote:  return "remote";
    case Proximity::Unknown: return "unknown";
  }
  return "unknown";
}

Proximity proximity_from_name(const std::string& name) {
  if (name == "local")  return Proximity::Local;
  if (name == "nearby") return Proximity::Nearby;
  if (name == "remote") return Proximity::Remote;
  return Proximity::Unknown;
}

const char* to_string(RouteMode m) {
  return m == RouteMode::Direct ? "direct" : "store_forward";
}

// ---------- select_route ----------

int proximity_bonus(ChannelId id, Proximity proximity) {
  if (proximity == Proximity::Local && (id == ChannelId::Bluetooth || id == ChannelId::Nfc)) {
    return 50;
  }
  if (proximity == Proximity::Nearby && id == ChannelId::WifiDirect) return 30;
  return 0;
}

int score_channel(const ChannelRegistry& registry, ChannelId id, size_t payload_bytes,
                  Proximity proximity, uint8_t priority_class) {
  const ChannelSpec& spec = channel_spec(id);
  int score = 100 - int(spec.priority) * 10;

  score += proximity_bonus(id, proximity);
  if (payload_bytes > spec.max_payload_bytes) {
    score -= 20;                                   // still usable, but must fragment
  }
  if (priority_class == relay_priority::THREAT) {
    if (spec.speed == Speed::High)        score += 20;
    else if (spec.speed == Speed::Medium) score += 10;
  }
  const auto& latency = registry.state(id).latency_ms;
  if (latency && *latency < 50) score += 15;

  return score;
}

// select_route()
// POLICY:
//   - candidates come out of available_channels() in registry order and are
//     stable-sorted by score, so equal scores keep that order.
//   - fragment_count uses the same effective capacity fragment() will use.
RouteDecision select_route(const ChannelRegistry& registry, size_t payload_bytes,
                           Proximity proximity, uint8_t priority_class) {
  RouteDecision d;
  const ChannelList available = registry.available_channels();
  if (available.empty()) {
    d.mode   = RouteMode::StoreForward;
    d.reason = "no_channels_available";
    return d;
  }

  struct Scored { ChannelId id; int score; };
  std::vector<Scored> routes;
  routes.reserve(available.size());
  for (ChannelId id : available) {
    routes.push_back({id, score_channel(registry, id, payload_bytes, proximity, priority_class)});
  }
  std::stable_sort(routes.begin(), routes.end(),
                   [](const Scored& a, const Scored& b) { return a.score > b.score; });

  const Scored& best = routes.front();
  const ChannelSpec& spec = channel_spec(best.id);

  d.mode    = RouteMode::Direct;
  d.channel = best.id;
  d.score   = best.score;
  d.needs_fragmentation = payload_bytes > spec.max_payload_bytes;
  if (d.needs_fragmentation) {
    const size_t cap = effective_capacity(spec.max_payload_bytes);
    d.fragment_count = static_cast<uint32_t>((payload_bytes + cap - 1) / cap);
  } else {
    d.fragment_count = 1;
  }
  for (size_t i = 1; i < routes.size() && !d.alternates.full(); ++i) {
    d.alternates.push_back(routes[i].id);
  }
  d.reason = std::string("optimal_route_") + spec.name;
  return d;
}

// ---------- plan_multi_path ----------

int bandwidth_rank(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return 4;
    case Bandwidth::LowMedium: return 2;
    case Bandwidth::Low:       return 1;
    case Bandwidth::VeryLow:   return 0;
  }
  return 0;
}

size_t bandwidth_share(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return 4;
    case Bandwidth::LowMedium: return 2;
    default:                   return 1;
  }
}

namespace {

const char* latency_for(Speed s) {
  if (s == Speed::High)   return "low";
  if (s == Speed::Medium) return "medium";
  return "high";
}

} // namespace

// plan_multi_path()
// POLICY: bandwidth class first; inside a class the proximity bonus decides,
//         then registry order. Without a hint this is plain registry order.
MultiPathPlan plan_multi_path(const ChannelRegistry& registry, size_t component_count,
                              Proximity proximity) {
  MultiPathPlan plan;
  plan.total_components = component_count;
  if (component_count == 0) {
    plan.reason = "no_components";
    return plan;
  }

  ChannelList by_bandwidth = registry.available_channels();
  if (by_bandwidth.empty()) {
    plan.reason = "no_channels_available";
    return plan;
  }
  std::stable_sort(by_bandwidth.begin(), by_bandwidth.end(), [proximity](ChannelId a, ChannelId b) {
    const int ra = bandwidth_rank(channel_spec(a).bandwidth);
    const int rb = bandwidth_rank(channel_spec(b).bandwidth);
    if (ra != rb) return ra > rb;
    return proximity_bonus(a, proximity) > proximity_bonus(b, proximity);
  });

  size_t next = 0;
  for (ChannelId id : by_bandwidth) {
    if (next >= component_count) break;
    const ChannelSpec& spec = channel_spec(id);
    const size_t count = std::min(bandwidth_share(spec.bandwidth), component_count - next);

    PathAssignment path{id, {}, latency_for(spec.speed)};
    for (size_t i = 0; i < count; ++i) path.components.push_back(next++);
    plan.paths.push_back(std::move(path));
  }

  // POLICY: overflow rides the highest-bandwidth path (always paths[0] here,
  //         since every available channel takes at least one component).
  while (next < component_count) {
    plan.paths.front().components.push_back(next++);
  }

  plan.ok     = true;
  plan.reason = plan.paths.size() > 1 ? "multi_path_distribution" : "single_path";
  return plan;
}

} // namespace relaymesh
