#include "relaymesh/transport/static_provider.hpp"

namespace relaymesh::transport {

StaticChannelProvider::StaticChannelProvider(const ChannelList& available) {
  for (ChannelId id : available) available_.insert(id);
}

void StaticChannelProvider::set_available(ChannelId id, bool available) {
  if (available) available_.insert(id);
  else available_.erase(id);
}

void StaticChannelProvider::set_send_result(ChannelId id, TxResult result) {
  busy_.erase(id);
  failing_.erase(id);
  if (result == TxResult::Busy)  busy_.insert(id);
  if (result == TxResult::Error) failing_.insert(id);
}

// Reports every channel, so a detect pass also clears channels that went away.
AvailabilityMap StaticChannelProvider::detect_availability() {
  AvailabilityMap out;
  for (const auto& spec : channel_table()) {
    out[spec.id] = available_.count(spec.id) != 0;
  }
  return out;
}

TxResult StaticChannelProvider::send(ChannelId channel, const MeshPacket& packet) {
  if (!available_.count(channel)) return TxResult::Error;
  if (failing_.count(channel))    return TxResult::Error;
  if (busy_.count(channel))       return TxResult::Busy;
  sent_.emplace_back(channel, packet);
  return TxResult::Ok;
}

} // namespace relaymesh::transport
