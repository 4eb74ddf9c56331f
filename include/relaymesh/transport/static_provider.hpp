#pragma once
/**
 * @file static_provider.hpp
 * @brief In-memory channel provider and content store.
 *
 * Availability comes from a fixed list instead of hardware detection; sent
 * packets are kept in order for inspection. Used by the CLI to simulate a node
 * and by the test suite.
 */

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

#include "relaymesh/transport/channel_provider.hpp"

namespace relaymesh::transport {

class StaticChannelProvider : public IChannelProvider {
public:
  StaticChannelProvider() = default;
  explicit StaticChannelProvider(const ChannelList& available);

  void set_available(ChannelId id, bool available);

  /// Make send() on @p id return @p result until cleared with TxResult::Ok.
  void set_send_result(ChannelId id, TxResult result);

  AvailabilityMap detect_availability() override;
  TxResult        send(ChannelId channel, const MeshPacket& packet) override;
  const char*     name() const override { return "static"; }

  const std::vector<std::pair<ChannelId, MeshPacket>>& sent() const { return sent_; }
  void clear_sent() { sent_.clear(); }

private:
  std::set<ChannelId>                            available_;
  std::set<ChannelId>                            busy_;
  std::set<ChannelId>                            failing_;
  std::vector<std::pair<ChannelId, MeshPacket>>  sent_;
};

/// Keeps every delivered content unit in arrival order.
class MemoryContentStore : public IContentStore {
public:
  void on_receive(const Content& content, ChannelId source_channel) override {
    received_.emplace_back(content, source_channel);
  }

  const std::vector<std::pair<Content, ChannelId>>& received() const { return received_; }
  size_t size() const { return received_.size(); }

private:
  std::vector<std::pair<Content, ChannelId>> received_;
};

} // namespace relaymesh::transport
