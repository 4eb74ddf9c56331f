#include <doctest/doctest.h>
#include <algorithm>
#include "relaymesh/fragments.hpp"
#include "relaymesh/node.hpp"
#include "relaymesh/transport/static_provider.hpp"

using namespace relaymesh;
using transport::MemoryContentStore;
using transport::StaticChannelProvider;
using transport::TxResult;

static ChannelList list_of(std::initializer_list<ChannelId> ids) {
    ChannelList out;
    for (ChannelId id : ids) out.push_back(id);
    return out;
}

static NodeConfig seeded(uint32_t seed) {
    NodeConfig cfg;
    cfg.seed = seed;
    return cfg;
}

static Bytes letters(size_t n) {
    Bytes out;
    for (size_t i = 0; i < n; ++i) out.push_back(uint8_t('a' + i % 26));
    return out;
}

TEST_CASE("Node ids look like node_ plus 20 hex and repeat per seed") {
    MeshNode a(seeded(42)), b(seeded(42));
    const std::string id = a.node_id();
    REQUIRE(id.size() == 25);
    CHECK(id.rfind("node_", 0) == 0);
    CHECK(id.find_first_not_of("0123456789abcdef", 5) == std::string::npos);
    CHECK(a.node_id() == b.node_id());

    NodeConfig fixed;
    fixed.node_id = "node_fixedfixedfixedfixed";
    MeshNode c(fixed);
    CHECK(c.node_id() == "node_fixedfixedfixedfixed");
}

TEST_CASE("Init detects channels once") {
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth, ChannelId::Lora}));
    MeshNode node(seeded(1));
    InitResult first = node.init(provider, nullptr, 100);
    CHECK(first.ok);
    CHECK_FALSE(first.already_initialized);
    CHECK(first.active_channels.size() == 2);
    CHECK(first.channels.at(ChannelId::Internet) == false);
    CHECK(node.initialized());

    InitResult again = node.init(provider, nullptr, 200);
    CHECK(again.ok);
    CHECK(again.already_initialized);
    CHECK(again.active_channels.size() == 2);
}

TEST_CASE("Empty content is refused") {
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth}));
    MeshNode node(seeded(2));
    node.init(provider, nullptr, 0);
    SendResult r = node.send_dtu(Bytes(), "", SendOptions(), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.error == SendError::NoDtuProvided);
    CHECK(provider.sent().empty());
}

TEST_CASE("Small content goes direct on the best channel") {
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth, ChannelId::Internet}));
    MeshNode node(seeded(3));
    node.init(provider, nullptr, 0);

    SendResult r = node.send_dtu(to_bytes("hello"), "node_peer", SendOptions(), 50);
    REQUIRE(r.ok);
    CHECK(r.mode == SendMode::Direct);
    REQUIRE(r.channel.has_value());
    CHECK(*r.channel == ChannelId::Bluetooth);
    CHECK(r.packets == 1);
    CHECK(r.total_bytes == 5 + TOTAL_OVERHEAD);
    REQUIRE(provider.sent().size() == 1);
    CHECK(provider.sent()[0].first == ChannelId::Bluetooth);

    TransmissionStats s = node.transmission_stats();
    CHECK(s.totals.total_transmissions == 1);
    CHECK(s.totals.bytes_sent == 5 + TOTAL_OVERHEAD);
    CHECK(s.by_channel[size_t(ChannelId::Bluetooth)].sent == 1);
    REQUIRE(s.recent.size() == 1);
    CHECK(std::string(s.recent[0].status) == "sent");
    CHECK(s.recent[0].destination == "node_peer");
}

TEST_CASE("No channel parks content in the relay queue") {
    StaticChannelProvider provider;
    MeshNode node(seeded(4));
    node.init(provider, nullptr, 0);

    SendResult r = node.send_dtu(to_bytes("{\"type\":\"THREAT\"}"), "", SendOptions(), 0);
    REQUIRE(r.ok);
    CHECK(r.mode == SendMode::StoreForward);
    CHECK_FALSE(r.relay_id.empty());
    CHECK(r.reason == "no_channels_available");

    auto pending = node.pending_queue();
    REQUIRE(pending.size() == 1);
    CHECK(pending[0].priority_class == relay_priority::THREAT);
    CHECK(node.metrics(0).pending_queue_size == 1);
}

TEST_CASE("Large content is fragmented for LoRa") {
    StaticChannelProvider provider(list_of({ChannelId::Lora}));
    MeshNode node(seeded(5));
    node.init(provider, nullptr, 0);

    SendResult r = node.send_dtu(letters(1000), "", SendOptions(), 0);
    REQUIRE(r.ok);
    CHECK(r.mode == SendMode::Fragmented);
    CHECK(r.packets == 6);
    CHECK(provider.sent().size() == 6);
    CHECK(node.transmission_stats().recent[0].fragmented);
}

TEST_CASE("A refused send fails over to the relay queue") {
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth}));
    provider.set_send_result(ChannelId::Bluetooth, TxResult::Busy);
    MeshNode node(seeded(6));
    node.init(provider, nullptr, 0);

    SendResult r = node.send_dtu(to_bytes("busy day"), "", SendOptions(), 0);
    REQUIRE(r.ok);
    CHECK(r.requeued == 1);
    CHECK(node.relay_queue().size() == 1);
    CHECK(node.relay_queue().entries()[0].attempts == 1);

    TransmissionStats s = node.transmission_stats();
    CHECK(s.totals.failovers == 1);
    CHECK(s.by_channel[size_t(ChannelId::Bluetooth)].errors == 1);
    CHECK(std::string(s.recent[0].status) == "requeued");
}

TEST_CASE("Packets from one node reassemble on another") {
    StaticChannelProvider tx(list_of({ChannelId::Lora}));
    MeshNode sender(seeded(7));
    sender.init(tx, nullptr, 0);

    const Bytes body = letters(900);
    REQUIRE(sender.send_dtu(body, "", SendOptions(), 0).ok);
    REQUIRE(tx.sent().size() > 1);

    StaticChannelProvider rx_provider(list_of({ChannelId::Lora}));
    MemoryContentStore store;
    MeshNode receiver(seeded(8));
    receiver.init(rx_provider, &store, 0);

    const auto& sent = tx.sent();
    for (size_t i = sent.size(); i-- > 1;) {
        ReceiveResult part = receiver.receive_dtu(sent[i].second, ChannelId::Lora, 10);
        CHECK(part.ok);
        CHECK_FALSE(part.complete);
    }
    ReceiveResult last = receiver.receive_dtu(sent[0].second, ChannelId::Lora, 10);
    REQUIRE(last.ok);
    CHECK(last.complete);
    REQUIRE(store.size() == 1);
    CHECK(store.received()[0].first.raw == body);
    CHECK(store.received()[0].second == ChannelId::Lora);

    ReceiveResult dup = receiver.receive_dtu(sent[0].second, ChannelId::Lora, 11);
    CHECK_FALSE(dup.ok);
    CHECK(dup.error == ReceiveError::Duplicate);
    CHECK(receiver.metrics(11).total_deduplicated == 1);
    CHECK(receiver.metrics(11).stats.total_received == 1);
}

TEST_CASE("Tampered packets fail the integrity check") {
    StaticChannelProvider tx(list_of({ChannelId::Internet}));
    MeshNode sender(seeded(9));
    sender.init(tx, nullptr, 0);
    REQUIRE(sender.send_dtu(to_bytes("original"), "", SendOptions(), 0).ok);

    MeshPacket packet = tx.sent()[0].second;
    packet.payload[0] ^= 0x01;

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(10));
    receiver.init(rx, &store, 0);
    ReceiveResult r = receiver.receive_dtu(packet, ChannelId::Internet, 0);
    CHECK_FALSE(r.ok);
    CHECK(r.error == ReceiveError::IntegrityCheckFailed);
    CHECK(r.expected_hash != r.actual_hash);
    CHECK(store.size() == 0);
}

TEST_CASE("Frames are decoded, deduplicated and delivered") {
    MeshNode sender(seeded(11));
    EncodeResult e = sender.build_frame(to_bytes("{\"type\":\"KNOWLEDGE\"}"), FrameOptions(), 0);
    REQUIRE(e.ok);

    StaticChannelProvider rx;
    MemoryContentStore store;
    MeshNode receiver(seeded(12));
    receiver.init(rx, &store, 0);

    ReceiveResult r = receiver.receive_frame(e.bytes, ChannelId::Lora, 0.5, 5);
    REQUIRE(r.ok);
    CHECK(r.complete);
    REQUIRE(r.content.has_value());
    CHECK(r.content->is_structured);
    CHECK(r.content->structured["type"] == "KNOWLEDGE");
    CHECK(store.size() == 1);

    ReceiveResult again = receiver.receive_frame(e.bytes, ChannelId::Lora, 0.5, 6);
    CHECK(again.error == ReceiveError::Duplicate);

    Bytes bad = e.bytes;
    bad[HEADER_SIZE] ^= 0x10;
    ReceiveResult broken = receiver.receive_frame(bad, ChannelId::Lora, 0.5, 7);
    CHECK(broken.error == ReceiveError::CrcMismatch);
    CHECK(receiver.metrics(7).protocol.crc_errors == 1);
    CHECK(receiver.channels().state(ChannelId::Lora).counters.errors == 1);
}

TEST_CASE("Emergency frames are rebroadcast with one hop less") {
    MeshNode sender(seeded(13));
    FrameOptions fo;
    fo.emergency = true;
    fo.ttl       = 3;
    EncodeResult e = sender.build_frame(to_bytes("flood warning"), fo, 0);
    REQUIRE(e.ok);

    MeshNode relay(seeded(14));
    ReceiveResult r = relay.receive_frame(e.bytes, ChannelId::RfPacket, 0.0, 1);
    REQUIRE(r.ok);
    REQUIRE(r.rebroadcast);

    DecodeResult fwd = decode_frame(r.relay_frame.data(), r.relay_frame.size());
    REQUIRE(fwd.ok);
    CHECK(fwd.header.ttl == 2);
    CHECK(fwd.is_relay());
    CHECK(fwd.is_emergency());
    CHECK(fwd.header.source_id == e.header.source_id);
    CHECK(to_text(fwd.payload) == "flood warning");
}

TEST_CASE("Frames with no hops left are not rebroadcast") {
    MeshNode sender(seeded(15));
    FrameOptions fo;
    fo.emergency = true;
    fo.ttl       = 0;
    EncodeResult e = sender.build_frame(to_bytes("last hop"), fo, 0);
    REQUIRE(e.ok);

    MeshNode relay(seeded(16));
    ReceiveResult r = relay.receive_frame(e.bytes, ChannelId::Lora, 1.0, 1);
    REQUIRE(r.ok);
    CHECK_FALSE(r.rebroadcast);
    CHECK(r.relay_frame.empty());
}

TEST_CASE("Fragment frames are joined per source") {
    MeshNode sender(seeded(17));
    FragmentFrames ff = sender.build_frames(to_bytes("hello, mesh"), 7, FrameOptions(), 0);
    REQUIRE(ff.ok);
    REQUIRE(ff.frames.size() == 2);

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(18));
    receiver.init(rx, &store, 0);

    ReceiveResult r1 = receiver.receive_frame(ff.frames[1], ChannelId::Lora, 0.0, 1);
    CHECK(r1.ok);
    CHECK_FALSE(r1.complete);
    ReceiveResult r2 = receiver.receive_frame(ff.frames[0], ChannelId::Lora, 0.0, 2);
    REQUIRE(r2.complete);
    CHECK(r2.content->text() == "hello, mesh");
    CHECK(store.size() == 1);
}

TEST_CASE("A fragment frame past its declared total is refused") {
    MeshNode sender(seeded(40));
    FrameOptions fo;
    fo.fragment       = true;
    fo.fragment_seq   = 9;
    fo.fragment_total = 2;
    EncodeResult e = sender.build_frame(to_bytes("stray"), fo, 0);
    REQUIRE(e.ok);

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(41));
    receiver.init(rx, &store, 0);

    ReceiveResult r = receiver.receive_frame(e.bytes, ChannelId::Lora, 0.0, 1);
    CHECK_FALSE(r.ok);
    CHECK(r.error == ReceiveError::InvalidFragment);
    CHECK(store.size() == 0);
    CHECK(receiver.channels().state(ChannelId::Lora).counters.errors == 1);
}

TEST_CASE("Interleaved fragment series from one source stay apart") {
    MeshNode sender(seeded(42));
    FragmentFrames first  = sender.build_frames(to_bytes("first message"), 6, FrameOptions(), 0);
    FragmentFrames second = sender.build_frames(to_bytes("other text"), 5, FrameOptions(), 0);
    REQUIRE(first.ok);
    REQUIRE(second.ok);
    REQUIRE(first.frames.size() == 3);
    REQUIRE(second.frames.size() == 2);
    CHECK(first.message_hash != second.message_hash);

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(43));
    receiver.init(rx, &store, 0);

    CHECK(receiver.receive_frame(first.frames[0], ChannelId::Lora, 0.0, 1).ok);
    CHECK(receiver.receive_frame(second.frames[0], ChannelId::Lora, 0.0, 2).ok);
    ReceiveResult done = receiver.receive_frame(second.frames[1], ChannelId::Lora, 0.0, 3);
    REQUIRE(done.complete);
    CHECK(done.content->text() == "other text");
    REQUIRE(store.size() == 1);

    CHECK(receiver.receive_frame(first.frames[2], ChannelId::Lora, 0.0, 4).ok);
    ReceiveResult last = receiver.receive_frame(first.frames[1], ChannelId::Lora, 0.0, 5);
    REQUIRE(last.complete);
    CHECK(last.content->text() == "first message");
    CHECK(store.size() == 2);
}

TEST_CASE("Joined fragment frames must match the message hash") {
    MeshNode sender(seeded(44));
    FragmentFrames ff = sender.build_frames(to_bytes("hello, mesh"), 7, FrameOptions(), 0);
    REQUIRE(ff.ok);

    // Same series identity, different second slice.
    FrameOptions fo;
    fo.fragment       = true;
    fo.fragment_seq   = 1;
    fo.fragment_total = 2;
    fo.message_hash   = ff.message_hash;
    EncodeResult forged = sender.build_frame(to_bytes("moon"), fo, 0);
    REQUIRE(forged.ok);

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(45));
    receiver.init(rx, &store, 0);

    CHECK(receiver.receive_frame(ff.frames[0], ChannelId::Lora, 0.0, 1).ok);
    ReceiveResult r = receiver.receive_frame(forged.bytes, ChannelId::Lora, 0.0, 2);
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.complete);
    CHECK(r.error == ReceiveError::FragmentHashMismatch);
    CHECK(store.size() == 0);
}

TEST_CASE("A fragment packet past its declared total is refused") {
    StaticChannelProvider tx(list_of({ChannelId::Lora}));
    MeshNode sender(seeded(46));
    sender.init(tx, nullptr, 0);
    REQUIRE(sender.send_dtu(letters(400), "", SendOptions(), 0).ok);
    REQUIRE(tx.sent().size() == 3);

    MeshPacket stray = tx.sent()[2].second;
    stray.header.sequence = 7;

    MemoryContentStore store;
    StaticChannelProvider rx;
    MeshNode receiver(seeded(47));
    receiver.init(rx, &store, 0);
    ReceiveResult r = receiver.receive_dtu(stray, ChannelId::Lora, 1);
    CHECK_FALSE(r.ok);
    CHECK(r.error == ReceiveError::InvalidFragment);
    CHECK(store.size() == 0);
}

TEST_CASE("Transfers spread components over the plan") {
    StaticChannelProvider provider(list_of({ChannelId::Internet, ChannelId::Bluetooth}));
    MeshNode node(seeded(19));
    node.init(provider, nullptr, 0);

    std::vector<Bytes> parts;
    for (int i = 0; i < 6; ++i) parts.push_back(to_bytes("component-" + std::to_string(i)));

    TransferResult r = node.initiate_transfer(parts, "node_dest", Proximity::Remote, 100);
    REQUIRE(r.ok);
    CHECK(r.transfer.state == TransferState::Completed);
    CHECK(r.transfer.sent_components == 6);
    CHECK(r.transfer.channels.size() == 2);
    CHECK(r.transfer.finished_ms == 100u);
    CHECK(provider.sent().size() == 6);

    const TransferRecord* rec = node.transfer_status(r.transfer.id);
    REQUIRE(rec != nullptr);
    CHECK(rec->state == TransferState::Completed);
    CHECK(node.metrics(100).stats.transfers_completed == 1);
    CHECK(node.transfer_status("transfer_missing") == nullptr);
}

TEST_CASE("Transfer edge cases") {
    StaticChannelProvider provider;
    MeshNode node(seeded(20));
    node.init(provider, nullptr, 0);

    TransferResult empty = node.initiate_transfer({}, "", Proximity::Unknown, 0);
    CHECK_FALSE(empty.ok);
    CHECK(empty.error == TransferError::NoComponents);

    std::vector<Bytes> parts = {to_bytes("a"), to_bytes("b"), to_bytes("c")};
    TransferResult offline = node.initiate_transfer(parts, "", Proximity::Unknown, 0);
    REQUIRE(offline.ok);
    CHECK(offline.transfer.state == TransferState::Failed);
    CHECK(node.relay_queue().size() == 3);
    CHECK(node.relay_queue().entries()[0].priority_class == relay_priority::CONSCIOUSNESS);
    CHECK(node.metrics(0).stats.transfers_failed == 1);
}

TEST_CASE("Heartbeat sweeps the relay queue and beacons every tenth tick") {
    StaticChannelProvider provider;
    MeshNode node(seeded(21));
    node.init(provider, nullptr, 0);
    REQUIRE(node.send_dtu(to_bytes("for later"), "node_friend", SendOptions(), 0).ok);

    HeartbeatReport h1 = node.tick(1, 1000);
    CHECK_FALSE(h1.skipped);
    CHECK(h1.relay.delivered == 0);
    CHECK_FALSE(h1.beacon.has_value());

    PeerInfo friend_info;
    friend_info.node_id = "node_friend";
    node.register_peer(friend_info, 1500);
    provider.set_available(ChannelId::Bluetooth, true);
    node.refresh_channels(1500);

    HeartbeatReport h10 = node.tick(10, 2000);
    CHECK(h10.relay.delivered == 1);
    CHECK(h10.forwarded == 1);
    CHECK(h10.beacon_sent == 1);
    REQUIRE(provider.sent().size() == 2);
    CHECK(provider.sent()[1].second.header.ttl == 1);
    REQUIRE(h10.beacon.has_value());
    CHECK(h10.beacon->node_id == node.node_id());
    CHECK(h10.beacon->version == "1.0.0");
    CHECK(h10.beacon->pending_count == 0);
    REQUIRE(node.last_beacon().has_value());
    CHECK(node.tick_count() == 2);
}

TEST_CASE("Every fiftieth tick prunes stale peers and old transfers") {
    const uint64_t HOUR = 60ull * 60ull * 1000ull;
    StaticChannelProvider provider(list_of({ChannelId::Internet}));
    MeshNode node(seeded(22));
    node.init(provider, nullptr, 0);

    PeerInfo old_peer;
    old_peer.node_id = "node_old";
    node.register_peer(old_peer, 0);
    REQUIRE(node.initiate_transfer({to_bytes("x")}, "", Proximity::Unknown, 0).ok);

    HeartbeatReport h49 = node.tick(49, 3 * HOUR);
    CHECK(h49.peers_pruned == 0);

    HeartbeatReport h50 = node.tick(50, 3 * HOUR);
    CHECK(h50.peers_pruned == 1);
    CHECK(h50.transfers_pruned == 1);
    CHECK(node.peers().size() == 0);
}

// Calls back into the node from inside a heartbeat.
class ReentrantProvider : public transport::IChannelProvider {
public:
    MeshNode* node = nullptr;
    std::vector<HeartbeatReport> inner;

    AvailabilityMap detect_availability() override {
        AvailabilityMap m;
        m[ChannelId::Internet] = true;
        return m;
    }
    TxResult send(ChannelId, const MeshPacket&) override {
        if (node) inner.push_back(node->tick(99, 0));
        return TxResult::Ok;
    }
    const char* name() const override { return "reentrant"; }
};

TEST_CASE("A heartbeat re-entered from a callback is skipped") {
    ReentrantProvider provider;
    MeshNode node(seeded(23));
    node.init(provider, nullptr, 0);

    // Queue a broadcast while the provider refuses nothing: force store-forward
    // by sending before any channel is known.
    node.channels().set_available(ChannelId::Internet, false, 0);
    REQUIRE(node.send_dtu(to_bytes("later"), "", SendOptions(), 0).mode == SendMode::StoreForward);
    node.channels().set_available(ChannelId::Internet, true, 0);

    provider.node = &node;
    HeartbeatReport outer = node.tick(1, 10);
    CHECK_FALSE(outer.skipped);
    CHECK(outer.forwarded == 1);
    REQUIRE(provider.inner.size() == 1);
    CHECK(provider.inner[0].skipped);
    CHECK(node.tick_count() == 1);
}

TEST_CASE("Offline sync plan lists at most one hundred ids") {
    StaticChannelProvider provider(list_of({ChannelId::Lora}));
    MeshNode node(seeded(24));
    node.init(provider, nullptr, 0);

    std::vector<std::string> ids;
    for (int i = 0; i < 150; ++i) ids.push_back("dtu_" + std::to_string(i));
    OfflineSyncPlan p = node.plan_offline_sync(ids);
    CHECK(p.ok);
    CHECK(p.outbound == 150);
    CHECK(p.outbound_ids.size() == MeshNode::OFFLINE_SYNC_LIMIT);
    CHECK(p.outbound_ids.front() == "dtu_0");
    REQUIRE(p.channels_available.size() == 1);
    CHECK(p.channels_available[0] == ChannelId::Lora);
}

TEST_CASE("Relay configuration passes through the node") {
    NodeConfig cfg = seeded(25);
    cfg.relay.max_queue_size = 5;
    MeshNode node(cfg);
    CHECK(node.relay_queue().config().max_queue_size == RelayConfig::QUEUE_SIZE_MIN);

    RelayConfigUpdate u;
    u.max_hold_ms = 120000;
    CHECK(node.configure_relay(u).max_hold_ms == 120000);
    CHECK(node.metrics(0).relay_config.max_hold_ms == 120000);
}

TEST_CASE("Reset returns a seeded node to its constructed state") {
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth}));
    MeshNode node(seeded(26));
    const std::string first_id = node.node_id();
    node.init(provider, nullptr, 0);
    node.send_dtu(to_bytes("x"), "", SendOptions(), 0);
    PeerInfo p;
    p.node_id = "node_p";
    node.register_peer(p, 0);

    node.reset();
    CHECK_FALSE(node.initialized());
    CHECK(node.node_id() == first_id);
    CHECK(node.peers().size() == 0);
    CHECK(node.transmission_stats().recent.empty());
    CHECK(node.metrics(0).stats.total_transmissions == 0);
    CHECK(node.channels().available_channels().empty());

    InitResult again = node.init(provider, nullptr, 5);
    CHECK_FALSE(again.already_initialized);
}

TEST_CASE("Topology reports self and known peers") {
    StaticChannelProvider provider(list_of({ChannelId::WifiDirect}));
    MeshNode node(seeded(27));
    node.init(provider, nullptr, 0);
    PeerInfo p;
    p.node_id = "node_neighbour";
    node.register_peer(p, 0);

    Topology t = node.topology();
    CHECK(t.self_node_id == node.node_id());
    CHECK(t.total_nodes == 2);
    REQUIRE(t.active_channels.size() == 1);
    CHECK(t.active_channels[0] == ChannelId::WifiDirect);
}

TEST_CASE("A refused relay forward stays queued until the carrier accepts") {
    StaticChannelProvider provider;
    MeshNode node(seeded(48));
    node.init(provider, nullptr, 0);
    REQUIRE(node.send_dtu(to_bytes("hold on"), "node_friend", SendOptions(), 0).mode ==
            SendMode::StoreForward);

    PeerInfo friend_info;
    friend_info.node_id = "node_friend";
    node.register_peer(friend_info, 10);
    provider.set_available(ChannelId::Bluetooth, true);
    provider.set_send_result(ChannelId::Bluetooth, TxResult::Error);
    node.refresh_channels(10);

    HeartbeatReport refused = node.tick(1, 100);
    CHECK(refused.forwarded == 0);
    CHECK(refused.relay.requeued == 1);
    REQUIRE(node.pending_queue().size() == 1);
    CHECK(node.pending_queue()[0].attempts == 1);
    CHECK(node.relay_queue().total_relayed() == 0);

    provider.set_send_result(ChannelId::Bluetooth, TxResult::Ok);
    HeartbeatReport accepted = node.tick(2, 200);
    CHECK(accepted.forwarded == 1);
    CHECK(node.pending_queue().empty());
    CHECK(node.relay_queue().total_relayed() == 1);
    CHECK(provider.sent().size() == 1);
}

TEST_CASE("A presence beacon registers its sender on the receiving node") {
    StaticChannelProvider tx(list_of({ChannelId::Bluetooth, ChannelId::Lora}));
    MeshNode sender(seeded(49));
    sender.init(tx, nullptr, 0);

    HeartbeatReport h = sender.tick(10, 5000);
    CHECK(h.beacon_sent == 2);
    REQUIRE(tx.sent().size() == 2);

    StaticChannelProvider rx(list_of({ChannelId::Bluetooth}));
    MemoryContentStore store;
    MeshNode receiver(seeded(50));
    receiver.init(rx, &store, 0);

    ReceiveResult r = receiver.receive_dtu(tx.sent()[0].second, ChannelId::Bluetooth, 5001);
    REQUIRE(r.ok);
    REQUIRE(r.content.has_value());
    CHECK(r.content->structured["type"] == "PRESENCE");

    const Peer* peer = receiver.peers().find(sender.node_id());
    REQUIRE(peer != nullptr);
    CHECK(peer->discovered_via == "bluetooth");
    CHECK(peer->last_seen_ms == 5001u);
    CHECK(std::find(peer->channels.begin(), peer->channels.end(), ChannelId::Lora) !=
          peer->channels.end());
}

TEST_CASE("Content beyond the fragment limit is refused before sending") {
    StaticChannelProvider provider(list_of({ChannelId::Lora}));
    MeshNode node(seeded(51));
    node.init(provider, nullptr, 0);

    const size_t slice = effective_capacity(channel_spec(ChannelId::Lora).max_payload_bytes);
    const Bytes huge(slice * MAX_FRAGMENTS + 1, uint8_t('x'));
    SendResult r = node.send_dtu(huge, "", SendOptions(), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.error == SendError::TooManyFragments);
    REQUIRE(r.channel.has_value());
    CHECK(*r.channel == ChannelId::Lora);
    CHECK(provider.sent().empty());
    CHECK(node.relay_queue().size() == 0);
}

TEST_CASE("Proximity picks the first path of a transfer") {
    StaticChannelProvider provider(list_of({ChannelId::Internet, ChannelId::WifiDirect}));
    MeshNode node(seeded(52));
    node.init(provider, nullptr, 0);
    const std::vector<Bytes> parts = {to_bytes("one"), to_bytes("two")};

    TransferResult nearby = node.initiate_transfer(parts, "", Proximity::Nearby, 0);
    REQUIRE(nearby.ok);
    REQUIRE_FALSE(nearby.transfer.channels.empty());
    CHECK(nearby.transfer.channels[0] == ChannelId::WifiDirect);

    TransferResult remote = node.initiate_transfer(parts, "", Proximity::Remote, 0);
    REQUIRE(remote.ok);
    REQUIRE_FALSE(remote.transfer.channels.empty());
    CHECK(remote.transfer.channels[0] == ChannelId::Internet);
}

TEST_CASE("An unusable configured node id fails init") {
    NodeConfig cfg = seeded(53);
    cfg.node_id = std::string(NODE_ID_MAX + 8, 'n');
    StaticChannelProvider provider(list_of({ChannelId::Bluetooth}));
    MeshNode node(cfg);

    InitResult r = node.init(provider, nullptr, 0);
    CHECK_FALSE(r.ok);
    CHECK(r.error == InitError::InvalidNodeId);
    CHECK_FALSE(node.initialized());
    CHECK(node.node_id().size() == 25);
    CHECK(node.node_id().rfind("node_", 0) == 0);

    NodeConfig spaced = seeded(54);
    spaced.node_id = "node with spaces";
    MeshNode other(spaced);
    CHECK(other.init(provider, nullptr, 0).error == InitError::InvalidNodeId);
}
