#include <doctest/doctest.h>
#include "relaymesh/peer_registry.hpp"

using namespace relaymesh;

static const uint64_t MIN  = 60ull * 1000ull;
static const uint64_t HOUR = 60ull * MIN;

static PeerInfo info(const std::string& id) {
    PeerInfo p;
    p.node_id = id;
    p.channels.push_back(ChannelId::Bluetooth);
    return p;
}

TEST_CASE("Registering fills defaults") {
    PeerRegistry reg("node_self");
    const Peer* p = reg.register_peer(info("node_a"), 100);
    REQUIRE(p != nullptr);
    CHECK(p->relay);
    CHECK(p->version == "unknown");
    CHECK(p->discovered_via == "unknown");
    CHECK(p->first_seen_ms == 100);
    CHECK(p->last_seen_ms == 100);
    CHECK(reg.size() == 1);
}

TEST_CASE("The node never lists itself") {
    PeerRegistry reg("node_self");
    CHECK(reg.register_peer(info("node_self"), 1) == nullptr);
    CHECK(reg.register_peer(info(""), 1) == nullptr);
    CHECK(reg.size() == 0);
}

TEST_CASE("Re-registering keeps history and replaces the advert") {
    PeerRegistry reg("node_self");
    reg.register_peer(info("node_a"), 100);
    CHECK(reg.note_transmission("node_a"));
    CHECK_FALSE(reg.note_transmission("node_missing"));

    PeerInfo update = info("node_a");
    update.version = "1.0.0";
    update.relay   = false;
    const Peer* p = reg.register_peer(update, 900);
    REQUIRE(p != nullptr);
    CHECK(p->first_seen_ms == 100);
    CHECK(p->last_seen_ms == 900);
    CHECK(p->transmissions == 1);
    CHECK(p->version == "1.0.0");
    CHECK_FALSE(p->relay);
    CHECK(reg.peers_discovered() == 1);
}

TEST_CASE("Stale peers are swept after two hours") {
    PeerRegistry reg("node_self");
    reg.register_peer(info("node_old"), 0);
    reg.register_peer(info("node_new"), 3 * HOUR - 30 * MIN);

    CHECK(reg.sweep_stale(3 * HOUR) == 1);
    CHECK_FALSE(reg.contains("node_old"));
    CHECK(reg.contains("node_new"));
}

TEST_CASE("A peer seen exactly at the threshold survives") {
    PeerRegistry reg("node_self");
    reg.register_peer(info("node_edge"), HOUR);
    CHECK(reg.sweep_stale(HOUR + PeerRegistry::STALE_MS) == 0);
    CHECK(reg.sweep_stale(HOUR + PeerRegistry::STALE_MS + 1) == 1);
}

TEST_CASE("Listing is newest first and limited") {
    PeerRegistry reg("node_self");
    reg.register_peer(info("node_a"), 10);
    reg.register_peer(info("node_b"), 30);
    reg.register_peer(info("node_c"), 20);

    auto all = reg.peers();
    REQUIRE(all.size() == 3);
    CHECK(all[0].node_id == "node_b");
    CHECK(all[1].node_id == "node_c");
    CHECK(all[2].node_id == "node_a");
    CHECK(reg.peers(2).size() == 2);
}

TEST_CASE("Topology counts self") {
    PeerRegistry reg("node_self");
    reg.register_peer(info("node_a"), 10);
    reg.register_peer(info("node_b"), 10);
    ChannelList active;
    active.push_back(ChannelId::Lora);

    Topology t = reg.topology(active);
    CHECK(t.self_node_id == "node_self");
    CHECK(t.nodes.size() == 2);
    CHECK(t.total_nodes == 3);
    REQUIRE(t.active_channels.size() == 1);
    CHECK(t.active_channels[0] == ChannelId::Lora);

    CHECK(reg.remove_peer("node_a"));
    CHECK(reg.find("node_a") == nullptr);
    reg.clear();
    CHECK(reg.size() == 0);
}
