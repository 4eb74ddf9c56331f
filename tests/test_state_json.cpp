#include <doctest/doctest.h>
#include "relaymesh/state_json.hpp"
#include "relaymesh/transport/static_provider.hpp"

using namespace relaymesh;
using nlohmann::json;

TEST_CASE("Send results serialize with snake_case names") {
    transport::StaticChannelProvider provider;
    MeshNode node;
    node.init(provider, nullptr, 0);

    json j = state::to_json(node.send_dtu(to_bytes("queued"), "", SendOptions(), 0));
    CHECK(j["ok"] == true);
    CHECK(j["mode"] == "store_forward");
    CHECK(j["channel"].is_null());
    CHECK(j["relay_id"].is_string());

    json err = state::to_json(node.send_dtu(Bytes(), "", SendOptions(), 0));
    CHECK(err["ok"] == false);
    CHECK(err["error"] == "no_dtu_provided");
}

TEST_CASE("Peers survive a save and restore") {
    PeerRegistry reg("node_self");
    PeerInfo a;
    a.node_id = "node_a";
    a.channels.push_back(ChannelId::Bluetooth);
    a.channels.push_back(ChannelId::Lora);
    a.version = "1.0.0";
    a.latency_ms = 40u;
    reg.register_peer(a, 100);

    json saved = state::peers_to_json(reg.peers());
    auto restored = state::peers_from_json(saved);
    REQUIRE(restored.size() == 1);
    CHECK(restored[0].node_id == "node_a");
    CHECK(restored[0].version == "1.0.0");
    CHECK(restored[0].latency_ms == 40u);
    CHECK(restored[0].discovered_via == state::RESTORED_VIA);
    REQUIRE(restored[0].channels.size() == 2);
    CHECK(restored[0].channels[1] == ChannelId::Lora);
}

TEST_CASE("Damaged state degrades instead of failing") {
    json j = json::parse(R"([
        {"node_id": "node_ok", "channels": ["lora", "smoke_signal", 7], "relay": "yes"},
        {"channels": ["bluetooth"]},
        42,
        {"node_id": 5}
    ])");
    auto peers = state::peers_from_json(j);
    REQUIRE(peers.size() == 1);
    CHECK(peers[0].node_id == "node_ok");
    REQUIRE(peers[0].channels.size() == 1);
    CHECK(peers[0].channels[0] == ChannelId::Lora);
    CHECK_FALSE(peers[0].relay.has_value());

    CHECK(state::peers_from_json(json("not an array")).empty());
}

TEST_CASE("Relay settings are read from config") {
    json conf = json::parse(R"({"relay": {"enabled": false, "max_queue_size": 50, "max_hold_ms": "soon"}})");
    RelayConfigUpdate u = state::relay_update_from_json(conf);
    CHECK(u.enabled == false);
    CHECK(u.max_queue_size == size_t(50));
    CHECK_FALSE(u.max_hold_ms.has_value());

    RelayConfigUpdate none = state::relay_update_from_json(json::object());
    CHECK_FALSE(none.enabled.has_value());
}

TEST_CASE("Heartbeat and metrics views") {
    transport::StaticChannelProvider provider;
    NodeConfig cfg;
    cfg.seed = 3;
    MeshNode node(cfg);
    node.init(provider, nullptr, 0);

    json h = state::to_json(node.tick(10, 5));
    CHECK(h["skipped"] == false);
    CHECK(h["beacon"]["type"] == "PRESENCE");
    CHECK(h["beacon"]["version"] == "1.0.0");
    CHECK(h["beacon_sent"] == 0);
    CHECK(h["relay"]["requeued"] == 0);
    CHECK(h["relay"]["dropped"] == 0);

    json m = state::to_json(node.metrics(5));
    CHECK(m["node_id"] == node.node_id());
    CHECK(m["total_channels"] == CHANNEL_COUNT);
    CHECK(m["relay"]["config"]["max_queue_size"] == RelayConfig::QUEUE_SIZE_DEFAULT);
    CHECK(m["relay"]["total_dropped"] == 0);

    json table = state::channel_table_to_json(node.channels());
    CHECK(table["lora"]["max_payload_bytes"] == 242);
    CHECK(table["lora"]["status"] == "inactive");
}

TEST_CASE("A refused init names its reason") {
    transport::StaticChannelProvider provider;
    NodeConfig cfg;
    cfg.node_id = "bad id";
    MeshNode node(cfg);

    json j = state::to_json(node.init(provider, nullptr, 0));
    CHECK(j["ok"] == false);
    CHECK(j["error"] == "invalid_node_id");

    MeshNode fine;
    CHECK(state::to_json(fine.init(provider, nullptr, 0))["error"].is_null());
}
