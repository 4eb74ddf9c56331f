#include <doctest/doctest.h>
#include <algorithm>
#include <random>
#include "relaymesh/fragments.hpp"

using namespace relaymesh;

static Bytes repeat(const std::string& unit, size_t times) {
    std::string s;
    for (size_t i = 0; i < times; ++i) s += unit;
    return to_bytes(s);
}

TEST_CASE("Effective capacity subtracts the packet overhead with a floor") {
    CHECK(effective_capacity(242) == 178);
    CHECK(effective_capacity(256) == 192);
    CHECK(effective_capacity(100) == MIN_FRAGMENT_CAPACITY);
    CHECK(effective_capacity(10) == MIN_FRAGMENT_CAPACITY);
}

TEST_CASE("Small payloads stay whole") {
    IdSource ids(1);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    auto packets = fragment(to_bytes("short"), 242, factory, 10).packets;
    REQUIRE(packets.size() == 1);
    CHECK(packets[0].header.total == 1);
    CHECK_FALSE(packets[0].header.is_fragmented());
    CHECK(packets[0].transfer_id.empty());
    CHECK(packets[0].destination == BROADCAST);
    CHECK(packets[0].verify());
}

TEST_CASE("Empty payload produces no packets") {
    IdSource ids(1);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    FragmentResult r = fragment(Bytes(), 242, factory, 0);
    CHECK(r.ok());
    CHECK(r.packets.empty());
    CHECK(fragment_count(Bytes(), 242) == 0);
}

TEST_CASE("5000 bytes over LoRa split into ordered, hashed slices") {
    IdSource ids(2);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    const Bytes payload = repeat("a", 5000);

    auto packets = fragment(payload, 242, factory, 10, "node_bbbbbbbbbbbbbbbbbbbb").packets;
    REQUIRE(packets.size() >= 21);
    CHECK(packets.size() == (5000 + 177) / 178);

    for (size_t i = 0; i < packets.size(); ++i) {
        const MeshPacket& p = packets[i];
        CHECK(p.header.sequence == i);
        CHECK(p.header.total == packets.size());
        CHECK(p.header.is_fragmented());
        CHECK(p.payload.size() <= 178);
        CHECK(p.transfer_id == packets[0].transfer_id);
        CHECK(p.fragment_hash == sha256_hex(p.payload));
        CHECK(p.header.destination == "bbbbbbbb");
    }
    CHECK(packets[0].transfer_id.rfind("xfer_", 0) == 0);
}

TEST_CASE("Reassembly accepts any order") {
    IdSource ids(3);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    std::string text;
    for (int i = 0; i < 600; ++i) text += char('a' + i % 26);
    auto packets = fragment(to_bytes(text), 242, factory, 0).packets;
    REQUIRE(packets.size() > 1);

    std::mt19937 rng(5);
    std::shuffle(packets.begin(), packets.end(), rng);

    ReassemblyResult r = reassemble(packets);
    REQUIRE(r.ok());
    CHECK(r.content->text() == text);
}

TEST_CASE("Repeated slices are ignored") {
    IdSource ids(4);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    auto packets = fragment(repeat("xy", 300), 242, factory, 0).packets;
    REQUIRE(packets.size() > 1);
    packets.push_back(packets[1]);
    ReassemblyResult r = reassemble(packets);
    REQUIRE(r.ok());
    CHECK(r.content->raw.size() == 600);
}

TEST_CASE("A missing slice leaves the transfer incomplete") {
    IdSource ids(5);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    auto packets = fragment(repeat("z", 1000), 242, factory, 0).packets;
    packets.erase(packets.begin() + 2);
    ReassemblyResult r = reassemble(packets);
    CHECK(r.status == ReassemblyStatus::Incomplete);
    CHECK_FALSE(r.content.has_value());
    CHECK(std::string(to_string(r.status)) == "incomplete_fragments");
}

TEST_CASE("A tampered slice fails the fragment hash") {
    IdSource ids(6);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    auto packets = fragment(repeat("q", 1000), 242, factory, 0).packets;
    packets[3].payload[0] ^= 0x20;
    ReassemblyResult r = reassemble(packets);
    CHECK(r.status == ReassemblyStatus::HashMismatch);
    CHECK_FALSE(r.content.has_value());
}

TEST_CASE("Cuts never split a UTF-8 sequence") {
    IdSource ids(7);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    const Bytes euro = repeat("\xE2\x82\xAC", 400);   // 3-byte code point
    auto packets = fragment(euro, 242, factory, 0).packets;
    REQUIRE(packets.size() > 1);
    for (const auto& p : packets) {
        CHECK(p.payload.size() % 3 == 0);
        CHECK(p.payload.front() == 0xE2);
    }
    ReassemblyResult r = reassemble(packets);
    REQUIRE(r.ok());
    CHECK(r.content->raw == euro);
}

TEST_CASE("Structured content is parsed on reassembly") {
    IdSource ids(8);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    std::string doc = "{\"type\":\"KNOWLEDGE\",\"body\":\"";
    doc += std::string(500, 'k');
    doc += "\"}";
    auto packets = fragment(to_bytes(doc), 242, factory, 0).packets;
    ReassemblyResult r = reassemble(packets);
    REQUIRE(r.ok());
    CHECK(r.content->is_structured);
    CHECK(r.content->structured["type"] == "KNOWLEDGE");
}

TEST_CASE("A sequence past the declared total is rejected") {
    IdSource ids(9);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    auto packets = fragment(repeat("s", 500), 242, factory, 0).packets;
    REQUIRE(packets.size() == 3);

    // {0, 1, 5} of 3: three distinct slices, but one is not part of the set
    packets[2].header.sequence = 5;
    ReassemblyResult r = reassemble(packets);
    CHECK(r.status == ReassemblyStatus::BadSequence);
    CHECK_FALSE(r.content.has_value());
    CHECK(std::string(to_string(r.status)) == "invalid_fragment_sequence");
}

TEST_CASE("Slice count is limited by the 16-bit total") {
    // 64-byte floor capacity on a tiny channel: 65535 slices fit exactly
    const Bytes at_limit(MIN_FRAGMENT_CAPACITY * MAX_FRAGMENTS, 'a');
    CHECK(fragment_count(at_limit, 10) == MAX_FRAGMENTS);

    Bytes over = at_limit;
    over.push_back('a');
    CHECK(fragment_count(over, 10) == MAX_FRAGMENTS + 1);

    IdSource ids(10);
    PacketFactory factory("node_aaaaaaaaaaaaaaaaaaaa", ids);
    FragmentResult r = fragment(over, 10, factory, 0);
    CHECK_FALSE(r.ok());
    CHECK(r.error == FragmentError::TooManyFragments);
    CHECK(r.packets.empty());
    CHECK(std::string(to_string(r.error)) == "too_many_fragments");
}
