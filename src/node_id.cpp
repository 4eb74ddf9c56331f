// -----------------------------------------------------------------------------
// node_id.cpp — Node identity helpers and random id generation.
//
// API & field descriptions:
//   see include/relaymesh/node_id.hpp
// -----------------------------------------------------------------------------
#include "relaymesh/node_id.hpp"
#include "relaymesh/hash.hpp"

namespace relaymesh {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

// ---------- IdSource ----------

IdSource::IdSource(uint32_t seed) {
  reseed(seed);
}

void IdSource::reseed(uint32_t seed) {
  if (seed == 0) {
    std::random_device rd;
    seed = rd();
  }
  rng_.seed(seed);
}

std::string IdSource::next(const char* prefix) {
  uint8_t raw[10];
  std::uniform_int_distribution<int> byte(0, 255);
  for (auto& b : raw) b = static_cast<uint8_t>(byte(rng_));
  std::string out = prefix ? prefix : "id";
  out += '_';
  out += to_hex(raw, sizeof(raw));
  return out;
}

// ---------- identity ----------

std::string generate_node_id(IdSource& ids) {
  return ids.next("node");
}

bool is_valid_node_id(const std::string& id) {
  if (id.empty() || id.size() > NODE_ID_MAX) return false;
  for (char c : id) {
    if (c <= 0x20 || c >= 0x7F) return false;
  }
  return true;
}

std::string short_id(const std::string& id) {
  if (id.size() <= SHORT_ID_LEN) return id;
  return id.substr(id.size() - SHORT_ID_LEN);
}

// pack_source_id()
// POLICY:
//   - 8 hex chars pack to the number they spell; this is the normal case for
//     generated ids and keeps the field readable in hex dumps.
//   - Anything else (callsigns, short names) is hashed so distinct ids still
//     land on distinct-looking source fields.
uint32_t pack_source_id(const std::string& id) {
  const std::string s = short_id(id);
  if (s.size() == SHORT_ID_LEN) {
    uint32_t v = 0;
    bool all_hex = true;
    for (char c : s) {
      const int h = hex_value(c);
      if (h < 0) { all_hex = false; break; }
      v = (v << 4) | static_cast<uint32_t>(h);
    }
    if (all_hex) return v;
  }
  const Digest d = sha256(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  return (uint32_t(d[0]) << 24) | (uint32_t(d[1]) << 16) | (uint32_t(d[2]) << 8) | uint32_t(d[3]);
}

std::string unpack_source_id(uint32_t packed) {
  const uint8_t raw[4] = {
    uint8_t(packed >> 24), uint8_t(packed >> 16), uint8_t(packed >> 8), uint8_t(packed)
  };
  return to_hex(raw, sizeof(raw));
}

} // namespace relaymesh
