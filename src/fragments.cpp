/**
 * @file fragments.cpp
 * @brief fragment()/reassemble() implementation.
 *
 * Refer to fragments.hpp for the slicing and reassembly contract.
 */
#include "relaymesh/fragments.hpp"

#include <algorithm>
#include <utility>

namespace relaymesh {

namespace {

// UTF-8 continuation bytes look like 10xxxxxx.
bool is_continuation(uint8_t b) {
  return (b & 0xC0) == 0x80;
}

// Slice boundaries [begin, end). Each cut is backed off until it lands on a
// UTF-8 boundary (never past the slice start).
std::vector<std::pair<size_t, size_t>> slice_bounds(const Bytes& payload, size_t cap) {
  std::vector<std::pair<size_t, size_t>> slices;
  size_t offset = 0;
  while (offset < payload.size()) {
    size_t end = std::min(offset + cap, payload.size());
    if (end < payload.size()) {
      size_t cut = end;
      while (cut > offset && is_continuation(payload[cut])) --cut;
      if (cut > offset) end = cut;                  // else: not UTF-8, hard cut
    }
    slices.emplace_back(offset, end);
    offset = end;
  }
  return slices;
}

} // namespace

size_t effective_capacity(uint32_t max_payload_bytes) {
  const size_t max = max_payload_bytes;
  if (max <= TOTAL_OVERHEAD) return MIN_FRAGMENT_CAPACITY;
  return std::max(max - TOTAL_OVERHEAD, MIN_FRAGMENT_CAPACITY);
}

const char* to_string(FragmentError e) {
  return e == FragmentError::TooManyFragments ? "too_many_fragments" : "none";
}

size_t fragment_count(const Bytes& payload, uint32_t max_payload_bytes) {
  if (payload.empty()) return 0;
  const size_t cap = effective_capacity(max_payload_bytes);
  if (payload.size() <= cap) return 1;
  return slice_bounds(payload, cap).size();
}

// fragment()
// Step 1: fits -> single packet, sequence 0 of 1.
// Step 2: slice boundaries; refuse before building anything when the count
//         does not fit the 16-bit total.
// Step 3: stamp every slice with the shared transfer id and its own hash.
FragmentResult fragment(const Bytes& payload, uint32_t max_payload_bytes,
                        PacketFactory& factory, uint64_t now_ms,
                        const std::string& destination) {
  FragmentResult r;
  if (payload.empty()) return r;

  const size_t cap = effective_capacity(max_payload_bytes);

  if (payload.size() <= cap) {
    PacketOptions opts;
    r.packets.push_back(factory.make(payload, destination, opts, now_ms));
    return r;
  }

  // Step 2
  const auto slices = slice_bounds(payload, cap);
  if (slices.size() > MAX_FRAGMENTS) {
    r.error = FragmentError::TooManyFragments;
    return r;
  }

  // Step 3
  const std::string transfer_id = factory.ids().next("xfer");
  const uint16_t total = static_cast<uint16_t>(slices.size());
  r.packets.reserve(slices.size());
  for (size_t i = 0; i < slices.size(); ++i) {
    Bytes chunk(payload.begin() + static_cast<std::ptrdiff_t>(slices[i].first),
                payload.begin() + static_cast<std::ptrdiff_t>(slices[i].second));
    PacketOptions opts;
    opts.sequence   = static_cast<uint16_t>(i);
    opts.total      = total;
    opts.fragmented = true;
    MeshPacket p = factory.make(chunk, destination, opts, now_ms);
    p.transfer_id   = transfer_id;
    p.fragment_hash = p.payload_hash;
    r.packets.push_back(std::move(p));
  }
  return r;
}

const char* to_string(ReassemblyStatus s) {
  switch (s) {
    case ReassemblyStatus::Ok:           return "ok";
    case ReassemblyStatus::Empty:        return "empty";
    case ReassemblyStatus::Incomplete:   return "incomplete_fragments";
    case ReassemblyStatus::HashMismatch: return "fragment_hash_mismatch";
    case ReassemblyStatus::BadSequence:  return "invalid_fragment_sequence";
  }
  return "unknown";
}

// reassemble()
// PRE:    fragments of one transfer, any order, possibly with repeats.
// POLICY: sort by sequence, keep first of each sequence, reject any sequence
//         at or past the declared total, require the declared total, verify
//         each slice before concatenating anything.
// OUT:    content only on Ok.
ReassemblyResult reassemble(std::vector<MeshPacket> fragments) {
  ReassemblyResult r;
  if (fragments.empty()) return r;

  std::stable_sort(fragments.begin(), fragments.end(),
                   [](const MeshPacket& a, const MeshPacket& b) {
                     return a.header.sequence < b.header.sequence;
                   });
  fragments.erase(std::unique(fragments.begin(), fragments.end(),
                              [](const MeshPacket& a, const MeshPacket& b) {
                                return a.header.sequence == b.header.sequence;
                              }),
                  fragments.end());

  const size_t expected = std::max<uint16_t>(fragments.front().header.total, 1);
  if (fragments.back().header.sequence >= expected) {
    r.status = ReassemblyStatus::BadSequence;
    return r;
  }
  if (fragments.size() < expected) {
    r.status = ReassemblyStatus::Incomplete;
    return r;
  }

  for (const auto& f : fragments) {
    if (!f.fragment_hash.empty() && sha256_hex(f.payload) != f.fragment_hash) {
      r.status = ReassemblyStatus::HashMismatch;
      return r;
    }
  }

  Bytes joined;
  for (const auto& f : fragments) {
    joined.insert(joined.end(), f.payload.begin(), f.payload.end());
  }

  r.status  = ReassemblyStatus::Ok;
  r.content = make_content(std::move(joined));
  return r;
}

} // namespace relaymesh
