/**
 * @file fragments.hpp
 * @brief Fragmentation and reassembly of oversized payloads.
 *
 * ---
 *
 * ## Purpose
 *
 * A LoRa hop carries 242 bytes; a knowledge unit can be megabytes. `fragment()`
 * cuts a payload into slices that each fit a channel after protocol overhead,
 * and `reassemble()` puts them back together only when every slice is present
 * and intact.
 *
 * ---
 *
 * ## Capacity
 *
 * ```
 * effective = max(max_payload - TOTAL_OVERHEAD, 64)
 * ```
 * A payload of at most `effective` bytes travels as one unfragmented packet.
 *
 * ---
 *
 * ## Slicing rules
 *
 * - Slices never end inside a UTF-8 multi-byte sequence. If a run of bytes has
 *   no boundary within capacity (not UTF-8 at all), it is cut at capacity.
 * - Every slice shares one transfer id, carries seq/total, and its own
 *   SHA-256 (`fragment_hash`) so it verifies independently.
 * - seq/total are 16-bit. A payload that would need more than
 *   `MAX_FRAGMENTS` slices is refused with `FragmentError::TooManyFragments`
 *   and no packets are built.
 *
 * ---
 *
 * ## Reassembly outcomes
 *
 * | Status        | Meaning                                           |
 * |---------------|---------------------------------------------------|
 * | Ok            | content available                                 |
 * | Empty         | no fragments given                                |
 * | Incomplete    | fewer distinct slices than the declared total     |
 * | HashMismatch  | a slice failed its own hash; nothing is returned  |
 * | BadSequence   | a slice claims a sequence at or past the total    |
 *
 * Partial or corrupt reconstructions are never returned.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_FRAGMENTS_HPP
#define RELAYMESH_FRAGMENTS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "relaymesh/content.hpp"
#include "relaymesh/packet.hpp"

namespace relaymesh {

static constexpr size_t MIN_FRAGMENT_CAPACITY = 64;
static constexpr size_t MAX_FRAGMENTS         = 0xFFFF;

/// Usable payload bytes per packet on a channel with @p max_payload_bytes.
size_t effective_capacity(uint32_t max_payload_bytes);

enum class FragmentError : uint8_t { None = 0, TooManyFragments };

const char* to_string(FragmentError e);

struct FragmentResult {
  FragmentError           error = FragmentError::None;
  std::vector<MeshPacket> packets;

  bool ok() const { return error == FragmentError::None; }
};

/// Number of packets fragment() would produce (0 for an empty payload).
size_t fragment_count(const Bytes& payload, uint32_t max_payload_bytes);

/**
 * @brief Split a payload for a channel.
 * @return One packet when it fits; otherwise one packet per slice, in order.
 *         Empty payload -> no packets.
 */
FragmentResult fragment(const Bytes& payload, uint32_t max_payload_bytes,
                        PacketFactory& factory, uint64_t now_ms,
                        const std::string& destination = std::string());

enum class ReassemblyStatus : uint8_t { Ok = 0, Empty, Incomplete, HashMismatch, BadSequence };

const char* to_string(ReassemblyStatus s);

struct ReassemblyResult {
  ReassemblyStatus       status = ReassemblyStatus::Empty;
  std::optional<Content> content;

  bool ok() const { return status == ReassemblyStatus::Ok; }
};

/**
 * @brief Rebuild a payload from its slices (any order).
 * @note Duplicate slices (same sequence) are ignored after the first.
 */
ReassemblyResult reassemble(std::vector<MeshPacket> fragments);

} // namespace relaymesh

#endif // RELAYMESH_FRAGMENTS_HPP
