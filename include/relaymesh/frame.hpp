/**
 * @page rm-frame relaymesh Frame
 * @file frame.hpp
 * @brief relaymesh Frame — fixed 20-byte header, payload, CRC-16 trailer.
 *
 * @section rm_frame_layout Wire Layout
 *
 * | Offset | Field          | Bytes | Notes                                       |
 * |--------|----------------|-------|---------------------------------------------|
 * | 0      | magic          | 2     | 0xCD01                                      |
 * | 2      | version        | 1     | PROTOCOL_VERSION                            |
 * | 3      | priority       | 1     | 0 (EMERGENCY) .. 7 (MINIMAL)                |
 * | 4      | ttl            | 1     | hop budget, default 7                       |
 * | 5      | flags          | 1     | FRAGMENT/RELAY/EMERGENCY/ENCRYPTED bits     |
 * | 6      | hash prefix    | 4     | first 4 bytes of SHA-256 (see below)        |
 * | 10     | source id      | 4     | see pack_source_id()                        |
 * | 14     | fragment seq   | 2     |                                             |
 * | 16     | fragment total | 2     | >= 1                                        |
 * | 18     | payload length | 2     | N                                           |
 * | 20     | payload        | N     |                                             |
 * | 20+N   | crc16          | 2     | over bytes [0, 20+N)                        |
 *
 * Multi-byte fields are big endian.
 *
 * The hash prefix covers the frame payload, except on fragment frames
 * (FRAGMENT flag, total > 1): there it covers the whole message, so every
 * slice names the message it belongs to and the receiver can check the joined
 * bytes. `FrameCodec::encode_fragments()` builds such a series.
 *
 * @section rm_frame_rules Rules
 * - No handshake. A frame self-verifies: the CRC must match or it is rejected.
 * - Priority 0 always carries the EMERGENCY flag.
 * - Only two frame-level rejections exist for well-sized input: bad magic and
 *   CRC mismatch. A buffer too short to hold a header is reported as truncated.
 *   What the payload means is the receiver's business, not the codec's.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_FRAME_HPP
#define RELAYMESH_FRAME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "relaymesh/hash.hpp"
#include "relaymesh/priority.hpp"

namespace relaymesh {

static constexpr uint16_t MAGIC            = 0xCD01;
static constexpr uint8_t  PROTOCOL_VERSION = 1;
static constexpr size_t   HEADER_SIZE      = 20;
static constexpr size_t   CRC_SIZE         = 2;
static constexpr uint8_t  DEFAULT_TTL      = 7;
static constexpr size_t   MAX_FRAME_PAYLOAD = 0xFFFF;
static constexpr size_t   MAX_FRAME_FRAGMENTS = 0xFFFF;

/// First four bytes of a SHA-256 digest, as carried in the header.
using HashPrefix = std::array<uint8_t, 4>;

HashPrefix hash_prefix_of(const Bytes& data);

/// Header flag bits.
namespace frame_flags {
static constexpr uint8_t FRAGMENT  = 0x01;
static constexpr uint8_t RELAY     = 0x02;
static constexpr uint8_t EMERGENCY = 0x04;
static constexpr uint8_t ENCRYPTED = 0x08;
} // namespace frame_flags

/**
 * @brief CRC-16 (poly 0xA001 reflected, init 0xFFFF).
 */
uint16_t crc16(const uint8_t* data, size_t len);

/// Caller-side knobs for building a frame.
struct FrameOptions {
  uint8_t     priority       = priority::GENERAL; ///< clamped to 0..7
  uint8_t     ttl            = DEFAULT_TTL;
  bool        fragment       = false;
  bool        relay          = false;
  bool        emergency      = false;
  bool        encrypted      = false;
  std::string source_node_id;                     ///< full or short node id
  uint16_t    fragment_seq   = 0;
  uint16_t    fragment_total = 1;                 ///< 0 is raised to 1
  std::optional<HashPrefix> message_hash;         ///< set on fragment frames; absent -> hash of this payload
};

/// Decoded header fields.
struct FrameHeader {
  uint16_t magic          = MAGIC;
  uint8_t  version        = PROTOCOL_VERSION;
  uint8_t  priority       = priority::GENERAL;
  uint8_t  ttl            = DEFAULT_TTL;
  uint8_t  flags          = 0;
  HashPrefix hash_prefix{};
  uint32_t source_id      = 0;
  uint16_t fragment_seq   = 0;
  uint16_t fragment_total = 1;
  uint16_t payload_length = 0;

  bool is_fragment()  const { return (flags & frame_flags::FRAGMENT)  != 0; }
  bool is_relay()     const { return (flags & frame_flags::RELAY)     != 0; }
  bool is_emergency() const { return (flags & frame_flags::EMERGENCY) != 0; }
  bool is_encrypted() const { return (flags & frame_flags::ENCRYPTED) != 0; }

  /// 8 hex chars of the content hash prefix.
  std::string hash_hex() const;
  /// 8 hex chars of the packed source id.
  std::string source_hex() const;
};

enum class FrameError : uint8_t {
  None = 0,
  PayloadTooLarge,  ///< encode: payload exceeds the 16-bit length field
  TooManyFragments, ///< encode_fragments: more slices than the 16-bit total holds
  Truncated,        ///< decode: buffer cannot hold a header, or length disagrees
  InvalidMagic,
  CrcMismatch
};

/// Stable snake_case name ("invalid_magic", "crc_mismatch", ...).
const char* to_string(FrameError e);

struct EncodeResult {
  bool        ok = false;
  FrameError  error = FrameError::None;
  FrameHeader header;
  Bytes       bytes;      ///< complete frame, header + payload + crc
};

/// A message cut into a series of fragment frames.
struct FragmentFrames {
  bool               ok = false;
  FrameError         error = FrameError::None;
  HashPrefix         message_hash{};
  std::vector<Bytes> frames;     ///< in sequence order
};

struct DecodeResult {
  bool        ok = false;
  FrameError  error = FrameError::None;
  FrameHeader header;
  Bytes       payload;
  uint16_t    expected_crc = 0;  ///< recomputed (set on CrcMismatch and success)
  uint16_t    received_crc = 0;

  bool is_fragment()  const { return header.is_fragment(); }
  bool is_relay()     const { return header.is_relay(); }
  bool is_emergency() const { return header.is_emergency(); }
  bool is_encrypted() const { return header.is_encrypted(); }
};

/// Stateless encode.
EncodeResult encode_frame(const Bytes& payload, const FrameOptions& opts);

/// Stateless decode of one complete frame.
DecodeResult decode_frame(const uint8_t* data, size_t len);
inline DecodeResult decode_frame(const Bytes& frame) { return decode_frame(frame.data(), frame.size()); }

/// One line of the recent-frame log.
struct FrameLogEntry {
  HashPrefix hash_prefix{};
  uint8_t  priority   = 0;
  size_t   size       = 0;
  uint64_t at_ms      = 0;
};

/// Protocol counters owned by a FrameCodec.
struct FrameStats {
  uint64_t frames_created = 0;
  uint64_t frames_parsed  = 0;
  uint64_t crc_errors     = 0;   ///< magic and CRC rejections both land here
  uint64_t last_frame_ms  = 0;
};

/**
 * @class FrameCodec
 * @brief Stateful wrapper around encode_frame/decode_frame that keeps metrics.
 *
 * @details
 * Holds the protocol counters and a bounded log of recently built frames
 * (`FRAME_LOG_CAP`, trimmed back to `FRAME_LOG_TRIM_TO` when full). One codec
 * belongs to one MeshNode; nothing here is global.
 */
class FrameCodec {
public:
  static constexpr size_t FRAME_LOG_CAP     = 500;
  static constexpr size_t FRAME_LOG_TRIM_TO = 400;

  using FrameLog = etl::deque<FrameLogEntry, FRAME_LOG_CAP>;

  EncodeResult encode(const Bytes& payload, const FrameOptions& opts, uint64_t now_ms);
  /**
   * @brief Cut @p message into frames of at most @p slice_bytes payload each.
   * @details A message that fits one slice (or is empty) becomes one plain
   *          frame. Otherwise every frame carries FRAGMENT, its seq/total and
   *          the whole-message hash prefix. @p opts supplies the other fields.
   */
  FragmentFrames encode_fragments(const Bytes& message, size_t slice_bytes, FrameOptions opts,
                                  uint64_t now_ms);

  DecodeResult decode(const uint8_t* data, size_t len);
  DecodeResult decode(const Bytes& frame) { return decode(frame.data(), frame.size()); }

  const FrameStats& stats() const { return stats_; }

  /// Up to @p limit most recent log entries, oldest first.
  std::vector<FrameLogEntry> recent_frames(size_t limit = 50) const;

  void reset();

private:
  FrameStats stats_;
  FrameLog   log_;
};

} // namespace relaymesh

#endif // RELAYMESH_FRAME_HPP
