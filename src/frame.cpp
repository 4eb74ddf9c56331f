// -----------------------------------------------------------------------------
// frame.cpp — relaymesh frame codec
//
// Field layout and rules live in include/relaymesh/frame.hpp.
// This file packs/unpacks the 20-byte header byte by byte (big endian),
// computes the CRC trailer and keeps the codec counters.
// -----------------------------------------------------------------------------
#include "relaymesh/frame.hpp"
#include "relaymesh/node_id.hpp"

#include <algorithm>

namespace relaymesh {

namespace {

void put16(Bytes& out, uint16_t v) {
  out.push_back(uint8_t(v >> 8));   // high byte first
  out.push_back(uint8_t(v & 0xFF));
}

void put32(Bytes& out, uint32_t v) {
  out.push_back(uint8_t(v >> 24));
  out.push_back(uint8_t(v >> 16));
  out.push_back(uint8_t(v >> 8));
  out.push_back(uint8_t(v & 0xFF));
}

uint16_t get16(const uint8_t* p) {
  return uint16_t((uint16_t(p[0]) << 8) | p[1]);
}

uint32_t get32(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

// ---------- crc ----------

uint16_t crc16(const uint8_t* data, size_t len) {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 1) crc = uint16_t((crc >> 1) ^ 0xA001);
      else         crc = uint16_t(crc >> 1);
    }
  }
  return crc;
}

// ---------- header helpers ----------

HashPrefix hash_prefix_of(const Bytes& data) {
  const Digest d = sha256(data);
  HashPrefix p{};
  std::copy(d.begin(), d.begin() + p.size(), p.begin());
  return p;
}

std::string FrameHeader::hash_hex() const {
  return to_hex(hash_prefix.data(), hash_prefix.size());
}

std::string FrameHeader::source_hex() const {
  return unpack_source_id(source_id);
}

const char* to_string(FrameError e) {
  switch (e) {
    case FrameError::None:             return "none";
    case FrameError::PayloadTooLarge:  return "payload_too_large";
    case FrameError::TooManyFragments: return "too_many_fragments";
    case FrameError::Truncated:        return "truncated";
    case FrameError::InvalidMagic:     return "invalid_magic";
    case FrameError::CrcMismatch:      return "crc_mismatch";
  }
  return "unknown";
}

// ---------- stateless codec ----------

// encode_frame()
// PRE:    payload fits the 16-bit length field.
// POLICY: priority clamped to 0..7; priority 0 forces EMERGENCY; total >= 1.
// OUT:    header + payload + crc16 over everything before the crc.
EncodeResult encode_frame(const Bytes& payload, const FrameOptions& opts) {
  EncodeResult r;
  if (payload.size() > MAX_FRAME_PAYLOAD) {
    r.error = FrameError::PayloadTooLarge;
    return r;
  }

  FrameHeader& h = r.header;
  h.priority = std::min<uint8_t>(opts.priority, priority::MAX);
  h.ttl      = opts.ttl;

  uint8_t flags = 0;
  if (opts.fragment) flags |= frame_flags::FRAGMENT;
  if (opts.relay)    flags |= frame_flags::RELAY;
  if (opts.emergency || h.priority == priority::EMERGENCY) flags |= frame_flags::EMERGENCY;
  if (opts.encrypted) flags |= frame_flags::ENCRYPTED;
  h.flags = flags;

  h.hash_prefix = opts.message_hash ? *opts.message_hash : hash_prefix_of(payload);

  h.source_id      = pack_source_id(opts.source_node_id.empty() ? std::string("self") : opts.source_node_id);
  h.fragment_seq   = opts.fragment_seq;
  h.fragment_total = opts.fragment_total == 0 ? uint16_t(1) : opts.fragment_total;
  h.payload_length = static_cast<uint16_t>(payload.size());

  Bytes& out = r.bytes;
  out.reserve(HEADER_SIZE + payload.size() + CRC_SIZE);
  put16(out, h.magic);
  out.push_back(h.version);
  out.push_back(h.priority);
  out.push_back(h.ttl);
  out.push_back(h.flags);
  out.insert(out.end(), h.hash_prefix.begin(), h.hash_prefix.end());
  put32(out, h.source_id);
  put16(out, h.fragment_seq);
  put16(out, h.fragment_total);
  put16(out, h.payload_length);
  out.insert(out.end(), payload.begin(), payload.end());
  put16(out, crc16(out.data(), out.size()));

  r.ok = true;
  return r;
}

// decode_frame()
// POLICY:
//   - magic is checked first so foreign traffic is rejected cheaply.
//   - the CRC covers every byte except the trailer, including the length
//     field; a corrupted length therefore surfaces as crc_mismatch.
//   - only a length that disagrees with a CRC-valid buffer is "truncated".
DecodeResult decode_frame(const uint8_t* data, size_t len) {
  DecodeResult r;
  if (!data || len < 2) {
    r.error = FrameError::Truncated;
    return r;
  }

  r.header.magic = get16(data);
  if (r.header.magic != MAGIC) {
    r.error = FrameError::InvalidMagic;
    return r;
  }
  if (len < HEADER_SIZE + CRC_SIZE) {
    r.error = FrameError::Truncated;
    return r;
  }

  const size_t body = len - CRC_SIZE;
  r.received_crc = get16(data + body);
  r.expected_crc = crc16(data, body);
  if (r.received_crc != r.expected_crc) {
    r.error = FrameError::CrcMismatch;
    return r;
  }

  FrameHeader& h = r.header;
  h.version  = data[2];
  h.priority = data[3];
  h.ttl      = data[4];
  h.flags    = data[5];
  std::copy(data + 6, data + 10, h.hash_prefix.begin());
  h.source_id      = get32(data + 10);
  h.fragment_seq   = get16(data + 14);
  h.fragment_total = get16(data + 16);
  h.payload_length = get16(data + 18);

  if (size_t(h.payload_length) != body - HEADER_SIZE) {
    r.error = FrameError::Truncated;
    return r;
  }

  r.payload.assign(data + HEADER_SIZE, data + body);
  r.ok = true;
  return r;
}

// ---------- FrameCodec ----------

EncodeResult FrameCodec::encode(const Bytes& payload, const FrameOptions& opts, uint64_t now_ms) {
  EncodeResult r = encode_frame(payload, opts);
  if (!r.ok) return r;

  ++stats_.frames_created;
  stats_.last_frame_ms = now_ms;

  // POLICY: on overflow drop the oldest entries down to the trim mark, then append.
  if (log_.full()) {
    while (log_.size() >= FRAME_LOG_TRIM_TO) log_.pop_front();
  }
  FrameLogEntry e;
  e.hash_prefix = r.header.hash_prefix;
  e.priority    = r.header.priority;
  e.size        = r.bytes.size();
  e.at_ms       = now_ms;
  log_.push_back(e);
  return r;
}

// encode_fragments()
// PRE:    slice_bytes is raised to 1 and capped at MAX_FRAME_PAYLOAD.
// POLICY: the slice count is checked before anything is encoded, so a refused
//         message leaves no trace in the counters or the log.
// OUT:    frames in sequence order; nothing on error.
FragmentFrames FrameCodec::encode_fragments(const Bytes& message, size_t slice_bytes,
                                            FrameOptions opts, uint64_t now_ms) {
  FragmentFrames r;
  const size_t slice = std::min(std::max<size_t>(slice_bytes, 1), MAX_FRAME_PAYLOAD);
  const size_t count = message.empty() ? 1 : (message.size() + slice - 1) / slice;
  if (count > MAX_FRAME_FRAGMENTS) {
    r.error = FrameError::TooManyFragments;
    return r;
  }

  r.message_hash = hash_prefix_of(message);
  if (count == 1) {
    opts.fragment       = false;
    opts.fragment_seq   = 0;
    opts.fragment_total = 1;
    opts.message_hash.reset();
    EncodeResult e = encode(message, opts, now_ms);
    if (!e.ok) {
      r.error = e.error;
      return r;
    }
    r.frames.push_back(std::move(e.bytes));
    r.ok = true;
    return r;
  }

  opts.fragment       = true;
  opts.fragment_total = static_cast<uint16_t>(count);
  opts.message_hash   = r.message_hash;
  r.frames.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const size_t begin = i * slice;
    const size_t end   = std::min(begin + slice, message.size());
    opts.fragment_seq = static_cast<uint16_t>(i);
    EncodeResult e = encode(Bytes(message.begin() + static_cast<std::ptrdiff_t>(begin),
                                  message.begin() + static_cast<std::ptrdiff_t>(end)),
                            opts, now_ms);
    r.frames.push_back(std::move(e.bytes));
  }
  r.ok = true;
  return r;
}

DecodeResult FrameCodec::decode(const uint8_t* data, size_t len) {
  DecodeResult r = decode_frame(data, len);
  if (r.ok) {
    ++stats_.frames_parsed;
  } else if (r.error == FrameError::InvalidMagic || r.error == FrameError::CrcMismatch) {
    ++stats_.crc_errors;
  }
  return r;
}

std::vector<FrameLogEntry> FrameCodec::recent_frames(size_t limit) const {
  const size_t n = std::min(limit, log_.size());
  return std::vector<FrameLogEntry>(log_.end() - static_cast<std::ptrdiff_t>(n), log_.end());
}

void FrameCodec::reset() {
  stats_ = FrameStats{};
  log_.clear();
}

} // namespace relaymesh
