/**
 * @file hash.hpp
 * @brief Byte buffers and SHA-256 content hashing for relaymesh.
 *
 * @details
 * Every unit that crosses the mesh is content-addressed. The frame header
 * carries the first four bytes of the SHA-256 digest, mesh packets carry the
 * full hex digest, and fragments carry a digest of their own slice so each one
 * self-verifies without a handshake.
 *
 * Hashing is delegated to OpenSSL's libcrypto one-shot `SHA256()`.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_HASH_HPP
#define RELAYMESH_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relaymesh {

/// Raw payload bytes as carried on the wire.
using Bytes = std::vector<uint8_t>;

/// 32-byte SHA-256 digest.
using Digest = std::array<uint8_t, 32>;

Digest sha256(const uint8_t* data, size_t len);
Digest sha256(const Bytes& data);

/**
 * @brief Lowercase hex SHA-256 of a buffer (64 chars).
 * @note This is the form stored in `MeshPacket::payload_hash` and compared on receipt.
 */
std::string sha256_hex(const Bytes& data);

/// Lowercase hex encoding of @p len bytes.
std::string to_hex(const uint8_t* data, size_t len);

/// Copy a string's bytes into a buffer (no terminator).
Bytes to_bytes(const std::string& s);

/// Interpret a buffer as text.
std::string to_text(const Bytes& b);

} // namespace relaymesh

#endif // RELAYMESH_HASH_HPP
