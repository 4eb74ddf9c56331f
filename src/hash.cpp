// -----------------------------------------------------------------------------
// hash.cpp — SHA-256 helpers over libcrypto.
// -----------------------------------------------------------------------------
#include "relaymesh/hash.hpp"

#include <openssl/sha.h>

namespace relaymesh {

Digest sha256(const uint8_t* data, size_t len) {
  Digest out{};
  // SHA256() accepts a null pointer only when len == 0; feed it a valid address.
  static const uint8_t empty = 0;
  SHA256(len ? data : &empty, len, out.data());
  return out;
}

Digest sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

std::string sha256_hex(const Bytes& data) {
  const Digest d = sha256(data);
  return to_hex(d.data(), d.size());
}

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* HEX = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(HEX[(data[i] >> 4) & 0x0F]);
    out.push_back(HEX[data[i] & 0x0F]);
  }
  return out;
}

Bytes to_bytes(const std::string& s) {
  return Bytes(s.begin(), s.end());
}

std::string to_text(const Bytes& b) {
  return std::string(b.begin(), b.end());
}

} // namespace relaymesh
