/**
 * @file node_id.hpp
 * @brief Node identity and unique-id generation for relaymesh.
 *
 * @details
 * PURPOSE
 * -------
 * A mesh node is known by a string id of the form `node_<20 hex>`. A fresh id
 * is drawn at every process start; it is NOT derived from hardware, so peers
 * see a new node after a restart unless the host pins the id in its config.
 *
 * The frame header only has room for 4 bytes of source identity. The "short
 * id" is the last 8 characters of the full id, and `pack_source_id()` turns it
 * into those 4 bytes:
 *
 * | Short id form       | Packed value                                   |
 * |---------------------|------------------------------------------------|
 * | 8 hex characters    | the 32-bit number they spell (big endian)      |
 * | anything else       | first 4 bytes of SHA-256(short id)             |
 *
 * `unpack_source_id()` always yields 8 lowercase hex characters, so a
 * `node_<hex>` id round-trips to its own short form.
 *
 * WHAT ELSE
 * ---------
 * - `IdSource`: seedable generator for `<prefix>_<20 hex>` ids used by packets,
 *   transfers, relay entries and transmissions. Tests seed it for replayable ids.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_NODE_ID_HPP
#define RELAYMESH_NODE_ID_HPP

#include <cstdint>
#include <random>
#include <string>

#include "etl/string.h"

namespace relaymesh {

/// Longest node id a node accepts.
static constexpr size_t NODE_ID_MAX = 32;

/// Fixed-capacity node id: "node_" + 20 hex fits with headroom.
using NodeIdStr = etl::string<NODE_ID_MAX>;

/// Number of characters kept from a node id in headers.
static constexpr size_t SHORT_ID_LEN = 8;

/// Destination used for packets addressed to everyone.
static constexpr const char* BROADCAST = "broadcast";

/**
 * @class IdSource
 * @brief Seedable generator of prefixed random ids.
 */
class IdSource {
public:
  /// seed == 0 draws a seed from std::random_device.
  explicit IdSource(uint32_t seed = 0);

  void reseed(uint32_t seed);

  /// "<prefix>_<20 lowercase hex>" (10 random bytes).
  std::string next(const char* prefix);

  std::mt19937& engine() { return rng_; }

private:
  std::mt19937 rng_;
};

/// New random node id ("node_" + 20 hex).
std::string generate_node_id(IdSource& ids);

/// 1..NODE_ID_MAX printable, non-space ASCII characters.
bool is_valid_node_id(const std::string& id);

/// Last SHORT_ID_LEN characters of @p id (whole id if shorter).
std::string short_id(const std::string& id);

/// Pack a node id into the 4-byte frame source field.
uint32_t pack_source_id(const std::string& id);

/// Render a packed source field as 8 lowercase hex characters.
std::string unpack_source_id(uint32_t packed);

} // namespace relaymesh

#endif // RELAYMESH_NODE_ID_HPP
