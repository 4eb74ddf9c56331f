#pragma once
/**
 * @file priority.hpp
 * @brief Priority scales used by frames, routing and the relay queue.
 *
 * Two scales, both "lower number = more urgent":
 *  - Frame priority (0..7) travels in the frame header and drives gossip.
 *  - Relay priority class (1..5) orders the store-and-forward queue and biases routing.
 */

#include <cstdint>
#include <string>

namespace relaymesh {

/// Frame priority levels carried in the header byte.
namespace priority {
static constexpr uint8_t EMERGENCY  = 0;
static constexpr uint8_t THREAT     = 1;
static constexpr uint8_t ECONOMIC   = 2;
static constexpr uint8_t KNOWLEDGE  = 3;
static constexpr uint8_t GENERAL    = 4;
static constexpr uint8_t LOW        = 5;
static constexpr uint8_t BACKGROUND = 6;
static constexpr uint8_t MINIMAL    = 7;
static constexpr uint8_t MAX        = MINIMAL;
} // namespace priority

/// Relay priority classes for queued content.
namespace relay_priority {
static constexpr uint8_t THREAT        = 1;
static constexpr uint8_t ECONOMIC      = 2;
static constexpr uint8_t CONSCIOUSNESS = 3;
static constexpr uint8_t KNOWLEDGE     = 4;
static constexpr uint8_t GENERAL       = 5;
} // namespace relay_priority

/**
 * @brief Derive a relay priority class from serialized content.
 *
 * Substring match on the JSON text, first hit wins:
 *  - `"type":"THREAT"` or `"pain_memory"`       -> THREAT
 *  - `"type":"TRANSACTION"` or `"royalt`        -> ECONOMIC
 *  - `"consciousness"` or `"type":"ENTITY"`     -> CONSCIOUSNESS
 *  - `"type":"KNOWLEDGE"` or `"type":"THEOREM"` -> KNOWLEDGE
 *  - otherwise                                   -> GENERAL
 */
uint8_t classify_relay_priority(const std::string& content);

} // namespace relaymesh
