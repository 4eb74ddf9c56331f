#include "relaymesh/priority.hpp"

namespace relaymesh {

namespace {

bool has(const std::string& s, const char* needle) {
  return s.find(needle) != std::string::npos;
}

} // namespace

uint8_t classify_relay_priority(const std::string& content) {
  if (has(content, "\"type\":\"THREAT\"") || has(content, "\"pain_memory\"")) {
    return relay_priority::THREAT;
  }
  if (has(content, "\"type\":\"TRANSACTION\"") || has(content, "\"royalt")) {
    return relay_priority::ECONOMIC;
  }
  if (has(content, "\"consciousness\"") || has(content, "\"type\":\"ENTITY\"")) {
    return relay_priority::CONSCIOUSNESS;
  }
  if (has(content, "\"type\":\"KNOWLEDGE\"") || has(content, "\"type\":\"THEOREM\"")) {
    return relay_priority::KNOWLEDGE;
  }
  return relay_priority::GENERAL;
}

} // namespace relaymesh
