#pragma once
/**
 * @file content.hpp
 * @brief Delivered content: raw bytes plus an optional structured (JSON) view.
 *
 * The mesh never interprets content. On delivery it only tries to parse the
 * bytes as JSON (nlohmann::json, non-throwing) and keeps the raw bytes when
 * that fails, so the content store gets whichever form exists.
 */

#include <string>

#include "nlohmann/json.hpp"
#include "relaymesh/hash.hpp"

namespace relaymesh {

struct Content {
  Bytes          raw;
  nlohmann::json structured;            ///< discarded unless is_structured
  bool           is_structured = false;

  std::string text() const { return to_text(raw); }
};

/// Wrap @p raw, attaching a parsed JSON view when the bytes are valid JSON.
Content make_content(Bytes raw);

} // namespace relaymesh
