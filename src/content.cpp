#include "relaymesh/content.hpp"

namespace relaymesh {

// make_content()
// POLICY: parse with allow_exceptions=false; malformed input yields a
//         "discarded" value instead of throwing, and we fall back to raw bytes.
Content make_content(Bytes raw) {
  Content c;
  c.raw = std::move(raw);
  if (c.raw.empty()) return c;

  nlohmann::json j = nlohmann::json::parse(c.raw.begin(), c.raw.end(), nullptr, false);
  if (!j.is_discarded()) {
    c.structured = std::move(j);
    c.is_structured = true;
  }
  return c;
}

} // namespace relaymesh
