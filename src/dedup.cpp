// -----------------------------------------------------------------------------
// dedup.cpp — DedupCache and GossipController.
// -----------------------------------------------------------------------------
#include "relaymesh/dedup.hpp"

#include <algorithm>

namespace relaymesh {

// ---------- DedupCache ----------

bool DedupCache::check_and_mark(const std::string& hash, uint64_t now_ms) {
  if (hash.empty()) return false;

  if (seen_.count(hash)) {
    ++total_deduplicated_;
    return true;
  }

  seen_.emplace(hash, now_ms);
  if (seen_.size() > SWEEP_THRESHOLD) sweep(now_ms);
  return false;
}

// sweep()
// POLICY: oldest-first by retention window only; if every entry is younger than
//         an hour the cache is allowed to stay above the threshold.
void DedupCache::sweep(uint64_t now_ms) {
  if (now_ms < RETENTION_MS) return;
  const uint64_t cutoff = now_ms - RETENTION_MS;
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (it->second < cutoff) it = seen_.erase(it);
    else ++it;
  }
}

void DedupCache::clear() {
  seen_.clear();
  total_deduplicated_ = 0;
}

// ---------- GossipController ----------

GossipController::GossipController(uint32_t seed) {
  reseed(seed);
}

void GossipController::reseed(uint32_t seed) {
  if (seed == 0) {
    std::random_device rd;
    seed = rd();
  }
  rng_.seed(seed);
}

double GossipController::probability_for(double novelty) {
  const double ns = std::clamp(novelty, 0.0, 1.0);
  return ns * 0.8 + 0.1;
}

bool GossipController::should_gossip(const FrameHeader& header, double novelty, uint64_t now_ms) {
  // POLICY: urgent traffic bypasses the draw entirely.
  if (header.is_emergency()) return true;
  if (header.priority <= priority::THREAT) return true;

  GossipRecord rec;
  rec.hash        = header.hash_hex();
  rec.novelty     = std::clamp(novelty, 0.0, 1.0);
  rec.probability = probability_for(novelty);
  rec.at_ms       = now_ms;

  std::bernoulli_distribution draw(rec.probability);
  rec.broadcast = draw(rng_);

  if (log_.full()) {
    while (log_.size() >= LOG_TRIM_TO) log_.pop_front();
  }
  log_.push_back(rec);

  if (rec.broadcast) ++broadcasts_;
  else ++suppressed_;
  return rec.broadcast;
}

void GossipController::clear() {
  log_.clear();
  broadcasts_ = 0;
  suppressed_ = 0;
}

} // namespace relaymesh
