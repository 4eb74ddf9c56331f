/**
 * @file dedup.hpp
 * @brief Duplicate suppression and probabilistic rebroadcast (gossip).
 *
 * @details
 * ## DedupCache
 * Same hash = same content = silently dropped. The cache maps a content hash
 * to the time it was first seen. Growth is bounded by a size-triggered sweep:
 * once the map holds more than `SWEEP_THRESHOLD` entries, anything older than
 * `RETENTION_MS` is dropped. No timer runs; the hot path stays O(1).
 *
 * ## GossipController
 * Decides whether a received frame should be rebroadcast.
 *  - EMERGENCY-flagged frames and priorities 0..1 always go out.
 *  - Everything else goes out with probability `novelty * 0.8 + 0.1`
 *    (10% floor, 90% ceiling), drawn from an injected, seedable engine so runs
 *    are replayable.
 * Every probabilistic decision is appended to a bounded audit log.
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_DEDUP_HPP
#define RELAYMESH_DEDUP_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>

#include "etl/deque.h"
#include "relaymesh/frame.hpp"

namespace relaymesh {

class DedupCache {
public:
  static constexpr size_t   SWEEP_THRESHOLD = 10000;
  static constexpr uint64_t RETENTION_MS    = 60ull * 60ull * 1000ull; // 1 hour

  /**
   * @brief Test-and-set on a content hash.
   * @retval true  already seen; caller drops the frame (counted as deduplicated)
   * @retval false first sighting; recorded at @p now_ms
   * @note An empty hash is never a duplicate and is not recorded.
   */
  bool check_and_mark(const std::string& hash, uint64_t now_ms);

  bool contains(const std::string& hash) const { return seen_.count(hash) != 0; }

  size_t size() const { return seen_.size(); }
  uint64_t total_deduplicated() const { return total_deduplicated_; }

  void clear();

private:
  void sweep(uint64_t now_ms);

  std::unordered_map<std::string, uint64_t> seen_;
  uint64_t total_deduplicated_ = 0;
};

/// One audited gossip decision.
struct GossipRecord {
  std::string hash;          ///< header hash prefix, hex
  double      novelty     = 0.0;
  double      probability = 0.0;
  bool        broadcast   = false;
  uint64_t    at_ms       = 0;
};

class GossipController {
public:
  static constexpr size_t LOG_CAP     = 200;
  static constexpr size_t LOG_TRIM_TO = 150;

  using GossipLog = etl::deque<GossipRecord, LOG_CAP>;

  /// seed == 0 draws from std::random_device.
  explicit GossipController(uint32_t seed = 0);

  void reseed(uint32_t seed);

  /**
   * @brief Rebroadcast decision for a received frame.
   * @param header  decoded frame header (flags, priority, hash prefix)
   * @param novelty caller's novelty score; clamped to [0, 1]
   */
  bool should_gossip(const FrameHeader& header, double novelty, uint64_t now_ms);

  /// Rebroadcast probability for a novelty score (after clamping).
  static double probability_for(double novelty);

  const GossipLog& log() const { return log_; }
  uint64_t broadcasts() const { return broadcasts_; }
  uint64_t suppressed() const { return suppressed_; }

  void clear();

private:
  std::mt19937 rng_;
  GossipLog    log_;
  uint64_t     broadcasts_ = 0;
  uint64_t     suppressed_ = 0;
};

} // namespace relaymesh

#endif // RELAYMESH_DEDUP_HPP
