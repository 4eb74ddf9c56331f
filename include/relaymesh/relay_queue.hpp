/**
 * @file relay_queue.hpp
 * @brief Store-and-forward relay queue: bounded, priority-ordered, expiring.
 *
 * @details
 * ## Field Brief
 * When no channel can carry a packet, or the carrier refuses it, the packet
 * waits here until its destination shows up or its hold time runs out.
 *
 * @par Ordering
 * Entries are kept sorted by relay priority class (lower = more urgent),
 * insertion order within a class.
 *
 * @par Capacity
 * `max_queue_size` entries. Enqueuing into a full queue first evicts the single
 * lowest-priority entry (largest class number, newest among equals). Eviction
 * is counted, never reported as an error.
 *
 * @par Sweep
 * 1. Drop every entry whose expiry is in the past (counted as expired).
 * 2. Take every remaining entry whose destination is "broadcast" or reachable
 *    out of the queue and bump its attempts.
 * 3. Offer each taken entry to the delivery callback. Accepted entries are
 *    counted as relayed. A refused entry goes back into the queue with its
 *    attempts kept, unless it has used up `max_attempts`, in which case it is
 *    dropped and counted as such.
 * The callback runs with the queue in a consistent state and may enqueue.
 * Without a callback every taken entry counts as accepted.
 *
 * @par Configuration
 * `configure()` clamps `max_queue_size` to [10, 10000] and `max_hold_ms` to
 * [60 s, 7 d].
 *
 * @author Leo
 * @author ChatGPT
 */
#ifndef RELAYMESH_RELAY_QUEUE_HPP
#define RELAYMESH_RELAY_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "relaymesh/node_id.hpp"
#include "relaymesh/packet.hpp"
#include "relaymesh/priority.hpp"

namespace relaymesh {

struct RelayConfig {
  static constexpr size_t   QUEUE_SIZE_DEFAULT = 1000;
  static constexpr size_t   QUEUE_SIZE_MIN     = 10;
  static constexpr size_t   QUEUE_SIZE_MAX     = 10000;
  static constexpr uint64_t HOLD_MS_DEFAULT    = 24ull * 60 * 60 * 1000;      // 24 h
  static constexpr uint64_t HOLD_MS_MIN        = 60ull * 1000;                // 60 s
  static constexpr uint64_t HOLD_MS_MAX        = 7ull * 24 * 60 * 60 * 1000;  // 7 d

  bool     enabled        = true;
  size_t   max_queue_size = QUEUE_SIZE_DEFAULT;
  uint64_t max_hold_ms    = HOLD_MS_DEFAULT;
};

/// Partial update for configure(); unset fields stay as they are.
struct RelayConfigUpdate {
  std::optional<bool>     enabled;
  std::optional<size_t>   max_queue_size;
  std::optional<uint64_t> max_hold_ms;
};

enum class RelayStatus : uint8_t { Queued, Delivered };

const char* to_string(RelayStatus s);

struct RelayEntry {
  std::string             id;
  MeshPacket              packet;
  std::string             destination;
  uint8_t                 priority_class = relay_priority::GENERAL;
  uint64_t                queued_at_ms   = 0;
  uint32_t                attempts       = 0;
  uint32_t                max_attempts   = 10;
  uint64_t                expires_at_ms  = 0;
  RelayStatus             status         = RelayStatus::Queued;
  std::optional<uint64_t> delivered_at_ms;
};

struct EnqueueOptions {
  std::optional<uint8_t>  priority_class;   ///< absent -> classify_relay_priority(payload)
  std::optional<uint64_t> hold_ms;          ///< absent -> config().max_hold_ms
  uint32_t                max_attempts = 10;
  uint32_t                attempts     = 0; ///< pre-counted attempts (failed live sends)
};

struct SweepResult {
  size_t delivered = 0;
  size_t requeued  = 0;   ///< refused by the callback, back in the queue
  size_t dropped   = 0;   ///< refused with no attempts left
  size_t expired   = 0;
  size_t remaining = 0;
};

/// Light view of an entry for diagnostics.
struct PendingView {
  std::string id;
  std::string destination;
  uint8_t     priority_class = 0;
  uint64_t    queued_at_ms   = 0;
  uint64_t    expires_at_ms  = 0;
  uint32_t    attempts       = 0;
  RelayStatus status         = RelayStatus::Queued;
  size_t      packet_bytes   = 0;
};

class RelayQueue {
public:
  /// Destination reachability test supplied by the owner (normally the peer registry).
  using ReachableFn = std::function<bool(const std::string&)>;
  /// Offered each released entry; returns false when the carrier refused it.
  using DeliverFn = std::function<bool(const RelayEntry&)>;

  explicit RelayQueue(IdSource& ids);

  /**
   * @brief Queue a packet for later delivery.
   * @param destination node id; empty means "broadcast"
   * @return id of the new entry
   */
  std::string enqueue(MeshPacket packet, const std::string& destination,
                      const EnqueueOptions& opts, uint64_t now_ms);

  /// Expire, then deliver to reachable destinations. See file docs.
  SweepResult sweep(uint64_t now_ms, const ReachableFn& reachable,
                    const DeliverFn& deliver = DeliverFn());

  /// First @p limit entries in queue order.
  std::vector<PendingView> pending(size_t limit = 50) const;

  const std::vector<RelayEntry>& entries() const { return queue_; }
  size_t size() const { return queue_.size(); }

  const RelayConfig& config() const { return config_; }
  const RelayConfig& configure(const RelayConfigUpdate& update);

  uint64_t total_store_forward() const { return total_store_forward_; }
  uint64_t total_relayed() const { return total_relayed_; }
  uint64_t total_evicted() const { return total_evicted_; }
  uint64_t total_expired() const { return total_expired_; }
  uint64_t total_dropped() const { return total_dropped_; }

  /// Empty the queue and restore default config and counters.
  void reset();

private:
  IdSource&               ids_;
  RelayConfig             config_;
  std::vector<RelayEntry> queue_;
  uint64_t                total_store_forward_ = 0;
  uint64_t                total_relayed_       = 0;
  uint64_t                total_evicted_       = 0;
  uint64_t                total_expired_       = 0;
  uint64_t                total_dropped_       = 0;

  void insert_sorted(RelayEntry entry);
};

} // namespace relaymesh

#endif // RELAYMESH_RELAY_QUEUE_HPP
