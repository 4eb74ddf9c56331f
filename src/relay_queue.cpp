// -----------------------------------------------------------------------------
// relay_queue.cpp — Store-and-forward queue
//
// Contract: include/relaymesh/relay_queue.hpp
// -----------------------------------------------------------------------------
#include "relaymesh/relay_queue.hpp"

#include <algorithm>
#include <iterator>

namespace relaymesh {

namespace {

bool by_priority(const RelayEntry& a, const RelayEntry& b) {
  return a.priority_class < b.priority_class;
}

} // namespace

const char* to_string(RelayStatus s) {
  return s == RelayStatus::Delivered ? "delivered" : "queued";
}

RelayQueue::RelayQueue(IdSource& ids)
: ids_(ids) {}

// -----------------------------------------------------------------------------
// enqueue()
// PRE:    queue_ is sorted by priority class (stable).
// POLICY:
//   - full queue: the back entry is the lowest priority (and newest among its
//     class), so evicting it is a pop_back. A config shrink can leave the
//     queue over the cap; keep evicting until there is room for one.
//   - insert_sorted() places the new entry after every entry of equal or
//     higher urgency, which keeps the queue sorted without a full re-sort.
// OUT:    id of the queued entry.
// -----------------------------------------------------------------------------
std::string RelayQueue::enqueue(MeshPacket packet, const std::string& destination,
                                const EnqueueOptions& opts, uint64_t now_ms) {
  RelayEntry entry;
  entry.id             = ids_.next("relay");
  entry.destination    = destination.empty() ? std::string(BROADCAST) : destination;
  entry.priority_class = opts.priority_class ? *opts.priority_class
                                             : classify_relay_priority(to_text(packet.payload));
  entry.queued_at_ms   = now_ms;
  entry.attempts       = opts.attempts;
  entry.max_attempts   = opts.max_attempts;
  entry.expires_at_ms  = now_ms + opts.hold_ms.value_or(config_.max_hold_ms);
  entry.packet         = std::move(packet);

  while (!queue_.empty() && queue_.size() >= config_.max_queue_size) {
    queue_.pop_back();
    ++total_evicted_;
  }

  const std::string id = entry.id;
  insert_sorted(std::move(entry));
  ++total_store_forward_;
  return id;
}

void RelayQueue::insert_sorted(RelayEntry entry) {
  auto pos = std::upper_bound(queue_.begin(), queue_.end(), entry, by_priority);
  queue_.insert(pos, std::move(entry));
}

// -----------------------------------------------------------------------------
// sweep()
// POLICY:
//   - expiry first, regardless of status: an expired entry is never offered.
//   - "now > expires_at" is expired; an entry at exactly its expiry survives.
//   - released entries leave the queue before any callback runs, so the
//     callback sees a consistent queue (and may enqueue into it).
//   - a refused entry keeps its id, expiry and attempts; it is dropped only
//     once attempts reach max_attempts.
// -----------------------------------------------------------------------------
SweepResult RelayQueue::sweep(uint64_t now_ms, const ReachableFn& reachable,
                              const DeliverFn& deliver) {
  SweepResult r;

  auto expired_end = std::remove_if(queue_.begin(), queue_.end(), [&](const RelayEntry& e) {
    return e.expires_at_ms < now_ms;
  });
  r.expired = static_cast<size_t>(std::distance(expired_end, queue_.end()));
  queue_.erase(expired_end, queue_.end());
  total_expired_ += r.expired;

  std::vector<RelayEntry> released;
  auto keep_end = std::stable_partition(queue_.begin(), queue_.end(), [&](const RelayEntry& e) {
    return !(e.destination == BROADCAST || (reachable && reachable(e.destination)));
  });
  std::move(keep_end, queue_.end(), std::back_inserter(released));
  queue_.erase(keep_end, queue_.end());

  for (auto& e : released) {
    ++e.attempts;
    e.status          = RelayStatus::Delivered;
    e.delivered_at_ms = now_ms;
    if (!deliver || deliver(e)) {
      ++r.delivered;
      ++total_relayed_;
      continue;
    }
    if (e.attempts >= e.max_attempts) {
      ++r.dropped;
      ++total_dropped_;
      continue;
    }
    e.status = RelayStatus::Queued;
    e.delivered_at_ms.reset();
    insert_sorted(std::move(e));
    ++r.requeued;
  }

  r.remaining = queue_.size();
  return r;
}

std::vector<PendingView> RelayQueue::pending(size_t limit) const {
  std::vector<PendingView> out;
  const size_t n = std::min(limit, queue_.size());
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const RelayEntry& e = queue_[i];
    out.push_back({e.id, e.destination, e.priority_class, e.queued_at_ms,
                   e.expires_at_ms, e.attempts, e.status, e.packet.total_bytes});
  }
  return out;
}

const RelayConfig& RelayQueue::configure(const RelayConfigUpdate& update) {
  if (update.enabled) config_.enabled = *update.enabled;
  if (update.max_queue_size) {
    config_.max_queue_size = std::clamp(*update.max_queue_size,
                                        RelayConfig::QUEUE_SIZE_MIN, RelayConfig::QUEUE_SIZE_MAX);
  }
  if (update.max_hold_ms) {
    config_.max_hold_ms = std::clamp(*update.max_hold_ms,
                                     RelayConfig::HOLD_MS_MIN, RelayConfig::HOLD_MS_MAX);
  }
  return config_;
}

void RelayQueue::reset() {
  queue_.clear();
  config_ = RelayConfig{};
  total_store_forward_ = 0;
  total_relayed_       = 0;
  total_evicted_       = 0;
  total_expired_       = 0;
  total_dropped_       = 0;
}

} // namespace relaymesh
