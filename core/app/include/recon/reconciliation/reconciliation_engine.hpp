#pragma once

#include "recon/eventbus/event_bus.hpp"
#include "recon/events/canonical_update.hpp"
#include "recon/ledger/position_ledger.hpp"
#include "recon/normalizer/event_normalizer.hpp"
#include "recon/normalizer/raw_message.hpp"
#include "recon/registry/order_registry.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recon {

// Per-update result of ReconciliationEngine::apply().
enum class ApplyOutcome {
  Applied,  // Mutated the registry or ledger
  Ignored,   // Valid but redundant: duplicate trade, stale status, sentinel
  Deferred,  // Fill held until its order's creation ack names the owner
  Dropped,   // Could not be attributed or violated an invariant
};

// -----------------------------------------------------------------------------
// ApplySummary
// -----------------------------------------------------------------------------
// Tally of one ingress call or batch.
//   applied  — updates that changed state
//   ignored  — updates that were already reflected (idempotent repeats)
//   deferred — fills held for an order still awaiting its creation ack
//   dropped  — updates or raw records that could not be used
//   failed   — whole payloads rejected (error envelope, malformed) plus
//              updates whose application threw
// -----------------------------------------------------------------------------
struct ApplySummary {
  std::size_t applied{0};
  std::size_t ignored{0};
  std::size_t deferred{0};
  std::size_t dropped{0};
  std::size_t failed{0};

  ApplySummary& operator+=(const ApplySummary& other) {
    applied += other.applied;
    ignored += other.ignored;
    deferred += other.deferred;
    dropped += other.dropped;
    failed += other.failed;
    return *this;
  }

  std::size_t total() const {
    return applied + ignored + deferred + dropped + failed;
  }
};

// -----------------------------------------------------------------------------
// ReconciliationEngine — single merge funnel for stream and poll updates
// -----------------------------------------------------------------------------
//
// @brief  Normalizes raw payloads and routes every canonical update to the
//         OrderRegistry or PositionLedger with the same semantics, whichever
//         channel delivered it.
//
// @details
// Routing (std::visit over CanonicalUpdate):
//   OrderStatusUpdate → OrderRegistry::applyStatusUpdate
//   FillUpdate        → owner resolution, OrderRegistry::applyFill, then
//                       PositionLedger::applyFillToPosition if applied
//   PositionSnapshot  → PositionLedger::applyPositionSnapshot
//   BalanceSnapshot   → PositionLedger::applyBalanceSnapshot
//   FundingUpdate     → PositionLedger::applyFundingPayment
//
// Fill owner resolution, in order:
//   1. Reverse index exchange_order_id → active order.
//   2. Linear scan of active orders comparing exchange_order_id. With more
//      than one match the oldest order wins and the ambiguity is logged.
//   3. Recently completed orders (a terminal status can arrive before the
//      trades that caused it).
//   Nothing found while some order still awaits its creation ack: the stream
//   can report a trade before the submit call returns, so the fill is held
//   (at most kMaxHeldFills, oldest evicted). Every OrderUpdateEvent that
//   carries an exchange id replays the fills held for that id. Held fills
//   are discarded once no order is waiting for an ack.
//   Nothing found otherwise: the fill is logged and dropped.
//
// Ordering: updates are applied strictly in the order given. Held fills are
// the only updates applied later than they arrived.
//
// Failure isolation: an update that throws is counted as failed and the
// batch continues with the next one.
//
// Thread model:
//   Called concurrently from the stream listener and poll scheduler threads.
//   The borrowed components do their own locking; held_mutex_ guards only
//   the held fills and is never held while calling out. Replays run on the
//   thread that published the acknowledging OrderUpdateEvent.
//
// Ownership:
//   Subscribes to bus in the constructor and unsubscribes in the destructor.
//   bus must outlive the engine.
// -----------------------------------------------------------------------------
class ReconciliationEngine {
 public:
  static constexpr std::size_t kMaxHeldFills = 256;

  ReconciliationEngine(const EventNormalizer& normalizer,
                       OrderRegistry& registry, PositionLedger& ledger,
                       EventBus& bus, bool debug_logging = false);
  ~ReconciliationEngine();

  ReconciliationEngine(const ReconciliationEngine&) = delete;
  ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

  // Ingress for the stream listener.
  ApplySummary onStreamEvent(const RawMessage& raw);

  // Ingress for the poll scheduler.
  ApplySummary onPollSnapshot(const RawMessage& raw);

  ApplySummary applyBatch(const std::vector<CanonicalUpdate>& updates);

  ApplyOutcome apply(const CanonicalUpdate& update);

  // Client id of the order owning exchange_order_id, per the resolution
  // order above.
  std::optional<std::string> resolveFillOwner(const domain::Fill& fill) const;

  std::size_t heldFillCount() const;

 private:
  ApplySummary ingest(const RawMessage& raw);

  ApplyOutcome applyOwnedFill(domain::Fill fill, const std::string& owner);

  // Queues fill for a later replay. false when fill has no exchange id.
  bool holdFill(const domain::Fill& fill);

  // Applies every held fill for exchange_order_id once it resolves.
  void replayHeldFills(const std::string& exchange_order_id);

  void onOrderUpdate(const OrderUpdateEvent& event);

  ApplyOutcome applyStatus(const OrderStatusUpdate& update);
  ApplyOutcome applyFill(const FillUpdate& update);
  ApplyOutcome applyPositions(const PositionSnapshot& snapshot);
  ApplyOutcome applyBalances(const BalanceSnapshot& snapshot);
  ApplyOutcome applyFunding(const FundingUpdate& update);

  const EventNormalizer& normalizer_;
  OrderRegistry& registry_;
  PositionLedger& ledger_;
  EventBus& bus_;
  const bool debug_logging_;

  mutable std::mutex held_mutex_;
  std::deque<domain::Fill> held_fills_;

  EventBus::SubscriptionId update_subscription_{0};
};

}  // namespace recon
