#pragma once

#include "recon/config/connector_config.hpp"
#include "recon/domain/fill.hpp"
#include "recon/domain/order.hpp"
#include "recon/domain/order_state.hpp"
#include "recon/eventbus/event_bus.hpp"
#include "recon/events/canonical_update.hpp"
#include "recon/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace recon {

// Result of OrderRegistry::applyFill().
enum class FillOutcome {
  Applied,             // Accumulated into the order
  DuplicateTrade,      // trade_id already applied to this order
  UnknownOrder,        // No active or recently completed order matches
  ExceedsOrderAmount,  // Would push filled_amount past amount + epsilon
  InvalidFill,         // Non-positive base amount
};

// Result of OrderRegistry::applyStatusUpdate().
enum class StatusOutcome {
  Applied,            // Timestamp and (possibly) state/exchange id updated
  UnknownOrder,       // Not active: other session, pruned, or already terminal
  Stale,              // Older than the order's last update
  IllegalTransition,  // Would move the order backwards
};

const char* toString(FillOutcome outcome);
const char* toString(StatusOutcome outcome);

// -----------------------------------------------------------------------------
// OrderRegistry — authoritative order book of the connector
// -----------------------------------------------------------------------------
//
// @brief  Owns every order from registration to terminal state, enforces the
//         forward-only lifecycle, deduplicates fills by trade id, and keeps a
//         bounded history of recently completed orders.
//
// @details
// Storage:
//   active_          client_order_id → TrackedOrder (non-terminal orders)
//   exchange_index_  exchange_order_id → client_order_id (active orders)
//   completed_       bounded FIFO of terminal TrackedOrders, oldest first
//   fill_history_    bounded FIFO of applied fills, oldest first
//
// Merge rules:
//   Status updates: last-update-wins by exchange timestamp. An update older
//     than order.last_update_timestamp_ms is ignored, so a slow poll response
//     cannot overwrite a fresher stream event. Open reported for a
//     PartiallyFilled order keeps PartiallyFilled (the exchange reports
//     partially filled orders as "open").
//   Fills: applied at most once per (order, trade_id). Filled amount,
//     average price, quote and fee accumulate; the order becomes
//     PartiallyFilled on the first fill and Filled when filled_amount
//     reaches amount within fill_epsilon. A fill that would overshoot by
//     more than epsilon is rejected without mutating anything.
//   Fills do not move last_update_timestamp_ms: that clock belongs to status
//     reports only.
//
// Terminal orders still accept fills while they sit in the completed
// history: the exchange may report "filled" or "cancelled" before the
// trades that led there have been delivered.
//
// Every transition publishes OrderUpdateEvent and every applied fill
// publishes OrderFilledEvent, after the registry lock has been released.
//
// Thread model:
//   One std::mutex serializes all mutations and reads, which makes
//   concurrent applyFill() calls for the same trade id linearizable. Views
//   return copies. Called from the stream listener, poll scheduler and
//   order submitter threads.
//
// Ownership:
//   Owned by ConnectorCore. Borrows the EventBus and time provider.
// -----------------------------------------------------------------------------
class OrderRegistry {
 public:
  OrderRegistry(EventBus& bus, const ITimeProvider& clock,
                const config::ConnectorConfig& config);

  OrderRegistry(const OrderRegistry&) = delete;
  OrderRegistry& operator=(const OrderRegistry&) = delete;
  OrderRegistry(OrderRegistry&&) = delete;
  OrderRegistry& operator=(OrderRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // registerOrder(order)
  // -------------------------------------------------------------------------
  // @brief  Inserts a new order in PendingCreate.
  //
  // @throws ValidationError      empty client id or trading pair,
  //                              non-positive amount, non-positive price on a
  //                              limit order.
  // @throws DuplicateOrderError  client id already active or in the
  //                              completed history.
  //
  // Fill bookkeeping fields and the state in the argument are ignored. A
  // zero creation timestamp is replaced by the clock.
  // -------------------------------------------------------------------------
  domain::Order registerOrder(const domain::Order& order);

  // -------------------------------------------------------------------------
  // applyStatusUpdate(update)
  // -------------------------------------------------------------------------
  // Unknown client ids are a no-op (debug log). A differing exchange id on
  // an order that already has one is logged and ignored; the state part of
  // the update is still applied.
  // -------------------------------------------------------------------------
  StatusOutcome applyStatusUpdate(const OrderStatusUpdate& update);

  // -------------------------------------------------------------------------
  // applyFill(fill)
  // -------------------------------------------------------------------------
  // fill.client_order_id must name the owning order (the
  // ReconciliationEngine resolves it). See class comment for merge rules.
  // -------------------------------------------------------------------------
  FillOutcome applyFill(const domain::Fill& fill);

  // Create-order acknowledgment: assigns the exchange id and moves
  // PendingCreate → Open. Returns false for unknown or terminal orders.
  bool processCreationAck(const std::string& client_order_id,
                          const std::string& exchange_order_id,
                          std::int64_t timestamp_ms);

  // Exchange confirmed a cancel request. → Canceled.
  bool processCancelConfirmed(const std::string& client_order_id,
                              std::int64_t timestamp_ms);

  // Exchange no longer knows the order (cancel or status query answered
  // "not found"). Treated as an implicit cancellation. → Canceled.
  bool processOrderNotFound(const std::string& client_order_id,
                            std::int64_t timestamp_ms);

  // Submission rejected or lost. → Failed, with reason recorded.
  bool markFailed(const std::string& client_order_id, const std::string& reason,
                  std::int64_t timestamp_ms);

  // --- Views (copies) --------------------------------------------------------
  std::vector<domain::Order> activeOrders() const;
  std::unordered_map<std::string, domain::Order> activeOrdersByExchangeId() const;

  // Active orders that carry an exchange id, i.e. can be matched against
  // trade history and queried for status.
  std::vector<domain::Order> tradePollableOrders() const;

  // Active or completed order by client id.
  std::optional<domain::Order> order(const std::string& client_order_id) const;

  // O(1) reverse-index lookup over active orders.
  std::optional<domain::Order> findByExchangeOrderId(
      const std::string& exchange_order_id) const;

  // Linear scan over active orders comparing exchange ids. Returns every
  // match, oldest creation timestamp first.
  std::vector<domain::Order> scanActiveByExchangeOrderId(
      const std::string& exchange_order_id) const;

  // Most recently completed order carrying exchange_order_id, if still in
  // the history window.
  std::optional<domain::Order> findCompletedByExchangeOrderId(
      const std::string& exchange_order_id) const;

  std::vector<domain::Order> completedOrders() const;
  // Newest fill_history_size applied fills, oldest first.
  std::vector<domain::Fill> fillHistory() const;
  std::size_t activeCount() const;

  // Active orders still waiting for their creation ack (no exchange id).
  std::size_t pendingCreateCount() const;

  // -------------------------------------------------------------------------
  // transitionAllowed(current, next)
  // -------------------------------------------------------------------------
  // Legal transitions:
  //   PendingCreate   → Open, PartiallyFilled, Filled, Canceled, Failed
  //   Open            → Open, PartiallyFilled, Filled, Canceled, Failed
  //   PartiallyFilled → PartiallyFilled, Filled, Canceled
  //   Filled / Canceled / Failed → (none)
  // -------------------------------------------------------------------------
  static bool transitionAllowed(domain::OrderState current,
                                domain::OrderState next);

 private:
  struct TrackedOrder {
    domain::Order order;
    std::unordered_set<std::string> applied_trade_ids;
  };

  // Finds an active order, then the completed history. nullptr if neither.
  TrackedOrder* findLocked(const std::string& client_order_id);
  const TrackedOrder* findLocked(const std::string& client_order_id) const;

  // Moves an active order whose state just became terminal into the
  // completed history and trims the history to its bound.
  void retireLocked(const std::string& client_order_id);

  // Shared body of the local terminal transitions (cancel confirmed, not
  // found, failed). Appends the event to publish to pending.
  bool terminateLocked(const std::string& client_order_id,
                       domain::OrderState next, std::int64_t timestamp_ms,
                       const std::string& reason, std::vector<Event>& pending);

  void publishAll(const std::vector<Event>& events);

  EventBus& bus_;
  const ITimeProvider& clock_;
  const double fill_epsilon_;
  const std::size_t history_size_;
  const std::size_t fill_history_size_;
  const bool debug_logging_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TrackedOrder> active_;
  std::unordered_map<std::string, std::string> exchange_index_;
  std::deque<TrackedOrder> completed_;
  std::deque<domain::Fill> fill_history_;
};

}  // namespace recon
