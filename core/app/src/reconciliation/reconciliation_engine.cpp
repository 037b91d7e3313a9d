#include "recon/reconciliation/reconciliation_engine.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <type_traits>

namespace recon {

ReconciliationEngine::ReconciliationEngine(const EventNormalizer& normalizer,
                                           OrderRegistry& registry,
                                           PositionLedger& ledger,
                                           EventBus& bus, bool debug_logging)
    : normalizer_(normalizer),
      registry_(registry),
      ledger_(ledger),
      bus_(bus),
      debug_logging_(debug_logging) {
  update_subscription_ = bus_.subscribe<OrderUpdateEvent>(
      [this](const OrderUpdateEvent& event) { onOrderUpdate(event); });
}

ReconciliationEngine::~ReconciliationEngine() {
  bus_.unsubscribe(update_subscription_);
}

ApplySummary ReconciliationEngine::onStreamEvent(const RawMessage& raw) {
  return ingest(raw);
}

ApplySummary ReconciliationEngine::onPollSnapshot(const RawMessage& raw) {
  return ingest(raw);
}

// -----------------------------------------------------------------------------
// ingest: normalize once, then apply in order
// -----------------------------------------------------------------------------
ApplySummary ReconciliationEngine::ingest(const RawMessage& raw) {
  NormalizationResult normalized = normalizer_.normalize(raw);

  ApplySummary summary;
  summary.dropped += normalized.dropped;

  if (!normalized.ok()) {
    std::cerr << "[ReconciliationEngine] WARNING: " << toString(raw.source)
              << " " << toString(raw.kind)
              << " payload rejected: " << *normalized.error << "\n";
    ++summary.failed;
    return summary;
  }

  summary += applyBatch(normalized.updates);
  return summary;
}

ApplySummary ReconciliationEngine::applyBatch(
    const std::vector<CanonicalUpdate>& updates) {
  ApplySummary summary;

  for (const auto& update : updates) {
    try {
      switch (apply(update)) {
        case ApplyOutcome::Applied:
          ++summary.applied;
          break;
        case ApplyOutcome::Ignored:
          ++summary.ignored;
          break;
        case ApplyOutcome::Deferred:
          ++summary.deferred;
          break;
        case ApplyOutcome::Dropped:
          ++summary.dropped;
          break;
      }
    } catch (const std::exception& e) {
      std::cerr << "[ReconciliationEngine] ERROR: update failed: " << e.what()
                << ". Continuing with next update.\n";
      ++summary.failed;
    }
  }

  return summary;
}

// -----------------------------------------------------------------------------
// apply: route by update kind
// -----------------------------------------------------------------------------
ApplyOutcome ReconciliationEngine::apply(const CanonicalUpdate& update) {
  return std::visit(
      [this](const auto& u) -> ApplyOutcome {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, OrderStatusUpdate>) {
          return applyStatus(u);
        } else if constexpr (std::is_same_v<T, FillUpdate>) {
          return applyFill(u);
        } else if constexpr (std::is_same_v<T, PositionSnapshot>) {
          return applyPositions(u);
        } else if constexpr (std::is_same_v<T, BalanceSnapshot>) {
          return applyBalances(u);
        } else {
          static_assert(std::is_same_v<T, FundingUpdate>,
                        "unhandled CanonicalUpdate alternative");
          return applyFunding(u);
        }
      },
      update);
}

ApplyOutcome ReconciliationEngine::applyStatus(const OrderStatusUpdate& update) {
  switch (registry_.applyStatusUpdate(update)) {
    case StatusOutcome::Applied:
      return ApplyOutcome::Applied;
    case StatusOutcome::UnknownOrder:
    case StatusOutcome::Stale:
      return ApplyOutcome::Ignored;
    case StatusOutcome::IllegalTransition:
      return ApplyOutcome::Dropped;
  }
  return ApplyOutcome::Dropped;
}

// -----------------------------------------------------------------------------
// resolveFillOwner: index → active scan → completed history
// -----------------------------------------------------------------------------
std::optional<std::string> ReconciliationEngine::resolveFillOwner(
    const domain::Fill& fill) const {
  if (auto order = registry_.findByExchangeOrderId(fill.exchange_order_id)) {
    return order->client_order_id;
  }

  auto matches = registry_.scanActiveByExchangeOrderId(fill.exchange_order_id);
  if (!matches.empty()) {
    const domain::Order& first = matches.front();
    if (matches.size() > 1) {
      std::cerr << "[ReconciliationEngine] WARNING: " << matches.size()
                << " active orders carry exchange_order_id="
                << fill.exchange_order_id << ". Attributing trade_id="
                << fill.trade_id << " to " << first.client_order_id << ".\n";
    }
    if (first.trading_pair != fill.trading_pair ||
        first.filled_amount + fill.fill_base_amount > first.amount) {
      std::cerr << "[ReconciliationEngine] WARNING: anomalous match for "
                   "trade_id=" << fill.trade_id << ": order "
                << first.client_order_id << " (" << first.trading_pair
                << ", remaining " << first.amount - first.filled_amount
                << ") vs fill (" << fill.trading_pair << ", "
                << fill.fill_base_amount << ").\n";
    }
    return first.client_order_id;
  }

  if (auto order =
          registry_.findCompletedByExchangeOrderId(fill.exchange_order_id)) {
    return order->client_order_id;
  }

  return std::nullopt;
}

ApplyOutcome ReconciliationEngine::applyFill(const FillUpdate& update) {
  if (auto owner = resolveFillOwner(update.fill)) {
    return applyOwnedFill(update.fill, *owner);
  }

  if (registry_.pendingCreateCount() > 0 && holdFill(update.fill)) {
    // The ack may have landed between resolution and hold.
    replayHeldFills(update.fill.exchange_order_id);
    return ApplyOutcome::Deferred;
  }

  std::cerr << "[ReconciliationEngine] WARNING: unattributable fill trade_id="
            << update.fill.trade_id << " exchange_order_id="
            << update.fill.exchange_order_id << ". Dropping.\n";
  return ApplyOutcome::Dropped;
}

ApplyOutcome ReconciliationEngine::applyOwnedFill(domain::Fill fill,
                                                  const std::string& owner) {
  fill.client_order_id = owner;

  switch (registry_.applyFill(fill)) {
    case FillOutcome::Applied:
      break;
    case FillOutcome::DuplicateTrade:
      return ApplyOutcome::Ignored;
    case FillOutcome::UnknownOrder:
    case FillOutcome::ExceedsOrderAmount:
    case FillOutcome::InvalidFill:
      return ApplyOutcome::Dropped;
  }

  if (auto order = registry_.order(fill.client_order_id)) {
    ledger_.applyFillToPosition(order->trading_pair, order->side,
                                fill.fill_base_amount, fill.fill_price);
  }

  if (debug_logging_) {
    std::cout << "[ReconciliationEngine] DEBUG: applied trade_id="
              << fill.trade_id << " to " << fill.client_order_id << "\n";
  }
  return ApplyOutcome::Applied;
}

// -----------------------------------------------------------------------------
// Held fills: trades reported before the creation ack
// -----------------------------------------------------------------------------
std::size_t ReconciliationEngine::heldFillCount() const {
  std::lock_guard lock(held_mutex_);
  return held_fills_.size();
}

bool ReconciliationEngine::holdFill(const domain::Fill& fill) {
  if (fill.exchange_order_id.empty()) {
    return false;
  }

  std::lock_guard lock(held_mutex_);
  if (held_fills_.size() >= kMaxHeldFills) {
    std::cerr << "[ReconciliationEngine] WARNING: held fill limit reached, "
                 "dropping trade_id=" << held_fills_.front().trade_id
              << " exchange_order_id="
              << held_fills_.front().exchange_order_id << ".\n";
    held_fills_.pop_front();
  }
  held_fills_.push_back(fill);

  if (debug_logging_) {
    std::cout << "[ReconciliationEngine] DEBUG: holding trade_id="
              << fill.trade_id << " until exchange_order_id="
              << fill.exchange_order_id << " is acknowledged\n";
  }
  return true;
}

void ReconciliationEngine::replayHeldFills(
    const std::string& exchange_order_id) {
  if (exchange_order_id.empty()) {
    return;
  }
  {
    std::lock_guard lock(held_mutex_);
    if (held_fills_.empty()) {
      return;
    }
  }

  domain::Fill key;
  key.exchange_order_id = exchange_order_id;
  auto owner = resolveFillOwner(key);
  if (!owner) {
    return;
  }

  std::vector<domain::Fill> ready;
  {
    std::lock_guard lock(held_mutex_);
    auto split = std::stable_partition(
        held_fills_.begin(), held_fills_.end(),
        [&](const domain::Fill& f) {
          return f.exchange_order_id != exchange_order_id;
        });
    ready.assign(std::make_move_iterator(split),
                 std::make_move_iterator(held_fills_.end()));
    held_fills_.erase(split, held_fills_.end());
  }
  if (ready.empty()) {
    return;
  }

  std::cout << "[ReconciliationEngine] replaying " << ready.size()
            << " held fill(s) for exchange_order_id=" << exchange_order_id
            << " -> " << *owner << "\n";

  for (const auto& fill : ready) {
    try {
      applyOwnedFill(fill, *owner);
    } catch (const std::exception& e) {
      std::cerr << "[ReconciliationEngine] ERROR: held trade_id="
                << fill.trade_id << " failed: " << e.what()
                << ". Continuing with next fill.\n";
    }
  }
}

void ReconciliationEngine::onOrderUpdate(const OrderUpdateEvent& event) {
  if (event.order.exchange_order_id) {
    replayHeldFills(*event.order.exchange_order_id);
  }

  if (event.previous_state != domain::OrderState::PendingCreate ||
      heldFillCount() == 0 || registry_.pendingCreateCount() > 0) {
    return;
  }

  std::size_t discarded = 0;
  {
    std::lock_guard lock(held_mutex_);
    discarded = held_fills_.size();
    held_fills_.clear();
  }
  if (discarded > 0) {
    std::cerr << "[ReconciliationEngine] WARNING: no order awaits a creation "
                 "ack. Dropping " << discarded << " held fill(s).\n";
  }
}

ApplyOutcome ReconciliationEngine::applyPositions(
    const PositionSnapshot& snapshot) {
  ledger_.applyPositionSnapshot(snapshot.positions);
  return ApplyOutcome::Applied;
}

ApplyOutcome ReconciliationEngine::applyBalances(
    const BalanceSnapshot& snapshot) {
  ledger_.applyBalanceSnapshot(snapshot.balances);
  return ApplyOutcome::Applied;
}

ApplyOutcome ReconciliationEngine::applyFunding(const FundingUpdate& update) {
  return ledger_.applyFundingPayment(update.payment) ? ApplyOutcome::Applied
                                                      : ApplyOutcome::Ignored;
}

}  // namespace recon
