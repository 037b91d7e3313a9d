#include "recon/registry/order_registry.hpp"
#include "recon/domain/errors.hpp"
#include "recon/events/order_filled_event.hpp"
#include "recon/events/order_update_event.hpp"

#include <algorithm>
#include <iostream>

namespace recon {

const char* toString(FillOutcome outcome) {
  switch (outcome) {
    case FillOutcome::Applied:            return "Applied";
    case FillOutcome::DuplicateTrade:     return "DuplicateTrade";
    case FillOutcome::UnknownOrder:       return "UnknownOrder";
    case FillOutcome::ExceedsOrderAmount: return "ExceedsOrderAmount";
    case FillOutcome::InvalidFill:        return "InvalidFill";
  }
  return "Unknown";
}

const char* toString(StatusOutcome outcome) {
  switch (outcome) {
    case StatusOutcome::Applied:           return "Applied";
    case StatusOutcome::UnknownOrder:      return "UnknownOrder";
    case StatusOutcome::Stale:             return "Stale";
    case StatusOutcome::IllegalTransition: return "IllegalTransition";
  }
  return "Unknown";
}

OrderRegistry::OrderRegistry(EventBus& bus, const ITimeProvider& clock,
                             const config::ConnectorConfig& config)
    : bus_(bus),
      clock_(clock),
      fill_epsilon_(config.fill_epsilon),
      history_size_(config.completed_history_size),
      fill_history_size_(config.fill_history_size),
      debug_logging_(config.debug_logging) {}

// -----------------------------------------------------------------------------
// transitionAllowed: forward-only lifecycle graph
// -----------------------------------------------------------------------------
bool OrderRegistry::transitionAllowed(domain::OrderState current,
                                      domain::OrderState next) {
  using S = domain::OrderState;

  switch (current) {
    case S::PendingCreate:
      return next == S::Open ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Failed;

    case S::Open:
      return next == S::Open ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Failed;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled;

    case S::Filled:
    case S::Canceled:
    case S::Failed:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// registerOrder
// -----------------------------------------------------------------------------
domain::Order OrderRegistry::registerOrder(const domain::Order& order) {
  if (order.client_order_id.empty()) {
    throw ValidationError("client order id must not be empty");
  }
  if (order.trading_pair.empty()) {
    throw ValidationError("trading pair must not be empty for order " +
                          order.client_order_id);
  }
  if (!(order.amount > 0.0)) {
    throw ValidationError("order amount must be positive for order " +
                          order.client_order_id);
  }
  if (order.order_type != domain::OrderType::Market && !(order.price > 0.0)) {
    throw ValidationError("limit price must be positive for order " +
                          order.client_order_id);
  }

  domain::Order fresh = order;
  fresh.exchange_order_id.reset();
  fresh.state = domain::OrderState::PendingCreate;
  fresh.filled_amount = 0.0;
  fresh.average_fill_price = 0.0;
  fresh.cumulative_quote = 0.0;
  fresh.cumulative_fee = 0.0;
  fresh.failure_reason.clear();
  if (fresh.creation_timestamp_ms == 0) {
    fresh.creation_timestamp_ms = clock_.now_ms();
  }
  // Local and exchange clocks are not comparable; the first exchange report
  // must never look stale against the registration time.
  fresh.last_update_timestamp_ms = 0;

  {
    std::lock_guard lock(mutex_);
    if (findLocked(fresh.client_order_id) != nullptr) {
      throw DuplicateOrderError(fresh.client_order_id);
    }
    active_.emplace(fresh.client_order_id, TrackedOrder{fresh, {}});
  }

  OrderUpdateEvent update;
  update.order = fresh;
  update.previous_state = domain::OrderState::PendingCreate;
  bus_.publish(update);

  return fresh;
}

// -----------------------------------------------------------------------------
// applyStatusUpdate: last-update-wins, forward-only
// -----------------------------------------------------------------------------
StatusOutcome OrderRegistry::applyStatusUpdate(const OrderStatusUpdate& update) {
  std::vector<Event> pending;

  {
    std::lock_guard lock(mutex_);

    auto it = active_.find(update.client_order_id);
    if (it == active_.end()) {
      if (debug_logging_) {
        std::cout << "[OrderRegistry] DEBUG: status update for untracked "
                     "client_order_id=" << update.client_order_id
                  << ". Ignoring.\n";
      }
      return StatusOutcome::UnknownOrder;
    }

    domain::Order& order = it->second.order;

    if (update.update_timestamp_ms < order.last_update_timestamp_ms) {
      if (debug_logging_) {
        std::cout << "[OrderRegistry] DEBUG: stale status update for "
                  << order.client_order_id << " (ts="
                  << update.update_timestamp_ms << " < "
                  << order.last_update_timestamp_ms << "). Ignoring.\n";
      }
      return StatusOutcome::Stale;
    }

    domain::OrderState next = update.new_state;
    if (order.state == domain::OrderState::PartiallyFilled &&
        next == domain::OrderState::Open) {
      next = domain::OrderState::PartiallyFilled;
    }

    if (!transitionAllowed(order.state, next)) {
      std::cerr << "[OrderRegistry] WARNING: illegal transition for "
                << order.client_order_id << " from " << toString(order.state)
                << " to " << toString(next) << ". Skipping.\n";
      return StatusOutcome::IllegalTransition;
    }

    bool id_assigned = false;
    if (update.exchange_order_id) {
      if (!order.exchange_order_id) {
        auto [idx, inserted] = exchange_index_.emplace(
            *update.exchange_order_id, order.client_order_id);
        if (inserted) {
          order.exchange_order_id = update.exchange_order_id;
          id_assigned = true;
        } else {
          std::cerr << "[OrderRegistry] WARNING: exchange_order_id="
                    << *update.exchange_order_id << " already belongs to "
                    << idx->second << ", not assigning to "
                    << order.client_order_id << ".\n";
        }
      } else if (*order.exchange_order_id != *update.exchange_order_id) {
        std::cerr << "[OrderRegistry] WARNING: conflicting exchange_order_id "
                     "for " << order.client_order_id << " (have "
                  << *order.exchange_order_id << ", got "
                  << *update.exchange_order_id << "). Keeping original.\n";
      }
    }

    const domain::OrderState previous = order.state;
    order.state = next;
    order.last_update_timestamp_ms = update.update_timestamp_ms;

    if (previous != next || id_assigned) {
      OrderUpdateEvent event;
      event.order = order;
      event.previous_state = previous;
      pending.emplace_back(std::move(event));
    }

    if (domain::isTerminal(next)) {
      retireLocked(update.client_order_id);
    }
  }

  publishAll(pending);
  return StatusOutcome::Applied;
}

// -----------------------------------------------------------------------------
// applyFill: at most once per trade id, bounded by amount + epsilon
// -----------------------------------------------------------------------------
FillOutcome OrderRegistry::applyFill(const domain::Fill& fill) {
  if (!(fill.fill_base_amount > 0.0)) {
    std::cerr << "[OrderRegistry] WARNING: trade_id=" << fill.trade_id
              << " has non-positive amount " << fill.fill_base_amount
              << ". Dropping.\n";
    return FillOutcome::InvalidFill;
  }

  std::vector<Event> pending;

  {
    std::lock_guard lock(mutex_);

    TrackedOrder* tracked = findLocked(fill.client_order_id);
    if (tracked == nullptr) {
      std::cerr << "[OrderRegistry] WARNING: fill trade_id=" << fill.trade_id
                << " for untracked client_order_id=" << fill.client_order_id
                << ". Dropping.\n";
      return FillOutcome::UnknownOrder;
    }

    if (tracked->applied_trade_ids.count(fill.trade_id) != 0) {
      if (debug_logging_) {
        std::cout << "[OrderRegistry] DEBUG: duplicate trade_id="
                  << fill.trade_id << " for " << fill.client_order_id
                  << ". Ignoring.\n";
      }
      return FillOutcome::DuplicateTrade;
    }

    domain::Order& order = tracked->order;
    const double new_filled = order.filled_amount + fill.fill_base_amount;
    if (new_filled > order.amount + fill_epsilon_) {
      std::cerr << "[OrderRegistry] WARNING: trade_id=" << fill.trade_id
                << " would fill " << new_filled << " of " << order.amount
                << " for " << order.client_order_id << ". Rejecting.\n";
      return FillOutcome::ExceedsOrderAmount;
    }

    order.average_fill_price =
        (order.average_fill_price * order.filled_amount +
         fill.fill_price * fill.fill_base_amount) / new_filled;
    order.filled_amount = new_filled;
    order.cumulative_quote += fill.fill_quote_amount;
    order.cumulative_fee += fill.fee_amount;

    const bool is_active = active_.count(order.client_order_id) != 0;
    if (is_active && !order.exchange_order_id &&
        !fill.exchange_order_id.empty() &&
        exchange_index_.emplace(fill.exchange_order_id, order.client_order_id)
            .second) {
      order.exchange_order_id = fill.exchange_order_id;
    }

    tracked->applied_trade_ids.insert(fill.trade_id);

    domain::Fill recorded = fill;
    recorded.client_order_id = order.client_order_id;
    fill_history_.push_back(recorded);
    while (fill_history_.size() > fill_history_size_) {
      fill_history_.pop_front();
    }

    const domain::OrderState previous = order.state;
    if (is_active) {
      if (new_filled >= order.amount - fill_epsilon_) {
        order.state = domain::OrderState::Filled;
      } else {
        order.state = domain::OrderState::PartiallyFilled;
      }
    }

    OrderFilledEvent filled_event;
    filled_event.fill = recorded;
    filled_event.order = order;
    pending.emplace_back(std::move(filled_event));

    if (order.state != previous) {
      OrderUpdateEvent update;
      update.order = order;
      update.previous_state = previous;
      pending.emplace_back(std::move(update));
    }

    if (is_active && domain::isTerminal(order.state)) {
      retireLocked(order.client_order_id);
    }
  }

  publishAll(pending);
  return FillOutcome::Applied;
}

// -----------------------------------------------------------------------------
// processCreationAck
// -----------------------------------------------------------------------------
bool OrderRegistry::processCreationAck(const std::string& client_order_id,
                                       const std::string& exchange_order_id,
                                       std::int64_t timestamp_ms) {
  std::vector<Event> pending;
  bool accepted = true;

  {
    std::lock_guard lock(mutex_);

    auto it = active_.find(client_order_id);
    if (it == active_.end()) {
      std::cerr << "[OrderRegistry] WARNING: creation ack for untracked "
                   "client_order_id=" << client_order_id << ".\n";
      return false;
    }

    domain::Order& order = it->second.order;
    const domain::OrderState previous = order.state;
    bool changed = false;

    if (!order.exchange_order_id) {
      auto [idx, inserted] =
          exchange_index_.emplace(exchange_order_id, client_order_id);
      if (!inserted) {
        // The exchange will never report this order under its own id, so
        // it can neither fill nor be canceled through the registry.
        const std::string reason = "exchange_order_id " + exchange_order_id +
                                   " already belongs to " + idx->second;
        std::cerr << "[OrderRegistry] ERROR: creation ack for "
                  << client_order_id << " rejected: " << reason
                  << ". Marking failed.\n";
        terminateLocked(client_order_id, domain::OrderState::Failed,
                        timestamp_ms, reason, pending);
        accepted = false;
      } else {
        order.exchange_order_id = exchange_order_id;
        changed = true;
      }
    } else if (*order.exchange_order_id != exchange_order_id) {
      std::cerr << "[OrderRegistry] WARNING: creation ack for "
                << client_order_id << " carries exchange_order_id="
                << exchange_order_id << ", already have "
                << *order.exchange_order_id << ". Keeping original.\n";
    }

    if (accepted) {
      if (order.state == domain::OrderState::PendingCreate) {
        order.state = domain::OrderState::Open;
        changed = true;
      }
      order.last_update_timestamp_ms =
          std::max(order.last_update_timestamp_ms, timestamp_ms);

      if (changed) {
        OrderUpdateEvent update;
        update.order = order;
        update.previous_state = previous;
        pending.emplace_back(std::move(update));
      }
    }
  }

  publishAll(pending);
  return accepted;
}

bool OrderRegistry::processCancelConfirmed(const std::string& client_order_id,
                                           std::int64_t timestamp_ms) {
  std::vector<Event> pending;
  bool done = false;
  {
    std::lock_guard lock(mutex_);
    done = terminateLocked(client_order_id, domain::OrderState::Canceled,
                           timestamp_ms, {}, pending);
  }
  publishAll(pending);
  return done;
}

bool OrderRegistry::processOrderNotFound(const std::string& client_order_id,
                                         std::int64_t timestamp_ms) {
  std::vector<Event> pending;
  bool done = false;
  {
    std::lock_guard lock(mutex_);
    done = terminateLocked(client_order_id, domain::OrderState::Canceled,
                           timestamp_ms, {}, pending);
  }
  if (done) {
    std::cout << "[OrderRegistry] Order " << client_order_id
              << " not found on exchange. Treating as canceled.\n";
  }
  publishAll(pending);
  return done;
}

bool OrderRegistry::markFailed(const std::string& client_order_id,
                               const std::string& reason,
                               std::int64_t timestamp_ms) {
  std::vector<Event> pending;
  bool done = false;
  {
    std::lock_guard lock(mutex_);
    done = terminateLocked(client_order_id, domain::OrderState::Failed,
                           timestamp_ms, reason, pending);
  }
  publishAll(pending);
  return done;
}

// -----------------------------------------------------------------------------
// Views
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderRegistry::activeOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(active_.size());
  for (const auto& [id, tracked] : active_) {
    result.push_back(tracked.order);
  }
  return result;
}

std::unordered_map<std::string, domain::Order>
OrderRegistry::activeOrdersByExchangeId() const {
  std::lock_guard lock(mutex_);
  std::unordered_map<std::string, domain::Order> result;
  for (const auto& [exchange_id, client_id] : exchange_index_) {
    auto it = active_.find(client_id);
    if (it != active_.end()) {
      result.emplace(exchange_id, it->second.order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderRegistry::tradePollableOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, tracked] : active_) {
    if (tracked.order.exchange_order_id) {
      result.push_back(tracked.order);
    }
  }
  return result;
}

std::optional<domain::Order> OrderRegistry::order(
    const std::string& client_order_id) const {
  std::lock_guard lock(mutex_);
  const TrackedOrder* tracked = findLocked(client_order_id);
  if (tracked == nullptr) {
    return std::nullopt;
  }
  return tracked->order;
}

std::optional<domain::Order> OrderRegistry::findByExchangeOrderId(
    const std::string& exchange_order_id) const {
  std::lock_guard lock(mutex_);
  auto idx = exchange_index_.find(exchange_order_id);
  if (idx == exchange_index_.end()) {
    return std::nullopt;
  }
  auto it = active_.find(idx->second);
  if (it == active_.end()) {
    return std::nullopt;
  }
  return it->second.order;
}

std::vector<domain::Order> OrderRegistry::scanActiveByExchangeOrderId(
    const std::string& exchange_order_id) const {
  std::vector<domain::Order> matches;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, tracked] : active_) {
      if (tracked.order.exchange_order_id == exchange_order_id) {
        matches.push_back(tracked.order);
      }
    }
  }
  std::sort(matches.begin(), matches.end(),
            [](const domain::Order& a, const domain::Order& b) {
              if (a.creation_timestamp_ms != b.creation_timestamp_ms) {
                return a.creation_timestamp_ms < b.creation_timestamp_ms;
              }
              return a.client_order_id < b.client_order_id;
            });
  return matches;
}

std::optional<domain::Order> OrderRegistry::findCompletedByExchangeOrderId(
    const std::string& exchange_order_id) const {
  std::lock_guard lock(mutex_);
  for (auto it = completed_.rbegin(); it != completed_.rend(); ++it) {
    if (it->order.exchange_order_id == exchange_order_id) {
      return it->order;
    }
  }
  return std::nullopt;
}

std::vector<domain::Order> OrderRegistry::completedOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(completed_.size());
  for (const auto& tracked : completed_) {
    result.push_back(tracked.order);
  }
  return result;
}

std::vector<domain::Fill> OrderRegistry::fillHistory() const {
  std::lock_guard lock(mutex_);
  return {fill_history_.begin(), fill_history_.end()};
}

std::size_t OrderRegistry::activeCount() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

std::size_t OrderRegistry::pendingCreateCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(active_.begin(), active_.end(), [](const auto& entry) {
        return entry.second.order.state == domain::OrderState::PendingCreate &&
               !entry.second.order.exchange_order_id;
      }));
}

// -----------------------------------------------------------------------------
// Private helpers (mutex_ held by caller)
// -----------------------------------------------------------------------------
OrderRegistry::TrackedOrder* OrderRegistry::findLocked(
    const std::string& client_order_id) {
  auto it = active_.find(client_order_id);
  if (it != active_.end()) {
    return &it->second;
  }
  for (auto& tracked : completed_) {
    if (tracked.order.client_order_id == client_order_id) {
      return &tracked;
    }
  }
  return nullptr;
}

const OrderRegistry::TrackedOrder* OrderRegistry::findLocked(
    const std::string& client_order_id) const {
  return const_cast<OrderRegistry*>(this)->findLocked(client_order_id);
}

void OrderRegistry::retireLocked(const std::string& client_order_id) {
  auto it = active_.find(client_order_id);
  if (it == active_.end()) {
    return;
  }
  if (it->second.order.exchange_order_id) {
    exchange_index_.erase(*it->second.order.exchange_order_id);
  }
  completed_.push_back(std::move(it->second));
  active_.erase(it);

  while (completed_.size() > history_size_) {
    completed_.pop_front();
  }
}

bool OrderRegistry::terminateLocked(const std::string& client_order_id,
                                    domain::OrderState next,
                                    std::int64_t timestamp_ms,
                                    const std::string& reason,
                                    std::vector<Event>& pending) {
  auto it = active_.find(client_order_id);
  if (it == active_.end()) {
    if (debug_logging_) {
      std::cout << "[OrderRegistry] DEBUG: " << toString(next)
                << " for untracked client_order_id=" << client_order_id
                << ". Ignoring.\n";
    }
    return false;
  }

  domain::Order& order = it->second.order;
  if (!transitionAllowed(order.state, next)) {
    std::cerr << "[OrderRegistry] WARNING: illegal transition for "
              << client_order_id << " from " << toString(order.state)
              << " to " << toString(next) << ". Skipping.\n";
    return false;
  }

  const domain::OrderState previous = order.state;
  order.state = next;
  order.last_update_timestamp_ms =
      std::max(order.last_update_timestamp_ms, timestamp_ms);
  if (!reason.empty()) {
    order.failure_reason = reason;
  }

  OrderUpdateEvent update;
  update.order = order;
  update.previous_state = previous;
  pending.emplace_back(std::move(update));

  retireLocked(client_order_id);
  return true;
}

void OrderRegistry::publishAll(const std::vector<Event>& events) {
  for (const auto& event : events) {
    bus_.publish(event);
  }
}

}  // namespace recon
