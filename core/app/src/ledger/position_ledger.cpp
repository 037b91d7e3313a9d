#include "recon/ledger/position_ledger.hpp"
#include "recon/events/funding_payment_event.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

namespace recon {

PositionLedger::PositionLedger(EventBus& bus, double amount_epsilon,
                               bool debug_logging)
    : bus_(bus), amount_epsilon_(amount_epsilon), debug_logging_(debug_logging) {}

// -----------------------------------------------------------------------------
// applyPositionSnapshot: full replace, realized PnL carried over
// -----------------------------------------------------------------------------
std::size_t PositionLedger::applyPositionSnapshot(
    const std::vector<domain::Position>& positions) {
  std::unordered_map<std::string, domain::Position> next;
  next.reserve(positions.size());

  std::unique_lock lock(mutex_);

  for (const auto& incoming : positions) {
    if (std::abs(incoming.amount) <= amount_epsilon_) {
      continue;
    }
    if (next.count(incoming.trading_pair) != 0) {
      std::cerr << "[PositionLedger] WARNING: position snapshot lists "
                << incoming.trading_pair << " twice. Keeping the last entry.\n";
    }

    domain::Position pos = incoming;
    pos.side = pos.amount > 0.0 ? domain::PositionSide::Long
                                : domain::PositionSide::Short;
    if (auto it = positions_.find(pos.trading_pair); it != positions_.end()) {
      pos.realized_pnl = it->second.realized_pnl;
    }
    next[pos.trading_pair] = pos;
  }

  if (debug_logging_) {
    for (const auto& [pair, pos] : positions_) {
      if (next.count(pair) == 0) {
        std::cout << "[PositionLedger] DEBUG: position " << pair
                  << " closed by snapshot.\n";
      }
    }
  }

  positions_.swap(next);
  return positions_.size();
}

// -----------------------------------------------------------------------------
// applyBalanceSnapshot: full replace
// -----------------------------------------------------------------------------
std::size_t PositionLedger::applyBalanceSnapshot(
    const std::vector<domain::Balance>& balances) {
  std::unordered_map<std::string, domain::Balance> next;
  next.reserve(balances.size());
  for (const auto& balance : balances) {
    next[balance.asset] = balance;
  }

  std::unique_lock lock(mutex_);
  balances_.swap(next);
  return balances_.size();
}

// -----------------------------------------------------------------------------
// applyFundingPayment: dedup by timestamp, sentinel ignored
// -----------------------------------------------------------------------------
bool PositionLedger::applyFundingPayment(const domain::FundingPayment& payment) {
  if (!payment.isPayment()) {
    if (debug_logging_) {
      std::cout << "[PositionLedger] DEBUG: no funding payment for "
                << payment.trading_pair << ".\n";
    }
    return false;
  }

  {
    std::unique_lock lock(mutex_);
    auto it = funding_.find(payment.trading_pair);
    if (it != funding_.end() && payment.timestamp_ms <= it->second.timestamp_ms) {
      return false;
    }
    funding_[payment.trading_pair] = payment;
  }

  std::cout << "[PositionLedger] Funding payment " << payment.payment
            << " on " << payment.trading_pair << " (rate "
            << payment.funding_rate << ", ts " << payment.timestamp_ms << ")\n";

  FundingPaymentEvent event;
  event.payment = payment;
  bus_.publish(event);
  return true;
}

// -----------------------------------------------------------------------------
// applyFillToPosition: incremental drift between snapshots
// -----------------------------------------------------------------------------
void PositionLedger::applyFillToPosition(const std::string& trading_pair,
                                         domain::Side side, double base_amount,
                                         double price) {
  const double signed_fill_qty =
      (side == domain::Side::Buy) ? base_amount : -base_amount;

  std::unique_lock lock(mutex_);

  domain::Position& pos = positions_[trading_pair];
  if (pos.trading_pair.empty()) {
    pos.trading_pair = trading_pair;
  }

  applyFill(pos, signed_fill_qty, price);

  if (std::abs(pos.amount) <= amount_epsilon_) {
    positions_.erase(trading_pair);
    return;
  }
  pos.side = pos.amount > 0.0 ? domain::PositionSide::Long
                              : domain::PositionSide::Short;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionLedger::positions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [pair, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::optional<domain::Position> PositionLedger::position(
    const std::string& trading_pair) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(trading_pair);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Balance> PositionLedger::balances() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Balance> result;
  result.reserve(balances_.size());
  for (const auto& [asset, balance] : balances_) {
    result.push_back(balance);
  }
  return result;
}

std::optional<domain::Balance> PositionLedger::balance(
    const std::string& asset) const {
  std::shared_lock lock(mutex_);
  auto it = balances_.find(asset);
  if (it == balances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::FundingPayment PositionLedger::lastFundingPayment(
    const std::string& trading_pair) const {
  std::shared_lock lock(mutex_);
  auto it = funding_.find(trading_pair);
  if (it == funding_.end()) {
    return domain::FundingPayment::none(trading_pair);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// applyFill: position math (static)
// -----------------------------------------------------------------------------
void PositionLedger::applyFill(domain::Position& pos, double signed_fill_qty,
                               double fill_price) {
  const double current_qty = pos.amount;

  // Flat: the fill opens a new position.
  if (current_qty == 0.0) {
    pos.amount = signed_fill_qty;
    pos.entry_price = fill_price;
    return;
  }

  const bool same_direction =
      (current_qty > 0.0 && signed_fill_qty > 0.0) ||
      (current_qty < 0.0 && signed_fill_qty < 0.0);

  if (same_direction) {
    // Case 1: increasing.
    const double new_total = current_qty + signed_fill_qty;
    pos.entry_price =
        (current_qty * pos.entry_price + signed_fill_qty * fill_price) /
        new_total;
    pos.amount = new_total;
    return;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(signed_fill_qty);
  const double direction_sign = (current_qty > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    // Case 2: decreasing, entry price unchanged.
    pos.realized_pnl +=
        abs_fill * (fill_price - pos.entry_price) * direction_sign;
    pos.amount = current_qty + signed_fill_qty;
    return;
  }

  // Case 3: crossing zero. Close everything, then open the remainder.
  pos.realized_pnl +=
      abs_current * (fill_price - pos.entry_price) * direction_sign;
  const double new_direction_sign = (signed_fill_qty > 0.0) ? 1.0 : -1.0;
  pos.amount = new_direction_sign * (abs_fill - abs_current);
  pos.entry_price = fill_price;
}

}  // namespace recon
