#pragma once

#include "recon/domain/balance.hpp"
#include "recon/domain/funding_payment.hpp"
#include "recon/domain/order.hpp"
#include "recon/domain/position.hpp"
#include "recon/eventbus/event_bus.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace recon {

// -----------------------------------------------------------------------------
// PositionLedger — positions, collateral balances and funding payments
// -----------------------------------------------------------------------------
//
// @brief  Owns the account-level state derived from exchange snapshots:
//         one position per trading pair, one balance per collateral asset,
//         and the most recent funding settlement per pair.
//
// @details
// Snapshot-replace:
//   applyPositionSnapshot() and applyBalanceSnapshot() treat their argument
//   as the complete account state. Entries absent from the snapshot are
//   removed; nothing is merged incrementally. Zero-amount positions are
//   never stored.
//
// Between snapshots:
//   applyFillToPosition() moves the position by each applied fill so the
//   local view does not lag a full poll interval behind execution. The next
//   snapshot overwrites whatever drift this introduced. realized_pnl is the
//   one field that survives a snapshot: the exchange does not report it.
//
// Fill math (signed fill: +amount for Buy, -amount for Sell):
//
//   Case 1 — Increasing (same direction or flat):
//     entry = (amount * entry + fill * price) / (amount + fill)
//     amount += fill
//
//   Case 2 — Decreasing (opposite direction, does not cross zero):
//     realized_pnl += |fill| * (price - entry) * sign(amount)
//     amount += fill
//     entry unchanged
//
//   Case 3 — Crossing zero (reversal):
//     realized_pnl += |amount| * (price - entry) * sign(amount)
//     amount = sign(fill) * (|fill| - |amount|)
//     entry = price
//
// Funding:
//   applyFundingPayment() records a settlement only if it is a real payment
//   (not the "no payment" sentinel) and newer than the one already held for
//   the pair. lastFundingPayment() returns the sentinel for a pair with no
//   recorded payment.
//
// Thread model:
//   positions_, balances_ and funding_ are guarded by one shared_mutex.
//   Writers (snapshot, fill, funding) take unique_lock; readers take
//   shared_lock and receive copies. FundingPaymentEvent is published after
//   the lock is released.
//
// Ownership:
//   Owned by ConnectorCore. Borrows the EventBus.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger(EventBus& bus, double amount_epsilon, bool debug_logging);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // Replaces the position set. Returns the number of positions held after
  // the replace. A pair appearing twice keeps the last entry.
  std::size_t applyPositionSnapshot(const std::vector<domain::Position>& positions);

  // Replaces the balance set. Returns the number of assets held afterwards.
  std::size_t applyBalanceSnapshot(const std::vector<domain::Balance>& balances);

  // Returns true when the payment was recorded (and published).
  bool applyFundingPayment(const domain::FundingPayment& payment);

  // Moves the pair's position by one fill. See class comment for the math.
  void applyFillToPosition(const std::string& trading_pair, domain::Side side,
                           double base_amount, double price);

  std::vector<domain::Position> positions() const;
  std::optional<domain::Position> position(const std::string& trading_pair) const;

  std::vector<domain::Balance> balances() const;
  std::optional<domain::Balance> balance(const std::string& asset) const;

  domain::FundingPayment lastFundingPayment(const std::string& trading_pair) const;

  // -------------------------------------------------------------------------
  // applyFill(pos, signed_fill_qty, fill_price)
  // -------------------------------------------------------------------------
  // Core position math, in place. Public and static so it can be tested
  // without a ledger.
  // -------------------------------------------------------------------------
  static void applyFill(domain::Position& pos, double signed_fill_qty,
                        double fill_price);

 private:
  EventBus& bus_;
  const double amount_epsilon_;
  const bool debug_logging_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, domain::Balance> balances_;
  std::unordered_map<std::string, domain::FundingPayment> funding_;
};

}  // namespace recon
