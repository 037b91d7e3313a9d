#pragma once

#include <string>

namespace recon {
namespace domain {

enum class PositionSide {
  Long,
  Short,
};

inline const char* toString(PositionSide side) {
  return side == PositionSide::Long ? "Long" : "Short";
}

// -----------------------------------------------------------------------------
// Position — per-pair derivatives position (one-way mode)
// -----------------------------------------------------------------------------
//
// @brief  Net exposure on one trading pair as last reported by the exchange,
//         adjusted by fills applied since that report.
//
// @details
// Only one-way position mode is supported: there is at most one position per
// trading pair, and its side follows the sign of amount.
//
// Sign convention for amount:
//   positive → long
//   negative → short
//   zero     → flat; a flat position is removed from the ledger, never kept
//              as a zero row.
//
// entry_price, mark_price, unrealized_pnl and leverage come from the
// exchange's position snapshot. realized_pnl accumulates locally from fills
// applied between snapshots and is carried across snapshot replacement.
//
// Thread model:
//   Value type. The authoritative copy lives inside PositionLedger behind
//   its shared_mutex; callers only ever receive copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string trading_pair;
  PositionSide side{PositionSide::Long};
  double amount{0.0};          // Signed: +long, -short
  double entry_price{0.0};     // Average entry price of the open amount
  double mark_price{0.0};
  double unrealized_pnl{0.0};
  double leverage{0.0};
  double realized_pnl{0.0};    // From fills applied between snapshots
};

}  // namespace domain
}  // namespace recon
