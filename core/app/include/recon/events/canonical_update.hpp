#pragma once

#include "recon/domain/balance.hpp"
#include "recon/domain/fill.hpp"
#include "recon/domain/funding_payment.hpp"
#include "recon/domain/order_state.hpp"
#include "recon/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace recon {

// -----------------------------------------------------------------------------
// Canonical updates
// -----------------------------------------------------------------------------
// Source-agnostic facts produced by the EventNormalizer from raw stream and
// poll payloads. Everything downstream of the normalizer (engine, registry,
// ledger) sees only these types; exchange field names and channel strings
// stop at the normalizer.
// -----------------------------------------------------------------------------

// Exchange-reported lifecycle state of one order.
struct OrderStatusUpdate {
  std::string client_order_id;
  std::optional<std::string> exchange_order_id;
  std::string trading_pair;
  domain::OrderState new_state{domain::OrderState::Open};
  std::int64_t update_timestamp_ms{0};
};

// One trade execution. fill.client_order_id is empty until attributed.
struct FillUpdate {
  domain::Fill fill;
};

// Full authoritative position set. Entries with zero amount are already
// filtered out by the normalizer.
struct PositionSnapshot {
  std::vector<domain::Position> positions;
};

// Full authoritative collateral set.
struct BalanceSnapshot {
  std::vector<domain::Balance> balances;
};

// Most recent funding settlement for one pair (possibly the "no payment"
// sentinel).
struct FundingUpdate {
  domain::FundingPayment payment;
};

// -----------------------------------------------------------------------------
// CanonicalUpdate
// -----------------------------------------------------------------------------
// Closed set of update kinds. Routing in the ReconciliationEngine is a
// std::visit over this variant, so adding a kind is a compile error at every
// site that does not handle it.
// -----------------------------------------------------------------------------
using CanonicalUpdate = std::variant<
    OrderStatusUpdate,
    FillUpdate,
    PositionSnapshot,
    BalanceSnapshot,
    FundingUpdate>;

}  // namespace recon
