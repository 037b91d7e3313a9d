#pragma once

#include "recon/domain/order_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace recon {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* toString(Side side) {
  return side == Side::Buy ? "Buy" : "Sell";
}

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// LimitMaker is a post-only limit order. Market orders are sent to the
// exchange as immediate-or-cancel.
// -----------------------------------------------------------------------------
enum class OrderType {
  Limit,
  LimitMaker,
  Market,
};

inline const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Limit:      return "Limit";
    case OrderType::LimitMaker: return "LimitMaker";
    case OrderType::Market:     return "Market";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: the connector's view of one order: the original request
// (pair, side, type, price, amount) plus everything learned from the
// exchange since (exchange id, lifecycle state, cumulative fills).
//
// @details
// client_order_id is generated locally before submission and never changes.
// exchange_order_id is empty until the exchange acknowledges the order; once
// set it never changes either. The authoritative copy lives inside the
// OrderRegistry; every Order handed out by a view or carried by an event is
// a snapshot.
//
// Timestamps are epoch milliseconds. creation_timestamp_ms is local.
// last_update_timestamp_ms is the exchange time of the latest applied status
// report and stays 0 until the first one arrives.
// -----------------------------------------------------------------------------
struct Order {
  std::string client_order_id;                 // Local id ("0x" + md5 hex)
  std::optional<std::string> exchange_order_id;  // Assigned on acceptance
  std::string trading_pair;                    // Canonical pair ("ETH-USDC")
  Side side{Side::Buy};
  OrderType order_type{OrderType::Limit};
  double price{0.0};                           // Requested limit price
  double amount{0.0};                          // Requested base amount
  OrderState state{OrderState::PendingCreate};

  double filled_amount{0.0};       // Sum of applied fill base amounts
  double average_fill_price{0.0};  // Volume-weighted over applied fills
  double cumulative_quote{0.0};    // Sum of applied fill quote amounts
  double cumulative_fee{0.0};      // Sum of applied fill fees

  std::int64_t creation_timestamp_ms{0};
  std::int64_t last_update_timestamp_ms{0};

  std::string failure_reason;  // Populated only for Failed orders
};

}  // namespace domain
}  // namespace recon
