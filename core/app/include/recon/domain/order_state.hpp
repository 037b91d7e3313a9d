#pragma once

namespace recon {
namespace domain {

// -----------------------------------------------------------------------------
// OrderState — order lifecycle as seen by the connector
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a locally tracked order can occupy between
//         the submission request and its terminal outcome on the exchange.
//
// @details
// Transitions only move forward. The OrderRegistry enforces the graph:
//
//   PendingCreate ──> Open ──> PartiallyFilled ──> Filled
//        │             │  ▲          │   ▲
//        │             └──┘          └───┘
//        │             │             │
//        ├──> Filled   ├──> Filled   ├──> Canceled
//        ├──> Canceled ├──> Canceled
//        └──> Failed   └──> Failed
//
// PendingCreate may also jump straight to PartiallyFilled when a fill
// overtakes the create-order acknowledgment.
//
// Terminal states: Filled, Canceled, Failed. Terminal orders leave the
// active map and move to the bounded completed-order history.
// -----------------------------------------------------------------------------
enum class OrderState {
  PendingCreate,    // Registered locally, exchange has not acknowledged yet
  Open,             // Live on the exchange, nothing filled
  PartiallyFilled,  // Some quantity filled, remainder still live
  Filled,           // Fully filled. Terminal
  Canceled,         // Canceled (explicitly or implicitly). Terminal
  Failed,           // Rejected by the exchange or lost on submit. Terminal
};

inline bool isTerminal(OrderState state) {
  return state == OrderState::Filled || state == OrderState::Canceled ||
         state == OrderState::Failed;
}

inline const char* toString(OrderState state) {
  switch (state) {
    case OrderState::PendingCreate:   return "PendingCreate";
    case OrderState::Open:            return "Open";
    case OrderState::PartiallyFilled: return "PartiallyFilled";
    case OrderState::Filled:          return "Filled";
    case OrderState::Canceled:        return "Canceled";
    case OrderState::Failed:          return "Failed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace recon
