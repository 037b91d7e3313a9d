#pragma once

#include "recon/concurrent/client_order_id_factory.hpp"
#include "recon/domain/order.hpp"
#include "recon/registry/order_registry.hpp"
#include "recon/symbols/i_symbol_mapper.hpp"
#include "recon/time/i_time_provider.hpp"
#include "recon/transport/i_exchange_transport.hpp"

#include <optional>
#include <string>

namespace recon {

struct SubmitResult {
  std::string client_order_id;
  std::optional<transport::TransportError> error;  // Set when the order failed

  bool ok() const { return !error.has_value(); }
};

enum class CancelOutcome {
  Canceled,         // Exchange confirmed; order is now Canceled
  AlreadyGone,      // Exchange did not know the order, or it was already terminal
  UnknownOrder,     // Client id never registered (or aged out of history)
  NotAcknowledged,  // No exchange id yet; nothing to cancel against
  Error,            // Transport failure or exchange declined; state unchanged
};

inline const char* toString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::Canceled:        return "Canceled";
    case CancelOutcome::AlreadyGone:     return "AlreadyGone";
    case CancelOutcome::UnknownOrder:    return "UnknownOrder";
    case CancelOutcome::NotAcknowledged: return "NotAcknowledged";
    case CancelOutcome::Error:           return "Error";
  }
  return "Unknown";
}

struct CancelResult {
  CancelOutcome outcome{CancelOutcome::Error};
  std::optional<transport::TransportError> error;
};

// -----------------------------------------------------------------------------
// OrderSubmitter — order entry and cancellation against the exchange
// -----------------------------------------------------------------------------
//
// @brief  Creates client order ids, registers orders before they leave the
//         process, and turns transport outcomes into registry transitions.
//
// @details
// submit():
//   1. Resolve the exchange symbol. Unmapped pair → ValidationError, nothing
//      registered.
//   2. Generate a client order id and register the order (PendingCreate).
//      Registration happens first so a stream report racing the ack always
//      finds the order.
//   3. Send the request. No registry lock is held across the call.
//   4. Ack → processCreationAck (exchange id, Open).
//      Any TransportError → markFailed, including TransientNetwork: a lost
//      request is not retried with the same id.
//
// cancel():
//   true      → processCancelConfirmed (Canceled)
//   NotFound  → processOrderNotFound (Canceled, the exchange forgot it)
//   false     → Error, order left as is; the next poll decides
//   other     → Error, order left as is
//
// Thread model:
//   Called from strategy threads. All state lives in the registry and id
//   factory, both thread-safe.
// -----------------------------------------------------------------------------
class OrderSubmitter {
 public:
  OrderSubmitter(OrderRegistry& registry, transport::IExchangeTransport& transport,
                 const ISymbolMapper& symbols, ClientOrderIdFactory& ids,
                 const ITimeProvider& clock);

  OrderSubmitter(const OrderSubmitter&) = delete;
  OrderSubmitter& operator=(const OrderSubmitter&) = delete;

  // Throws ValidationError for bad parameters or an unmapped pair.
  SubmitResult submit(domain::Side side, const std::string& trading_pair,
                      double amount, domain::OrderType order_type, double price);

  SubmitResult buy(const std::string& trading_pair, double amount,
                   domain::OrderType order_type, double price);
  SubmitResult sell(const std::string& trading_pair, double amount,
                    domain::OrderType order_type, double price);

  CancelResult cancel(const std::string& client_order_id);

 private:
  OrderRegistry& registry_;
  transport::IExchangeTransport& transport_;
  const ISymbolMapper& symbols_;
  ClientOrderIdFactory& ids_;
  const ITimeProvider& clock_;
};

}  // namespace recon
