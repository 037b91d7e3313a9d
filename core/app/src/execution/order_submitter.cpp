#include "recon/execution/order_submitter.hpp"
#include "recon/domain/errors.hpp"

#include <iostream>

namespace recon {

using transport::TransportError;
using transport::TransportErrorKind;

OrderSubmitter::OrderSubmitter(OrderRegistry& registry,
                               transport::IExchangeTransport& transport,
                               const ISymbolMapper& symbols,
                               ClientOrderIdFactory& ids,
                               const ITimeProvider& clock)
    : registry_(registry),
      transport_(transport),
      symbols_(symbols),
      ids_(ids),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// submit: register → send → ack or fail
// -----------------------------------------------------------------------------
SubmitResult OrderSubmitter::submit(domain::Side side,
                                    const std::string& trading_pair,
                                    double amount, domain::OrderType order_type,
                                    double price) {
  auto symbol = symbols_.toExchangeSymbol(trading_pair);
  if (!symbol) {
    throw ValidationError("no exchange instrument for trading pair " +
                          trading_pair);
  }

  domain::Order order;
  order.client_order_id = ids_.next(side, trading_pair);
  order.trading_pair = trading_pair;
  order.side = side;
  order.order_type = order_type;
  order.price = price;
  order.amount = amount;
  order.creation_timestamp_ms = clock_.now_ms();

  registry_.registerOrder(order);

  SubmitResult result;
  result.client_order_id = order.client_order_id;

  transport::OrderRequest request;
  request.client_order_id = order.client_order_id;
  request.exchange_symbol = *symbol;
  request.side = side;
  request.order_type = order_type;
  request.price = price;
  request.amount = amount;

  auto response = transport_.submitOrder(request);

  if (auto* error = std::get_if<TransportError>(&response)) {
    std::cerr << "[OrderSubmitter] WARNING: submit " << order.client_order_id
              << " failed (" << toString(error->kind) << "): "
              << error->message << "\n";
    registry_.markFailed(order.client_order_id,
                         std::string(toString(error->kind)) + ": " +
                             error->message,
                         clock_.now_ms());
    result.error = *error;
    return result;
  }

  const auto& ack = std::get<transport::SubmitAck>(response);
  if (!registry_.processCreationAck(order.client_order_id,
                                    ack.exchange_order_id,
                                    ack.accepted_timestamp_ms)) {
    result.error = TransportError{
        TransportErrorKind::Rejected,
        "creation ack not accepted for exchange_order_id " +
            ack.exchange_order_id};
    return result;
  }

  std::cout << "[OrderSubmitter] " << toString(side) << " "
            << amount << " " << trading_pair << " @ " << price
            << " accepted: " << order.client_order_id << " -> "
            << ack.exchange_order_id << "\n";
  return result;
}

SubmitResult OrderSubmitter::buy(const std::string& trading_pair, double amount,
                                 domain::OrderType order_type, double price) {
  return submit(domain::Side::Buy, trading_pair, amount, order_type, price);
}

SubmitResult OrderSubmitter::sell(const std::string& trading_pair, double amount,
                                  domain::OrderType order_type, double price) {
  return submit(domain::Side::Sell, trading_pair, amount, order_type, price);
}

// -----------------------------------------------------------------------------
// cancel
// -----------------------------------------------------------------------------
CancelResult OrderSubmitter::cancel(const std::string& client_order_id) {
  CancelResult result;

  auto order = registry_.order(client_order_id);
  if (!order) {
    result.outcome = CancelOutcome::UnknownOrder;
    return result;
  }
  if (domain::isTerminal(order->state)) {
    result.outcome = CancelOutcome::AlreadyGone;
    return result;
  }
  if (!order->exchange_order_id) {
    result.outcome = CancelOutcome::NotAcknowledged;
    return result;
  }

  transport::CancelRequest request;
  request.client_order_id = client_order_id;
  request.exchange_order_id = *order->exchange_order_id;
  request.exchange_symbol =
      symbols_.toExchangeSymbol(order->trading_pair).value_or(std::string{});

  auto response = transport_.cancelOrder(request);

  if (auto* error = std::get_if<TransportError>(&response)) {
    if (error->kind == TransportErrorKind::NotFound) {
      registry_.processOrderNotFound(client_order_id, clock_.now_ms());
      result.outcome = CancelOutcome::AlreadyGone;
      return result;
    }
    std::cerr << "[OrderSubmitter] WARNING: cancel " << client_order_id
              << " failed (" << toString(error->kind) << "): "
              << error->message << "\n";
    result.outcome = CancelOutcome::Error;
    result.error = *error;
    return result;
  }

  if (!std::get<bool>(response)) {
    std::cerr << "[OrderSubmitter] WARNING: cancel " << client_order_id
              << " declined by exchange. Order state unchanged.\n";
    result.outcome = CancelOutcome::Error;
    result.error = TransportError{TransportErrorKind::Rejected,
                                  "cancel declined"};
    return result;
  }

  // A fill or status on another thread may have finished the order while
  // the cancel was in flight.
  if (!registry_.processCancelConfirmed(client_order_id, clock_.now_ms())) {
    std::cout << "[OrderSubmitter] cancel " << client_order_id
              << " confirmed after the order had already completed.\n";
    result.outcome = CancelOutcome::AlreadyGone;
    return result;
  }
  result.outcome = CancelOutcome::Canceled;
  return result;
}

}  // namespace recon
