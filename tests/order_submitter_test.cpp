// =============================================================================
// order_submitter_test.cpp
// =============================================================================
// Unit tests for recon::OrderSubmitter against MockExchangeTransport.
//
// Validates:
//   - A successful submit registers, sends and acknowledges the order
//   - Unmapped pairs and invalid parameters throw before anything is sent
//   - Any transport error on submit moves the order to Failed
//   - Cancel outcomes: confirmed, not found, declined, transport error,
//     unknown id, terminal order, order without exchange id
//   - A cancel confirmed after the order already filled reports AlreadyGone
//   - An acknowledgement the registry refuses fails the submit
// =============================================================================

#include "recon/execution/order_submitter.hpp"
#include "recon/domain/errors.hpp"
#include "recon/eventbus/event_bus.hpp"
#include "recon/symbols/symbol_map.hpp"
#include "recon/time/manual_time_provider.hpp"
#include "recon/transport/mock_exchange_transport.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <utility>

using recon::CancelOutcome;
using recon::domain::OrderState;
using recon::domain::OrderType;
using recon::transport::MockExchangeTransport;
using recon::transport::TransportError;
using recon::transport::TransportErrorKind;
using Endpoint = MockExchangeTransport::Endpoint;

// Forwards to the mock exchange and runs a hook once the exchange has
// answered a cancel, standing in for work done by another thread while the
// cancel response is in flight.
class CancelHookTransport : public recon::transport::IExchangeTransport {
 public:
  CancelHookTransport(MockExchangeTransport& inner, std::function<void()> hook)
      : inner_(inner), hook_(std::move(hook)) {}

  recon::transport::TransportResult<recon::transport::SubmitAck> submitOrder(
      const recon::transport::OrderRequest& request) override {
    return inner_.submitOrder(request);
  }
  recon::transport::TransportResult<bool> cancelOrder(
      const recon::transport::CancelRequest& request) override {
    auto response = inner_.cancelOrder(request);
    hook_();
    return response;
  }
  recon::transport::TransportResult<nlohmann::json> fetchOrderStatus(
      const std::string& exchange_order_id) override {
    return inner_.fetchOrderStatus(exchange_order_id);
  }
  recon::transport::TransportResult<nlohmann::json> fetchTradeHistory() override {
    return inner_.fetchTradeHistory();
  }
  recon::transport::TransportResult<nlohmann::json> fetchBalances() override {
    return inner_.fetchBalances();
  }
  recon::transport::TransportResult<nlohmann::json> fetchPositions() override {
    return inner_.fetchPositions();
  }
  recon::transport::TransportResult<nlohmann::json> fetchFundingHistory(
      const std::string& exchange_symbol, std::int64_t start_ms) override {
    return inner_.fetchFundingHistory(exchange_symbol, start_ms);
  }
  recon::transport::TransportResult<nlohmann::json> fetchInstruments() override {
    return inner_.fetchInstruments();
  }

 private:
  MockExchangeTransport& inner_;
  std::function<void()> hook_;
};

class OrderSubmitterTest : public ::testing::Test {
 protected:
  void SetUp() override { symbols.add("ETH-PERP", "ETH-USDC"); }

  std::string placeOpenOrder() {
    auto result = submitter.buy("ETH-USDC", 1.0, OrderType::Limit, 3000.0);
    EXPECT_TRUE(result.ok());
    return result.client_order_id;
  }

  recon::ManualTimeProvider clock{5'000};
  recon::EventBus bus;
  recon::config::ConnectorConfig config;
  recon::OrderRegistry registry{bus, clock, config};
  recon::SymbolMap symbols;
  MockExchangeTransport exchange{clock};
  recon::ClientOrderIdFactory ids{"HBOT", 32};
  recon::OrderSubmitter submitter{registry, exchange, symbols, ids, clock};
};

// -----------------------------------------------------------------------------
// 1. Happy path: registered, sent with the exchange symbol, acknowledged.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, SubmitAcknowledged) {
  auto result = submitter.sell("ETH-USDC", 0.5, OrderType::Limit, 3100.0);

  ASSERT_TRUE(result.ok());
  auto order = registry.order(result.client_order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->state, OrderState::Open);
  EXPECT_EQ(order->exchange_order_id, "E1");
  EXPECT_EQ(order->side, recon::domain::Side::Sell);
  EXPECT_EQ(order->creation_timestamp_ms, 5'000);

  auto record = exchange.orderRecord("E1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->at("label"), result.client_order_id);
  EXPECT_EQ(record->at("instrument_name"), "ETH-PERP");
  EXPECT_EQ(record->at("direction"), "sell");
}

// -----------------------------------------------------------------------------
// 2. An unmapped pair is rejected before registration and transport.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, UnmappedPairThrows) {
  EXPECT_THROW(submitter.buy("XRP-USDC", 1.0, OrderType::Limit, 0.5),
               recon::ValidationError);
  EXPECT_EQ(registry.activeCount(), 0u);
  EXPECT_EQ(exchange.callCount(Endpoint::Submit), 0u);
}

// -----------------------------------------------------------------------------
// 3. Invalid order parameters never reach the exchange.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, InvalidParametersThrow) {
  EXPECT_THROW(submitter.buy("ETH-USDC", 0.0, OrderType::Limit, 3000.0),
               recon::ValidationError);
  EXPECT_THROW(submitter.buy("ETH-USDC", 1.0, OrderType::Limit, -1.0),
               recon::ValidationError);
  EXPECT_EQ(exchange.callCount(Endpoint::Submit), 0u);
}

// -----------------------------------------------------------------------------
// 4. A rejected submit leaves a Failed order with the reason recorded.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, RejectedSubmitMarksFailed) {
  exchange.failNext(Endpoint::Submit,
                    TransportError{TransportErrorKind::Rejected,
                                   "insufficient margin"});

  auto result = submitter.buy("ETH-USDC", 1.0, OrderType::Limit, 3000.0);

  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, TransportErrorKind::Rejected);
  auto order = registry.order(result.client_order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->state, OrderState::Failed);
  EXPECT_EQ(order->failure_reason, "Rejected: insufficient margin");
  EXPECT_EQ(registry.activeCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. A network failure also fails the order.
// Why: the request may or may not have reached the exchange; retrying
//      with the same client id could place it twice.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, TransientSubmitErrorMarksFailed) {
  exchange.failNext(Endpoint::Submit,
                    TransportError{TransportErrorKind::TransientNetwork,
                                   "connection reset"});

  auto result = submitter.buy("ETH-USDC", 1.0, OrderType::Market, 0.0);

  EXPECT_FALSE(result.ok());
  EXPECT_EQ(registry.order(result.client_order_id)->state, OrderState::Failed);
}

// -----------------------------------------------------------------------------
// 6. A confirmed cancel moves the order to Canceled.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, CancelConfirmed) {
  const std::string id = placeOpenOrder();

  auto result = submitter.cancel(id);

  EXPECT_EQ(result.outcome, CancelOutcome::Canceled);
  EXPECT_EQ(registry.order(id)->state, OrderState::Canceled);
  EXPECT_EQ(exchange.orderRecord("E1")->at("order_status"), "cancelled");
}

// -----------------------------------------------------------------------------
// 7. The exchange no longer knows the order: implicit cancellation.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, CancelNotFoundTreatedAsCanceled) {
  const std::string id = placeOpenOrder();
  exchange.forgetOrder("E1");

  auto result = submitter.cancel(id);

  EXPECT_EQ(result.outcome, CancelOutcome::AlreadyGone);
  EXPECT_EQ(registry.order(id)->state, OrderState::Canceled);
}

// -----------------------------------------------------------------------------
// 8. Declined cancels and transport errors leave the order untouched.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, CancelDeclinedOrFailedLeavesState) {
  const std::string id = placeOpenOrder();

  exchange.declineNextCancel();
  auto declined = submitter.cancel(id);
  EXPECT_EQ(declined.outcome, CancelOutcome::Error);
  ASSERT_TRUE(declined.error.has_value());
  EXPECT_EQ(declined.error->kind, TransportErrorKind::Rejected);
  EXPECT_EQ(registry.order(id)->state, OrderState::Open);

  exchange.failNext(Endpoint::Cancel,
                    TransportError{TransportErrorKind::TransientNetwork, "timeout"});
  auto failed = submitter.cancel(id);
  EXPECT_EQ(failed.outcome, CancelOutcome::Error);
  EXPECT_EQ(registry.order(id)->state, OrderState::Open);

  EXPECT_EQ(submitter.cancel(id).outcome, CancelOutcome::Canceled);
}

// -----------------------------------------------------------------------------
// 9. Cancels that never reach the exchange.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, CancelWithoutExchangeCall) {
  EXPECT_EQ(submitter.cancel("0xnever").outcome, CancelOutcome::UnknownOrder);

  recon::domain::Order pending;
  pending.client_order_id = "0xpending";
  pending.trading_pair = "ETH-USDC";
  pending.price = 3000.0;
  pending.amount = 1.0;
  registry.registerOrder(pending);
  EXPECT_EQ(submitter.cancel("0xpending").outcome,
            CancelOutcome::NotAcknowledged);

  const std::string id = placeOpenOrder();
  ASSERT_EQ(submitter.cancel(id).outcome, CancelOutcome::Canceled);
  EXPECT_EQ(submitter.cancel(id).outcome, CancelOutcome::AlreadyGone);

  EXPECT_EQ(exchange.callCount(Endpoint::Cancel), 1u);
}

// -----------------------------------------------------------------------------
// 10. The order fills completely while the cancel is in flight. The
//     exchange still confirms the cancel, but the registry already retired
//     the order as Filled.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, CancelConfirmedAfterFillReportsAlreadyGone) {
  std::string id;
  CancelHookTransport racing{exchange, [&] {
    recon::domain::Fill fill;
    fill.trade_id = "T-race";
    fill.client_order_id = id;
    fill.exchange_order_id = "E1";
    fill.trading_pair = "ETH-USDC";
    fill.fill_price = 3000.0;
    fill.fill_base_amount = 1.0;
    ASSERT_EQ(registry.applyFill(fill), recon::FillOutcome::Applied);
  }};
  recon::OrderSubmitter racing_submitter{registry, racing, symbols, ids, clock};

  auto placed = racing_submitter.buy("ETH-USDC", 1.0, OrderType::Limit, 3000.0);
  ASSERT_TRUE(placed.ok());
  id = placed.client_order_id;

  auto result = racing_submitter.cancel(id);

  EXPECT_EQ(result.outcome, CancelOutcome::AlreadyGone);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(registry.order(id)->state, OrderState::Filled);
  EXPECT_DOUBLE_EQ(registry.order(id)->filled_amount, 1.0);
}

// -----------------------------------------------------------------------------
// 11. The exchange acknowledges with an id another tracked order already
//     owns. The submit fails and the new order is marked Failed instead of
//     waiting in PendingCreate.
// -----------------------------------------------------------------------------
TEST_F(OrderSubmitterTest, ConflictingAckFailsSubmit) {
  recon::domain::Order other;
  other.client_order_id = "0xother";
  other.trading_pair = "ETH-USDC";
  other.price = 3000.0;
  other.amount = 1.0;
  registry.registerOrder(other);
  ASSERT_TRUE(registry.processCreationAck("0xother", "E1", 10));

  // The mock numbers its orders from E1.
  auto result = submitter.buy("ETH-USDC", 1.0, OrderType::Limit, 3000.0);

  EXPECT_FALSE(result.ok());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, TransportErrorKind::Rejected);
  auto order = registry.order(result.client_order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->state, OrderState::Failed);
  EXPECT_FALSE(order->exchange_order_id.has_value());
  auto owner = registry.findByExchangeOrderId("E1");
  ASSERT_TRUE(owner.has_value());
  EXPECT_EQ(owner->client_order_id, "0xother");
}
