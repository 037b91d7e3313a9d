// =============================================================================
// reconciliation_engine_test.cpp
// =============================================================================
// Unit tests for recon::ReconciliationEngine.
//
// Validates:
//   - Stream and poll payloads converge on the same registry state
//   - A trade seen on both channels is applied once
//   - A slow poll status cannot overwrite a newer stream status
//   - Fill owner resolution: index, completed history, unattributable
//   - Fills that race ahead of the creation ack are held, then applied once
//     the ack or a status update names the owner
//   - Applied fills move the ledger position
//   - Error envelopes count as failed; bad records count as dropped
//   - Snapshots and funding route to the ledger; the sentinel is ignored
// =============================================================================

#include "recon/reconciliation/reconciliation_engine.hpp"
#include "recon/eventbus/event_bus.hpp"
#include "recon/symbols/symbol_map.hpp"
#include "recon/time/manual_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

using nlohmann::json;
using recon::ApplySummary;
using recon::Channel;
using recon::MessageKind;
using recon::RawMessage;
using recon::domain::OrderState;

class ReconciliationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override { symbols.add("ETH-PERP", "ETH-USDC"); }

  void openOrder(const std::string& id, const std::string& exid,
                 double amount = 1.0,
                 recon::domain::Side side = recon::domain::Side::Buy) {
    recon::domain::Order o;
    o.client_order_id = id;
    o.trading_pair = "ETH-USDC";
    o.side = side;
    o.price = 3000.0;
    o.amount = amount;
    registry.registerOrder(o);
    ASSERT_TRUE(registry.processCreationAck(id, exid, 100));
  }

  static json trade(const std::string& trade_id, const std::string& exid,
                    double amount, double price = 3000.0) {
    return {{"trade_id", trade_id},
            {"order_id", exid},
            {"instrument_name", "ETH-PERP"},
            {"trade_price", price},
            {"trade_amount", amount},
            {"trade_fee", 0.1},
            {"timestamp", 1000}};
  }

  static json orderRecord(const std::string& id, const std::string& exid,
                          const std::string& status, std::int64_t ts) {
    return {{"label", id},
            {"order_id", exid},
            {"order_status", status},
            {"instrument_name", "ETH-PERP"},
            {"last_update_timestamp", ts}};
  }

  // Stream frames carry the bare "data" list.
  ApplySummary stream(MessageKind kind, const json& data) {
    RawMessage raw;
    raw.source = Channel::Stream;
    raw.kind = kind;
    raw.payload = data;
    return engine.onStreamEvent(raw);
  }

  // Poll responses carry the REST envelope.
  ApplySummary poll(MessageKind kind, const json& body) {
    RawMessage raw;
    raw.source = Channel::Poll;
    raw.kind = kind;
    raw.payload = body;
    return engine.onPollSnapshot(raw);
  }

  recon::SymbolMap symbols;
  recon::EventNormalizer normalizer{symbols};
  recon::EventBus bus;
  recon::ManualTimeProvider clock{1'000'000};
  recon::config::ConnectorConfig config;
  recon::OrderRegistry registry{bus, clock, config};
  recon::PositionLedger ledger{bus, config.fill_epsilon, false};
  recon::ReconciliationEngine engine{normalizer, registry, ledger, bus};
};

// -----------------------------------------------------------------------------
// 1. The same fill reaches the same state by stream or by poll.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, StreamAndPollConverge) {
  openOrder("via-stream", "E1");
  openOrder("via-poll", "E2");

  auto s = stream(MessageKind::Trade, json::array({trade("T1", "E1", 0.4)}));
  auto p = poll(MessageKind::Trade,
                {{"result", {{"trades", json::array({trade("T2", "E2", 0.4)})}}}});

  EXPECT_EQ(s.applied, 1u);
  EXPECT_EQ(p.applied, 1u);

  auto a = registry.order("via-stream");
  auto b = registry.order("via-poll");
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->state, b->state);
  EXPECT_DOUBLE_EQ(a->filled_amount, b->filled_amount);
  EXPECT_DOUBLE_EQ(a->average_fill_price, b->average_fill_price);
  EXPECT_EQ(a->state, OrderState::PartiallyFilled);
}

// -----------------------------------------------------------------------------
// 2. A trade delivered by the stream and later by the trade poll counts
//    once, in the registry and in the ledger.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, DuplicateTradeAcrossChannelsIgnored) {
  openOrder("c1", "E1");

  auto first = stream(MessageKind::Trade, json::array({trade("T1", "E1", 0.5)}));
  auto second = poll(MessageKind::Trade,
                     {{"result", {{"trades", json::array({trade("T1", "E1", 0.5)})}}}});

  EXPECT_EQ(first.applied, 1u);
  EXPECT_EQ(second.applied, 0u);
  EXPECT_EQ(second.ignored, 1u);
  EXPECT_DOUBLE_EQ(registry.order("c1")->filled_amount, 0.5);
  ASSERT_TRUE(ledger.position("ETH-USDC").has_value());
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 0.5);
}

// -----------------------------------------------------------------------------
// 3. The stream reports the order at t=500; a poll snapshot taken at t=400
//    arrives afterwards. The poll result is ignored.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, SlowPollCannotOverwriteStream) {
  registry.registerOrder([] {
    recon::domain::Order o;
    o.client_order_id = "c2";
    o.trading_pair = "ETH-USDC";
    o.price = 3000.0;
    o.amount = 1.0;
    return o;
  }());

  auto s = stream(MessageKind::OrderStatus,
                  json::array({orderRecord("c2", "E2", "open", 500)}));
  auto p = poll(MessageKind::OrderStatus,
                {{"result", orderRecord("c2", "E2", "open", 400)}});

  EXPECT_EQ(s.applied, 1u);
  EXPECT_EQ(p.ignored, 1u);
  EXPECT_EQ(registry.order("c2")->last_update_timestamp_ms, 500);
  EXPECT_EQ(registry.order("c2")->exchange_order_id, "E2");
}

// -----------------------------------------------------------------------------
// 4. Trades that arrive after the terminal status resolve through the
//    completed history.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, FillAfterFilledStatusResolvesFromHistory) {
  openOrder("c1", "E1");

  auto status = stream(MessageKind::OrderStatus,
                       json::array({orderRecord("c1", "E1", "filled", 900)}));
  ASSERT_EQ(status.applied, 1u);
  ASSERT_EQ(registry.activeCount(), 0u);

  auto fills = stream(MessageKind::Trade, json::array({trade("T1", "E1", 1.0)}));

  EXPECT_EQ(fills.applied, 1u);
  EXPECT_DOUBLE_EQ(registry.order("c1")->filled_amount, 1.0);
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 1.0);
}

// -----------------------------------------------------------------------------
// 5. A fill for an order this session never placed is dropped.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, UnattributableFillDropped) {
  auto summary = stream(MessageKind::Trade, json::array({trade("T9", "E404", 1.0)}));

  EXPECT_EQ(summary.applied, 0u);
  EXPECT_EQ(summary.dropped, 1u);
  EXPECT_TRUE(registry.fillHistory().empty());
  EXPECT_FALSE(ledger.position("ETH-USDC").has_value());

  recon::domain::Fill orphan;
  orphan.exchange_order_id = "E404";
  EXPECT_FALSE(engine.resolveFillOwner(orphan).has_value());
}

// -----------------------------------------------------------------------------
// 6. Sell fills move the position short.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, SellFillShortsPosition) {
  openOrder("c1", "E1", 2.0, recon::domain::Side::Sell);

  stream(MessageKind::Trade, json::array({trade("T1", "E1", 2.0, 3100.0)}));

  auto position = ledger.position("ETH-USDC");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->amount, -2.0);
  EXPECT_DOUBLE_EQ(position->entry_price, 3100.0);
  EXPECT_EQ(position->side, recon::domain::PositionSide::Short);
}

// -----------------------------------------------------------------------------
// 7. Error envelopes fail the whole payload; bad records are dropped and
//    the good ones in the same payload still apply.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, ErrorsAndDroppedRecordsCounted) {
  openOrder("c1", "E1");

  auto failed = poll(MessageKind::Trade, {{"error", {{"message", "timeout"}}}});
  EXPECT_EQ(failed.failed, 1u);
  EXPECT_EQ(failed.applied, 0u);

  json unknown_instrument = trade("T2", "E1", 0.1);
  unknown_instrument["instrument_name"] = "DOGE-PERP";
  auto mixed = stream(MessageKind::Trade,
                      json::array({unknown_instrument, trade("T1", "E1", 0.1)}));
  EXPECT_EQ(mixed.dropped, 1u);
  EXPECT_EQ(mixed.applied, 1u);
  EXPECT_EQ(mixed.total(), 2u);
}

// -----------------------------------------------------------------------------
// 8. A backwards status is dropped, not applied.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, IllegalTransitionDropped) {
  openOrder("c1", "E1");
  stream(MessageKind::Trade, json::array({trade("T1", "E1", 0.2)}));

  auto summary = poll(MessageKind::OrderStatus,
                      {{"result", orderRecord("c1", "E1", "rejected", 2000)}});

  EXPECT_EQ(summary.dropped, 1u);
  EXPECT_EQ(registry.order("c1")->state, OrderState::PartiallyFilled);
}

// -----------------------------------------------------------------------------
// 9. Snapshots replace ledger state; the funding sentinel is ignored.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, SnapshotsAndFundingRouteToLedger) {
  auto balances = poll(MessageKind::BalanceSnapshot,
                       json::parse(R"({"result":{"collaterals":[
                         {"asset_name":"USDC","amount":"500","available":"400"}]}})"));
  auto positions = poll(MessageKind::PositionSnapshot,
                        json::parse(R"({"result":{"positions":[
                          {"instrument_name":"ETH-PERP","amount":"1.5",
                           "average_price":"2900"}]}})"));
  EXPECT_EQ(balances.applied, 1u);
  EXPECT_EQ(positions.applied, 1u);
  EXPECT_DOUBLE_EQ(ledger.balance("USDC")->available, 400.0);
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 1.5);

  RawMessage funding;
  funding.source = Channel::Poll;
  funding.kind = MessageKind::FundingEvent;
  funding.trading_pair_hint = "ETH-USDC";
  funding.payload = json::parse(R"({"result":{"events":[]}})");
  EXPECT_EQ(engine.onPollSnapshot(funding).ignored, 1u);

  funding.payload = json::parse(R"({"result":{"events":[
    {"instrument_name":"ETH-PERP","funding":"-0.75","funding_rate":"0.0001",
     "timestamp":3600000}]}})");
  EXPECT_EQ(engine.onPollSnapshot(funding).applied, 1u);
  // Same settlement again: already recorded.
  EXPECT_EQ(engine.onPollSnapshot(funding).ignored, 1u);
  EXPECT_DOUBLE_EQ(ledger.lastFundingPayment("ETH-USDC").payment, -0.75);
}

// -----------------------------------------------------------------------------
// 10. The stream reports a trade before the submit call has returned the
//     exchange id. The fill is held, and the creation ack applies it.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, FillBeforeAckAppliedOnAck) {
  recon::domain::Order o;
  o.client_order_id = "O1";
  o.trading_pair = "ETH-USDC";
  o.price = 3000.0;
  o.amount = 1.0;
  registry.registerOrder(o);

  auto early = stream(MessageKind::Trade, json::array({trade("T1", "E1", 0.5)}));

  EXPECT_EQ(early.deferred, 1u);
  EXPECT_EQ(early.dropped, 0u);
  EXPECT_EQ(engine.heldFillCount(), 1u);
  EXPECT_DOUBLE_EQ(registry.order("O1")->filled_amount, 0.0);

  ASSERT_TRUE(registry.processCreationAck("O1", "E1", 100));

  EXPECT_EQ(engine.heldFillCount(), 0u);
  auto order = registry.order("O1");
  ASSERT_TRUE(order.has_value());
  EXPECT_DOUBLE_EQ(order->filled_amount, 0.5);
  EXPECT_EQ(order->state, OrderState::PartiallyFilled);
  ASSERT_TRUE(ledger.position("ETH-USDC").has_value());
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 0.5);

  // The trade poll repeating T1 is a duplicate.
  auto repeat = poll(MessageKind::Trade,
                     {{"result", {{"trades", json::array({trade("T1", "E1", 0.5)})}}}});
  EXPECT_EQ(repeat.ignored, 1u);
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 0.5);
}

// -----------------------------------------------------------------------------
// 11. A status update that first reveals the exchange id also releases the
//     held fills, even with no creation ack at all.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, HeldFillAppliedWhenStatusNamesExchangeId) {
  recon::domain::Order o;
  o.client_order_id = "O2";
  o.trading_pair = "ETH-USDC";
  o.price = 3000.0;
  o.amount = 1.0;
  registry.registerOrder(o);

  stream(MessageKind::Trade, json::array({trade("T1", "E2", 1.0)}));
  ASSERT_EQ(engine.heldFillCount(), 1u);

  auto status = poll(MessageKind::OrderStatus,
                     {{"result", orderRecord("O2", "E2", "open", 500)}});

  EXPECT_EQ(status.applied, 1u);
  EXPECT_EQ(engine.heldFillCount(), 0u);
  EXPECT_EQ(registry.order("O2")->state, OrderState::Filled);
  EXPECT_DOUBLE_EQ(ledger.position("ETH-USDC")->amount, 1.0);
}

// -----------------------------------------------------------------------------
// 12. Held fills are discarded once no order is waiting for an ack.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationEngineTest, HeldFillsDiscardedWhenNoAckPending) {
  recon::domain::Order o;
  o.client_order_id = "O3";
  o.trading_pair = "ETH-USDC";
  o.price = 3000.0;
  o.amount = 1.0;
  registry.registerOrder(o);

  auto early = stream(MessageKind::Trade, json::array({trade("T7", "E7", 0.3)}));
  EXPECT_EQ(early.deferred, 1u);

  ASSERT_TRUE(registry.markFailed("O3", "Rejected: margin", 200));

  EXPECT_EQ(engine.heldFillCount(), 0u);
  EXPECT_TRUE(registry.fillHistory().empty());
  EXPECT_FALSE(ledger.position("ETH-USDC").has_value());

  // Nothing is pending now, so a stray fill is dropped immediately.
  auto stray = stream(MessageKind::Trade, json::array({trade("T8", "E7", 0.3)}));
  EXPECT_EQ(stray.dropped, 1u);
  EXPECT_EQ(engine.heldFillCount(), 0u);
}
