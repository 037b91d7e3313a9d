#pragma once

#include "recon/concurrent/client_order_id_factory.hpp"
#include "recon/config/connector_config.hpp"
#include "recon/eventbus/event_bus.hpp"
#include "recon/execution/order_submitter.hpp"
#include "recon/ledger/position_ledger.hpp"
#include "recon/normalizer/event_normalizer.hpp"
#include "recon/polling/poll_scheduler.hpp"
#include "recon/reconciliation/reconciliation_engine.hpp"
#include "recon/registry/order_registry.hpp"
#include "recon/stream/i_stream_source.hpp"
#include "recon/stream/stream_listener.hpp"
#include "recon/symbols/symbol_map.hpp"
#include "recon/time/i_time_provider.hpp"
#include "recon/transport/i_exchange_transport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recon {

// -----------------------------------------------------------------------------
// ConnectorCore
// -----------------------------------------------------------------------------
//
// @brief  Composition root of the connector: owns every reconciliation
//         component, wires them together and runs their lifecycle.
//
// @details
// Startup sequence (start()):
//   1. Warm start (config.warm_start): run one long cycle (instruments),
//      one short cycle (orders, trades, balances, positions) and one funding
//      cycle synchronously, so queries are meaningful the moment start()
//      returns.
//   2. Start the PollScheduler thread. Without warm start its first cycles
//      fire immediately instead.
//   3. Start the StreamListener thread, if a stream source exists.
//
// Both ingress paths end in the same ReconciliationEngine, so an update is
// applied with identical semantics whichever channel delivered it.
//
// Stream source selection:
//   - an IStreamSource passed to the constructor (tests, embedding), else
//   - a ZmqStreamSource on config.stream_endpoint if it is non-empty, else
//   - none: the connector runs on polling alone.
//
// Thread layout after start():
//   poll thread      → PollScheduler::run (std::async fan-out per cycle)
//   stream thread    → StreamListener::run
//   caller threads   → buy / sell / cancel / queries
//
// Ownership:
//   ConnectorCore
//    ├── config_            (ConnectorConfig, validated copy)
//    ├── bus_               (EventBus)
//    ├── symbols_           (SymbolMap)
//    ├── normalizer_        (EventNormalizer → symbols_)
//    ├── registry_          (OrderRegistry → bus_)
//    ├── ledger_            (PositionLedger → bus_)
//    ├── engine_            (ReconciliationEngine → normalizer_, registry_, ledger_, bus_)
//    ├── ids_               (ClientOrderIdFactory)
//    ├── submitter_         (OrderSubmitter)
//    ├── poll_scheduler_    (unique_ptr<PollScheduler>)
//    ├── owned_stream_      (unique_ptr<IStreamSource>, ZeroMQ only)
//    └── stream_listener_   (unique_ptr<StreamListener>, optional)
//   Transport, clock and an injected stream source are borrowed and must
//   outlive the core. Members are declared in dependency order so that
//   destruction runs consumers first.
// -----------------------------------------------------------------------------
class ConnectorCore {
 public:
  // Throws ConfigError if config fails validation, StreamError if the
  // ZeroMQ stream socket cannot be set up.
  ConnectorCore(config::ConnectorConfig config,
                transport::IExchangeTransport& transport,
                const ITimeProvider& clock,
                IStreamSource* stream_source = nullptr);

  ~ConnectorCore();

  ConnectorCore(const ConnectorCore&) = delete;
  ConnectorCore& operator=(const ConnectorCore&) = delete;
  ConnectorCore(ConnectorCore&&) = delete;
  ConnectorCore& operator=(ConnectorCore&&) = delete;

  // Idempotent.
  void start();

  // Stops the stream listener, then the poll scheduler. Idempotent.
  void stop();

  bool running() const { return running_; }

  // --- Order entry -----------------------------------------------------------
  SubmitResult buy(const std::string& trading_pair, double amount,
                   domain::OrderType order_type, double price);
  SubmitResult sell(const std::string& trading_pair, double amount,
                    domain::OrderType order_type, double price);
  CancelResult cancel(const std::string& client_order_id);

  // --- Ingress ---------------------------------------------------------------
  ApplySummary onStreamEvent(const RawMessage& raw);
  ApplySummary onPollSnapshot(const RawMessage& raw);

  // --- Queries ---------------------------------------------------------------
  std::vector<domain::Order> activeOrders() const;
  std::optional<domain::Order> order(const std::string& client_order_id) const;
  std::vector<domain::Position> positions() const;
  std::vector<domain::Balance> balances() const;
  domain::FundingPayment lastFundingPayment(const std::string& trading_pair) const;

  // --- Components ------------------------------------------------------------
  const config::ConnectorConfig& config() const { return config_; }
  EventBus& eventBus() { return bus_; }
  SymbolMap& symbols() { return symbols_; }
  OrderRegistry& registry() { return registry_; }
  PositionLedger& ledger() { return ledger_; }
  ReconciliationEngine& engine() { return engine_; }
  PollScheduler& pollScheduler() { return *poll_scheduler_; }

  // nullptr when the connector runs without a stream.
  StreamListener* streamListener() { return stream_listener_.get(); }

 private:
  const config::ConnectorConfig config_;
  transport::IExchangeTransport& transport_;
  const ITimeProvider& clock_;

  EventBus bus_;
  SymbolMap symbols_;
  EventNormalizer normalizer_;
  OrderRegistry registry_;
  PositionLedger ledger_;
  ReconciliationEngine engine_;
  ClientOrderIdFactory ids_;
  OrderSubmitter submitter_;

  std::unique_ptr<PollScheduler> poll_scheduler_;
  std::unique_ptr<IStreamSource> owned_stream_;
  std::unique_ptr<StreamListener> stream_listener_;

  bool running_{false};
};

}  // namespace recon
