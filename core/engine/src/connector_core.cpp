#include "recon/engine/connector_core.hpp"
#include "recon/config/config_loader.hpp"
#include "recon/stream/zmq_stream_source.hpp"

#include <iostream>
#include <utility>

namespace recon {

namespace {

config::ConnectorConfig validated(config::ConnectorConfig config) {
  config::validateConfig(config);
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build and wire components; no threads yet
// -----------------------------------------------------------------------------
ConnectorCore::ConnectorCore(config::ConnectorConfig config,
                             transport::IExchangeTransport& transport,
                             const ITimeProvider& clock,
                             IStreamSource* stream_source)
    : config_(validated(std::move(config))),
      transport_(transport),
      clock_(clock),
      normalizer_(symbols_),
      registry_(bus_, clock_, config_),
      ledger_(bus_, config_.fill_epsilon, config_.debug_logging),
      engine_(normalizer_, registry_, ledger_, bus_, config_.debug_logging),
      ids_(config_.broker_id, config_.max_client_order_id_len,
           static_cast<std::uint64_t>(clock_.now_ms())),
      submitter_(registry_, transport_, symbols_, ids_, clock_) {
  poll_scheduler_ = std::make_unique<PollScheduler>(
      transport_, engine_, registry_, symbols_, clock_, config_);

  if (stream_source == nullptr && !config_.stream_endpoint.empty()) {
    owned_stream_ = std::make_unique<ZmqStreamSource>(config_.stream_endpoint);
    stream_source = owned_stream_.get();
  }
  if (stream_source != nullptr) {
    stream_listener_ =
        std::make_unique<StreamListener>(engine_, *stream_source, config_);
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ConnectorCore::~ConnectorCore() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ConnectorCore::start() {
  if (running_) {
    return;
  }

  // ---  1) Warm start --------------------------------------------------------
  if (config_.warm_start) {
    const std::size_t instruments = poll_scheduler_->runLongCycle();
    const ApplySummary orders = poll_scheduler_->runShortCycle();
    const ApplySummary funding = poll_scheduler_->runFundingCycle();

    std::cout << "[ConnectorCore] Warm start complete: " << instruments
              << " instrument(s), " << ledger_.positions().size()
              << " position(s), " << ledger_.balances().size()
              << " balance(s), " << orders.failed + funding.failed
              << " failed fetch(es).\n";
  }

  // ---  2) Poll thread -------------------------------------------------------
  poll_scheduler_->start(!config_.warm_start);

  // ---  3) Stream thread -----------------------------------------------------
  if (stream_listener_) {
    stream_listener_->start();
  }

  running_ = true;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ConnectorCore::stop() {
  if (!running_) {
    return;
  }

  if (stream_listener_) {
    stream_listener_->stop();
  }
  poll_scheduler_->stop();

  running_ = false;
  std::cout << "[ConnectorCore] Stopped. " << registry_.activeCount()
            << " order(s) still active.\n";
}

// -----------------------------------------------------------------------------
// Order entry
// -----------------------------------------------------------------------------
SubmitResult ConnectorCore::buy(const std::string& trading_pair, double amount,
                                domain::OrderType order_type, double price) {
  return submitter_.buy(trading_pair, amount, order_type, price);
}

SubmitResult ConnectorCore::sell(const std::string& trading_pair, double amount,
                                 domain::OrderType order_type, double price) {
  return submitter_.sell(trading_pair, amount, order_type, price);
}

CancelResult ConnectorCore::cancel(const std::string& client_order_id) {
  return submitter_.cancel(client_order_id);
}

// -----------------------------------------------------------------------------
// Ingress
// -----------------------------------------------------------------------------
ApplySummary ConnectorCore::onStreamEvent(const RawMessage& raw) {
  return engine_.onStreamEvent(raw);
}

ApplySummary ConnectorCore::onPollSnapshot(const RawMessage& raw) {
  return engine_.onPollSnapshot(raw);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::Order> ConnectorCore::activeOrders() const {
  return registry_.activeOrders();
}

std::optional<domain::Order> ConnectorCore::order(
    const std::string& client_order_id) const {
  return registry_.order(client_order_id);
}

std::vector<domain::Position> ConnectorCore::positions() const {
  return ledger_.positions();
}

std::vector<domain::Balance> ConnectorCore::balances() const {
  return ledger_.balances();
}

domain::FundingPayment ConnectorCore::lastFundingPayment(
    const std::string& trading_pair) const {
  return ledger_.lastFundingPayment(trading_pair);
}

}  // namespace recon
