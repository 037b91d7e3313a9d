// -----------------------------------------------------------------------------
// perp_recon — paper-mode entry point.
//
// Runs the reconciliation core against an in-process mock exchange:
//   1) Load the connector configuration (optional path argument).
//   2) Seed the mock exchange with an instrument, collateral and a funding
//      settlement from the previous hour.
//   3) Start ConnectorCore (warm start, poll thread, stream thread).
//   4) Place one limit order, fill half of it through the stream channel
//      and the rest silently, so the poll path has to catch up.
//   5) Run until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread     → scripted exchange activity, then idle wait
//   poll thread     → PollScheduler cycles
//   stream thread   → StreamListener reading the in-process queue
//
// With "stream.endpoint" set in the config, the stream thread reads a
// ZeroMQ SUB socket instead of the in-process queue.
// -----------------------------------------------------------------------------

#include "recon/config/config_loader.hpp"
#include "recon/domain/errors.hpp"
#include "recon/engine/connector_core.hpp"
#include "recon/events/funding_payment_event.hpp"
#include "recon/events/order_filled_event.hpp"
#include "recon/events/order_update_event.hpp"
#include "recon/stream/queue_stream_source.hpp"
#include "recon/time/live_time_provider.hpp"
#include "recon/time/time_utils.hpp"
#include "recon/transport/mock_exchange_transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by main().
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  recon::config::ConnectorConfig config;
  if (argc > 1) {
    try {
      config = recon::config::loadConfig(argv[1]);
    } catch (const recon::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }
  // The demo only needs one poll interval to show convergence.
  config.short_poll_interval_ms = std::min<std::int64_t>(
      config.short_poll_interval_ms, 2000);

  // -------------------------------------------------------------------------
  // 2) Mock exchange
  // -------------------------------------------------------------------------
  recon::LiveTimeProvider clock;
  recon::transport::MockExchangeTransport exchange(clock);

  const std::string pair = config.trading_pairs.front();
  const std::string symbol = pair.substr(0, pair.find('-')) + "-PERP";
  exchange.addInstrument(symbol);
  exchange.setCollateral("USDC", 10000.0, 10000.0);
  exchange.addFundingEvent(
      symbol, -0.42, 0.0000125,
      recon::previous_hour_start_ms(clock.now_ms()) + recon::kMsPerHour);

  recon::QueueStreamSource queue_stream;
  recon::IStreamSource* stream =
      config.stream_endpoint.empty() ? &queue_stream : nullptr;

  // -------------------------------------------------------------------------
  // 3) Connector
  // -------------------------------------------------------------------------
  try {
    recon::ConnectorCore connector(config, exchange, clock, stream);

    connector.eventBus().subscribe<recon::OrderUpdateEvent>(
        [](const recon::OrderUpdateEvent& e) {
          std::cout << "[OrderUpdate] " << e.order.client_order_id << " "
                    << toString(e.previous_state) << " -> "
                    << toString(e.order.state)
                    << " filled=" << e.order.filled_amount << "/"
                    << e.order.amount << "\n";
        });
    connector.eventBus().subscribe<recon::OrderFilledEvent>(
        [](const recon::OrderFilledEvent& e) {
          std::cout << "[OrderFilled] trade_id=" << e.fill.trade_id << " "
                    << e.fill.fill_base_amount << " @ " << e.fill.fill_price
                    << " fee=" << e.fill.fee_amount << " " << e.fill.fee_asset
                    << "\n";
        });
    connector.eventBus().subscribe<recon::FundingPaymentEvent>(
        [](const recon::FundingPaymentEvent& e) {
          std::cout << "[FundingPayment] " << e.payment.trading_pair << " "
                    << e.payment.payment << "\n";
        });

    connector.start();
    std::signal(SIGINT, sigint_handler);

    // -----------------------------------------------------------------------
    // 4) Scripted exchange activity
    // -----------------------------------------------------------------------
    auto submitted =
        connector.buy(pair, 0.2, recon::domain::OrderType::Limit, 3000.0);
    if (submitted.ok()) {
      auto order = connector.order(submitted.client_order_id);
      const std::string exchange_id =
          order && order->exchange_order_id ? *order->exchange_order_id : "";

      nlohmann::json trade = exchange.fillOrder(exchange_id, 0.1, 2999.5, 0.03);
      nlohmann::json frame{{"channel", config.account_id + ".trades"},
                           {"data", nlohmann::json::array({trade})}};
      queue_stream.push(frame.dump());

      exchange.fillOrder(exchange_id, 0.1, 3000.0, 0.03);
      exchange.setPosition(symbol, 0.2, 2999.75, 3001.0);
    }

    // -----------------------------------------------------------------------
    // 5) Run until Ctrl-C
    // -----------------------------------------------------------------------
    std::cout << "[main] Running. Press Ctrl-C to stop.\n";
    while (!g_stop_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    connector.stop();

    for (const auto& pos : connector.positions()) {
      std::cout << "[main] Position " << pos.trading_pair << " "
                << toString(pos.side) << " " << pos.amount << " @ "
                << pos.entry_price << "\n";
    }
    for (const auto& balance : connector.balances()) {
      std::cout << "[main] Balance " << balance.asset << " " << balance.total
                << " (available " << balance.available << ")\n";
    }
  } catch (const recon::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Shutdown complete.\n";
  return 0;
}
