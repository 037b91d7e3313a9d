#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace recon {
namespace config {

// -----------------------------------------------------------------------------
// ConnectorConfig — connector-wide tunables
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct holding every knob the reconciliation core reads.
//         Defaults describe a working connector; a JSON file only needs to
//         override what differs.
//
// @details
// Loaded once at startup (see config_loader.hpp) and then passed by value or
// const reference into each component. Nothing mutates it after start().
//
// Intervals are milliseconds so tests can shrink them without touching
// chrono types. The poll defaults mirror the exchange's practical limits:
// order/balance/position state every 5 s, instrument metadata every minute,
// funding every 2 minutes (settlement itself is hourly).
// -----------------------------------------------------------------------------
struct ConnectorConfig {
  // --- Account ---------------------------------------------------------------
  std::string account_id{"default"};  // Stream channel prefix ("<id>.orders")
  std::string broker_id{"HBOT"};      // Client order id prefix
  std::size_t max_client_order_id_len{32};
  std::vector<std::string> trading_pairs{"ETH-USDC"};

  // --- Registry --------------------------------------------------------------
  double fill_epsilon{1e-9};              // Filled-amount equality tolerance
  std::size_t completed_history_size{500};
  std::size_t fill_history_size{5000};    // Applied fills kept for inspection

  // --- Polling ---------------------------------------------------------------
  std::int64_t short_poll_interval_ms{5000};
  std::int64_t long_poll_interval_ms{60000};
  std::int64_t funding_poll_interval_ms{120000};

  // --- Stream ----------------------------------------------------------------
  std::int64_t stream_poll_timeout_ms{100};
  std::int64_t stream_retry_delay_ms{1000};
  std::string stream_endpoint;  // Empty: no ZeroMQ stream source is opened

  // Run one short, long and funding cycle synchronously inside start()
  // before any worker thread is spawned.
  bool warm_start{true};

  bool debug_logging{false};
};

}  // namespace config
}  // namespace recon
