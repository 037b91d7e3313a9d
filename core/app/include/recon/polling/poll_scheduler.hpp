#pragma once

#include "recon/config/connector_config.hpp"
#include "recon/reconciliation/reconciliation_engine.hpp"
#include "recon/registry/order_registry.hpp"
#include "recon/symbols/symbol_map.hpp"
#include "recon/time/i_time_provider.hpp"
#include "recon/transport/i_exchange_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace recon {

// -----------------------------------------------------------------------------
// PollScheduler — periodic request/response reconciliation
// -----------------------------------------------------------------------------
//
// @brief  Pulls authoritative state from the exchange on three cadences and
//         feeds it through ReconciliationEngine::onPollSnapshot().
//
// @details
// Short cycle (short_poll_interval_ms):
//   Fetched in parallel with std::async:
//     - status of every active order that has an exchange id
//     - account trade history (skipped when no such order exists)
//     - collateral balances
//     - positions
//   Applied in a fixed order once all fetches return: trades, statuses,
//   balances, positions. A status query answered NotFound moves the order
//   to Canceled via OrderRegistry::processOrderNotFound(). Other transport
//   errors are logged and the endpoint is retried next cycle.
//
// Long cycle (long_poll_interval_ms):
//   Instrument metadata → SymbolMap::rebuild().
//
// Funding cycle (funding_poll_interval_ms):
//   For each configured pair, funding history since the start of the
//   previous hour, tagged with the pair as trading_pair_hint.
//
// Stop semantics:
//   stop() sets stop_requested_ before joining. A cycle in flight checks it
//   before each apply step, so no poll result is applied after stop()
//   returns.
//
// Thread model:
//   start() spawns one worker thread that sleeps on a condition variable
//   until the earliest cycle deadline (steady_clock) or stop(). The
//   run*Cycle() methods are also public so ConnectorCore can warm-start
//   synchronously and tests can drive cycles by hand.
//
// Ownership:
//   Owned by ConnectorCore. Borrows transport, engine, registry, symbols,
//   clock and config, all of which must outlive it.
// -----------------------------------------------------------------------------
class PollScheduler {
 public:
  PollScheduler(transport::IExchangeTransport& transport,
                ReconciliationEngine& engine, OrderRegistry& registry,
                SymbolMap& symbols, const ITimeProvider& clock,
                const config::ConnectorConfig& config);

  ~PollScheduler();

  PollScheduler(const PollScheduler&) = delete;
  PollScheduler& operator=(const PollScheduler&) = delete;
  PollScheduler(PollScheduler&&) = delete;
  PollScheduler& operator=(PollScheduler&&) = delete;

  ApplySummary runShortCycle();

  // Returns the number of instruments mapped after the rebuild, or 0 if the
  // fetch failed (the previous map is kept).
  std::size_t runLongCycle();

  ApplySummary runFundingCycle();

  // With run_immediately the first cycle of each kind fires at once;
  // otherwise after one interval. Idempotent.
  void start(bool run_immediately = false);

  // Idempotent. Blocks until the worker has exited.
  void stop();

  bool running() const { return running_.load(); }

  std::uint64_t shortCycles() const { return short_cycles_.load(); }
  std::uint64_t longCycles() const { return long_cycles_.load(); }
  std::uint64_t fundingCycles() const { return funding_cycles_.load(); }

 private:
  void run(bool run_immediately);

  bool stopRequested() const { return stop_requested_.load(); }

  transport::IExchangeTransport& transport_;
  ReconciliationEngine& engine_;
  OrderRegistry& registry_;
  SymbolMap& symbols_;
  const ITimeProvider& clock_;
  const config::ConnectorConfig& config_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;

  std::atomic<std::uint64_t> short_cycles_{0};
  std::atomic<std::uint64_t> long_cycles_{0};
  std::atomic<std::uint64_t> funding_cycles_{0};
};

}  // namespace recon
