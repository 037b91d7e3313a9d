#include "recon/polling/poll_scheduler.hpp"
#include "recon/normalizer/raw_message.hpp"
#include "recon/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace recon {

namespace {

using nlohmann::json;
using transport::TransportError;
using transport::TransportErrorKind;
using transport::TransportResult;
using Clock = std::chrono::steady_clock;

RawMessage pollMessage(MessageKind kind) {
  RawMessage raw;
  raw.source = Channel::Poll;
  raw.kind = kind;
  return raw;
}

template <typename Fn>
void runGuarded(const char* cycle, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    std::cerr << "[PollScheduler] ERROR: " << cycle
              << " cycle threw: " << e.what() << ". Retrying next interval.\n";
  }
}

}  // namespace

PollScheduler::PollScheduler(transport::IExchangeTransport& transport,
                             ReconciliationEngine& engine,
                             OrderRegistry& registry, SymbolMap& symbols,
                             const ITimeProvider& clock,
                             const config::ConnectorConfig& config)
    : transport_(transport),
      engine_(engine),
      registry_(registry),
      symbols_(symbols),
      clock_(clock),
      config_(config) {}

PollScheduler::~PollScheduler() { stop(); }

// -----------------------------------------------------------------------------
// runShortCycle: parallel fetch, ordered apply
// -----------------------------------------------------------------------------
ApplySummary PollScheduler::runShortCycle() {
  struct StatusFetch {
    domain::Order order;
    std::future<TransportResult<json>> result;
  };

  const std::vector<domain::Order> pollable = registry_.tradePollableOrders();

  // --- Fan out ---------------------------------------------------------------
  std::vector<StatusFetch> statuses;
  statuses.reserve(pollable.size());
  for (const auto& order : pollable) {
    const std::string exchange_id = *order.exchange_order_id;
    statuses.push_back(StatusFetch{
        order, std::async(std::launch::async, [this, exchange_id] {
          return transport_.fetchOrderStatus(exchange_id);
        })});
  }

  std::optional<std::future<TransportResult<json>>> trades;
  if (!pollable.empty()) {
    trades = std::async(std::launch::async,
                        [this] { return transport_.fetchTradeHistory(); });
  }
  auto balances = std::async(std::launch::async,
                             [this] { return transport_.fetchBalances(); });
  auto positions = std::async(std::launch::async,
                              [this] { return transport_.fetchPositions(); });

  // --- Apply -----------------------------------------------------------------
  ApplySummary summary;

  auto applyFetched = [this, &summary](TransportResult<json> result,
                                       RawMessage raw, const char* what) {
    if (auto* error = std::get_if<TransportError>(&result)) {
      std::cerr << "[PollScheduler] WARNING: " << what << " fetch failed ("
                << toString(error->kind) << "): " << error->message << "\n";
      ++summary.failed;
      return;
    }
    if (stopRequested()) {
      return;
    }
    raw.payload = std::move(std::get<json>(result));
    summary += engine_.onPollSnapshot(raw);
  };

  if (trades) {
    applyFetched(trades->get(), pollMessage(MessageKind::Trade), "trade history");
  }

  for (auto& fetch : statuses) {
    TransportResult<json> result = fetch.result.get();
    auto* error = std::get_if<TransportError>(&result);
    if (error != nullptr && error->kind == TransportErrorKind::NotFound) {
      if (!stopRequested() &&
          registry_.processOrderNotFound(fetch.order.client_order_id,
                                         clock_.now_ms())) {
        ++summary.applied;
      }
      continue;
    }

    RawMessage raw = pollMessage(MessageKind::OrderStatus);
    raw.trading_pair_hint = fetch.order.trading_pair;
    raw.client_order_id_hint = fetch.order.client_order_id;
    applyFetched(std::move(result), std::move(raw), "order status");
  }

  applyFetched(balances.get(), pollMessage(MessageKind::BalanceSnapshot),
               "balance");
  applyFetched(positions.get(), pollMessage(MessageKind::PositionSnapshot),
               "position");

  ++short_cycles_;

  if (config_.debug_logging) {
    std::cout << "[PollScheduler] DEBUG: short cycle " << short_cycles_.load()
              << " polled " << pollable.size() << " orders: applied="
              << summary.applied << " ignored=" << summary.ignored
              << " deferred=" << summary.deferred
              << " dropped=" << summary.dropped << " failed=" << summary.failed
              << "\n";
  }
  return summary;
}

// -----------------------------------------------------------------------------
// runLongCycle: instrument metadata
// -----------------------------------------------------------------------------
std::size_t PollScheduler::runLongCycle() {
  auto result = transport_.fetchInstruments();
  ++long_cycles_;

  if (auto* error = std::get_if<TransportError>(&result)) {
    std::cerr << "[PollScheduler] WARNING: instrument fetch failed ("
              << toString(error->kind) << "): " << error->message
              << ". Keeping current symbol map.\n";
    return 0;
  }
  if (stopRequested()) {
    return 0;
  }
  return symbols_.rebuild(std::get<json>(result));
}

// -----------------------------------------------------------------------------
// runFundingCycle: one request per configured pair
// -----------------------------------------------------------------------------
ApplySummary PollScheduler::runFundingCycle() {
  ApplySummary summary;
  const std::int64_t start_ms = previous_hour_start_ms(clock_.now_ms());

  for (const auto& pair : config_.trading_pairs) {
    auto symbol = symbols_.toExchangeSymbol(pair);
    if (!symbol) {
      std::cerr << "[PollScheduler] WARNING: no instrument for " << pair
                << ". Skipping funding poll.\n";
      ++summary.dropped;
      continue;
    }

    auto result = transport_.fetchFundingHistory(*symbol, start_ms);
    if (auto* error = std::get_if<TransportError>(&result)) {
      std::cerr << "[PollScheduler] WARNING: funding fetch for " << pair
                << " failed (" << toString(error->kind)
                << "): " << error->message << "\n";
      ++summary.failed;
      continue;
    }
    if (stopRequested()) {
      break;
    }

    RawMessage raw = pollMessage(MessageKind::FundingEvent);
    raw.trading_pair_hint = pair;
    raw.payload = std::move(std::get<json>(result));
    summary += engine_.onPollSnapshot(raw);
  }

  ++funding_cycles_;
  return summary;
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void PollScheduler::start(bool run_immediately) {
  if (thread_.joinable()) {
    return;
  }
  stop_requested_.store(false);
  running_.store(true);
  thread_ = std::thread([this, run_immediately] { run(run_immediately); });
}

void PollScheduler::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(wake_mutex_);
    stop_requested_.store(true);
  }
  wake_cv_.notify_all();
  thread_.join();
  running_.store(false);
}

// -----------------------------------------------------------------------------
// run(): worker loop, earliest deadline first
// -----------------------------------------------------------------------------
void PollScheduler::run(bool run_immediately) {
  const auto short_every = std::chrono::milliseconds(config_.short_poll_interval_ms);
  const auto long_every = std::chrono::milliseconds(config_.long_poll_interval_ms);
  const auto funding_every =
      std::chrono::milliseconds(config_.funding_poll_interval_ms);

  const auto started = Clock::now();
  auto next_short = run_immediately ? started : started + short_every;
  auto next_long = run_immediately ? started : started + long_every;
  auto next_funding = run_immediately ? started : started + funding_every;

  while (!stopRequested()) {
    const auto deadline = std::min({next_short, next_long, next_funding});
    {
      std::unique_lock lock(wake_mutex_);
      if (wake_cv_.wait_until(lock, deadline,
                              [this] { return stopRequested(); })) {
        break;
      }
    }

    // Instruments first so the other cycles see a fresh symbol map.
    const auto now = Clock::now();
    if (now >= next_long) {
      runGuarded("long", [this] { runLongCycle(); });
      next_long = now + long_every;
    }
    if (now >= next_short && !stopRequested()) {
      runGuarded("short", [this] { runShortCycle(); });
      next_short = now + short_every;
    }
    if (now >= next_funding && !stopRequested()) {
      runGuarded("funding", [this] { runFundingCycle(); });
      next_funding = now + funding_every;
    }
  }
}

}  // namespace recon
