#pragma once

#include "recon/time/i_time_provider.hpp"
#include "recon/transport/i_exchange_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace recon {
namespace transport {

// -----------------------------------------------------------------------------
// MockExchangeTransport — in-process exchange for tests and the demo binary
// -----------------------------------------------------------------------------
//
// @brief  Keeps a small book of orders, trades, collaterals, positions,
//         funding events and instruments, and answers IExchangeTransport
//         calls from it with the same JSON shapes the real exchange uses.
//
// @details
// Orders:
//   submitOrder() accepts every request (unless a failure is injected),
//   assigns exchange ids "E1", "E2", ... and records the order as "open".
//   fillOrder() executes part or all of an order, appends a trade record
//   and returns it, so a test can feed the same record to the stream path.
//   cancelOrder() answers NotFound for ids it never issued or orders that
//   are no longer open.
//
// Scripting:
//   failNext(endpoint, error)     the next call to endpoint fails
//   failAlways(endpoint, error)   every call fails until clearFailures()
//   injectBody(endpoint, body)    the next fetch returns body verbatim
//                                 (error envelopes, malformed payloads)
//   declineNextCancel()           the next cancel returns false
//
// All timestamps come from the injected ITimeProvider so tests using a
// ManualTimeProvider stay deterministic.
//
// Thread model:
//   Every public method takes mutex_. Safe for the poll scheduler's
//   parallel fetches.
//
// Ownership:
//   Borrows the time provider.
// -----------------------------------------------------------------------------
class MockExchangeTransport final : public IExchangeTransport {
 public:
  enum class Endpoint {
    Submit,
    Cancel,
    OrderStatus,
    Trades,
    Balances,
    Positions,
    Funding,
    Instruments,
  };

  explicit MockExchangeTransport(const ITimeProvider& clock);

  MockExchangeTransport(const MockExchangeTransport&) = delete;
  MockExchangeTransport& operator=(const MockExchangeTransport&) = delete;

  // --- IExchangeTransport ----------------------------------------------------
  TransportResult<SubmitAck> submitOrder(const OrderRequest& request) override;
  TransportResult<bool> cancelOrder(const CancelRequest& request) override;
  TransportResult<nlohmann::json> fetchOrderStatus(
      const std::string& exchange_order_id) override;
  TransportResult<nlohmann::json> fetchTradeHistory() override;
  TransportResult<nlohmann::json> fetchBalances() override;
  TransportResult<nlohmann::json> fetchPositions() override;
  TransportResult<nlohmann::json> fetchFundingHistory(
      const std::string& exchange_symbol, std::int64_t start_ms) override;
  TransportResult<nlohmann::json> fetchInstruments() override;

  // --- Exchange-side actions -------------------------------------------------

  // Executes amount at price against an open order. Returns the trade
  // record. Throws std::invalid_argument for an unknown exchange id.
  nlohmann::json fillOrder(const std::string& exchange_order_id, double amount,
                           double price, double fee = 0.0);

  // Overrides the order's status as reported by fetchOrderStatus().
  void setOrderStatus(const std::string& exchange_order_id,
                      const std::string& status);

  // The exchange forgets the order: status queries and cancels answer
  // NotFound.
  void forgetOrder(const std::string& exchange_order_id);

  // Order record as the exchange would report it. nullopt if unknown.
  std::optional<nlohmann::json> orderRecord(
      const std::string& exchange_order_id) const;

  void setNextExchangeOrderId(std::uint64_t next);

  // --- Account state ---------------------------------------------------------
  void setCollateral(const std::string& asset, double amount, double available);
  void setPosition(const std::string& exchange_symbol, double amount,
                   double average_price, double mark_price = 0.0);
  void clearPositions();
  void addFundingEvent(const std::string& exchange_symbol, double funding,
                       double funding_rate, std::int64_t timestamp_ms);
  void addInstrument(const std::string& exchange_symbol, bool is_active = true);

  // --- Scripting -------------------------------------------------------------
  void failNext(Endpoint endpoint, TransportError error);
  void failAlways(Endpoint endpoint, TransportError error);
  void clearFailures();
  void injectBody(Endpoint endpoint, nlohmann::json body);
  void declineNextCancel();

  std::size_t callCount(Endpoint endpoint) const;

 private:
  // Counts the call and returns an injected failure, if any. mutex_ held.
  std::optional<TransportError> enterLocked(Endpoint endpoint);

  // Returns and consumes an injected body, if any. mutex_ held.
  std::optional<nlohmann::json> takeBodyLocked(Endpoint endpoint);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::uint64_t next_order_id_{1};
  std::uint64_t next_trade_id_{1};

  std::map<std::string, nlohmann::json> orders_;  // exchange id → record
  nlohmann::json trades_ = nlohmann::json::array();
  std::map<std::string, nlohmann::json> collaterals_;
  std::map<std::string, nlohmann::json> positions_;
  nlohmann::json funding_events_ = nlohmann::json::array();
  nlohmann::json instruments_ = nlohmann::json::array();

  std::unordered_map<int, std::deque<TransportError>> one_shot_failures_;
  std::unordered_map<int, TransportError> sticky_failures_;
  std::unordered_map<int, std::deque<nlohmann::json>> injected_bodies_;
  std::unordered_map<int, std::size_t> call_counts_;
  bool decline_next_cancel_{false};
};

}  // namespace transport
}  // namespace recon
