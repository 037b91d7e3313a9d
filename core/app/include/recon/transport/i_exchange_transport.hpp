#pragma once

#include "recon/transport/transport_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace recon {
namespace transport {

// -----------------------------------------------------------------------------
// IExchangeTransport — request/response boundary to the exchange
// -----------------------------------------------------------------------------
//
// @brief  Abstract interface for every call the connector makes to the
//         exchange's request/response API.
//
// @details
// Fetch calls return the exchange's raw JSON body. Interpreting it is the
// EventNormalizer's job, so a transport never needs to know the canonical
// model. Error envelopes the exchange returns with a success status are
// passed through as JSON too; only failures the transport itself can
// classify (not found, rejected, network) come back as TransportError.
//
// Signing, rate limiting and HTTP plumbing live behind this interface and
// are out of scope for this library. MockExchangeTransport is the in-process
// implementation used by tests and the demo binary.
//
// Thread model:
//   Implementations must be safe to call concurrently. The poll scheduler
//   fans out fetches in parallel and order submission happens on caller
//   threads.
//
// Ownership:
//   Borrowed by ConnectorCore, OrderSubmitter and PollScheduler. Must
//   outlive all of them.
// -----------------------------------------------------------------------------
class IExchangeTransport {
 public:
  virtual ~IExchangeTransport() = default;

  virtual TransportResult<SubmitAck> submitOrder(const OrderRequest& request) = 0;

  // true: cancel accepted. false: the exchange declined without an error
  // (order still live).
  virtual TransportResult<bool> cancelOrder(const CancelRequest& request) = 0;

  // Single-order status. Body shape: {"result": {order fields}}.
  virtual TransportResult<nlohmann::json> fetchOrderStatus(
      const std::string& exchange_order_id) = 0;

  // Recent trades for the account. Body shape: {"result": {"trades": [...]}}.
  virtual TransportResult<nlohmann::json> fetchTradeHistory() = 0;

  // {"result": {"collaterals": [...]}}
  virtual TransportResult<nlohmann::json> fetchBalances() = 0;

  // {"result": {"positions": [...]}}
  virtual TransportResult<nlohmann::json> fetchPositions() = 0;

  // Funding settlements for one instrument since start_ms.
  // {"result": {"events": [...]}}
  virtual TransportResult<nlohmann::json> fetchFundingHistory(
      const std::string& exchange_symbol, std::int64_t start_ms) = 0;

  // {"result": [instrument, ...]}
  virtual TransportResult<nlohmann::json> fetchInstruments() = 0;
};

}  // namespace transport
}  // namespace recon
