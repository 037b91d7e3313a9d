#include "recon/transport/mock_exchange_transport.hpp"

#include <stdexcept>
#include <utility>

namespace recon {
namespace transport {

namespace {

using nlohmann::json;

int key(MockExchangeTransport::Endpoint endpoint) {
  return static_cast<int>(endpoint);
}

const char* orderTypeParam(domain::OrderType type) {
  switch (type) {
    case domain::OrderType::Limit:      return "limit";
    case domain::OrderType::LimitMaker: return "limit";
    case domain::OrderType::Market:     return "market";
  }
  return "limit";
}

TransportError notFound(const std::string& exchange_order_id) {
  return {TransportErrorKind::NotFound,
          "Order does not exist: " + exchange_order_id};
}

}  // namespace

MockExchangeTransport::MockExchangeTransport(const ITimeProvider& clock)
    : clock_(clock) {}

std::optional<TransportError> MockExchangeTransport::enterLocked(
    Endpoint endpoint) {
  ++call_counts_[key(endpoint)];

  auto& queue = one_shot_failures_[key(endpoint)];
  if (!queue.empty()) {
    TransportError error = std::move(queue.front());
    queue.pop_front();
    return error;
  }
  auto it = sticky_failures_.find(key(endpoint));
  if (it != sticky_failures_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<json> MockExchangeTransport::takeBodyLocked(Endpoint endpoint) {
  auto& queue = injected_bodies_[key(endpoint)];
  if (queue.empty()) {
    return std::nullopt;
  }
  json body = std::move(queue.front());
  queue.pop_front();
  return body;
}

// -----------------------------------------------------------------------------
// Order entry
// -----------------------------------------------------------------------------
TransportResult<SubmitAck> MockExchangeTransport::submitOrder(
    const OrderRequest& request) {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Submit)) {
    return *error;
  }

  const std::int64_t now = clock_.now_ms();
  const std::string exchange_id = "E" + std::to_string(next_order_id_++);

  orders_[exchange_id] = json{
      {"order_id", exchange_id},
      {"label", request.client_order_id},
      {"instrument_name", request.exchange_symbol},
      {"direction", request.side == domain::Side::Buy ? "buy" : "sell"},
      {"order_type", orderTypeParam(request.order_type)},
      {"limit_price", request.price},
      {"amount", request.amount},
      {"filled_amount", 0.0},
      {"average_price", 0.0},
      {"order_status", "open"},
      {"creation_timestamp", now},
      {"last_update_timestamp", now},
  };

  SubmitAck ack;
  ack.exchange_order_id = exchange_id;
  ack.accepted_timestamp_ms = now;
  return ack;
}

TransportResult<bool> MockExchangeTransport::cancelOrder(
    const CancelRequest& request) {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Cancel)) {
    return *error;
  }

  auto it = orders_.find(request.exchange_order_id);
  if (it == orders_.end() || it->second.at("order_status") != "open") {
    return notFound(request.exchange_order_id);
  }
  if (decline_next_cancel_) {
    decline_next_cancel_ = false;
    return false;
  }

  it->second["order_status"] = "cancelled";
  it->second["last_update_timestamp"] = clock_.now_ms();
  return true;
}

// -----------------------------------------------------------------------------
// Fetches
// -----------------------------------------------------------------------------
TransportResult<json> MockExchangeTransport::fetchOrderStatus(
    const std::string& exchange_order_id) {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::OrderStatus)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::OrderStatus)) {
    return *body;
  }

  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    return notFound(exchange_order_id);
  }
  return json{{"result", it->second}};
}

TransportResult<json> MockExchangeTransport::fetchTradeHistory() {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Trades)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::Trades)) {
    return *body;
  }
  return json{{"result", {{"trades", trades_}}}};
}

TransportResult<json> MockExchangeTransport::fetchBalances() {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Balances)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::Balances)) {
    return *body;
  }

  json list = json::array();
  for (const auto& [asset, record] : collaterals_) {
    list.push_back(record);
  }
  return json{{"result", {{"collaterals", list}}}};
}

TransportResult<json> MockExchangeTransport::fetchPositions() {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Positions)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::Positions)) {
    return *body;
  }

  json list = json::array();
  for (const auto& [symbol, record] : positions_) {
    list.push_back(record);
  }
  return json{{"result", {{"positions", list}}}};
}

TransportResult<json> MockExchangeTransport::fetchFundingHistory(
    const std::string& exchange_symbol, std::int64_t start_ms) {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Funding)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::Funding)) {
    return *body;
  }

  json list = json::array();
  for (const auto& event : funding_events_) {
    if (event.at("instrument_name") == exchange_symbol &&
        event.at("timestamp").get<std::int64_t>() >= start_ms) {
      list.push_back(event);
    }
  }
  return json{{"result", {{"events", list}}}};
}

TransportResult<json> MockExchangeTransport::fetchInstruments() {
  std::lock_guard lock(mutex_);
  if (auto error = enterLocked(Endpoint::Instruments)) {
    return *error;
  }
  if (auto body = takeBodyLocked(Endpoint::Instruments)) {
    return *body;
  }
  return json{{"result", instruments_}};
}

// -----------------------------------------------------------------------------
// Exchange-side actions
// -----------------------------------------------------------------------------
json MockExchangeTransport::fillOrder(const std::string& exchange_order_id,
                                      double amount, double price, double fee) {
  std::lock_guard lock(mutex_);

  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    throw std::invalid_argument("fillOrder: unknown exchange order id " +
                                exchange_order_id);
  }
  json& order = it->second;

  const std::int64_t now = clock_.now_ms();
  const double filled = order.at("filled_amount").get<double>();
  const double total = order.at("amount").get<double>();
  const double new_filled = filled + amount;

  const double avg = order.at("average_price").get<double>();
  order["average_price"] = (filled * avg + amount * price) / new_filled;
  order["filled_amount"] = new_filled;
  order["last_update_timestamp"] = now;
  if (new_filled >= total) {
    order["order_status"] = "filled";
  }

  json trade{
      {"trade_id", "T" + std::to_string(next_trade_id_++)},
      {"order_id", exchange_order_id},
      {"label", order.at("label")},
      {"instrument_name", order.at("instrument_name")},
      {"direction", order.at("direction")},
      {"trade_price", price},
      {"trade_amount", amount},
      {"trade_fee", fee},
      {"timestamp", now},
  };
  trades_.push_back(trade);
  return trade;
}

void MockExchangeTransport::setOrderStatus(const std::string& exchange_order_id,
                                           const std::string& status) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    throw std::invalid_argument("setOrderStatus: unknown exchange order id " +
                                exchange_order_id);
  }
  it->second["order_status"] = status;
  it->second["last_update_timestamp"] = clock_.now_ms();
}

void MockExchangeTransport::forgetOrder(const std::string& exchange_order_id) {
  std::lock_guard lock(mutex_);
  orders_.erase(exchange_order_id);
}

std::optional<json> MockExchangeTransport::orderRecord(
    const std::string& exchange_order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MockExchangeTransport::setNextExchangeOrderId(std::uint64_t next) {
  std::lock_guard lock(mutex_);
  next_order_id_ = next;
}

// -----------------------------------------------------------------------------
// Account state
// -----------------------------------------------------------------------------
void MockExchangeTransport::setCollateral(const std::string& asset,
                                          double amount, double available) {
  std::lock_guard lock(mutex_);
  collaterals_[asset] = json{
      {"asset_name", asset}, {"amount", amount}, {"available", available}};
}

void MockExchangeTransport::setPosition(const std::string& exchange_symbol,
                                        double amount, double average_price,
                                        double mark_price) {
  std::lock_guard lock(mutex_);
  if (amount == 0.0) {
    positions_.erase(exchange_symbol);
    return;
  }
  positions_[exchange_symbol] = json{
      {"instrument_name", exchange_symbol},
      {"amount", amount},
      {"average_price", average_price},
      {"mark_price", mark_price},
      {"unrealized_pnl", (mark_price - average_price) * amount},
      {"leverage", 1.0},
  };
}

void MockExchangeTransport::clearPositions() {
  std::lock_guard lock(mutex_);
  positions_.clear();
}

void MockExchangeTransport::addFundingEvent(const std::string& exchange_symbol,
                                            double funding, double funding_rate,
                                            std::int64_t timestamp_ms) {
  std::lock_guard lock(mutex_);
  funding_events_.push_back(json{
      {"instrument_name", exchange_symbol},
      {"funding", funding},
      {"funding_rate", funding_rate},
      {"timestamp", timestamp_ms},
  });
}

void MockExchangeTransport::addInstrument(const std::string& exchange_symbol,
                                          bool is_active) {
  std::lock_guard lock(mutex_);
  instruments_.push_back(json{
      {"instrument_name", exchange_symbol},
      {"instrument_type", "perp"},
      {"is_active", is_active},
  });
}

// -----------------------------------------------------------------------------
// Scripting
// -----------------------------------------------------------------------------
void MockExchangeTransport::failNext(Endpoint endpoint, TransportError error) {
  std::lock_guard lock(mutex_);
  one_shot_failures_[key(endpoint)].push_back(std::move(error));
}

void MockExchangeTransport::failAlways(Endpoint endpoint, TransportError error) {
  std::lock_guard lock(mutex_);
  sticky_failures_[key(endpoint)] = std::move(error);
}

void MockExchangeTransport::clearFailures() {
  std::lock_guard lock(mutex_);
  one_shot_failures_.clear();
  sticky_failures_.clear();
}

void MockExchangeTransport::injectBody(Endpoint endpoint, json body) {
  std::lock_guard lock(mutex_);
  injected_bodies_[key(endpoint)].push_back(std::move(body));
}

void MockExchangeTransport::declineNextCancel() {
  std::lock_guard lock(mutex_);
  decline_next_cancel_ = true;
}

std::size_t MockExchangeTransport::callCount(Endpoint endpoint) const {
  std::lock_guard lock(mutex_);
  auto it = call_counts_.find(key(endpoint));
  return it == call_counts_.end() ? 0 : it->second;
}

}  // namespace transport
}  // namespace recon
