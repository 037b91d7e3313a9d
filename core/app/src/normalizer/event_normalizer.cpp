#include "recon/normalizer/event_normalizer.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace recon {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Field readers. All return std::nullopt for absent, null or unusable values
// instead of throwing; the caller decides whether the field was required.
// -----------------------------------------------------------------------------

std::optional<double> numberField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number()) {
    return it->get<double>();
  }
  if (it->is_string()) {
    const auto& text = it->get_ref<const std::string&>();
    try {
      std::size_t consumed = 0;
      double value = std::stod(text, &consumed);
      if (consumed != text.size()) {
        return std::nullopt;
      }
      return value;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<std::int64_t> integerField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (auto value = numberField(obj, key)) {
    return static_cast<std::int64_t>(std::llround(*value));
  }
  return std::nullopt;
}

// Ids come as strings or as integers depending on the endpoint.
std::optional<std::string> idField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    auto value = it->get<std::string>();
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }
  if (it->is_number_unsigned()) {
    return std::to_string(it->get<std::uint64_t>());
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<std::int64_t>());
  }
  return std::nullopt;
}

std::string stringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::string quoteCurrency(const std::string& trading_pair) {
  const auto dash = trading_pair.find('-');
  return dash == std::string::npos ? std::string{}
                                   : trading_pair.substr(dash + 1);
}

// -----------------------------------------------------------------------------
// extractRecords
// -----------------------------------------------------------------------------
// Accepted shapes:
//   {"error": {"message": ...}}          → error
//   [ {...}, ... ]                       → list as-is (stream "data")
//   {"result": {"<list_key>": [...]}}    → list
//   {"result": [...]}                    → list
//   {"result": {...}}                    → single record (if !list_required)
//   {"<list_key>": [...]}                → list
//   {...}                                → single record (if !list_required)
//   null                                 → empty (if !list_required)
// -----------------------------------------------------------------------------
std::optional<std::string> extractRecords(const json& payload,
                                          const char* list_key,
                                          bool list_required,
                                          json& records) {
  records = json::array();

  if (payload.is_null()) {
    if (list_required) {
      return std::string("empty response, expected '") + list_key + "' list";
    }
    return std::nullopt;
  }

  if (payload.is_array()) {
    records = payload;
    return std::nullopt;
  }

  if (!payload.is_object()) {
    return std::string("unexpected payload type: ") + payload.type_name();
  }

  if (payload.contains("error") && !payload.at("error").is_null()) {
    const auto& err = payload.at("error");
    if (err.is_object() && err.contains("message") &&
        err.at("message").is_string()) {
      return "exchange error: " + err.at("message").get<std::string>();
    }
    return "exchange error: " + err.dump();
  }

  const json& body = payload.contains("result") ? payload.at("result") : payload;

  if (body.is_array()) {
    records = body;
    return std::nullopt;
  }
  if (body.is_object() && body.contains(list_key)) {
    if (!body.at(list_key).is_array()) {
      return std::string("'") + list_key + "' is not a list";
    }
    records = body.at(list_key);
    return std::nullopt;
  }
  if (body.is_object() && !list_required) {
    records.push_back(body);
    return std::nullopt;
  }
  return std::string("response has no '") + list_key + "' list";
}

}  // namespace

EventNormalizer::EventNormalizer(const ISymbolMapper& symbols)
    : symbols_(symbols) {}

// -----------------------------------------------------------------------------
// mapOrderStatus
// -----------------------------------------------------------------------------
std::optional<domain::OrderState> EventNormalizer::mapOrderStatus(
    const std::string& exchange_status) {
  using S = domain::OrderState;
  if (exchange_status == "open" || exchange_status == "untriggered") {
    return S::Open;
  }
  if (exchange_status == "filled") {
    return S::Filled;
  }
  if (exchange_status == "cancelled" || exchange_status == "expired") {
    return S::Canceled;
  }
  if (exchange_status == "rejected" ||
      exchange_status == "insufficient_margin") {
    return S::Failed;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// normalize: unwrap the envelope, then dispatch per kind
// -----------------------------------------------------------------------------
NormalizationResult EventNormalizer::normalize(const RawMessage& raw) const {
  NormalizationResult out;
  json records;

  const char* list_key = "orders";
  bool list_required = false;
  switch (raw.kind) {
    case MessageKind::OrderStatus:
      list_key = "orders";
      break;
    case MessageKind::Trade:
      list_key = "trades";
      break;
    case MessageKind::PositionSnapshot:
      list_key = "positions";
      list_required = true;
      break;
    case MessageKind::BalanceSnapshot:
      list_key = "collaterals";
      list_required = true;
      break;
    case MessageKind::FundingEvent:
      list_key = "events";
      list_required = true;
      break;
  }

  if (auto error = extractRecords(raw.payload, list_key, list_required,
                                  records)) {
    out.error = std::move(error);
    return out;
  }

  switch (raw.kind) {
    case MessageKind::OrderStatus:
      normalizeOrders(raw, records, out);
      break;
    case MessageKind::Trade:
      normalizeTrades(raw, records, out);
      break;
    case MessageKind::PositionSnapshot:
      normalizePositions(records, out);
      break;
    case MessageKind::BalanceSnapshot:
      normalizeBalances(records, out);
      break;
    case MessageKind::FundingEvent:
      normalizeFunding(raw, records, out);
      break;
  }
  return out;
}

std::optional<std::string> EventNormalizer::resolvePair(
    const json& record, const char* context) const {
  const std::string symbol = stringField(record, "instrument_name");
  if (symbol.empty()) {
    std::cerr << "[EventNormalizer] WARNING: " << context
              << " record without instrument_name. Dropping.\n";
    return std::nullopt;
  }
  auto pair = symbols_.toTradingPair(symbol);
  if (!pair) {
    std::cerr << "[EventNormalizer] WARNING: unresolved instrument '"
              << symbol << "' in " << context << " record. Dropping.\n";
  }
  return pair;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void EventNormalizer::normalizeOrders(const RawMessage& raw,
                                      const json& records,
                                      NormalizationResult& out) const {
  for (const auto& record : records) {
    if (!record.is_object()) {
      ++out.dropped;
      continue;
    }

    std::string client_id = idField(record, "label").value_or(
        raw.client_order_id_hint);
    if (client_id.empty()) {
      std::cerr << "[EventNormalizer] WARNING: order record without label ("
                << toString(raw.source) << "). Dropping.\n";
      ++out.dropped;
      continue;
    }

    const std::string status = stringField(record, "order_status");
    auto state = mapOrderStatus(status);
    if (!state) {
      std::cerr << "[EventNormalizer] WARNING: unknown order_status '" << status
                << "' for client_order_id=" << client_id << ". Dropping.\n";
      ++out.dropped;
      continue;
    }

    OrderStatusUpdate update;
    if (record.contains("instrument_name")) {
      auto pair = resolvePair(record, "order");
      if (!pair) {
        ++out.dropped;
        continue;
      }
      update.trading_pair = *pair;
    }
    update.client_order_id = std::move(client_id);
    update.exchange_order_id = idField(record, "order_id");
    update.new_state = *state;
    update.update_timestamp_ms =
        integerField(record, "last_update_timestamp").value_or(0);

    out.updates.emplace_back(std::move(update));
  }
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
void EventNormalizer::normalizeTrades(const RawMessage& raw,
                                      const json& records,
                                      NormalizationResult& out) const {
  for (const auto& record : records) {
    if (!record.is_object()) {
      ++out.dropped;
      continue;
    }

    auto trade_id = idField(record, "trade_id");
    auto order_id = idField(record, "order_id");
    auto price = numberField(record, "trade_price");
    auto amount = numberField(record, "trade_amount");
    if (!trade_id || !order_id || !price || !amount || *amount <= 0.0) {
      std::cerr << "[EventNormalizer] WARNING: incomplete trade record ("
                << toString(raw.source) << "): " << record.dump()
                << ". Dropping.\n";
      ++out.dropped;
      continue;
    }

    auto pair = resolvePair(record, "trade");
    if (!pair) {
      ++out.dropped;
      continue;
    }

    FillUpdate update;
    domain::Fill& fill = update.fill;
    fill.trade_id = *trade_id;
    fill.exchange_order_id = *order_id;
    fill.trading_pair = *pair;
    fill.fill_price = *price;
    fill.fill_base_amount = *amount;
    fill.fill_quote_amount =
        numberField(record, "quote_amount").value_or(*price * *amount);
    fill.fee_amount = numberField(record, "trade_fee").value_or(0.0);
    fill.fee_asset = stringField(record, "fee_asset");
    if (fill.fee_asset.empty()) {
      fill.fee_asset = quoteCurrency(*pair);
    }
    fill.fill_timestamp_ms = integerField(record, "timestamp").value_or(0);

    out.updates.emplace_back(std::move(update));
  }
}

// -----------------------------------------------------------------------------
// Positions: one snapshot, zero-amount rows filtered
// -----------------------------------------------------------------------------
void EventNormalizer::normalizePositions(const json& records,
                                         NormalizationResult& out) const {
  PositionSnapshot snapshot;

  for (const auto& record : records) {
    if (!record.is_object()) {
      ++out.dropped;
      continue;
    }
    auto amount = numberField(record, "amount");
    if (!amount) {
      std::cerr << "[EventNormalizer] WARNING: position record without "
                   "amount: " << record.dump() << ". Dropping.\n";
      ++out.dropped;
      continue;
    }
    auto pair = resolvePair(record, "position");
    if (!pair) {
      ++out.dropped;
      continue;
    }
    if (*amount == 0.0) {
      continue;
    }

    domain::Position pos;
    pos.trading_pair = *pair;
    pos.amount = *amount;
    pos.side = *amount > 0.0 ? domain::PositionSide::Long
                             : domain::PositionSide::Short;
    pos.entry_price = numberField(record, "average_price")
                          .value_or(numberField(record, "index_price")
                                        .value_or(0.0));
    pos.mark_price = numberField(record, "mark_price").value_or(0.0);
    pos.unrealized_pnl = numberField(record, "unrealized_pnl").value_or(0.0);
    pos.leverage = numberField(record, "leverage").value_or(0.0);
    snapshot.positions.push_back(std::move(pos));
  }

  out.updates.emplace_back(std::move(snapshot));
}

// -----------------------------------------------------------------------------
// Balances: one snapshot, available falls back to total
// -----------------------------------------------------------------------------
void EventNormalizer::normalizeBalances(const json& records,
                                        NormalizationResult& out) const {
  BalanceSnapshot snapshot;

  for (const auto& record : records) {
    if (!record.is_object()) {
      ++out.dropped;
      continue;
    }
    const std::string asset = stringField(record, "asset_name");
    auto amount = numberField(record, "amount");
    if (asset.empty() || !amount) {
      std::cerr << "[EventNormalizer] WARNING: incomplete collateral record: "
                << record.dump() << ". Dropping.\n";
      ++out.dropped;
      continue;
    }

    domain::Balance balance;
    balance.asset = asset;
    balance.total = *amount;
    balance.available = numberField(record, "available").value_or(*amount);
    snapshot.balances.push_back(std::move(balance));
  }

  out.updates.emplace_back(std::move(snapshot));
}

// -----------------------------------------------------------------------------
// Funding: most recent settlement only; zero funding is "no payment"
// -----------------------------------------------------------------------------
void EventNormalizer::normalizeFunding(const RawMessage& raw,
                                       const json& records,
                                       NormalizationResult& out) const {
  const json* latest = nullptr;
  std::int64_t latest_ts = 0;
  for (const auto& record : records) {
    if (!record.is_object()) {
      continue;
    }
    const std::int64_t ts = integerField(record, "timestamp").value_or(0);
    if (latest == nullptr || ts > latest_ts) {
      latest = &record;
      latest_ts = ts;
    }
  }

  std::string pair = raw.trading_pair_hint;
  if (latest != nullptr && latest->contains("instrument_name")) {
    auto resolved = resolvePair(*latest, "funding");
    if (!resolved) {
      ++out.dropped;
      return;
    }
    pair = *resolved;
  }
  if (pair.empty()) {
    std::cerr << "[EventNormalizer] WARNING: funding response with no "
                 "trading pair. Dropping.\n";
    ++out.dropped;
    return;
  }

  FundingUpdate update;
  update.payment = domain::FundingPayment::none(pair);

  if (latest != nullptr) {
    const double funding = numberField(*latest, "funding").value_or(0.0);
    if (funding != 0.0) {
      update.payment.timestamp_ms = latest_ts;
      update.payment.payment = funding;
      update.payment.funding_rate =
          numberField(*latest, "funding_rate")
              .value_or(numberField(*latest, "pnl").value_or(0.0));
    }
  }

  out.updates.emplace_back(std::move(update));
}

}  // namespace recon
