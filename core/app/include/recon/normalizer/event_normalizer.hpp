#pragma once

#include "recon/domain/order_state.hpp"
#include "recon/events/canonical_update.hpp"
#include "recon/normalizer/raw_message.hpp"
#include "recon/symbols/i_symbol_mapper.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace recon {

// -----------------------------------------------------------------------------
// NormalizationResult
// -----------------------------------------------------------------------------
// error is set when the payload as a whole could not be used: an exchange
// error envelope (carrying the exchange's message verbatim) or a response
// without the expected shape. In that case updates is empty.
//
// dropped counts individual records skipped inside an otherwise usable
// payload (unknown status, unresolved pair, missing identity field).
// -----------------------------------------------------------------------------
struct NormalizationResult {
  std::vector<CanonicalUpdate> updates;
  std::optional<std::string> error;
  std::size_t dropped{0};

  bool ok() const { return !error.has_value(); }
};

// -----------------------------------------------------------------------------
// EventNormalizer — raw exchange payload → canonical updates
// -----------------------------------------------------------------------------
//
// @brief  The only place in the core that knows exchange field names. Turns
//         a RawMessage into zero or more CanonicalUpdate values.
//
// @details
// Per kind:
//
//   OrderStatus      → OrderStatusUpdate per order record
//                      (label, order_id, order_status, last_update_timestamp)
//   Trade            → FillUpdate per trade record
//                      (trade_id, order_id, instrument_name, trade_price,
//                       trade_amount, trade_fee, timestamp)
//   PositionSnapshot → one PositionSnapshot for the whole list
//   BalanceSnapshot  → one BalanceSnapshot for the whole list
//   FundingEvent     → one FundingUpdate from the most recent event, or the
//                      "no payment" sentinel
//
// Numeric fields are accepted as JSON numbers or numeric strings (the
// exchange sends decimals as strings). Missing optional fields take
// sentinel defaults; missing identity fields drop the record.
//
// A snapshot response without its list is an error, not an empty snapshot:
// treating it as empty would wipe every position or balance.
//
// Thread model:
//   Stateless apart from the borrowed ISymbolMapper; normalize() is safe to
//   call concurrently from the stream and poll threads.
// -----------------------------------------------------------------------------
class EventNormalizer {
 public:
  explicit EventNormalizer(const ISymbolMapper& symbols);

  NormalizationResult normalize(const RawMessage& raw) const;

  // Exchange order_status string → OrderState. std::nullopt for strings the
  // connector does not know; such records are dropped.
  static std::optional<domain::OrderState> mapOrderStatus(
      const std::string& exchange_status);

 private:
  void normalizeOrders(const RawMessage& raw, const nlohmann::json& records,
                       NormalizationResult& out) const;
  void normalizeTrades(const RawMessage& raw, const nlohmann::json& records,
                       NormalizationResult& out) const;
  void normalizePositions(const nlohmann::json& records,
                          NormalizationResult& out) const;
  void normalizeBalances(const nlohmann::json& records,
                         NormalizationResult& out) const;
  void normalizeFunding(const RawMessage& raw, const nlohmann::json& records,
                        NormalizationResult& out) const;

  // Pair from an instrument_name field, or std::nullopt with a warning.
  std::optional<std::string> resolvePair(const nlohmann::json& record,
                                         const char* context) const;

  const ISymbolMapper& symbols_;
};

}  // namespace recon
