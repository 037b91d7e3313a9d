#pragma once

#include <cstdint>
#include <string>

namespace recon {
namespace domain {

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
// Responsibility: one trade execution against one of our orders, exactly as
// reported by the exchange (stream trade message or trade-history poll).
//
// @details
// trade_id is globally unique per exchange and is the deduplication key: the
// same fill normally arrives twice, once from the stream and again from the
// next trade-history poll, and must be applied only once.
//
// The owning order is identified by exchange_order_id. client_order_id is
// filled in once the ReconciliationEngine has attributed the fill; it is
// empty straight out of the normalizer.
//
// fill_quote_amount is the exchange-reported value. The normalizer only
// computes price * amount when the exchange omits it.
// -----------------------------------------------------------------------------
struct Fill {
  std::string trade_id;
  std::string exchange_order_id;
  std::string client_order_id;
  std::string trading_pair;
  double fill_price{0.0};
  double fill_base_amount{0.0};
  double fill_quote_amount{0.0};
  double fee_amount{0.0};
  std::string fee_asset;
  std::int64_t fill_timestamp_ms{0};
};

}  // namespace domain
}  // namespace recon
