#pragma once

#include "recon/domain/order.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace recon {
namespace transport {

// -----------------------------------------------------------------------------
// TransportErrorKind
// -----------------------------------------------------------------------------
// NotFound          The exchange does not know the order (cancel or status
//                   query). Callers treat this as an implicit cancellation.
// Rejected          The exchange refused the request (bad params, margin).
// TransientNetwork  Timeout, disconnect, 5xx. Safe to retry next cycle.
// Unknown           Anything else.
// -----------------------------------------------------------------------------
enum class TransportErrorKind {
  NotFound,
  Rejected,
  TransientNetwork,
  Unknown,
};

inline const char* toString(TransportErrorKind kind) {
  switch (kind) {
    case TransportErrorKind::NotFound:         return "NotFound";
    case TransportErrorKind::Rejected:         return "Rejected";
    case TransportErrorKind::TransientNetwork: return "TransientNetwork";
    case TransportErrorKind::Unknown:          return "Unknown";
  }
  return "Unknown";
}

struct TransportError {
  TransportErrorKind kind{TransportErrorKind::Unknown};
  std::string message;
};

// Either the call's value or the reason it failed.
template <typename T>
using TransportResult = std::variant<T, TransportError>;

template <typename T>
bool isError(const TransportResult<T>& result) {
  return std::holds_alternative<TransportError>(result);
}

// -----------------------------------------------------------------------------
// Request / response payloads
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string client_order_id;
  std::string exchange_symbol;   // e.g. "ETH-PERP"
  domain::Side side{domain::Side::Buy};
  domain::OrderType order_type{domain::OrderType::Limit};
  double price{0.0};
  double amount{0.0};
};

struct SubmitAck {
  std::string exchange_order_id;
  std::int64_t accepted_timestamp_ms{0};  // Exchange time of acceptance
};

struct CancelRequest {
  std::string client_order_id;
  std::string exchange_order_id;
  std::string exchange_symbol;
};

}  // namespace transport
}  // namespace recon
