#pragma once

#include <stdexcept>
#include <string>

namespace recon {

// -----------------------------------------------------------------------------
// Local error types
// -----------------------------------------------------------------------------
// Thrown for errors the caller made (bad order parameters, reused client id,
// broken configuration file). Exchange-side outcomes never throw: they travel
// as TransportError values (see transport/transport_types.hpp), and
// unattributable or malformed exchange events are logged and dropped inside
// the ReconciliationEngine.
// -----------------------------------------------------------------------------

// Bad local order parameters. The order is never registered.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& what)
      : std::runtime_error(what) {}
};

// The client order id is already tracked (active or recently completed).
class DuplicateOrderError : public ValidationError {
 public:
  explicit DuplicateOrderError(const std::string& client_order_id)
      : ValidationError("duplicate client order id: " + client_order_id),
        client_order_id_(client_order_id) {}

  const std::string& clientOrderId() const { return client_order_id_; }

 private:
  std::string client_order_id_;
};

// Configuration file missing, unparsable, or holding invalid values.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace recon
