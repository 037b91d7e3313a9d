#pragma once

#include "recon/domain/order.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace recon {

// -----------------------------------------------------------------------------
// ClientOrderIdFactory — content-addressed client order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces a unique client order id for every order submission:
//         "0x" followed by the MD5 hex digest of a broker-prefixed raw id.
//
// @details
// Raw id layout:
//
//   <broker_id><B|S><BASE[:4]><QUOTE[:4]><nonce>
//
// capped at max_len characters by trimming the prefix part, never the
// nonce. The digest gives a
// fixed-length hex id that satisfies the exchange's label charset and
// length limits regardless of pair names.
//
// The nonce is an atomic counter starting at the value given to the
// constructor. Callers seed it from the clock so ids do not repeat across
// restarts; tests seed it with a constant to get deterministic ids.
//
// Thread model:
//   next() is safe to call concurrently. fetch_add with relaxed ordering is
//   enough: the only requirement is that every call sees a distinct nonce.
// -----------------------------------------------------------------------------
class ClientOrderIdFactory {
 public:
  ClientOrderIdFactory(std::string broker_id, std::size_t max_len,
                       std::uint64_t first_nonce = 1);

  ClientOrderIdFactory(const ClientOrderIdFactory&) = delete;
  ClientOrderIdFactory& operator=(const ClientOrderIdFactory&) = delete;
  ClientOrderIdFactory(ClientOrderIdFactory&&) = delete;
  ClientOrderIdFactory& operator=(ClientOrderIdFactory&&) = delete;

  // Returns a fresh "0x..." id. Throws std::runtime_error if the digest
  // cannot be computed.
  std::string next(domain::Side side, const std::string& trading_pair);

  // Pre-digest id for a given nonce. Exposed for tests and logging.
  std::string rawId(domain::Side side, const std::string& trading_pair,
                    std::uint64_t nonce) const;

  // "0x" + lowercase MD5 hex of input.
  static std::string md5Hex(const std::string& input);

 private:
  const std::string broker_id_;
  const std::size_t max_len_;
  std::atomic<std::uint64_t> nonce_;
};

}  // namespace recon
