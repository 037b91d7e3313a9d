#pragma once

#include <optional>
#include <string>

namespace recon {

// -----------------------------------------------------------------------------
// ISymbolMapper — exchange symbol <-> canonical trading pair
// -----------------------------------------------------------------------------
// Fails closed: an unknown name yields std::nullopt, never a guess. Callers
// drop whatever they were resolving and log a warning.
//
// Implementations must be safe for concurrent lookups from the stream and
// poll threads.
// -----------------------------------------------------------------------------
class ISymbolMapper {
 public:
  virtual ~ISymbolMapper() = default;

  virtual std::optional<std::string> toTradingPair(
      const std::string& exchange_symbol) const = 0;

  virtual std::optional<std::string> toExchangeSymbol(
      const std::string& trading_pair) const = 0;
};

}  // namespace recon
