#pragma once

#include "recon/symbols/i_symbol_mapper.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace recon {

// -----------------------------------------------------------------------------
// SymbolMap — instrument-derived ISymbolMapper
// -----------------------------------------------------------------------------
//
// @brief  Bidirectional map between exchange instrument names ("ETH-PERP")
//         and canonical trading pairs ("ETH-USDC").
//
// @details
// Perpetual instruments all settle in USDC, so the canonical pair is always
// "<BASE>-USDC" whatever quote suffix the instrument name carries.
//
// The map is rebuilt wholesale from the exchange's instrument list on the
// poll scheduler's long cycle. Inactive instruments and entries without an
// instrument_name are skipped. A rebuild swaps both directions under one
// exclusive lock, so readers never observe a half-built map.
//
// Thread model:
//   Lookups take a shared_lock and may run concurrently from the stream
//   listener and poll scheduler threads. rebuild()/add() take a unique_lock.
// -----------------------------------------------------------------------------
class SymbolMap final : public ISymbolMapper {
 public:
  SymbolMap() = default;

  SymbolMap(const SymbolMap&) = delete;
  SymbolMap& operator=(const SymbolMap&) = delete;

  std::optional<std::string> toTradingPair(
      const std::string& exchange_symbol) const override;

  std::optional<std::string> toExchangeSymbol(
      const std::string& trading_pair) const override;

  // Inserts one mapping, replacing any previous mapping of either name.
  void add(const std::string& exchange_symbol, const std::string& trading_pair);

  // -------------------------------------------------------------------------
  // rebuild(instruments)
  // -------------------------------------------------------------------------
  // @param  instruments  Array of instrument records, or a response
  //                      envelope {"result": {"instruments": [...]}} or
  //                      {"result": [...]}.
  // @return Number of mappings in the new map.
  //
  // A payload that contains no usable instrument leaves the current map in
  // place (returns 0): an empty or broken response must not unmap every
  // symbol the connector is trading.
  // -------------------------------------------------------------------------
  std::size_t rebuild(const nlohmann::json& instruments);

  std::size_t size() const;

  // "ETH-PERP" -> "ETH-USDC". Empty when the name has no base part.
  static std::string canonicalPairFor(const std::string& exchange_symbol);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::string> to_pair_;      // exchange → pair
  std::unordered_map<std::string, std::string> to_exchange_;  // pair → exchange
};

}  // namespace recon
