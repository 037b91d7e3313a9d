#include "recon/symbols/symbol_map.hpp"

#include <iostream>
#include <mutex>

namespace recon {

namespace {

constexpr const char* kSettlementCurrency = "USDC";

const nlohmann::json* instrumentList(const nlohmann::json& payload) {
  if (payload.is_array()) {
    return &payload;
  }
  if (payload.is_object() && payload.contains("result")) {
    const auto& result = payload.at("result");
    if (result.is_array()) {
      return &result;
    }
    if (result.is_object() && result.contains("instruments") &&
        result.at("instruments").is_array()) {
      return &result.at("instruments");
    }
  }
  return nullptr;
}

}  // namespace

std::optional<std::string> SymbolMap::toTradingPair(
    const std::string& exchange_symbol) const {
  std::shared_lock lock(mutex_);
  auto it = to_pair_.find(exchange_symbol);
  if (it == to_pair_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> SymbolMap::toExchangeSymbol(
    const std::string& trading_pair) const {
  std::shared_lock lock(mutex_);
  auto it = to_exchange_.find(trading_pair);
  if (it == to_exchange_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SymbolMap::add(const std::string& exchange_symbol,
                    const std::string& trading_pair) {
  std::unique_lock lock(mutex_);
  if (auto it = to_pair_.find(exchange_symbol); it != to_pair_.end()) {
    to_exchange_.erase(it->second);
  }
  if (auto it = to_exchange_.find(trading_pair); it != to_exchange_.end()) {
    to_pair_.erase(it->second);
  }
  to_pair_[exchange_symbol] = trading_pair;
  to_exchange_[trading_pair] = exchange_symbol;
}

std::size_t SymbolMap::rebuild(const nlohmann::json& instruments) {
  const nlohmann::json* list = instrumentList(instruments);
  if (list == nullptr) {
    std::cerr << "[SymbolMap] WARNING: instrument payload has no instrument "
                 "list. Keeping current map.\n";
    return 0;
  }

  std::unordered_map<std::string, std::string> to_pair;
  std::unordered_map<std::string, std::string> to_exchange;

  for (const auto& info : *list) {
    if (!info.is_object() || !info.contains("instrument_name") ||
        !info.at("instrument_name").is_string()) {
      continue;
    }
    if (info.contains("is_active") && info.at("is_active").is_boolean() &&
        !info.at("is_active").get<bool>()) {
      continue;
    }

    const auto name = info.at("instrument_name").get<std::string>();
    const auto pair = canonicalPairFor(name);
    if (pair.empty()) {
      continue;
    }
    to_pair[name] = pair;
    to_exchange[pair] = name;
  }

  if (to_pair.empty()) {
    std::cerr << "[SymbolMap] WARNING: instrument payload has no active "
                 "instruments. Keeping current map.\n";
    return 0;
  }

  std::unique_lock lock(mutex_);
  to_pair_.swap(to_pair);
  to_exchange_.swap(to_exchange);
  return to_pair_.size();
}

std::size_t SymbolMap::size() const {
  std::shared_lock lock(mutex_);
  return to_pair_.size();
}

std::string SymbolMap::canonicalPairFor(const std::string& exchange_symbol) {
  const auto dash = exchange_symbol.find('-');
  const std::string base = exchange_symbol.substr(0, dash);
  if (base.empty()) {
    return {};
  }
  return base + "-" + kSettlementCurrency;
}

}  // namespace recon
