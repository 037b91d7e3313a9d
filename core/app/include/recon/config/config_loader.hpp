#pragma once

#include "recon/config/connector_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace recon {
namespace config {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
// JSON layout (every key optional, absent keys keep the struct default):
//
//   {
//     "account":  { "id": "...", "broker_id": "HBOT",
//                   "max_client_order_id_len": 32 },
//     "trading_pairs": ["ETH-USDC", "BTC-USDC"],
//     "registry": { "fill_epsilon": 1e-9, "completed_history_size": 500,
//                   "fill_history_size": 5000 },
//     "polling":  { "short_interval_ms": 5000, "long_interval_ms": 60000,
//                   "funding_interval_ms": 120000 },
//     "stream":   { "endpoint": "tcp://127.0.0.1:5557",
//                   "poll_timeout_ms": 100, "retry_delay_ms": 1000 },
//     "warm_start": true,
//     "debug_logging": false
//   }
//
// Errors: a missing or unreadable file, malformed JSON, a value of the wrong
// type, or a value outside its valid range all throw ConfigError.
// -----------------------------------------------------------------------------

// nlohmann ADL hook. Throws nlohmann::json::exception on type mismatch;
// parseConfig() converts that into ConfigError.
void from_json(const nlohmann::json& j, ConnectorConfig& c);

// Parses and validates an already-decoded JSON document.
ConnectorConfig parseConfig(const nlohmann::json& j);

// Reads, parses and validates a JSON configuration file.
ConnectorConfig loadConfig(const std::string& path);

// Range checks shared by both entry points. Throws ConfigError.
void validateConfig(const ConnectorConfig& c);

}  // namespace config
}  // namespace recon
