#include "recon/config/config_loader.hpp"
#include "recon/domain/errors.hpp"

#include <fstream>

namespace recon {
namespace config {

namespace {

// Overwrites target only when the key is present.
template <typename T>
void readIfPresent(const nlohmann::json& obj, const char* key, T& target) {
  if (obj.contains(key)) {
    target = obj.at(key).get<T>();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// from_json: nested sections map onto the flat ConnectorConfig
// -----------------------------------------------------------------------------
void from_json(const nlohmann::json& j, ConnectorConfig& c) {
  if (j.contains("account")) {
    const auto& account = j.at("account");
    readIfPresent(account, "id", c.account_id);
    readIfPresent(account, "broker_id", c.broker_id);
    readIfPresent(account, "max_client_order_id_len",
                  c.max_client_order_id_len);
  }

  if (j.contains("trading_pairs")) {
    c.trading_pairs.clear();
    for (const auto& pair : j.at("trading_pairs")) {
      c.trading_pairs.push_back(pair.get<std::string>());
    }
  }

  if (j.contains("registry")) {
    const auto& registry = j.at("registry");
    readIfPresent(registry, "fill_epsilon", c.fill_epsilon);
    readIfPresent(registry, "completed_history_size",
                  c.completed_history_size);
    readIfPresent(registry, "fill_history_size", c.fill_history_size);
  }

  if (j.contains("polling")) {
    const auto& polling = j.at("polling");
    readIfPresent(polling, "short_interval_ms", c.short_poll_interval_ms);
    readIfPresent(polling, "long_interval_ms", c.long_poll_interval_ms);
    readIfPresent(polling, "funding_interval_ms", c.funding_poll_interval_ms);
  }

  if (j.contains("stream")) {
    const auto& stream = j.at("stream");
    readIfPresent(stream, "endpoint", c.stream_endpoint);
    readIfPresent(stream, "poll_timeout_ms", c.stream_poll_timeout_ms);
    readIfPresent(stream, "retry_delay_ms", c.stream_retry_delay_ms);
  }

  readIfPresent(j, "warm_start", c.warm_start);
  readIfPresent(j, "debug_logging", c.debug_logging);
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
void validateConfig(const ConnectorConfig& c) {
  if (c.account_id.empty()) {
    throw ConfigError("account.id must not be empty");
  }
  if (c.broker_id.empty()) {
    throw ConfigError("account.broker_id must not be empty");
  }
  // "0x" prefix plus at least a few hex digits of the digest.
  if (c.max_client_order_id_len < 8) {
    throw ConfigError("account.max_client_order_id_len must be >= 8");
  }
  if (c.trading_pairs.empty()) {
    throw ConfigError("trading_pairs must list at least one pair");
  }
  if (c.fill_epsilon < 0.0) {
    throw ConfigError("registry.fill_epsilon must be >= 0");
  }
  if (c.completed_history_size == 0) {
    throw ConfigError("registry.completed_history_size must be > 0");
  }
  if (c.fill_history_size == 0) {
    throw ConfigError("registry.fill_history_size must be > 0");
  }
  if (c.short_poll_interval_ms <= 0 || c.long_poll_interval_ms <= 0 ||
      c.funding_poll_interval_ms <= 0) {
    throw ConfigError("polling intervals must be positive");
  }
  if (c.stream_poll_timeout_ms <= 0 || c.stream_retry_delay_ms < 0) {
    throw ConfigError("stream timeouts must be non-negative");
  }
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
ConnectorConfig parseConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  ConnectorConfig c;
  try {
    c = j.get<ConnectorConfig>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration value: ") + e.what());
  }

  validateConfig(c);
  return c;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
ConnectorConfig loadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("failed to open config file: " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("failed to parse config file " + path + ": " + e.what());
  }

  return parseConfig(j);
}

}  // namespace config
}  // namespace recon
