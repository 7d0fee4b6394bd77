#include "riskledger/config/config_loader.hpp"

#include <cmath>
#include <fstream>
#include <iostream>

namespace riskledger {

using nlohmann::json;

namespace {

// ---- field readers: missing key keeps the default, wrong type throws ----

domain::Money readMoney(const json& j, const char* key, domain::Money fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const json& v = j.at(key);
  if (v.is_string()) {
    auto parsed = domain::Money::parse(v.get<std::string>());
    if (!parsed) {
      throw ConfigError(std::string("'") + key +
                        "' is not a decimal amount: " + v.get<std::string>());
    }
    return *parsed;
  }
  if (!v.is_number()) {
    throw ConfigError(std::string("'") + key + "' must be a number");
  }
  try {
    return domain::Money::fromDouble(v.get<double>());
  } catch (const std::overflow_error& e) {
    throw ConfigError(std::string("'") + key + "' out of range: " + e.what());
  }
}

double readDouble(const json& j, const char* key, double fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const json& v = j.at(key);
  if (!v.is_number() || !std::isfinite(v.get<double>())) {
    throw ConfigError(std::string("'") + key + "' must be a finite number");
  }
  return v.get<double>();
}

std::int64_t readInt(const json& j, const char* key, std::int64_t fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const json& v = j.at(key);
  if (!v.is_number_integer()) {
    throw ConfigError(std::string("'") + key + "' must be an integer");
  }
  return v.get<std::int64_t>();
}

std::string readString(const json& j, const char* key,
                       const std::string& fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const json& v = j.at(key);
  if (!v.is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a string");
  }
  return v.get<std::string>();
}

const json& section(const json& j, const char* key) {
  static const json kEmpty = json::object();
  if (!j.contains(key)) {
    return kEmpty;
  }
  const json& s = j.at(key);
  if (!s.is_object()) {
    throw ConfigError(std::string("section '") + key + "' must be an object");
  }
  return s;
}

void requireNonNegative(domain::Money value, const char* key) {
  if (value.isNegative()) {
    throw ConfigError(std::string("'") + key + "' must not be negative");
  }
}

void requireFraction(double value, const char* key) {
  if (value < 0.0 || value > 1.0) {
    throw ConfigError(std::string("'") + key + "' must lie in [0, 1]");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// riskLimitsFromJson / riskLimitsToJson
// -----------------------------------------------------------------------------
domain::RiskLimits riskLimitsFromJson(const json& j,
                                      const domain::RiskLimits& defaults) {
  if (!j.is_object()) {
    throw ConfigError("risk_limits must be an object");
  }

  domain::RiskLimits l;
  l.min_cash_reserve =
      readMoney(j, "min_cash_reserve", defaults.min_cash_reserve);
  l.max_trade_value = readMoney(j, "max_trade_value", defaults.max_trade_value);
  l.max_daily_loss = readMoney(j, "max_daily_loss", defaults.max_daily_loss);
  l.max_position_value =
      readMoney(j, "max_position_value", defaults.max_position_value);
  l.max_position_ratio =
      readDouble(j, "max_position_ratio", defaults.max_position_ratio);
  l.max_sector_concentration = readDouble(j, "max_sector_concentration",
                                          defaults.max_sector_concentration);
  l.max_daily_trades = readInt(j, "max_daily_trades", defaults.max_daily_trades);
  l.max_order_frequency =
      readInt(j, "max_order_frequency", defaults.max_order_frequency);
  l.max_drawdown = readDouble(j, "max_drawdown", defaults.max_drawdown);

  requireNonNegative(l.min_cash_reserve, "min_cash_reserve");
  requireNonNegative(l.max_trade_value, "max_trade_value");
  requireNonNegative(l.max_daily_loss, "max_daily_loss");
  requireNonNegative(l.max_position_value, "max_position_value");
  requireFraction(l.max_position_ratio, "max_position_ratio");
  requireFraction(l.max_sector_concentration, "max_sector_concentration");
  requireFraction(l.max_drawdown, "max_drawdown");
  if (l.max_daily_trades < 0 || l.max_order_frequency < 0) {
    throw ConfigError("trade count limits must not be negative");
  }
  return l;
}

json riskLimitsToJson(const domain::RiskLimits& l) {
  return json{
      {"min_cash_reserve", l.min_cash_reserve.toString()},
      {"max_trade_value", l.max_trade_value.toString()},
      {"max_daily_loss", l.max_daily_loss.toString()},
      {"max_position_value", l.max_position_value.toString()},
      {"max_position_ratio", l.max_position_ratio},
      {"max_sector_concentration", l.max_sector_concentration},
      {"max_daily_trades", l.max_daily_trades},
      {"max_order_frequency", l.max_order_frequency},
      {"max_drawdown", l.max_drawdown},
  };
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be an object");
  }

  EngineConfig config;
  config.account_id = readString(j, "account_id", config.account_id);
  config.initial_cash = readMoney(j, "initial_cash", config.initial_cash);
  if (!config.initial_cash.isPositive()) {
    throw ConfigError("'initial_cash' must be positive");
  }
  const std::int64_t history = readInt(
      j, "max_trade_history",
      static_cast<std::int64_t>(config.max_trade_history));
  if (history < 1) {
    throw ConfigError("'max_trade_history' must be at least 1");
  }
  config.max_trade_history = static_cast<std::size_t>(history);

  const json& commission = section(j, "commission");
  config.commission.rate =
      readDouble(commission, "rate", config.commission.rate);
  config.commission.minimum =
      readMoney(commission, "minimum", config.commission.minimum);
  requireFraction(config.commission.rate, "rate");
  requireNonNegative(config.commission.minimum, "minimum");

  config.risk_limits = riskLimitsFromJson(section(j, "risk_limits"));

  const json& market = section(j, "market_data");
  config.market_data.endpoint =
      readString(market, "endpoint", config.market_data.endpoint);
  config.market_data.max_quote_age_ms = readInt(
      market, "max_quote_age_ms", config.market_data.max_quote_age_ms);
  if (config.market_data.max_quote_age_ms < 0) {
    throw ConfigError("'max_quote_age_ms' must not be negative");
  }

  const json& ipc = section(j, "ipc");
  config.ipc.command_endpoint =
      readString(ipc, "command_endpoint", config.ipc.command_endpoint);
  config.ipc.telemetry_endpoint =
      readString(ipc, "telemetry_endpoint", config.ipc.telemetry_endpoint);
  return config;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("malformed JSON in " + path + ": " + e.what());
  }

  EngineConfig config = parseConfig(j);
  std::cout << "[Config] Loaded " << path << " (account "
            << config.account_id << ", initial cash "
            << config.initial_cash.toString() << ")\n";
  return config;
}

}  // namespace riskledger
