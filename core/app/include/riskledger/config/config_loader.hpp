#pragma once

#include "riskledger/domain/commission_schedule.hpp"
#include "riskledger/domain/money.hpp"
#include "riskledger/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace riskledger {

// Thrown for unreadable files, malformed JSON, wrong value types and values
// outside their valid range. Startup-only; never thrown once the engine runs.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct MarketDataConfig {
  std::string endpoint{"tcp://127.0.0.1:5555"};
  std::int64_t max_quote_age_ms{0};  // 0 = quotes never go stale
};

struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig — everything main() needs to wire one account
// -----------------------------------------------------------------------------
//
// JSON layout (every key optional, defaults below):
//
//   {
//     "account_id": "paper-001",
//     "initial_cash": 1000000,
//     "max_trade_history": 1000,
//     "commission":  { "rate": 0.001, "minimum": 10 },
//     "risk_limits": { "min_cash_reserve": 10000, ..., "max_drawdown": 0.15 },
//     "market_data": { "endpoint": "tcp://127.0.0.1:5555",
//                      "max_quote_age_ms": 0 },
//     "ipc":         { "command_endpoint": "tcp://127.0.0.1:5556",
//                      "telemetry_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// Money values may be JSON numbers or decimal strings ("10000.50").
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string account_id{"paper-001"};
  domain::Money initial_cash{domain::Money::fromUnits(1'000'000)};
  std::size_t max_trade_history{1000};
  domain::CommissionSchedule commission;
  domain::RiskLimits risk_limits;
  MarketDataConfig market_data;
  IpcConfig ipc;
};

// Reads and parses the file. Throws ConfigError.
EngineConfig loadConfig(const std::string& path);

// Parses an already-decoded document. Throws ConfigError.
EngineConfig parseConfig(const nlohmann::json& j);

// Missing keys keep the value from `defaults`.
domain::RiskLimits riskLimitsFromJson(const nlohmann::json& j,
                                      const domain::RiskLimits& defaults = {});

nlohmann::json riskLimitsToJson(const domain::RiskLimits& limits);

}  // namespace riskledger
