// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for the JSON configuration layer.
//
// Validates:
//   - Missing keys keep defaults; present keys override
//   - Money accepts JSON numbers and decimal strings
//   - Wrong types and out-of-range values raise ConfigError
//   - Risk limits survive a to-JSON / from-JSON trip
//   - loadConfig reads files and reports unreadable or malformed ones
// =============================================================================

#include "riskledger/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;
using riskledger::ConfigError;
using riskledger::domain::Money;
using riskledger::domain::RiskLimits;

namespace {

// Writes text to a file under the temp dir and removes it on scope exit.
class TempFile {
 public:
  TempFile(const std::string& name, const std::string& text)
      : path_((std::filesystem::temp_directory_path() / name).string()) {
    std::ofstream out(path_);
    out << text;
  }
  ~TempFile() { std::remove(path_.c_str()); }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the documented defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
  auto config = riskledger::parseConfig(json::object());

  EXPECT_EQ(config.account_id, "paper-001");
  EXPECT_EQ(config.initial_cash, Money::fromUnits(1'000'000));
  EXPECT_EQ(config.max_trade_history, 1000u);
  EXPECT_DOUBLE_EQ(config.commission.rate, 0.001);
  EXPECT_EQ(config.commission.minimum, Money::fromUnits(10));
  EXPECT_EQ(config.risk_limits, RiskLimits{});
  EXPECT_EQ(config.market_data.endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.market_data.max_quote_age_ms, 0);
  EXPECT_EQ(config.ipc.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.ipc.telemetry_endpoint, "tcp://127.0.0.1:5557");
}

// -----------------------------------------------------------------------------
// 2. Present keys override; untouched siblings keep defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, OverridesApply) {
  json j = {
      {"account_id", "acct-7"},
      {"initial_cash", "250000.50"},
      {"commission", {{"rate", 0.0005}, {"minimum", 5}}},
      {"risk_limits", {{"max_trade_value", 20000}, {"max_daily_trades", 3}}},
      {"market_data", {{"max_quote_age_ms", 1500}}},
  };

  auto config = riskledger::parseConfig(j);

  EXPECT_EQ(config.account_id, "acct-7");
  EXPECT_EQ(config.initial_cash, *Money::parse("250000.5"));
  EXPECT_DOUBLE_EQ(config.commission.rate, 0.0005);
  EXPECT_EQ(config.commission.minimum, Money::fromUnits(5));
  EXPECT_EQ(config.risk_limits.max_trade_value, Money::fromUnits(20'000));
  EXPECT_EQ(config.risk_limits.max_daily_trades, 3);
  EXPECT_EQ(config.risk_limits.min_cash_reserve, Money::fromUnits(10'000));
  EXPECT_EQ(config.market_data.max_quote_age_ms, 1500);
  EXPECT_EQ(config.market_data.endpoint, "tcp://127.0.0.1:5555");
}

// -----------------------------------------------------------------------------
// 3. Type and range violations are rejected with ConfigError.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, InvalidValuesThrow) {
  EXPECT_THROW(riskledger::parseConfig(json::array()), ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"account_id", 5}}), ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"initial_cash", 0}}), ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"initial_cash", "12.345678"}}),
               ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"max_trade_history", 0}}),
               ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"commission", "flat"}}), ConfigError);
  EXPECT_THROW(riskledger::parseConfig({{"commission", {{"rate", 1.5}}}}),
               ConfigError);
  EXPECT_THROW(
      riskledger::parseConfig({{"market_data", {{"max_quote_age_ms", -1}}}}),
      ConfigError);

  EXPECT_THROW(riskledger::riskLimitsFromJson({{"max_drawdown", 2.0}}),
               ConfigError);
  EXPECT_THROW(riskledger::riskLimitsFromJson({{"max_daily_loss", -1}}),
               ConfigError);
  EXPECT_THROW(riskledger::riskLimitsFromJson({{"max_daily_trades", 1.5}}),
               ConfigError);
  EXPECT_THROW(riskledger::riskLimitsFromJson({{"max_order_frequency", -2}}),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Risk limits written to JSON read back equal.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, RiskLimitsJsonRoundTrip) {
  RiskLimits limits;
  limits.min_cash_reserve = *Money::parse("1234.5678");
  limits.max_position_ratio = 0.25;
  limits.max_order_frequency = 4;
  limits.max_drawdown = 0.08;

  json j = riskledger::riskLimitsToJson(limits);
  EXPECT_EQ(j.at("min_cash_reserve"), "1234.5678");
  EXPECT_EQ(riskledger::riskLimitsFromJson(j), limits);
}

// -----------------------------------------------------------------------------
// 5. Partial limits start from the supplied defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, PartialLimitsKeepSuppliedDefaults) {
  RiskLimits base;
  base.max_daily_trades = 7;

  auto limits =
      riskledger::riskLimitsFromJson({{"max_trade_value", 5000}}, base);
  EXPECT_EQ(limits.max_daily_trades, 7);
  EXPECT_EQ(limits.max_trade_value, Money::fromUnits(5000));
}

// -----------------------------------------------------------------------------
// 6. loadConfig reads a file and reports bad files as ConfigError.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
  TempFile good("riskledger_config_good.json",
                R"({"account_id": "file-acct", "initial_cash": 5000})");
  auto config = riskledger::loadConfig(good.path());
  EXPECT_EQ(config.account_id, "file-acct");
  EXPECT_EQ(config.initial_cash, Money::fromUnits(5000));

  TempFile broken("riskledger_config_broken.json", R"({"account_id": )");
  EXPECT_THROW(riskledger::loadConfig(broken.path()), ConfigError);

  EXPECT_THROW(riskledger::loadConfig("/nonexistent/riskledger.json"),
               ConfigError);
}
