// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON wire codec used by the IPC command and telemetry
// channels.
//
// Validates:
//   - Signal parsing: limit price as number or string, defaults, bad input
//     (including fractional quantities)
//   - Telemetry envelopes carry a "type" per event kind
//   - Market data ticks are not republished as telemetry
//   - Optional figures render as null
// =============================================================================

#include "riskledger/serialization/json_codec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

using nlohmann::json;
using riskledger::domain::Money;
using riskledger::domain::Side;

// -----------------------------------------------------------------------------
// 1. A full signal, limit price given as a decimal string.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SignalFromJsonWithStringLimit) {
  json j = {{"id", "s-1"},        {"symbol", "0700.HK"},
            {"side", "BUY"},      {"quantity", 200},
            {"limit_price", "312.4"}, {"strategy", "momentum"},
            {"timestamp_ms", 42}};

  auto signal = riskledger::signalFromJson(j);
  EXPECT_EQ(signal.id, "s-1");
  EXPECT_EQ(signal.symbol, "0700.HK");
  EXPECT_EQ(signal.side, Side::Buy);
  EXPECT_EQ(signal.quantity, 200);
  ASSERT_TRUE(signal.limit_price.has_value());
  EXPECT_EQ(*signal.limit_price, *Money::parse("312.4"));
  EXPECT_EQ(signal.strategy, "momentum");
  EXPECT_EQ(signal.timestamp_ms, 42);
}

// -----------------------------------------------------------------------------
// 2. Optional fields default; a null limit price means a market order.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SignalFromJsonDefaults) {
  json j = {{"id", "s-2"},
            {"symbol", "AAPL"},
            {"side", "sell"},
            {"quantity", 5},
            {"limit_price", nullptr}};

  auto signal = riskledger::signalFromJson(j);
  EXPECT_EQ(signal.side, Side::Sell);
  EXPECT_FALSE(signal.limit_price.has_value());
  EXPECT_EQ(signal.strategy, "default");
  EXPECT_EQ(signal.timestamp_ms, 0);

  j["limit_price"] = 99.5;
  EXPECT_EQ(*riskledger::signalFromJson(j).limit_price, *Money::parse("99.5"));
}

// -----------------------------------------------------------------------------
// 3. Malformed signals throw.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SignalFromJsonRejectsBadInput) {
  json base = {{"id", "s-3"}, {"symbol", "AAPL"}, {"side", "buy"},
               {"quantity", 1}};

  json bad_side = base;
  bad_side["side"] = "short";
  EXPECT_THROW(riskledger::signalFromJson(bad_side), std::invalid_argument);

  json bad_price = base;
  bad_price["limit_price"] = "12.ab";
  EXPECT_THROW(riskledger::signalFromJson(bad_price), std::invalid_argument);

  json missing = base;
  missing.erase("symbol");
  EXPECT_THROW(riskledger::signalFromJson(missing), json::exception);

  json wrong_type = base;
  wrong_type["quantity"] = "ten";
  EXPECT_THROW(riskledger::signalFromJson(wrong_type), std::invalid_argument);

  // Fractional quantities are refused, never truncated to a smaller trade.
  json fractional = base;
  fractional["quantity"] = 1.9;
  EXPECT_THROW(riskledger::signalFromJson(fractional), std::invalid_argument);
  fractional["quantity"] = 0.5;
  EXPECT_THROW(riskledger::signalFromJson(fractional), std::invalid_argument);

  json too_large = base;
  too_large["quantity"] = std::uint64_t{18'446'744'073'709'551'615u};
  EXPECT_THROW(riskledger::signalFromJson(too_large), std::invalid_argument);

  json missing_qty = base;
  missing_qty.erase("quantity");
  EXPECT_THROW(riskledger::signalFromJson(missing_qty), json::exception);
}

// -----------------------------------------------------------------------------
// 4. Each controller event renders with its own type tag.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, TelemetryEnvelopes) {
  riskledger::OrderUpdateEvent update;
  update.order.id = 9;
  update.order.symbol = "AAPL";
  update.order.status = riskledger::domain::OrderStatus::Filled;
  update.timestamp_ms = 100;
  auto order_json = riskledger::telemetryJson(update);
  ASSERT_TRUE(order_json.has_value());
  EXPECT_EQ(order_json->at("type"), "order_update");
  EXPECT_EQ(order_json->at("order_id"), 9);
  EXPECT_EQ(order_json->at("status"), "filled");
  EXPECT_EQ(order_json->at("previous_status"), "submitted");

  riskledger::RiskRejectionEvent rejection;
  rejection.check = "cash";
  rejection.reason = "insufficient cash";
  auto rejection_json = riskledger::telemetryJson(rejection);
  ASSERT_TRUE(rejection_json.has_value());
  EXPECT_EQ(rejection_json->at("type"), "risk_rejection");
  EXPECT_EQ(rejection_json->at("check"), "cash");

  riskledger::EmergencyStopEvent stop{true, "manual", 5};
  auto stop_json = riskledger::telemetryJson(stop);
  ASSERT_TRUE(stop_json.has_value());
  EXPECT_EQ(stop_json->at("type"), "emergency_stop");
  EXPECT_EQ(stop_json->at("active"), true);

  riskledger::PositionUpdateEvent position;
  position.position.symbol = "AAPL";
  position.account.cash = Money::fromUnits(10);
  auto position_json = riskledger::telemetryJson(position);
  ASSERT_TRUE(position_json.has_value());
  EXPECT_EQ(position_json->at("type"), "position_update");
  EXPECT_EQ(position_json->at("position").at("symbol"), "AAPL");
  EXPECT_DOUBLE_EQ(position_json->at("account").at("cash").get<double>(), 10.0);
}

// -----------------------------------------------------------------------------
// 5. Raw ticks are not telemetry.
// Why: the tick stream would drown the subscriber feed.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MarketDataIsNotTelemetry) {
  riskledger::MarketDataEvent tick;
  tick.symbol = "AAPL";
  tick.price = Money::fromUnits(150);
  EXPECT_FALSE(riskledger::telemetryJson(tick).has_value());
}

// -----------------------------------------------------------------------------
// 6. Optional values render as null.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, OptionalFiguresRenderNull) {
  riskledger::PerformanceSummary perf;
  EXPECT_TRUE(riskledger::toJson(perf).at("win_rate").is_null());
  perf.win_rate = 0.5;
  EXPECT_DOUBLE_EQ(riskledger::toJson(perf).at("win_rate").get<double>(), 0.5);

  riskledger::domain::Order market;
  EXPECT_TRUE(riskledger::toJson(market).at("limit_price").is_null());

  riskledger::RiskStatus status;
  json j = riskledger::toJson(status);
  EXPECT_TRUE(j.at("emergency_stop_time_ms").is_null());
  EXPECT_EQ(j.at("limits").at("max_daily_trades"), 100);
}
