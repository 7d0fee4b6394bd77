// =============================================================================
// market_data_gateway_test.cpp
// =============================================================================
// Unit tests for MarketDataGateway::parseTick, the wire-to-event step of the
// market data feed, and for the MarketDataThread lifecycle.
//
// Validates:
//   - Numeric and string prices parse to Money
//   - Missing volume defaults to zero
//   - Malformed JSON, missing keys and invalid values yield std::nullopt
//   - The feed thread starts, ignores a second start() and stops promptly
// =============================================================================

#include "riskledger/gateway/market_data_gateway.hpp"
#include "riskledger/network/market_data_thread.hpp"
#include "riskledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using riskledger::MarketDataGateway;
using riskledger::domain::Money;

// -----------------------------------------------------------------------------
// 1. A well-formed tick.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, ParsesValidTick) {
  auto tick = MarketDataGateway::parseTick(
      R"({"symbol":"AAPL","price":150.25,"volume":1200,"timestamp_ms":1704187800000})",
      7);

  ASSERT_TRUE(tick.has_value());
  EXPECT_EQ(tick->symbol, "AAPL");
  EXPECT_EQ(tick->price, *Money::parse("150.25"));
  EXPECT_DOUBLE_EQ(tick->volume, 1200.0);
  EXPECT_EQ(tick->timestamp_ms, 1'704'187'800'000);
  EXPECT_EQ(tick->sequence_id, 7u);
}

// -----------------------------------------------------------------------------
// 2. String prices keep full decimal precision; volume is optional.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, StringPriceAndDefaultVolume) {
  auto tick = MarketDataGateway::parseTick(
      R"({"symbol":"0700.HK","price":"312.4005","timestamp_ms":5})", 1);

  ASSERT_TRUE(tick.has_value());
  EXPECT_EQ(tick->price.raw(), 3'124'005);
  EXPECT_DOUBLE_EQ(tick->volume, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Bad payloads are dropped, never thrown out of the receive loop.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, RejectsBadPayloads) {
  EXPECT_FALSE(MarketDataGateway::parseTick("not json", 1).has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","timestamp_ms":5})", 1)
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","price":"abc","timestamp_ms":5})", 1)
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","price":true,"timestamp_ms":5})", 1)
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","price":1e300,"timestamp_ms":5})", 1)
                   .has_value());
}

// -----------------------------------------------------------------------------
// 4. Empty symbols and non-positive prices are not quotes.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, RejectsInvalidQuotes) {
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"","price":10,"timestamp_ms":5})", 1)
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","price":0,"timestamp_ms":5})", 1)
                   .has_value());
  EXPECT_FALSE(MarketDataGateway::parseTick(
                   R"({"symbol":"AAPL","price":-3.5,"timestamp_ms":5})", 1)
                   .has_value());
}

// -----------------------------------------------------------------------------
// 5. MarketDataThread starts and stops cleanly with no publisher attached.
// Why: shutdown must not hang waiting for a tick that never comes.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, ThreadStartsAndStopsWithoutPublisher) {
  riskledger::SimulationTimeProvider clock{0};
  int ticks = 0;
  riskledger::MarketDataThread feed(
      clock, [&ticks](const riskledger::MarketDataEvent&) { ++ticks; },
      "tcp://127.0.0.1:5599");

  EXPECT_FALSE(feed.isRunning());
  feed.start();
  EXPECT_TRUE(feed.isRunning());
  feed.start();  // already running: no second thread
  EXPECT_TRUE(feed.isRunning());

  feed.stop();
  EXPECT_FALSE(feed.isRunning());
  feed.stop();
  EXPECT_EQ(ticks, 0);
  EXPECT_EQ(clock.now_ms(), 0);
}
