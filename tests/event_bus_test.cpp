// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for riskledger::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only its own type, with payload intact
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A callback may publish again without deadlocking
//
// Single-threaded; the controller tests cover publication from submit().
// =============================================================================

#include "riskledger/eventbus/event_bus.hpp"
#include "riskledger/events/event.hpp"

#include <gtest/gtest.h>

#include <string>

using riskledger::domain::Money;

class EventBusTest : public ::testing::Test {
 protected:
  riskledger::EventBus bus;

  static riskledger::MarketDataEvent makeTick(const std::string& symbol,
                                              std::int64_t price_units) {
    riskledger::MarketDataEvent e;
    e.symbol = symbol;
    e.price = Money::fromUnits(price_units);
    e.volume = 100.0;
    e.timestamp_ms = 1'000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative of the Event variant.
// Why: the IPC telemetry bridge subscribes generically.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const riskledger::Event&) { ++calls; });

  bus.publish(makeTick("AAPL", 150));
  bus.publish(riskledger::EmergencyStopEvent{true, "manual", 5});
  bus.publish(riskledger::RiskRejectionEvent{});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its type and gets the exact payload.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersAndKeepsPayload) {
  int ticks = 0;
  std::string symbol;
  Money price;
  bus.subscribe<riskledger::MarketDataEvent>(
      [&](const riskledger::MarketDataEvent& e) {
        ++ticks;
        symbol = e.symbol;
        price = e.price;
      });

  bus.publish(riskledger::EmergencyStopEvent{true, "manual", 5});
  bus.publish(makeTick("TSLA", 237));

  EXPECT_EQ(ticks, 1);
  EXPECT_EQ(symbol, "TSLA");
  EXPECT_EQ(price, Money::fromUnits(237));
}

// -----------------------------------------------------------------------------
// 3. Every subscriber of a type receives the same event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe<riskledger::EmergencyStopEvent>(
      [&a](const riskledger::EmergencyStopEvent&) { ++a; });
  bus.subscribe<riskledger::EmergencyStopEvent>(
      [&b](const riskledger::EmergencyStopEvent&) { ++b; });

  bus.publish(riskledger::EmergencyStopEvent{false, "resumed", 9});

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. unsubscribe() stops delivery.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<riskledger::MarketDataEvent>(
      [&calls](const riskledger::MarketDataEvent&) { ++calls; });

  bus.publish(makeTick("AAPL", 150));
  bus.unsubscribe(id);
  bus.publish(makeTick("AAPL", 151));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreNoOps) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(makeTick("AAPL", 150)));
}

// -----------------------------------------------------------------------------
// 6. Publishing from inside a callback does not deadlock.
// Why: publish() must release its lock before invoking subscribers.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int stops = 0;
  bus.subscribe<riskledger::EmergencyStopEvent>(
      [&stops](const riskledger::EmergencyStopEvent&) { ++stops; });
  bus.subscribe<riskledger::MarketDataEvent>(
      [this](const riskledger::MarketDataEvent& e) {
        bus.publish(riskledger::EmergencyStopEvent{true, "halt " + e.symbol,
                                                   e.timestamp_ms});
      });

  bus.publish(makeTick("AAPL", 150));

  EXPECT_EQ(stops, 1);
}
