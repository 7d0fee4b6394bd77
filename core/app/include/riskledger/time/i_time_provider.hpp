#pragma once

#include <cstdint>

namespace riskledger {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Two things in the ledger depend on time:
//   - RiskGate decides when a trading day has ended (daily counter reset)
//     and timestamps the emergency stop.
//   - ExecutionLedger and PriceCache stamp orders, trades and quotes, and
//     PriceCache ages quotes out.
//
// If those components read the wall clock directly, a test that wants to
// "move to tomorrow" would have to sleep for a day. Instead they receive a
// `const ITimeProvider&`:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the replay layer
//                              (MarketDataGateway) or by a test.
//
// int64_t milliseconds since the Unix epoch is used everywhere because the
// ZeroMQ market data feed and the JSON telemetry both carry integer
// timestamps.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // @return May be 0 before a simulation clock has been advanced.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskledger
