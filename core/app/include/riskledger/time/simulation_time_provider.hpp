#pragma once

#include "riskledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskledger {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly, either by the
//         MarketDataGateway from each tick's timestamp_ms or by a test.
//
// @details
// Replaying a recorded session through the ledger must reproduce the same
// day boundaries and the same order/trade timestamps on every run. The
// clock therefore only moves when data (or a test) says so.
//
// Tests use advance_by() to cross a trading-day boundary without sleeping.
//
// Internal storage is a single std::atomic<int64_t>: the gateway thread
// writes, the controller and IPC threads read, and no lock is needed.
//
// Thread model:
//   advance_time()/advance_by() are intended for a single writer.
//   now_ms() may be called from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given epoch milliseconds.
  //
  // @details
  // Monotonicity is the caller's responsibility (the gateway replays ticks
  // in order); setting an arbitrary time is useful in tests.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskledger
