#pragma once

#include "riskledger/events/event_types.hpp"
#include "riskledger/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace riskledger {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB bridge for replayed market data
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a SUB socket, advances the simulation clock
//         and hands each decoded MarketDataEvent to a tick sink.
//
// @details
// Wire format (one JSON object per ZMQ message):
//   {
//     "timestamp_ms": 1700000000000,
//     "symbol":       "AAPL",
//     "price":        150.25,          // number or decimal string
//     "volume":       100.0            // optional, defaults to 0
//   }
//
// Per message, in this order:
//   1. advance_time(timestamp_ms), so anything reading now_ms() while the
//      tick is processed sees the tick's time.
//   2. tick_sink_(event). main() binds this to PriceCache::updatePrice, which
//      is how quotes reach the ledger and the risk gate.
//
// Malformed payloads (bad JSON, missing keys, non-positive or unrepresentable
// price) are logged to stderr and skipped. They never stop the loop.
//
// Thread model:
//   run() blocks the calling thread until stop() is called from any thread.
//   A stop() that lands before run() starts still ends it; a stopped gateway
//   is not restarted (MarketDataThread builds a fresh one per start()).
//   ZMQ_RCVTIMEO bounds each recv() so the stop flag is re-checked every
//   kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. Holds a reference to the
//   SimulationTimeProvider, which must outlive the gateway.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(const MarketDataEvent&)>;

  MarketDataGateway(SimulationTimeProvider& time_provider, TickSink tick_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // Number of ticks delivered to the sink so far.
  std::uint64_t ticksReceived() const { return sequence_.load(); }

  // -------------------------------------------------------------------------
  // parseTick(payload, sequence_id)
  // -------------------------------------------------------------------------
  // @brief  Decodes one wire message.
  //
  // @return The event, or std::nullopt if the payload is malformed. The
  //         failure reason goes to stderr.
  //
  // Pure apart from logging; exposed for tests.
  // -------------------------------------------------------------------------
  static std::optional<MarketDataEvent> parseTick(const std::string& payload,
                                                  std::uint64_t sequence_id);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider& time_provider_;
  TickSink tick_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace riskledger
