#pragma once

#include "riskledger/gateway/market_data_gateway.hpp"
#include "riskledger/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace riskledger {

// -----------------------------------------------------------------------------
// MarketDataThread — owns the gateway and the thread running its recv loop
// -----------------------------------------------------------------------------
//
// The gateway (and its socket) is created in start(), not in the
// constructor, so the thread object can be built before the endpoint is
// reachable. stop() is idempotent and also runs from the destructor.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  MarketDataThread(SimulationTimeProvider& time_provider,
                   MarketDataGateway::TickSink tick_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  SimulationTimeProvider& time_provider_;
  MarketDataGateway::TickSink tick_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace riskledger
