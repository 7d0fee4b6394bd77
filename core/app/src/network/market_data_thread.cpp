#include "riskledger/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace riskledger {

MarketDataThread::MarketDataThread(SimulationTimeProvider& time_provider,
                                   MarketDataGateway::TickSink tick_sink,
                                   std::string endpoint)
    : time_provider_(time_provider),
      tick_sink_(std::move(tick_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): build the gateway, then spawn the recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(time_provider_, tick_sink_,
                                                 endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited after "
              << gateway_->ticksReceived() << " ticks.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal, join, release the socket
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace riskledger
