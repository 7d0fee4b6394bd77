#include "riskledger/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace riskledger {

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything, bound recv() by kRecvTimeoutMs
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider& time_provider,
                                     TickSink tick_sink,
                                     const std::string& endpoint)
    : time_provider_(time_provider), tick_sink_(std::move(tick_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parseTick(): JSON payload -> MarketDataEvent
// -----------------------------------------------------------------------------
std::optional<MarketDataEvent> MarketDataGateway::parseTick(
    const std::string& payload, std::uint64_t sequence_id) {
  try {
    auto json = nlohmann::json::parse(payload);

    MarketDataEvent md;
    md.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    md.symbol = json.at("symbol").get<std::string>();
    md.volume = json.value("volume", 0.0);
    md.sequence_id = sequence_id;

    const auto& price = json.at("price");
    if (price.is_string()) {
      auto parsed = domain::Money::parse(price.get<std::string>());
      if (!parsed) {
        std::cerr << "[MarketDataGateway] bad price string in payload: "
                  << payload << "\n";
        return std::nullopt;
      }
      md.price = *parsed;
    } else {
      md.price = domain::Money::fromDouble(price.get<double>());
    }

    if (md.symbol.empty() || !md.price.isPositive()) {
      std::cerr << "[MarketDataGateway] rejected tick (empty symbol or "
                << "non-positive price): " << payload << "\n";
      return std::nullopt;
    }
    return md;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
  } catch (const std::overflow_error& e) {
    std::cerr << "[MarketDataGateway] price out of range: " << e.what()
              << " payload: " << payload << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout, re-check stop_requested_
    }

    auto tick = parseTick(msg.to_string(), sequence_.load() + 1);
    if (!tick) {
      continue;
    }

    time_provider_.advance_time(tick->timestamp_ms);
    sequence_.fetch_add(1);
    tick_sink_(*tick);
  }
}

// -----------------------------------------------------------------------------
// stop(): the loop exits within kRecvTimeoutMs
// -----------------------------------------------------------------------------
void MarketDataGateway::stop() { stop_requested_.store(true); }

}  // namespace riskledger
