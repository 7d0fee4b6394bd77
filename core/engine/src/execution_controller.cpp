#include "riskledger/engine/execution_controller.hpp"
#include "riskledger/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace riskledger {

using nlohmann::json;

namespace {

json attributionToJson(const StrategyAttribution& a) {
  return json{
      {"strategy", a.strategy},
      {"trades", a.trades},
      {"buys", a.buys},
      {"sells", a.sells},
      {"turnover", a.turnover.toDouble()},
      {"commission", a.commission.toDouble()},
      {"realized_pnl", a.realized_pnl.toDouble()},
  };
}

json submissionToJson(const SubmissionResult& r) {
  json j;
  j["result"] = submissionStatusToString(r.status);
  j["order"] = toJson(r.order);
  j["risk"] = toJson(r.risk);
  if (!r.reason.empty()) {
    j["reason"] = r.reason;
  }
  if (r.fill) {
    j["fill"] = toJson(*r.fill);
  }
  if (r.failure) {
    j["failure"] = toJson(*r.failure);
  }
  return j;
}

json errorResponse(const std::string& message) {
  return json{{"status", "error"}, {"response", message}};
}

// Splits "VERB rest of line" and strips surrounding whitespace.
std::pair<std::string, std::string> splitCommand(const std::string& cmd) {
  const char* kSpace = " \t\r\n";
  auto first = cmd.find_first_not_of(kSpace);
  if (first == std::string::npos) {
    return {"", ""};
  }
  auto last = cmd.find_last_not_of(kSpace);
  std::string line = cmd.substr(first, last - first + 1);

  auto gap = line.find_first_of(kSpace);
  if (gap == std::string::npos) {
    return {line, ""};
  }
  auto arg = line.find_first_not_of(kSpace, gap);
  return {line.substr(0, gap), line.substr(arg)};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionController::ExecutionController(
    std::string account_id, std::unique_ptr<RiskGate> risk_gate,
    std::unique_ptr<ExecutionLedger> ledger,
    const IMarketDataProvider& market_data, EventBus& event_bus,
    const ITimeProvider& clock)
    : account_id_(std::move(account_id)),
      risk_gate_(std::move(risk_gate)),
      ledger_(std::move(ledger)),
      market_data_(market_data),
      event_bus_(event_bus),
      clock_(clock) {
  if (!risk_gate_ || !ledger_) {
    throw std::invalid_argument(
        "ExecutionController requires a RiskGate and an ExecutionLedger");
  }
  std::cout << "[ExecutionController] account " << account_id_
            << " ready, cash " << ledger_->getAccountInfo().cash.toString()
            << "\n";
}

// -----------------------------------------------------------------------------
// submit(): the per-account pipeline
// -----------------------------------------------------------------------------
SubmissionResult ExecutionController::submit(const domain::Signal& signal) {
  SubmissionResult result;
  std::vector<Event> events;

  {
    std::lock_guard lock(submit_mutex_);
    const std::int64_t now = clock_.now_ms();

    // --- 1. refresh valuations so drawdown sees current equity ------------
    ledger_->markToMarket();

    // --- 2. every signal gets an order id --------------------------------
    domain::Order order = ledger_->createOrder(signal);

    // --- 3. pre-trade gate ------------------------------------------------
    const domain::AccountSnapshot account = ledger_->getAccountInfo();
    const std::vector<domain::Position> positions = ledger_->getPositions();
    // One quote per signal: the gate values the trade at it and a market
    // order fills at it, so a tick landing in between cannot move the fill.
    const std::optional<domain::Money> quote =
        market_data_.getCurrentPrice(signal.symbol);
    RiskCheckResult check =
        risk_gate_->check(signal, account, positions, quote);
    result.risk = check.detail;

    if (!check.allowed) {
      const RiskCheck failed =
          check.detail.failed_check.value_or(RiskCheck::Basic);
      result.status = (failed == RiskCheck::Basic)
                          ? SubmissionStatus::ValidationRejected
                          : SubmissionStatus::RiskRejected;
      result.reason = check.reason;
      result.order = ledger_->rejectOrder(order.id, check.reason).value_or(order);

      RiskRejectionEvent rejection;
      rejection.order_id = order.id;
      rejection.signal_id = signal.id;
      rejection.symbol = signal.symbol;
      rejection.check = riskCheckToString(failed);
      rejection.reason = check.reason;
      rejection.timestamp_ms = now;
      for (const auto& outcome : check.detail.checks) {
        if (outcome.check == failed && !outcome.passed) {
          rejection.observed = outcome.observed.value_or(0.0);
          rejection.limit = outcome.limit.value_or(0.0);
        }
      }
      events.emplace_back(std::move(rejection));
      events.emplace_back(OrderUpdateEvent{
          result.order, domain::OrderStatus::Submitted, now});

    } else {
      // --- 4. simulated fill -------------------------------------------------
      ExecutionResult executed = ledger_->execute(order.id, quote);

      if (auto* fill = std::get_if<FillReport>(&executed)) {
        // --- 5. feed counters and attribution --------------------------------
        risk_gate_->recordTrade(fill->symbol, fill->side,
                                fill->filled_quantity, fill->filled_price,
                                fill->realized_pnl);
        recordAttributionLocked(order.strategy, *fill);

        result.status = SubmissionStatus::Filled;
        result.fill = *fill;
        result.order = ledger_->getOrder(order.id).value_or(order);

        domain::Position position;
        position.symbol = fill->symbol;
        position = ledger_->getPosition(fill->symbol).value_or(position);

        events.emplace_back(OrderUpdateEvent{
            result.order, domain::OrderStatus::Submitted, fill->timestamp_ms});
        events.emplace_back(PositionUpdateEvent{
            std::move(position), ledger_->getAccountInfo(),
            fill->timestamp_ms});

      } else {
        const auto& failure = std::get<ExecutionFailure>(executed);
        result.status = SubmissionStatus::ExecutionFailed;
        result.failure = failure;
        result.reason = failure.reason;
        result.order = ledger_->getOrder(order.id).value_or(order);

        events.emplace_back(OrderUpdateEvent{
            result.order, domain::OrderStatus::Submitted, now});
      }
    }
  }

  for (const auto& event : events) {
    event_bus_.publish(event);
  }
  return result;
}

// -----------------------------------------------------------------------------
// recordAttributionLocked(): caller holds submit_mutex_
// -----------------------------------------------------------------------------
void ExecutionController::recordAttributionLocked(const std::string& strategy,
                                                  const FillReport& fill) {
  std::lock_guard lock(attribution_mutex_);
  auto& a = attribution_[strategy];
  a.strategy = strategy;
  ++a.trades;
  if (fill.side == domain::Side::Buy) {
    ++a.buys;
  } else {
    ++a.sells;
  }
  a.turnover += fill.trade_value;
  a.commission += fill.commission;
  a.realized_pnl += fill.realized_pnl;
}

std::vector<StrategyAttribution> ExecutionController::attribution() const {
  std::lock_guard lock(attribution_mutex_);
  std::vector<StrategyAttribution> out;
  out.reserve(attribution_.size());
  for (const auto& [name, totals] : attribution_) {
    out.push_back(totals);
  }
  return out;
}

// -----------------------------------------------------------------------------
// Operator controls
// -----------------------------------------------------------------------------
bool ExecutionController::emergencyStop(const std::string& reason) {
  bool changed = false;
  bool answer = false;
  {
    std::lock_guard lock(submit_mutex_);
    changed = !risk_gate_->isEmergencyStopActive();
    answer = risk_gate_->emergencyStop(reason);
  }
  if (changed) {
    event_bus_.publish(EmergencyStopEvent{true, reason, clock_.now_ms()});
  }
  return answer;
}

bool ExecutionController::resume() {
  bool changed = false;
  bool answer = false;
  {
    std::lock_guard lock(submit_mutex_);
    changed = risk_gate_->isEmergencyStopActive();
    answer = risk_gate_->resumeFromEmergencyStop();
  }
  if (changed) {
    event_bus_.publish(EmergencyStopEvent{false, "resumed", clock_.now_ms()});
  }
  return answer;
}

void ExecutionController::resetRisk() {
  bool was_stopped = false;
  {
    std::lock_guard lock(submit_mutex_);
    was_stopped = risk_gate_->isEmergencyStopActive();
    risk_gate_->resetRiskState();
  }
  if (was_stopped) {
    event_bus_.publish(
        EmergencyStopEvent{false, "risk state reset", clock_.now_ms()});
  }
}

std::size_t ExecutionController::markToMarket() {
  std::lock_guard lock(submit_mutex_);
  return ledger_->markToMarket();
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command dispatch
// -----------------------------------------------------------------------------
std::string ExecutionController::executeCommand(const std::string& cmd) {
  auto [verb, arg] = splitCommand(cmd);
  json response;

  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      response["status"] = "ok";
      response["account_id"] = account_id_;
      response["risk"] = toJson(risk_gate_->getStatus());
    } else if (verb == "ACCOUNT") {
      response["status"] = "ok";
      response["account"] = toJson(ledger_->getAccountInfo());
    } else if (verb == "POSITIONS") {
      json positions = json::array();
      for (const auto& p : ledger_->getPositions()) {
        positions.push_back(toJson(p));
      }
      response["status"] = "ok";
      response["positions"] = std::move(positions);
    } else if (verb == "ORDERS") {
      std::optional<domain::OrderStatus> filter;
      if (!arg.empty()) {
        filter = domain::parseOrderStatus(arg);
        if (!filter) {
          return errorResponse("Unknown order status: " + arg).dump();
        }
      }
      json orders = json::array();
      for (const auto& o : ledger_->getOrders(filter)) {
        orders.push_back(toJson(o));
      }
      response["status"] = "ok";
      response["orders"] = std::move(orders);
    } else if (verb == "TRADES") {
      json trades = json::array();
      for (const auto& t : ledger_->getTrades()) {
        trades.push_back(toJson(t));
      }
      response["status"] = "ok";
      response["trades"] = std::move(trades);
    } else if (verb == "PERFORMANCE") {
      response["status"] = "ok";
      response["performance"] = toJson(ledger_->getPerformance());
    } else if (verb == "ATTRIBUTION") {
      json strategies = json::array();
      for (const auto& a : attribution()) {
        strategies.push_back(attributionToJson(a));
      }
      response["status"] = "ok";
      response["attribution"] = std::move(strategies);
    } else if (verb == "HALT") {
      emergencyStop(arg.empty() ? "operator halt" : arg);
      response["status"] = "ok";
      response["response"] = "Trading halted";
    } else if (verb == "RESUME") {
      resume();
      response["status"] = "ok";
      response["response"] = "Trading resumed";
    } else if (verb == "RESET_RISK") {
      resetRisk();
      response["status"] = "ok";
      response["response"] = "Risk state reset";
    } else if (verb == "SUBMIT") {
      if (arg.empty()) {
        return errorResponse("SUBMIT requires a signal JSON object").dump();
      }
      SubmissionResult result = submit(signalFromJson(json::parse(arg)));
      response = submissionToJson(result);
      response["status"] = "ok";
    } else if (verb == "MARK") {
      response["status"] = "ok";
      response["updated"] = markToMarket();
    } else {
      return errorResponse("Unknown command: " + cmd).dump();
    }
  } catch (const json::exception& e) {
    std::cerr << "[ExecutionController] bad command payload: " << e.what()
              << "\n";
    return errorResponse(std::string("Malformed JSON: ") + e.what()).dump();
  } catch (const std::invalid_argument& e) {
    return errorResponse(e.what()).dump();
  } catch (const std::overflow_error& e) {
    return errorResponse(e.what()).dump();
  }

  return response.dump();
}

}  // namespace riskledger
