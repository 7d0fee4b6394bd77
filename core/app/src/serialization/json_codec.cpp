#include "riskledger/serialization/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <variant>

namespace riskledger {

using nlohmann::json;

namespace {

json optionalNumber(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

json toJson(const domain::Order& order) {
  json j;
  j["order_id"] = order.id;
  j["signal_id"] = order.signal_id;
  j["strategy"] = order.strategy;
  j["symbol"] = order.symbol;
  j["side"] = domain::sideToString(order.side);
  j["type"] = domain::orderTypeToString(order.type);
  j["quantity"] = order.quantity;
  j["limit_price"] =
      order.limit_price ? json(order.limit_price->toDouble()) : json(nullptr);
  j["status"] = domain::orderStatusToString(order.status);
  j["filled_quantity"] = order.filled_quantity;
  j["average_fill_price"] = order.average_fill_price.toDouble();
  j["commission"] = order.commission.toDouble();
  j["reject_reason"] = order.reject_reason;
  j["created_ms"] = order.created_ms;
  j["updated_ms"] = order.updated_ms;
  return j;
}

json toJson(const domain::Position& position) {
  json j;
  j["symbol"] = position.symbol;
  j["quantity"] = position.quantity;
  j["average_cost"] = position.average_cost.toDouble();
  j["cost_basis"] = position.cost_basis.toDouble();
  j["current_price"] = position.current_price.toDouble();
  j["market_value"] = position.market_value.toDouble();
  j["unrealized_pnl"] = position.unrealized_pnl.toDouble();
  j["realized_pnl"] = position.realized_pnl.toDouble();
  return j;
}

json toJson(const domain::AccountSnapshot& account) {
  json j;
  j["initial_cash"] = account.initial_cash.toDouble();
  j["cash"] = account.cash.toDouble();
  j["market_value"] = account.market_value.toDouble();
  j["equity"] = account.equity.toDouble();
  j["buying_power"] = account.buying_power.toDouble();
  j["total_commission"] = account.total_commission.toDouble();
  j["updated_ms"] = account.updated_ms;
  return j;
}

json toJson(const domain::TradeRecord& trade) {
  json j;
  j["trade_id"] = trade.trade_id;
  j["order_id"] = trade.order_id;
  j["signal_id"] = trade.signal_id;
  j["strategy"] = trade.strategy;
  j["symbol"] = trade.symbol;
  j["side"] = domain::sideToString(trade.side);
  j["quantity"] = trade.quantity;
  j["price"] = trade.price.toDouble();
  j["trade_value"] = trade.trade_value.toDouble();
  j["commission"] = trade.commission.toDouble();
  j["realized_pnl"] = trade.realized_pnl.toDouble();
  j["cash_after"] = trade.cash_after.toDouble();
  j["timestamp_ms"] = trade.timestamp_ms;
  return j;
}

json toJson(const FillReport& fill) {
  json j;
  j["order_id"] = fill.order_id;
  j["trade_id"] = fill.trade_id;
  j["symbol"] = fill.symbol;
  j["side"] = domain::sideToString(fill.side);
  j["filled_price"] = fill.filled_price.toDouble();
  j["filled_quantity"] = fill.filled_quantity;
  j["trade_value"] = fill.trade_value.toDouble();
  j["commission"] = fill.commission.toDouble();
  j["realized_pnl"] = fill.realized_pnl.toDouble();
  j["cash_after"] = fill.cash_after.toDouble();
  j["timestamp_ms"] = fill.timestamp_ms;
  return j;
}

json toJson(const ExecutionFailure& failure) {
  return json{{"kind", executionFailureKindToString(failure.kind)},
              {"reason", failure.reason}};
}

json toJson(const PerformanceSummary& performance) {
  json j;
  j["initial_cash"] = performance.initial_cash.toDouble();
  j["equity"] = performance.equity.toDouble();
  j["total_return"] = performance.total_return.toDouble();
  j["return_rate"] = performance.return_rate;
  j["realized_pnl"] = performance.realized_pnl.toDouble();
  j["unrealized_pnl"] = performance.unrealized_pnl.toDouble();
  j["total_commission"] = performance.total_commission.toDouble();
  j["trade_count"] = performance.trade_count;
  j["winning_trades"] = performance.winning_trades;
  j["losing_trades"] = performance.losing_trades;
  j["win_rate"] = optionalNumber(performance.win_rate);
  return j;
}

json toJson(const RiskStatus& status) {
  json j;
  j["emergency_stop"] = status.emergency_stop_active;
  j["emergency_stop_reason"] = status.emergency_stop_reason;
  j["emergency_stop_time_ms"] = status.emergency_stop_time_ms
                                    ? json(*status.emergency_stop_time_ms)
                                    : json(nullptr);
  j["emergency_stop_duration_ms"] =
      status.emergency_stop_duration_ms
          ? json(*status.emergency_stop_duration_ms)
          : json(nullptr);
  j["has_limits_backup"] = status.has_limits_backup;
  j["daily_pnl"] = status.daily_pnl.toDouble();
  j["daily_trade_count"] = status.daily_trade_count;
  j["trades_by_symbol"] = status.trades_by_symbol;
  j["peak_equity"] = status.peak_equity.toDouble();
  j["current_drawdown"] = status.current_drawdown;
  j["last_reset_day"] = status.last_reset_day;

  const domain::RiskLimits& l = status.limits;
  j["limits"] = {
      {"min_cash_reserve", l.min_cash_reserve.toDouble()},
      {"max_trade_value", l.max_trade_value.toDouble()},
      {"max_daily_loss", l.max_daily_loss.toDouble()},
      {"max_position_value", l.max_position_value.toDouble()},
      {"max_position_ratio", l.max_position_ratio},
      {"max_sector_concentration", l.max_sector_concentration},
      {"max_daily_trades", l.max_daily_trades},
      {"max_order_frequency", l.max_order_frequency},
      {"max_drawdown", l.max_drawdown},
  };
  return j;
}

json toJson(const RiskCheckDetail& detail) {
  json j;
  j["emergency_stop"] = detail.emergency_stop;
  if (detail.stop) {
    j["stop"] = {{"reason", detail.stop->reason},
                 {"stop_time_ms", detail.stop->stop_time_ms},
                 {"duration_ms", detail.stop->duration_ms}};
  }
  j["failed_check"] = detail.failed_check
                          ? json(riskCheckToString(*detail.failed_check))
                          : json(nullptr);
  j["valuation_price"] = detail.valuation_price
                             ? json(detail.valuation_price->toDouble())
                             : json(nullptr);
  j["trade_value"] = detail.trade_value.toDouble();
  j["estimated_commission"] = detail.estimated_commission.toDouble();

  json checks = json::array();
  for (const auto& c : detail.checks) {
    checks.push_back({{"check", riskCheckToString(c.check)},
                      {"passed", c.passed},
                      {"message", c.message},
                      {"observed", optionalNumber(c.observed)},
                      {"limit", optionalNumber(c.limit)}});
  }
  j["checks"] = std::move(checks);
  return j;
}

// -----------------------------------------------------------------------------
// telemetryJson: dispatch Event variant to per-type envelopes
// -----------------------------------------------------------------------------
std::optional<json> telemetryJson(const Event& event) {
  if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    json j = toJson(e->order);
    j["type"] = "order_update";
    j["previous_status"] = domain::orderStatusToString(e->previous_status);
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    json j;
    j["type"] = "position_update";
    j["position"] = toJson(e->position);
    j["account"] = toJson(e->account);
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<RiskRejectionEvent>(&event)) {
    json j;
    j["type"] = "risk_rejection";
    j["order_id"] = e->order_id;
    j["signal_id"] = e->signal_id;
    j["symbol"] = e->symbol;
    j["check"] = e->check;
    j["reason"] = e->reason;
    j["observed"] = e->observed;
    j["limit"] = e->limit;
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<EmergencyStopEvent>(&event)) {
    json j;
    j["type"] = "emergency_stop";
    j["active"] = e->active;
    j["reason"] = e->reason;
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// signalFromJson
// -----------------------------------------------------------------------------
domain::Signal signalFromJson(const json& j) {
  domain::Signal signal;
  signal.id = j.at("id").get<std::string>();
  signal.symbol = j.at("symbol").get<std::string>();

  const auto side_text = j.at("side").get<std::string>();
  const auto side = domain::parseSide(side_text);
  if (!side) {
    throw std::invalid_argument("unknown side: " + side_text);
  }
  signal.side = *side;

  // Whole shares only: a fractional quantity is malformed, not rounded.
  const json& quantity = j.at("quantity");
  if (!quantity.is_number_integer() ||
      (quantity.is_number_unsigned() &&
       quantity.get<std::uint64_t>() >
           static_cast<std::uint64_t>(
               std::numeric_limits<domain::Quantity>::max()))) {
    throw std::invalid_argument("quantity must be a whole number: " +
                                quantity.dump());
  }
  signal.quantity = quantity.get<domain::Quantity>();

  if (j.contains("limit_price") && !j.at("limit_price").is_null()) {
    const json& price = j.at("limit_price");
    if (price.is_string()) {
      auto parsed = domain::Money::parse(price.get<std::string>());
      if (!parsed) {
        throw std::invalid_argument("malformed limit_price: " +
                                    price.get<std::string>());
      }
      signal.limit_price = *parsed;
    } else {
      signal.limit_price = domain::Money::fromDouble(price.get<double>());
    }
  }

  signal.strategy = j.value("strategy", std::string("default"));
  signal.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
  return signal;
}

}  // namespace riskledger
