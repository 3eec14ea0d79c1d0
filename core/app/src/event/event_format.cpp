#include "intraday/events/event_format.hpp"
#include "intraday/time/time_utils.hpp"

#include <type_traits>

namespace intraday {

namespace {

using nlohmann::json;

json header(const char* type, Timestamp ts) {
  json record;
  record["type"] = type;
  record["timestamp_ms"] = timestamp_to_ms(ts);
  return record;
}

// Flattens a name → value map into `record`. Keys already present (type,
// symbol, ...) are never overwritten by a metric of the same name.
void merge(json& record, const std::map<std::string, double>& values) {
  for (const auto& [key, value] : values) {
    if (!record.contains(key)) {
      record[key] = value;
    }
  }
}

json format(const TradeEvent& e) {
  const domain::TradeRecord& r = e.record;
  json record = header("trade", r.timestamp);
  record["action"] = domain::toString(r.action);
  record["symbol"] = r.symbol;
  record["quantity"] = r.quantity;
  record["price"] = r.price;
  record["trade_count"] = e.trade_count;
  record["portfolio_value"] = e.portfolio_value;
  if (e.ema) record["ema"] = *e.ema;
  if (e.rsi) record["rsi"] = *e.rsi;
  if (r.exit_reason) record["exit_reason"] = domain::toString(*r.exit_reason);
  if (r.entry_price) record["entry_price"] = *r.entry_price;
  if (r.pnl_percent) record["pnl_percent"] = *r.pnl_percent;
  if (r.duration_minutes) record["duration_minutes"] = *r.duration_minutes;
  return record;
}

json format(const SignalEvent& e) {
  json record = header("signal", e.timestamp);
  record["signal_type"] = toString(e.type);
  record["symbol"] = e.symbol;
  merge(record, e.indicator_values);
  return record;
}

json format(const RiskEvent& e) {
  json record = header("risk", e.timestamp);
  record["event_type"] = toString(e.type);
  record["symbol"] = e.symbol;
  merge(record, e.details);
  return record;
}

json format(const PerformanceEvent& e) {
  json record = header("performance", e.timestamp);
  record["report"] = toString(e.kind);
  merge(record, e.metrics);
  return record;
}

json format(const EntryDecisionEvent& e) {
  json record = header("entry_decision", e.timestamp);
  record["symbol"] = e.symbol;
  record["target_fraction"] = e.target_fraction;
  record["price"] = e.price;
  return record;
}

json format(const ExitDecisionEvent& e) {
  json record = header("exit_decision", e.timestamp);
  record["symbol"] = e.symbol;
  record["liquidate"] = e.liquidate;
  record["reason"] = domain::toString(e.reason);
  record["price"] = e.price;
  return record;
}

}  // namespace

std::optional<nlohmann::json> formatEvent(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<json> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BarEvent> ||
                      std::is_same_v<T, TickEvent> ||
                      std::is_same_v<T, DayEndEvent> ||
                      std::is_same_v<T, RunEndEvent>) {
          return std::nullopt;
        } else {
          return format(e);
        }
      },
      event);
}

}  // namespace intraday
